#pragma once

#include "s3Helpers.hpp"

#include <curl/curl.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace aax::util {

// Easy handle with the options every request here shares. Signals are off
// because handles run on pool workers.
class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() { return h_; }

private:
    CURL* h_;
};

// Owns both the header strings and the list curl points into.
class SList {
public:
    SList() = default;
    SList(SList&& o) noexcept : lines_(std::move(o.lines_)), head_(o.head_) { o.head_ = nullptr; }
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;
    ~SList() { curl_slist_free_all(head_); }

    void add(std::string line) {
        lines_.push_back(std::move(line));
        head_ = curl_slist_append(head_, lines_.back().c_str());
    }

    [[nodiscard]] curl_slist* get() const { return head_; }

private:
    std::vector<std::string> lines_;
    curl_slist* head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;
    std::string headers;

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    [[nodiscard]] bool transportFailed() const { return curl != CURLE_OK; }

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const {
        return findHeader(headers, name);
    }

    // "HTTP 503" or the curl error text, for log lines and exception messages
    [[nodiscard]] std::string describe() const {
        if (transportFailed()) return curl_easy_strerror(curl);
        return "HTTP " + std::to_string(http);
    }
};

// One buffered request; setup adds the method, URL and headers.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    CurlEasy h;
    HttpResponse r;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &r.headers);

    setup(static_cast<CURL*>(h));

    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    return r;
}

}
