#include "cloud/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

using namespace aax::cloud;
using namespace aax::util;
using namespace aax::log;

namespace {

constexpr auto UNSIGNED_PAYLOAD = "UNSIGNED-PAYLOAD";

struct PutCtx {
    const ObjectStore::ProgressFn* onProgress = nullptr;
    const std::atomic<bool>* cancel = nullptr;
};

int onPutProgress(void* userdata, curl_off_t, curl_off_t, const curl_off_t ultotal, const curl_off_t ulnow) {
    const auto* ctx = static_cast<PutCtx*>(userdata);
    if (ctx->cancel->load()) return 1;
    if (*ctx->onProgress && ultotal > 0)
        (*ctx->onProgress)(static_cast<uint64_t>(ulnow), static_cast<uint64_t>(ultotal));
    return 0;
}

}

S3Controller::S3Controller(config::ObjectStorageConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.endpoint.empty() || cfg_.bucket.empty())
        throw std::runtime_error("S3Controller requires an endpoint and a bucket");
    ensureCurlGlobalInit();
}

std::string S3Controller::put(const std::string& key,
                              const std::filesystem::path& file,
                              const ProgressFn& onProgress,
                              const std::atomic<bool>& cancel) {
    std::ifstream fin(file, std::ios::binary);
    if (!fin) throw std::runtime_error("Cannot open " + file.string() + " for upload");

    fin.seekg(0, std::ios::end);
    const curl_off_t sz = fin.tellg();
    fin.seekg(0);

    // Books run to hundreds of MB; sign without hashing the body.
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("PUT", canonical, UNSIGNED_PAYLOAD);
    hdrs.add("Content-Type: audio/mp4");
    hdrs.add("Expect:");

    PutCtx ctx{&onProgress, &cancel};

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &fin);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, sz);
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* buf, size_t size, size_t nm, void* ud) -> size_t {
                auto* fp = static_cast<std::ifstream*>(ud);
                fp->read(buf, static_cast<std::streamsize>(size * nm));
                return static_cast<size_t>(fp->gcount());
            });
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onPutProgress);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    });

    if (resp.curl == CURLE_ABORTED_BY_CALLBACK || cancel.load())
        throw std::runtime_error("Upload of " + key + " aborted");

    if (!resp.ok()) {
        Registry::cloud()->error("[S3Controller] put failed for {}: {} Response:\n{}", key, resp.describe(), resp.body);
        throw std::runtime_error(fmt::format("Failed to upload {} to S3 ({})", key, resp.describe()));
    }

    Registry::cloud()->debug("[S3Controller] Uploaded {} ({} bytes)", key, static_cast<long long>(sz));
    return url;
}

bool S3Controller::exists(const std::string& key) {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);
    const SList hdrs = makeSigHeaders("HEAD", canonical, UNSIGNED_PAYLOAD);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.ok()) return true;
    if (!resp.transportFailed() && resp.http == 404) return false;

    Registry::cloud()->error("[S3Controller] HEAD failed for {}: {}", key, resp.describe());
    throw std::runtime_error(fmt::format("Failed to check {} in S3 ({})", key, resp.describe()));
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
        {"host", cfg_.endpoint.substr(cfg_.endpoint.find("//") + 2)},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::filesystem::path& p) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, p);
    const auto canonicalPath = "/" + cfg_.bucket + "/" + escapedKey;
    const auto url = cfg_.endpoint + canonicalPath;
    return {canonicalPath, url};
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash) const {
    const auto base = buildHeaderMap(payloadHash);
    const auto auth = buildAuthorizationHeader(cfg_, method, canonical, base, payloadHash);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) out.add(k + ": " + v);
    return out;
}
