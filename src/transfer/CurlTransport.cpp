#include "transfer/CurlTransport.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <fmt/format.h>

using namespace aax::transfer;
using namespace aax::util;
using namespace aax::log;

namespace {

struct FetchCtx {
    std::FILE* out = nullptr;
    int writeErrno = 0;
    const ByteProgress* onProgress = nullptr;
    const std::atomic<bool>* cancel = nullptr;
};

size_t writeToFile(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchCtx*>(userdata);
    const size_t n = size * nmemb;
    const size_t written = std::fwrite(ptr, 1, n, ctx->out);
    if (written != n) ctx->writeErrno = errno ? errno : ENOSPC;
    return written;
}

int onXferInfo(void* userdata, const curl_off_t dltotal, const curl_off_t dlnow, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<FetchCtx*>(userdata);
    if (ctx->cancel->load()) return 1;   // aborts with CURLE_ABORTED_BY_CALLBACK
    if (*ctx->onProgress) (*ctx->onProgress)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    return 0;
}

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

}

CurlTransport::CurlTransport(config::TransferConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

void CurlTransport::fetch(const std::string& url,
                          const std::filesystem::path& dest,
                          const ByteProgress& onProgress,
                          const std::atomic<bool>& cancel) {
    if (cancel.load()) throw TransferError(TransferError::Kind::Aborted, "Transfer aborted before start");

    errno = 0;
    const std::unique_ptr<std::FILE, FileCloser> out(std::fopen(dest.c_str(), "wb"));
    if (!out) {
        const int err = errno;
        throw TransferError(TransferError::Kind::LocalWrite,
                            fmt::format("Cannot open {} for writing: {}", dest.string(), std::strerror(err)), err);
    }

    FetchCtx ctx{out.get(), 0, &onProgress, &cancel};

    SList headers;
    headers.add("User-Agent: " + cfg_.user_agent);

    CurlEasy h;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
    // Stall detection instead of a total timeout; books can take a long time.
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg_.connect_timeout_seconds * 2));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToFile);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onXferInfo);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);

    const CURLcode res = curl_easy_perform(h);
    long http = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http);

    if (res == CURLE_OK && std::fflush(out.get()) != 0) ctx.writeErrno = errno;

    if (res == CURLE_OK && ctx.writeErrno == 0) {
        Registry::transfer()->debug("[CurlTransport] Fetched {} -> {}", url, dest.string());
        return;
    }

    if (res == CURLE_ABORTED_BY_CALLBACK || cancel.load())
        throw TransferError(TransferError::Kind::Aborted, "Transfer aborted");

    if (res == CURLE_WRITE_ERROR || ctx.writeErrno != 0)
        throw TransferError(TransferError::Kind::LocalWrite,
                            fmt::format("Writing {} failed: {}", dest.string(),
                                        std::strerror(ctx.writeErrno ? ctx.writeErrno : ENOSPC)),
                            ctx.writeErrno ? ctx.writeErrno : ENOSPC);

    if (res == CURLE_HTTP_RETURNED_ERROR)
        throw TransferError(TransferError::Kind::Http, fmt::format("HTTP {} fetching {}", http, url));

    throw TransferError(TransferError::Kind::Network,
                        fmt::format("CURL error {} fetching {}: {}", static_cast<int>(res), url, curl_easy_strerror(res)));
}
