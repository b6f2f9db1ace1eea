#include "storage/DeviceProbe.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <sys/statvfs.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

using namespace aax::storage;
using namespace aax::util;
using namespace aax::log;

DeviceProbe::DeviceProbe(config::TransferConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

uint64_t DeviceProbe::availableBytes(const std::filesystem::path& path) const {
    // statvfs needs an existing path; walk up until one is found
    auto probe = path;
    while (!probe.empty() && !std::filesystem::exists(probe) && probe != probe.root_path())
        probe = probe.parent_path();
    if (probe.empty()) probe = std::filesystem::current_path();

    struct statvfs st{};
    if (::statvfs(probe.c_str(), &st) != 0)
        throw std::runtime_error("statvfs failed for " + probe.string() + ": " + std::strerror(errno));

    return static_cast<uint64_t>(st.f_bavail) * static_cast<uint64_t>(st.f_frsize);
}

std::optional<uint64_t> DeviceProbe::estimateRemoteSize(const std::string& url) const {
    SList headers;
    headers.add("User-Agent: " + cfg_.user_agent);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.connect_timeout_seconds));
    });

    if (!resp.ok()) {
        Registry::storage()->warn("[DeviceProbe] HEAD {} failed: {}", url, resp.describe());
        return std::nullopt;
    }

    if (const auto len = resp.header("Content-Length")) {
        try {
            if (const auto bytes = std::stoull(*len); bytes > 0) return bytes;
        } catch (const std::exception& e) {
            Registry::storage()->debug("[DeviceProbe] Unparseable Content-Length '{}': {}", *len, e.what());
        }
    }

    Registry::storage()->debug("[DeviceProbe] No size reported for {}, assuming {}MB", url, cfg_.default_estimate_mb);
    return cfg_.default_estimate_mb * config::MB;
}
