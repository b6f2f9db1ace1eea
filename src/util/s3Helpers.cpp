#include "util/s3Helpers.hpp"
#include "config/Config.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace aax::util {

namespace {

std::string toHex(const unsigned char* bytes, const size_t n) {
    std::ostringstream oss;
    for (size_t i = 0; i < n; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return oss.str();
}

}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    const auto sig = hmacSha256Raw(rawKey, data);
    return toHex(reinterpret_cast<const unsigned char*>(sig.data()), sig.size());
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p) {
    std::ostringstream out;
    bool first = true;
    for (const auto& part : p) {
        if (!first) out << '/';
        first = false;

        const std::string seg = part.string();
        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("Failed to escape object key segment: " + seg);
        out << esc;
        curl_free(esc);
    }
    return out.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string buildAuthorizationHeader(const config::ObjectStorageConfig& store,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash) {
    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8);

    // headers is an ordered map, so these come out sorted as SigV4 requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end()) signedHeaders += ";";
    }

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << "\n"   // empty query
                     << canonicalHeaders << "\n"
                     << signedHeaders << "\n"
                     << payloadHash;

    const std::string credentialScope = dateStamp + "/" + store.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSign;
    stringToSign << algorithm << "\n"
                 << amzDate << "\n"
                 << credentialScope << "\n"
                 << sha256Hex(canonicalRequest.str());

    const std::string kDate    = hmacSha256Raw("AWS4" + store.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, store.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSign.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << store.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

std::optional<std::string> findHeader(const std::string& rawHeaders, const std::string& name) {
    const auto lower = [](std::string v) {
        std::ranges::transform(v, v.begin(), [](const unsigned char c) { return std::tolower(c); });
        return v;
    };

    const auto wanted = lower(name);
    std::optional<std::string> found;

    // Redirects produce several header blocks; the last match wins.
    std::istringstream stream(rawHeaders);
    std::string line;
    while (std::getline(stream, line)) {
        const auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        trimInPlace(key);
        if (lower(key) != wanted) continue;
        std::string value = line.substr(pos + 1);
        trimInPlace(value);
        found = std::move(value);
    }

    return found;
}

}
