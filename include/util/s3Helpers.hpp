#pragma once

#include <curl/curl.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace aax::config { struct ObjectStorageConfig; }

namespace aax::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// SigV4 Authorization value for a request without a query string. headers must
// already hold every signed header, x-amz-date included, keyed in lowercase.
std::string buildAuthorizationHeader(const config::ObjectStorageConfig& store,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash);
void trimInPlace(std::string& s);

// Case-insensitive lookup of a single response header in a raw header block.
std::optional<std::string> findHeader(const std::string& rawHeaders, const std::string& name);

void ensureCurlGlobalInit();

}
