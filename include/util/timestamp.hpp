#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace aax::util {

// YYYYMMDDTHHMMSSZ, as S3 wants in x-amz-date
inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

}
