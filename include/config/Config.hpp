#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace aax::config {

constexpr static uint64_t MB = 1024 * 1024;

struct StorageConfig {
    std::filesystem::path data_dir = "/var/lib/aaxpipe";
    std::filesystem::path transient_dir = "/var/cache/aaxpipe";
    std::string raw_subdir = "aax_files";
    std::string converted_subdir = "converted_books";
    uint64_t download_margin_mb = 100;     // added on top of the remote estimate
    uint64_t fallback_required_mb = 300;   // when the remote size is unknown
    uint64_t move_reserve_mb = 50;         // free space required before moving a finished download
};

enum class BackoffStrategy { Fixed, Exponential };

struct RetryConfig {
    unsigned int max_attempts = 3;
    std::chrono::milliseconds delay{3000};
    BackoffStrategy strategy = BackoffStrategy::Fixed;
    std::chrono::milliseconds max_delay{30000};
    bool jitter = false;
};

struct TransferConfig {
    std::string user_agent = "Audible/671 CFNetwork/1240.0.4 Darwin/20.6.0";
    unsigned int workers = 3;
    unsigned int connect_timeout_seconds = 30;
    std::chrono::milliseconds progress_interval{100};
    uint64_t default_estimate_mb = 200;    // HEAD succeeded but sent no Content-Length
};

struct ValidationConfig {
    double size_tolerance = 0.05;
};

struct ObjectStorageConfig {
    std::string endpoint;
    std::string region = "auto";
    std::string bucket;
    std::string access_key;
    std::string secret_access_key;
    std::string upload_prefix = "UserData/{user}/Uploads/Raw";
    std::string upload_extension = ".m4b";
};

struct BackendConfig {
    std::string functions_base_url;
    std::string process_function = "v1processPrivateM4B";
    std::string metadata_function = "v1updateAAXMetadata";
    unsigned int request_timeout_seconds = 60;
};

struct AuthConfig {
    std::string user_id;
    std::string id_token;
};

struct CodecConfig {
    std::string ffmpeg_path = "ffmpeg";
    std::string ffprobe_path = "ffprobe";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum aaxpipe   = spdlog::level::info;   // startup/shutdown, CLI
    spdlog::level::level_enum pipeline  = spdlog::level::info;   // task lifecycle, stage transitions
    spdlog::level::level_enum transfer  = spdlog::level::info;   // downloads and uploads
    spdlog::level::level_enum cloud     = spdlog::level::warn;   // S3 errors, not routine puts
    spdlog::level::level_enum codec     = spdlog::level::info;   // conversions
    spdlog::level::level_enum storage   = spdlog::level::warn;   // free space, moves, cleanup
    spdlog::level::level_enum remote    = spdlog::level::warn;   // backend calls
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/aaxpipe";
    bool file_sink = true;
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    RetryConfig retry;
    TransferConfig transfer;
    ValidationConfig validation;
    ObjectStorageConfig object_storage;
    BackendConfig backend;
    AuthConfig auth;
    CodecConfig codec;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const RetryConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void to_json(nlohmann::json& j, const ValidationConfig& c);
void to_json(nlohmann::json& j, const ObjectStorageConfig& c);
void to_json(nlohmann::json& j, const BackendConfig& c);
void to_json(nlohmann::json& j, const CodecConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

std::string to_string(BackoffStrategy s);
BackoffStrategy backoffFromString(const std::string& s);

} // namespace aax::config
