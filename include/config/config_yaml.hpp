#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace aax::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["data_dir"] = rhs.data_dir.string();
        node["transient_dir"] = rhs.transient_dir.string();
        node["raw_subdir"] = rhs.raw_subdir;
        node["converted_subdir"] = rhs.converted_subdir;
        node["download_margin_mb"] = rhs.download_margin_mb;
        node["fallback_required_mb"] = rhs.fallback_required_mb;
        node["move_reserve_mb"] = rhs.move_reserve_mb;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = node["data_dir"].as<std::string>("/var/lib/aaxpipe");
        rhs.transient_dir = node["transient_dir"].as<std::string>("/var/cache/aaxpipe");
        rhs.raw_subdir = node["raw_subdir"].as<std::string>("aax_files");
        rhs.converted_subdir = node["converted_subdir"].as<std::string>("converted_books");
        rhs.download_margin_mb = node["download_margin_mb"].as<uint64_t>(100);
        rhs.fallback_required_mb = node["fallback_required_mb"].as<uint64_t>(300);
        rhs.move_reserve_mb = node["move_reserve_mb"].as<uint64_t>(50);
        return true;
    }
};

template<>
struct convert<RetryConfig> {
    static Node encode(const RetryConfig& rhs) {
        Node node;
        node["max_attempts"] = rhs.max_attempts;
        node["delay_ms"] = rhs.delay.count();
        node["strategy"] = aax::config::to_string(rhs.strategy);
        node["max_delay_ms"] = rhs.max_delay.count();
        node["jitter"] = rhs.jitter;
        return node;
    }

    static bool decode(const Node& node, RetryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(3);
        if (rhs.max_attempts == 0) rhs.max_attempts = 1;
        rhs.delay = std::chrono::milliseconds(node["delay_ms"].as<long>(3000));
        rhs.strategy = backoffFromString(node["strategy"].as<std::string>("fixed"));
        rhs.max_delay = std::chrono::milliseconds(node["max_delay_ms"].as<long>(30000));
        rhs.jitter = node["jitter"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["user_agent"] = rhs.user_agent;
        node["workers"] = rhs.workers;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["progress_interval_ms"] = rhs.progress_interval.count();
        node["default_estimate_mb"] = rhs.default_estimate_mb;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.user_agent = node["user_agent"].as<std::string>(rhs.user_agent);
        rhs.workers = node["workers"].as<unsigned int>(3);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(30);
        rhs.progress_interval = std::chrono::milliseconds(node["progress_interval_ms"].as<long>(100));
        rhs.default_estimate_mb = node["default_estimate_mb"].as<uint64_t>(200);
        return true;
    }
};

template<>
struct convert<ValidationConfig> {
    static Node encode(const ValidationConfig& rhs) {
        Node node;
        node["size_tolerance"] = rhs.size_tolerance;
        return node;
    }

    static bool decode(const Node& node, ValidationConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.size_tolerance = node["size_tolerance"].as<double>(0.05);
        return true;
    }
};

template<>
struct convert<ObjectStorageConfig> {
    static Node encode(const ObjectStorageConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["access_key"] = rhs.access_key;
        node["upload_prefix"] = rhs.upload_prefix;
        node["upload_extension"] = rhs.upload_extension;
        return node;
    }

    static bool decode(const Node& node, ObjectStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("auto");
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        rhs.upload_prefix = node["upload_prefix"].as<std::string>("UserData/{user}/Uploads/Raw");
        rhs.upload_extension = node["upload_extension"].as<std::string>(".m4b");
        return true;
    }
};

template<>
struct convert<BackendConfig> {
    static Node encode(const BackendConfig& rhs) {
        Node node;
        node["functions_base_url"] = rhs.functions_base_url;
        node["process_function"] = rhs.process_function;
        node["metadata_function"] = rhs.metadata_function;
        node["request_timeout_seconds"] = rhs.request_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, BackendConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.functions_base_url = node["functions_base_url"].as<std::string>("");
        rhs.process_function = node["process_function"].as<std::string>("v1processPrivateM4B");
        rhs.metadata_function = node["metadata_function"].as<std::string>("v1updateAAXMetadata");
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(60);
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.user_id = node["user_id"].as<std::string>("");
        rhs.id_token = node["id_token"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<CodecConfig> {
    static Node encode(const CodecConfig& rhs) {
        Node node;
        node["ffmpeg_path"] = rhs.ffmpeg_path;
        node["ffprobe_path"] = rhs.ffprobe_path;
        return node;
    }

    static bool decode(const Node& node, CodecConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ffmpeg_path = node["ffmpeg_path"].as<std::string>("ffmpeg");
        rhs.ffprobe_path = node["ffprobe_path"].as<std::string>("ffprobe");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["aaxpipe"]  = to_std_string(spdlog::level::to_string_view(rhs.aaxpipe));
        node["pipeline"] = to_std_string(spdlog::level::to_string_view(rhs.pipeline));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["cloud"]    = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["codec"]    = to_std_string(spdlog::level::to_string_view(rhs.codec));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.aaxpipe = spdlog::level::from_str(node["aaxpipe"].as<std::string>("info"));
        rhs.pipeline = spdlog::level::from_str(node["pipeline"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.codec = spdlog::level::from_str(node["codec"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["file_sink"] = rhs.file_sink;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/aaxpipe");
        rhs.file_sink = node["file_sink"].as<bool>(true);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
