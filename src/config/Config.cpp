#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace aax::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["retry"]) YAML::convert<RetryConfig>::decode(node, cfg.retry);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["validation"]) YAML::convert<ValidationConfig>::decode(node, cfg.validation);
    if (auto node = root["object_storage"]) YAML::convert<ObjectStorageConfig>::decode(node, cfg.object_storage);
    if (auto node = root["backend"]) YAML::convert<BackendConfig>::decode(node, cfg.backend);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);
    if (auto node = root["codec"]) YAML::convert<CodecConfig>::decode(node, cfg.codec);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.validation.size_tolerance < 0.0 || cfg.validation.size_tolerance >= 1.0)
        throw std::runtime_error("validation.size_tolerance must lie in [0, 1)");

    return cfg;
}

std::string to_string(const BackoffStrategy s) {
    switch (s) {
        case BackoffStrategy::Fixed: return "fixed";
        case BackoffStrategy::Exponential: return "exponential";
    }
    return "fixed";
}

BackoffStrategy backoffFromString(const std::string& s) {
    if (s == "fixed") return BackoffStrategy::Fixed;
    if (s == "exponential") return BackoffStrategy::Exponential;
    throw std::runtime_error("Unknown retry strategy: " + s);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"retry", c.retry},
        {"transfer", c.transfer},
        {"validation", c.validation},
        {"object_storage", c.object_storage},
        {"backend", c.backend},
        {"auth", {{"user_id", c.auth.user_id}, {"signed_in", !c.auth.id_token.empty()}}},
        {"codec", c.codec},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"data_dir", c.data_dir.string()},
        {"transient_dir", c.transient_dir.string()},
        {"raw_subdir", c.raw_subdir},
        {"converted_subdir", c.converted_subdir},
        {"download_margin_mb", c.download_margin_mb},
        {"fallback_required_mb", c.fallback_required_mb},
        {"move_reserve_mb", c.move_reserve_mb}
    };
}

void to_json(nlohmann::json& j, const RetryConfig& c) {
    j = {
        {"max_attempts", c.max_attempts},
        {"delay_ms", c.delay.count()},
        {"strategy", to_string(c.strategy)},
        {"max_delay_ms", c.max_delay.count()},
        {"jitter", c.jitter}
    };
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"user_agent", c.user_agent},
        {"workers", c.workers},
        {"connect_timeout_seconds", c.connect_timeout_seconds},
        {"progress_interval_ms", c.progress_interval.count()},
        {"default_estimate_mb", c.default_estimate_mb}
    };
}

void to_json(nlohmann::json& j, const ValidationConfig& c) {
    j = {{"size_tolerance", c.size_tolerance}};
}

void to_json(nlohmann::json& j, const ObjectStorageConfig& c) {
    // secret_access_key is never serialized
    j = {
        {"endpoint", c.endpoint},
        {"region", c.region},
        {"bucket", c.bucket},
        {"access_key", c.access_key},
        {"upload_prefix", c.upload_prefix},
        {"upload_extension", c.upload_extension}
    };
}

void to_json(nlohmann::json& j, const BackendConfig& c) {
    j = {
        {"functions_base_url", c.functions_base_url},
        {"process_function", c.process_function},
        {"metadata_function", c.metadata_function},
        {"request_timeout_seconds", c.request_timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const CodecConfig& c) {
    j = {
        {"ffmpeg_path", c.ffmpeg_path},
        {"ffprobe_path", c.ffprobe_path}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto lvl = [](const spdlog::level::level_enum l) {
        const auto sv = spdlog::level::to_string_view(l);
        return std::string(sv.data(), sv.size());
    };

    const auto& sub = c.levels.subsystem_levels;
    j = {
        {"log_dir", c.log_dir.string()},
        {"file_sink", c.file_sink},
        {"log_levels", {
            {"console_log_level", lvl(c.levels.console_log_level)},
            {"file_log_level", lvl(c.levels.file_log_level)},
            {"subsystem_levels", {
                {"aaxpipe", lvl(sub.aaxpipe)},
                {"pipeline", lvl(sub.pipeline)},
                {"transfer", lvl(sub.transfer)},
                {"cloud", lvl(sub.cloud)},
                {"codec", lvl(sub.codec)},
                {"storage", lvl(sub.storage)},
                {"remote", lvl(sub.remote)}
            }}
        }}
    };
}

} // namespace aax::config
