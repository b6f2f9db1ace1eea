#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace aax::storage {

// On-disk areas for one item's artifacts:
//   transient/            in-flight downloads ({itemId}.{seq}.part), disposable
//   data/aax_files/       encrypted payloads ({itemId}.aax)
//   data/converted_books/ decrypted output ({itemId}.m4a)
class Layout {
public:
    explicit Layout(config::StorageConfig cfg);

    [[nodiscard]] const std::filesystem::path& transientDir() const { return transient_; }
    [[nodiscard]] const std::filesystem::path& rawDir() const { return raw_; }
    [[nodiscard]] const std::filesystem::path& convertedDir() const { return converted_; }
    [[nodiscard]] const std::filesystem::path& dataDir() const { return cfg_.data_dir; }

    // One name per download attempt, so a cancelled transfer that is still
    // unwinding never shares a file with its replacement.
    [[nodiscard]] std::filesystem::path transientFile(const std::string& itemId, uint64_t seq) const;
    [[nodiscard]] std::filesystem::path rawFile(const std::string& itemId) const;
    [[nodiscard]] std::filesystem::path convertedFile(const std::string& itemId) const;

    [[nodiscard]] bool hasRaw(const std::string& itemId) const;
    [[nodiscard]] bool hasConverted(const std::string& itemId) const;

    void ensureDirectories() const;

    // Every regular file in dir whose name contains itemId.
    [[nodiscard]] static std::vector<std::filesystem::path> filesContaining(const std::filesystem::path& dir,
                                                                            const std::string& itemId);

    static constexpr const char* RAW_EXTENSION = ".aax";
    static constexpr const char* CONVERTED_EXTENSION = ".m4a";
    static constexpr const char* PARTIAL_EXTENSION = ".part";

private:
    config::StorageConfig cfg_;
    std::filesystem::path transient_, raw_, converted_;
};

}
