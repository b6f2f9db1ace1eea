#pragma once

#include "codec/EncryptionMaterial.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace aax::codec {

// Keeps the material of downloaded items on disk so a conversion can resume
// after a restart without asking for the license again.
class MaterialStore {
public:
    explicit MaterialStore(std::filesystem::path file);

    void put(const std::string& itemId, const EncryptionMaterial& material);
    [[nodiscard]] std::optional<EncryptionMaterial> get(const std::string& itemId) const;
    [[nodiscard]] bool contains(const std::string& itemId) const;
    void remove(const std::string& itemId);
    void clear();

private:
    std::filesystem::path file_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, EncryptionMaterial> entries_;

    void load();
    void flush() const;
};

}
