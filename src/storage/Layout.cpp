#include "storage/Layout.hpp"

#include <string>

using namespace aax::storage;
namespace fs = std::filesystem;

Layout::Layout(config::StorageConfig cfg)
    : cfg_(std::move(cfg)),
      transient_(cfg_.transient_dir),
      raw_(cfg_.data_dir / cfg_.raw_subdir),
      converted_(cfg_.data_dir / cfg_.converted_subdir) {}

fs::path Layout::transientFile(const std::string& itemId, const uint64_t seq) const {
    return transient_ / (itemId + "." + std::to_string(seq) + PARTIAL_EXTENSION);
}

fs::path Layout::rawFile(const std::string& itemId) const {
    return raw_ / (itemId + RAW_EXTENSION);
}

fs::path Layout::convertedFile(const std::string& itemId) const {
    return converted_ / (itemId + CONVERTED_EXTENSION);
}

bool Layout::hasRaw(const std::string& itemId) const {
    std::error_code ec;
    return fs::is_regular_file(rawFile(itemId), ec);
}

bool Layout::hasConverted(const std::string& itemId) const {
    std::error_code ec;
    return fs::is_regular_file(convertedFile(itemId), ec);
}

void Layout::ensureDirectories() const {
    fs::create_directories(transient_);
    fs::create_directories(raw_);
    fs::create_directories(converted_);
}

std::vector<fs::path> Layout::filesContaining(const fs::path& dir, const std::string& itemId) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().filename().string().find(itemId) != std::string::npos) out.push_back(entry.path());
    }
    return out;
}
