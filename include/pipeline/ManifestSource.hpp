#pragma once

#include "pipeline/LicenseSource.hpp"

#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace aax::pipeline {

// Items and their licenses read from a JSON manifest:
//
//   {"items": [{"id": "B0...", "title": "...", "url": "https://...",
//               "key": "hex", "iv": "hex", "protected": true,
//               "remote_progress": 0.0}]}
class ManifestSource final : public LicenseSource, public ItemResolver {
public:
    static std::shared_ptr<ManifestSource> load(const std::filesystem::path& file);

    DownloadLicense fetchLicense(const Item& item) override;
    [[nodiscard]] std::optional<Item> resolve(const std::string& itemId) const override;

    [[nodiscard]] const std::vector<Item>& items() const { return items_; }

private:
    std::vector<Item> items_;
    std::unordered_map<std::string, DownloadLicense> licenses_;
    mutable std::mutex mutex_;
};

}
