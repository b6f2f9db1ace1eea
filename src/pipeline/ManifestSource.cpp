#include "pipeline/ManifestSource.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace aax::pipeline;
using namespace aax::log;
using json = nlohmann::json;

std::shared_ptr<ManifestSource> ManifestSource::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("Cannot open manifest " + file.string());

    const auto doc = json::parse(in);
    auto src = std::make_shared<ManifestSource>();

    for (const auto& entry : doc.at("items")) {
        Item item;
        item.id = entry.at("id").get<std::string>();
        item.title = entry.value("title", item.id);
        item.isProtected = entry.value("protected", true);
        if (entry.contains("remote_progress") && entry["remote_progress"].is_number())
            item.remoteProgress = entry["remote_progress"].get<double>();

        if (item.id.empty()) throw std::runtime_error("Manifest entry without an id in " + file.string());

        // Licenses stay untyped here; key/iv are only validated when the download starts.
        src->licenses_[item.id] = {entry.value("url", std::string()),
                                   entry.value("key", std::string()),
                                   entry.value("iv", std::string())};
        src->items_.push_back(std::move(item));
    }

    Registry::aaxpipe()->info("[ManifestSource] Loaded {} item(s) from {}", src->items_.size(), file.string());
    return src;
}

DownloadLicense ManifestSource::fetchLicense(const Item& item) {
    std::scoped_lock lock(mutex_);
    const auto it = licenses_.find(item.id);
    if (it == licenses_.end()) throw std::runtime_error("No license for " + item.id);
    if (it->second.url.empty()) throw std::runtime_error("License for " + item.id + " has no download URL");
    return it->second;
}

std::optional<Item> ManifestSource::resolve(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    for (const auto& item : items_)
        if (item.id == itemId) return item;
    return std::nullopt;
}
