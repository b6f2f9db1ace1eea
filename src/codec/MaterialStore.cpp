#include "codec/MaterialStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace aax::codec;
using namespace aax::log;
using json = nlohmann::json;
namespace fs = std::filesystem;

MaterialStore::MaterialStore(fs::path file) : file_(std::move(file)) {
    load();
}

void MaterialStore::load() {
    std::error_code ec;
    if (!fs::exists(file_, ec)) return;

    std::ifstream in(file_);
    if (!in) throw std::runtime_error("Cannot read material store " + file_.string());

    const auto doc = json::parse(in);
    for (const auto& [itemId, entry] : doc.items()) {
        try {
            entries_.insert_or_assign(itemId, EncryptionMaterial::parse(entry.at("key").get<std::string>(),
                                                                        entry.at("iv").get<std::string>()));
        } catch (const std::exception& e) {
            Registry::codec()->warn("[MaterialStore] Discarding unreadable entry for {}: {}", itemId, e.what());
        }
    }

    Registry::codec()->debug("[MaterialStore] Loaded {} entries from {}", entries_.size(), file_.string());
}

void MaterialStore::flush() const {
    json doc = json::object();
    for (const auto& [itemId, m] : entries_) doc[itemId] = {{"key", m.keyHex()}, {"iv", m.ivHex()}};

    if (file_.has_parent_path()) fs::create_directories(file_.parent_path());

    const auto tmp = fs::path(file_.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot write material store " + tmp.string());
        out << doc.dump(2);
        if (!out) throw std::runtime_error("Failed writing material store " + tmp.string());
    }
    fs::rename(tmp, file_);
}

void MaterialStore::put(const std::string& itemId, const EncryptionMaterial& material) {
    std::scoped_lock lock(mutex_);
    entries_.insert_or_assign(itemId, material);
    flush();
}

std::optional<EncryptionMaterial> MaterialStore::get(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = entries_.find(itemId); it != entries_.end()) return it->second;
    return std::nullopt;
}

bool MaterialStore::contains(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    return entries_.contains(itemId);
}

void MaterialStore::remove(const std::string& itemId) {
    std::scoped_lock lock(mutex_);
    if (entries_.erase(itemId) > 0) flush();
}

void MaterialStore::clear() {
    std::scoped_lock lock(mutex_);
    entries_.clear();
    flush();
}
