#pragma once

#include "pipeline/Item.hpp"

#include <optional>
#include <string>

namespace aax::pipeline {

// Where download URLs and decryption material come from. Blocking; called on
// pool workers. Throws std::runtime_error when no license can be obtained.
class LicenseSource {
public:
    virtual ~LicenseSource() = default;
    virtual DownloadLicense fetchLicense(const Item& item) = 0;
};

// Turns a queued item id back into an Item when its turn comes.
class ItemResolver {
public:
    virtual ~ItemResolver() = default;
    [[nodiscard]] virtual std::optional<Item> resolve(const std::string& itemId) const = 0;
};

}
