#include "pipeline/Validator.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <cmath>

using namespace aax::pipeline;
using namespace aax::error;
using namespace aax::log;
namespace fs = std::filesystem;

Validator::Validator(config::ValidationConfig cfg) : cfg_(cfg) {}

bool Validator::validateConvertedArtifact(const fs::path& original, const fs::path& converted) const {
    std::error_code ec;
    if (!fs::is_regular_file(original, ec)) throw Error::uploadFailed("Original file not found: " + original.string());
    if (!fs::is_regular_file(converted, ec)) throw Error::uploadFailed("Converted file not found: " + converted.string());

    const auto originalSize = fs::file_size(original, ec);
    if (ec) throw Error::uploadFailed("Unable to read size of " + original.string());
    const auto convertedSize = fs::file_size(converted, ec);
    if (ec) throw Error::uploadFailed("Unable to read size of " + converted.string());

    const auto lower = static_cast<double>(originalSize) * (1.0 - cfg_.size_tolerance);
    const auto upper = static_cast<double>(originalSize) * (1.0 + cfg_.size_tolerance);
    const auto size = static_cast<double>(convertedSize);

    Registry::pipeline()->debug("[Validator] Original {} bytes, converted {} bytes, valid range {:.0f}-{:.0f}",
                                originalSize, convertedSize, lower, upper);

    if (size >= lower && size <= upper) return true;

    const double diff = originalSize == 0 ? 100.0
        : std::abs(size - static_cast<double>(originalSize)) / static_cast<double>(originalSize) * 100.0;
    Registry::pipeline()->warn("[Validator] {} looks corrupted ({:.1f}% size difference), deleting it",
                               converted.string(), diff);

    fs::remove(converted, ec);
    if (ec) Registry::pipeline()->error("[Validator] Could not delete {}: {}", converted.string(), ec.message());
    return false;
}
