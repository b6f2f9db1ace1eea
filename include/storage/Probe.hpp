#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace aax::storage {

// Answers the two questions asked before a download may start: how much room
// is left on the device, and how large the remote artifact is going to be.
class Probe {
public:
    virtual ~Probe() = default;

    // Free bytes on the filesystem holding path. Throws std::runtime_error when
    // the filesystem cannot be queried.
    [[nodiscard]] virtual uint64_t availableBytes(const std::filesystem::path& path) const = 0;

    // Size of the remote artifact in bytes, or nullopt when it cannot be learned.
    [[nodiscard]] virtual std::optional<uint64_t> estimateRemoteSize(const std::string& url) const = 0;
};

}
