#pragma once

#include "storage/Probe.hpp"
#include "config/Config.hpp"

namespace aax::storage {

class DeviceProbe final : public Probe {
public:
    explicit DeviceProbe(config::TransferConfig cfg);

    [[nodiscard]] uint64_t availableBytes(const std::filesystem::path& path) const override;

    // HTTP HEAD; a reachable server that omits Content-Length gets the configured default estimate.
    [[nodiscard]] std::optional<uint64_t> estimateRemoteSize(const std::string& url) const override;

private:
    config::TransferConfig cfg_;
};

}
