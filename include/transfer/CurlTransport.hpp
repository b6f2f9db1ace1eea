#pragma once

#include "transfer/Transport.hpp"
#include "config/Config.hpp"

namespace aax::transfer {

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(config::TransferConfig cfg);

    void fetch(const std::string& url,
               const std::filesystem::path& dest,
               const ByteProgress& onProgress,
               const std::atomic<bool>& cancel) override;

private:
    config::TransferConfig cfg_;
};

}
