#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace aax::cloud {

// Durable storage for converted books. Blocking; call from pool workers.
class ObjectStore {
public:
    // bytesSent, bytesTotal
    using ProgressFn = std::function<void(uint64_t, uint64_t)>;

    virtual ~ObjectStore() = default;

    // Uploads file under key and returns the object's URL. Throws std::runtime_error
    // on failure, including when cancel is raised mid-transfer.
    virtual std::string put(const std::string& key,
                            const std::filesystem::path& file,
                            const ProgressFn& onProgress,
                            const std::atomic<bool>& cancel) = 0;

    [[nodiscard]] virtual bool exists(const std::string& key) = 0;
};

}
