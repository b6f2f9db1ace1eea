#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>

namespace aax::transfer {

// bytesDone, bytesTotal (0 when the server did not say)
using ByteProgress = std::function<void(uint64_t, uint64_t)>;

class TransferError : public std::runtime_error {
public:
    enum class Kind { Network, Http, LocalWrite, Aborted };

    TransferError(const Kind kind, const std::string& message, const int sysErrno = 0)
        : std::runtime_error(message), kind_(kind), errno_(sysErrno) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // errno captured when the local file could not be opened or written
    [[nodiscard]] int sysErrno() const noexcept { return errno_; }

private:
    Kind kind_;
    int errno_;
};

// Blocking HTTP used by the Downloader. Runs on pool workers only.
class Transport {
public:
    virtual ~Transport() = default;

    // Streams url into dest, truncating it first. Polls cancel between chunks and
    // throws TransferError{Aborted} once it is set. Throws TransferError for any
    // other failure; dest may be left partially written.
    virtual void fetch(const std::string& url,
                       const std::filesystem::path& dest,
                       const ByteProgress& onProgress,
                       const std::atomic<bool>& cancel) = 0;
};

}
