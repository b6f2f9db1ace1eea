#pragma once

#include <chrono>
#include <cstdint>

namespace aax::transfer {

// Rate limits progress pushes from a worker thread. Single writer.
class ProgressThrottle {
public:
    explicit ProgressThrottle(const std::chrono::milliseconds interval) : interval_(interval) {}

    // True when enough time has passed since the last accepted push, or on completion.
    bool admit(const uint64_t done, const uint64_t total) {
        const auto now = std::chrono::steady_clock::now();
        const bool finished = total > 0 && done >= total;
        if (!finished && started_ && now - last_ < interval_) return false;
        if (done == lastDone_ && started_) return false;
        started_ = true;
        last_ = now;
        lastDone_ = done;
        return true;
    }

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_{};
    uint64_t lastDone_ = 0;
    bool started_ = false;
};

}
