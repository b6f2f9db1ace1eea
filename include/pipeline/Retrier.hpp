#pragma once

#include "config/Config.hpp"
#include "error/Error.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace aax::pipeline {

// Runs one stage until it succeeds, hits a non-retryable error or exhausts
// its attempts, waiting on a steady_timer between attempts. Lives on the
// io_context thread.
class Retrier : public std::enable_shared_from_this<Retrier> {
    // Constructible only through create()
    struct Token {
        explicit Token() = default;
    };

public:
    using Outcome = std::optional<error::Error>;          // nullopt on success
    using Done = std::function<void(Outcome)>;
    using Attempt = std::function<void(unsigned int attempt, Done done)>;

    static std::shared_ptr<Retrier> create(boost::asio::io_context& ioc,
                                           config::RetryConfig cfg,
                                           std::string label);

    Retrier(Token, boost::asio::io_context& ioc, config::RetryConfig cfg, std::string label);

    // onDone fires exactly once unless cancel() is called first.
    void run(Attempt attempt, Done onDone);

    // Stops the backoff timer and swallows whatever the in-flight attempt reports.
    void cancel();

    [[nodiscard]] unsigned int attempts() const { return attempt_; }
    [[nodiscard]] bool cancelled() const { return cancelled_; }

    [[nodiscard]] std::chrono::milliseconds delayBefore(unsigned int nextAttempt) const;

private:
    boost::asio::steady_timer timer_;
    config::RetryConfig cfg_;
    std::string label_;

    Attempt attemptFn_;
    Done onDone_;
    unsigned int attempt_ = 0;
    bool cancelled_ = false;
    bool finished_ = false;

    void next();
    void handle(unsigned int attempt, Outcome outcome);
};

}
