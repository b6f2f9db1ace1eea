#include "pipeline/Retrier.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <random>

using namespace aax::pipeline;
using namespace aax::log;

std::shared_ptr<Retrier> Retrier::create(boost::asio::io_context& ioc, config::RetryConfig cfg, std::string label) {
    return std::make_shared<Retrier>(Token{}, ioc, std::move(cfg), std::move(label));
}

Retrier::Retrier(Token, boost::asio::io_context& ioc, config::RetryConfig cfg, std::string label)
    : timer_(ioc), cfg_(std::move(cfg)), label_(std::move(label)) {
    if (cfg_.max_attempts == 0) cfg_.max_attempts = 1;
}

void Retrier::run(Attempt attempt, Done onDone) {
    attemptFn_ = std::move(attempt);
    onDone_ = std::move(onDone);
    attempt_ = 0;
    next();
}

void Retrier::cancel() {
    if (cancelled_ || finished_) return;
    cancelled_ = true;
    timer_.cancel();
    Registry::pipeline()->debug("[Retrier] {} cancelled after {} attempt(s)", label_, attempt_);
}

std::chrono::milliseconds Retrier::delayBefore(const unsigned int nextAttempt) const {
    auto delay = cfg_.delay;

    if (cfg_.strategy == config::BackoffStrategy::Exponential && nextAttempt > 1) {
        const auto shift = std::min(nextAttempt - 2, 20u);
        delay = std::min<std::chrono::milliseconds>(
            std::chrono::milliseconds(cfg_.delay.count() * (int64_t{1} << shift)), cfg_.max_delay);
    }

    if (cfg_.jitter && delay.count() > 0) {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.5, 1.0);
        delay = std::chrono::milliseconds(static_cast<long long>(static_cast<double>(delay.count()) * dist(rng)));
    }

    return delay;
}

void Retrier::next() {
    const unsigned int attempt = ++attempt_;
    Registry::pipeline()->debug("[Retrier] {} attempt {}/{}", label_, attempt, cfg_.max_attempts);

    attemptFn_(attempt, [self = shared_from_this(), attempt](Outcome outcome) {
        self->handle(attempt, std::move(outcome));
    });
}

void Retrier::handle(const unsigned int attempt, Outcome outcome) {
    // A stale or duplicate report, or one arriving after cancel()
    if (cancelled_ || finished_ || attempt != attempt_) return;

    if (!outcome) {
        finished_ = true;
        onDone_(std::nullopt);
        return;
    }

    const auto& err = *outcome;
    if (!err.retryable() || attempt >= cfg_.max_attempts) {
        if (err.retryable())
            Registry::pipeline()->error("[Retrier] {} failed after {} attempts: {}", label_, attempt, err.what());
        finished_ = true;
        onDone_(std::move(outcome));
        return;
    }

    const auto delay = delayBefore(attempt + 1);
    Registry::pipeline()->warn("[Retrier] {} attempt {} failed: {}. Retrying in {}ms ({}/{})",
                               label_, attempt, err.what(), delay.count(), attempt + 1, cfg_.max_attempts);

    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || self->cancelled_) return;
        self->next();
    });
}
