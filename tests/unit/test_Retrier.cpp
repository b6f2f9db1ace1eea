#include "pipeline/Retrier.hpp"
#include "fakes.hpp"

#include <boost/asio/post.hpp>
#include <gtest/gtest.h>

#include <type_traits>

using namespace aax;
using namespace aax::pipeline;
using namespace aax::test;
using aax::error::Error;

class RetrierTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    config::RetryConfig cfg{3, std::chrono::milliseconds(1)};

    std::optional<Retrier::Outcome> result;
    int attempts = 0;

    std::shared_ptr<Retrier> make() { return Retrier::create(ioc, cfg, "test"); }

    Retrier::Done record() {
        return [this](Retrier::Outcome o) { result = std::move(o); };
    }

    // Fails with err for the first n attempts, then succeeds.
    Retrier::Attempt failingFor(const int n, const Error& err) {
        return [this, n, err](unsigned int, Retrier::Done done) {
            ++attempts;
            boost::asio::post(ioc, [this, n, err, done] {
                if (attempts <= n) done(err);
                else done(std::nullopt);
            });
        };
    }
};

static_assert(!std::is_constructible_v<Retrier, boost::asio::io_context&, config::RetryConfig, std::string>,
              "Retrier instances come from create()");

TEST_F(RetrierTest, CreatedInstanceIsSharedOwned) {
    const auto r = make();
    EXPECT_EQ(r.use_count(), 1);
    EXPECT_EQ(r->shared_from_this(), r);
}

TEST_F(RetrierTest, SucceedsAfterTransientFailure) {
    const auto r = make();
    r->run(failingFor(1, Error::unknown("flaky")), record());

    ASSERT_TRUE(runUntil(ioc, [&] { return result.has_value(); }));
    EXPECT_FALSE(result->has_value());
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(r->attempts(), 2u);
}

TEST_F(RetrierTest, GivesUpAfterMaxAttempts) {
    const auto r = make();
    r->run(failingFor(10, Error::unknown("down")), record());

    ASSERT_TRUE(runUntil(ioc, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->code(), error::Code::UnknownError);
    EXPECT_EQ(attempts, 3);
}

TEST_F(RetrierTest, NonRetryableErrorStopsImmediately) {
    const auto r = make();
    r->run(failingFor(10, Error::insufficientStorage(600, 300)), record());

    ASSERT_TRUE(runUntil(ioc, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->code(), error::Code::InsufficientStorage);
    EXPECT_EQ(attempts, 1);
}

TEST_F(RetrierTest, FileMoveFailureIsNeverRetried) {
    const auto r = make();
    r->run(failingFor(10, Error::fileMoveFailed("no .aax file found")), record());

    ASSERT_TRUE(runUntil(ioc, [&] { return result.has_value(); }));
    EXPECT_EQ((*result)->code(), error::Code::FileMoveFailed);
    EXPECT_EQ(attempts, 1);
}

TEST_F(RetrierTest, CancelledIsNeverRetried) {
    const auto r = make();
    r->run(failingFor(10, Error::cancelled("Download")), record());

    ASSERT_TRUE(runUntil(ioc, [&] { return result.has_value(); }));
    EXPECT_TRUE((*result)->isCancelled());
    EXPECT_EQ(attempts, 1);
}

TEST_F(RetrierTest, CancelSwallowsLateOutcome) {
    cfg.delay = std::chrono::milliseconds(50);
    const auto r = make();
    r->run(failingFor(10, Error::unknown("down")), record());

    ASSERT_TRUE(runUntil(ioc, [&] { return attempts >= 1; }));
    r->cancel();
    ioc.restart();
    ioc.run_for(std::chrono::milliseconds(150));

    EXPECT_TRUE(r->cancelled());
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(attempts, 1);
}

TEST_F(RetrierTest, FixedDelayIsConstant) {
    cfg.delay = std::chrono::milliseconds(3000);
    const auto r = make();
    EXPECT_EQ(r->delayBefore(2), std::chrono::milliseconds(3000));
    EXPECT_EQ(r->delayBefore(3), std::chrono::milliseconds(3000));
}

TEST_F(RetrierTest, ExponentialDelayDoublesUpToCap) {
    cfg.delay = std::chrono::milliseconds(1000);
    cfg.strategy = config::BackoffStrategy::Exponential;
    cfg.max_delay = std::chrono::milliseconds(5000);
    const auto r = make();

    EXPECT_EQ(r->delayBefore(2), std::chrono::milliseconds(1000));
    EXPECT_EQ(r->delayBefore(3), std::chrono::milliseconds(2000));
    EXPECT_EQ(r->delayBefore(4), std::chrono::milliseconds(4000));
    EXPECT_EQ(r->delayBefore(5), std::chrono::milliseconds(5000));
}

TEST_F(RetrierTest, JitterStaysWithinHalfToFullDelay) {
    cfg.delay = std::chrono::milliseconds(1000);
    cfg.jitter = true;
    const auto r = make();

    for (int i = 0; i < 50; ++i) {
        const auto d = r->delayBefore(2);
        EXPECT_GE(d, std::chrono::milliseconds(500));
        EXPECT_LE(d, std::chrono::milliseconds(1000));
    }
}
