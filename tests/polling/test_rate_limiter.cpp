#include "rfsync/core/clock.h"
#include "rfsync/core/configuration.h"
#include "rfsync/core/errors.h"
#include "rfsync/polling/rate_limiter.h"

#include <gtest/gtest.h>

using namespace rfsync;
using namespace std::chrono_literals;

class TokenBucketTest : public ::testing::Test {
protected:
    void SetUp() override { clock_ = std::make_shared<core::ManualClock>(); }

    std::shared_ptr<core::ManualClock> clock_;
};

TEST_F(TokenBucketTest, StartsFullAndRefillsOverTime) {
    polling::TokenBucket bucket(2.0, 1.0, clock_);
    EXPECT_TRUE(bucket.tryAcquire());
    EXPECT_TRUE(bucket.tryAcquire());
    EXPECT_FALSE(bucket.tryAcquire());

    clock_->advance(500ms);
    EXPECT_FALSE(bucket.tryAcquire());
    clock_->advance(500ms);
    EXPECT_TRUE(bucket.tryAcquire());

    clock_->advance(10s);
    EXPECT_DOUBLE_EQ(bucket.available(), 2.0);
}

TEST_F(TokenBucketTest, AcquireGivesUpWhenTheWaitExceedsTheTimeout) {
    polling::TokenBucket bucket(1.0, 1.0, clock_);
    ASSERT_TRUE(bucket.tryAcquire());

    auto before = clock_->monotonic();
    EXPECT_FALSE(bucket.acquire(500ms));
    EXPECT_EQ(clock_->monotonic(), before);
}

TEST_F(TokenBucketTest, AcquireWaitsForARefill) {
    polling::TokenBucket bucket(1.0, 2.0, clock_);
    ASSERT_TRUE(bucket.tryAcquire());

    auto before = clock_->monotonic();
    EXPECT_TRUE(bucket.acquire(2s));
    EXPECT_EQ(clock_->monotonic() - before, std::chrono::nanoseconds(500ms));
    EXPECT_FALSE(bucket.tryAcquire());
}

TEST_F(TokenBucketTest, RequestsLargerThanCapacityNeverSucceed) {
    polling::TokenBucket bucket(2.0, 1.0, clock_);
    EXPECT_FALSE(bucket.acquire(1h, 3.0));
}

TEST_F(TokenBucketTest, RejectsNonPositiveSettings) {
    EXPECT_THROW(polling::TokenBucket(0.0, 1.0, clock_), core::ConfigurationError);
    EXPECT_THROW(polling::TokenBucket(1.0, 0.0, clock_), core::ConfigurationError);
}

TEST_F(TokenBucketTest, RegistryKeepsVendorsIndependent) {
    core::SyncConfig config;
    core::VendorConfig alpha;
    alpha.code = "alpha";
    alpha.rateLimitCapacity = 1.0;
    alpha.rateLimitRefillPerSecond = 0.1;
    core::VendorConfig beta = alpha;
    beta.code = "beta";
    config.vendors = {alpha, beta};

    auto registry = polling::RateLimiterRegistry::fromConfig(config, clock_);
    EXPECT_TRUE(registry->acquire("alpha", 0ms));
    EXPECT_FALSE(registry->acquire("alpha", 0ms));
    EXPECT_TRUE(registry->acquire("beta", 0ms));
    EXPECT_THROW(registry->acquireOrThrow("alpha", 100ms), core::RateLimitExceeded);

    // Vendors without a bucket are not limited
    EXPECT_EQ(registry->bucket("gamma"), nullptr);
    EXPECT_TRUE(registry->acquire("gamma", 0ms));
}
