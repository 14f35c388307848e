#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "docwire/write/rate_limiter.hpp"

using namespace docwire;
using namespace std::chrono_literals;

namespace {

    const RateLimiter::Clock::time_point kStart{};

    RateLimiter make_limiter(double max = 10000) {
        return RateLimiter(500, 1.5, 5min, max, kStart);
    }

    TEST(RateLimiterTest, ConsumesTokens) {
        auto limiter = make_limiter();
        EXPECT_TRUE(limiter.try_make_request(500, kStart));
        EXPECT_FALSE(limiter.try_make_request(1, kStart));
        EXPECT_EQ(limiter.available_tokens(), 0);
    }

    TEST(RateLimiterTest, RefillsOverTime) {
        auto limiter = make_limiter();
        EXPECT_TRUE(limiter.try_make_request(500, kStart));
        EXPECT_FALSE(limiter.try_make_request(100, kStart + 100ms));
        EXPECT_TRUE(limiter.try_make_request(100, kStart + 200ms));
    }

    TEST(RateLimiterTest, NextRequestDelay) {
        auto limiter = make_limiter();
        EXPECT_EQ(limiter.next_request_delay(500, kStart), 0ms);
        EXPECT_TRUE(limiter.try_make_request(500, kStart));
        EXPECT_EQ(limiter.next_request_delay(100, kStart), 200ms);
        EXPECT_EQ(limiter.next_request_delay(100, kStart + 200ms), 0ms);

        // More than the capacity can never be sent.
        EXPECT_FALSE(limiter.next_request_delay(501, kStart + 200ms).has_value());
    }

    TEST(RateLimiterTest, CapacityRampsUpEveryFiveMinutes) {
        auto limiter = make_limiter();
        EXPECT_EQ(limiter.calculate_capacity(kStart), 500);
        EXPECT_EQ(limiter.calculate_capacity(kStart + 4min), 500);
        EXPECT_EQ(limiter.calculate_capacity(kStart + 5min), 750);
        EXPECT_EQ(limiter.calculate_capacity(kStart + 10min), 1125);
        EXPECT_EQ(limiter.calculate_capacity(kStart + 15min), 1687);
        EXPECT_EQ(limiter.calculate_capacity(kStart + 90min), 10000);
    }

    TEST(RateLimiterTest, CapacityIsCappedAtMaximum) {
        auto limiter = make_limiter(1000);
        EXPECT_EQ(limiter.calculate_capacity(kStart + 10min), 1000);
        EXPECT_EQ(limiter.maximum_capacity(), 1000);
    }

    TEST(RateLimiterTest, TimeGoingBackwardsThrows) {
        auto limiter = make_limiter();
        EXPECT_TRUE(limiter.try_make_request(1, kStart + 1s));
        EXPECT_THROW(limiter.try_make_request(1, kStart), std::invalid_argument);
    }

}  // namespace
