//----------------------------------------------------------------------------------------------------------------------
#include "Components/Connection/BackoffPolicy.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Connection::BackoffPolicy::Options const Options{
    .base = std::chrono::milliseconds{ 500 },
    .ceiling = std::chrono::seconds{ 30 },
    .limit = 12,
    .jitter = 0.2
};

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(BackoffPolicySuite, NominalDelayTest)
{
    Connection::BackoffPolicy policy{ test::Options, [] () { return 0.0; } };

    std::vector<std::chrono::milliseconds> const expected = {
        std::chrono::milliseconds{ 500 }, std::chrono::milliseconds{ 1'000 }, std::chrono::milliseconds{ 2'000 },
        std::chrono::milliseconds{ 4'000 }, std::chrono::milliseconds{ 8'000 }, std::chrono::milliseconds{ 16'000 },
        std::chrono::milliseconds{ 30'000 }, std::chrono::milliseconds{ 30'000 } };

    for (auto const& delay : expected) {
        auto const optDelay = policy.Next();
        ASSERT_TRUE(optDelay);
        EXPECT_EQ(*optDelay, delay);
    }
    EXPECT_EQ(policy.GetAttempts(), expected.size());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(BackoffPolicySuite, JitterBoundsTest)
{
    // The largest sample removes the full jitter fraction from the nominal delay.
    Connection::BackoffPolicy policy{ test::Options, [] () { return 1.0; } };

    auto const optFirst = policy.Next();
    ASSERT_TRUE(optFirst);
    EXPECT_EQ(*optFirst, std::chrono::milliseconds{ 400 });

    auto const optSecond = policy.Next();
    ASSERT_TRUE(optSecond);
    EXPECT_EQ(*optSecond, std::chrono::milliseconds{ 800 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(BackoffPolicySuite, NonDecreasingTest)
{
    // Alternate between the extremes of the sample range so that the jitter would otherwise produce a shorter delay
    // once the ceiling has been reached.
    bool flip = false;
    Connection::BackoffPolicy policy{ test::Options, [&flip] () { flip = !flip; return flip ? 0.0 : 1.0; } };

    std::chrono::milliseconds previous = std::chrono::milliseconds::zero();
    while (auto const optDelay = policy.Next()) {
        EXPECT_GE(*optDelay, previous);
        EXPECT_LE(*optDelay, test::Options.ceiling);
        EXPECT_GE(optDelay->count(), 1);
        previous = *optDelay;
    }

    EXPECT_EQ(previous, test::Options.ceiling);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(BackoffPolicySuite, DefaultRandomSourceTest)
{
    Connection::BackoffPolicy policy{ test::Options };

    std::chrono::milliseconds previous = std::chrono::milliseconds::zero();
    for (std::uint32_t attempt = 1; attempt <= test::Options.limit; ++attempt) {
        auto const optDelay = policy.Next();
        ASSERT_TRUE(optDelay);
        EXPECT_GE(*optDelay, previous);
        EXPECT_LE(*optDelay, test::Options.ceiling);
        previous = *optDelay;
    }
    EXPECT_GE(previous, std::chrono::milliseconds{ 24'000 }); // The jitter removes at most a fifth of the ceiling.
}

//----------------------------------------------------------------------------------------------------------------------

TEST(BackoffPolicySuite, RetryLimitTest)
{
    Connection::BackoffPolicy policy{
        Connection::BackoffPolicy::Options{
            .base = std::chrono::milliseconds{ 100 }, .ceiling = std::chrono::seconds{ 1 }, .limit = 3, .jitter = 0.0 },
        [] () { return 0.5; } };

    EXPECT_FALSE(policy.IsExhausted());
    EXPECT_EQ(policy.Next(), std::chrono::milliseconds{ 100 });
    EXPECT_EQ(policy.Next(), std::chrono::milliseconds{ 200 });
    EXPECT_EQ(policy.Next(), std::chrono::milliseconds{ 400 });
    EXPECT_TRUE(policy.IsExhausted());
    EXPECT_EQ(policy.GetAttempts(), 3u);

    EXPECT_FALSE(policy.Next());
    EXPECT_FALSE(policy.Next());
    EXPECT_EQ(policy.GetAttempts(), 3u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(BackoffPolicySuite, ResetTest)
{
    Connection::BackoffPolicy policy{
        Connection::BackoffPolicy::Options{
            .base = std::chrono::milliseconds{ 100 }, .ceiling = std::chrono::seconds{ 1 }, .limit = 2, .jitter = 0.0 } };

    EXPECT_TRUE(policy.Next());
    EXPECT_TRUE(policy.Next());
    EXPECT_TRUE(policy.IsExhausted());

    policy.Reset();
    EXPECT_FALSE(policy.IsExhausted());
    EXPECT_EQ(policy.GetAttempts(), 0u);
    EXPECT_EQ(policy.Next(), std::chrono::milliseconds{ 100 }); // The delays restart from the base delay.
}

//----------------------------------------------------------------------------------------------------------------------
