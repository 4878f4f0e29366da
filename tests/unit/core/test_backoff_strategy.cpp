#include <gtest/gtest.h>
#include "core/backoff/backoff_strategy.h"

#include <vector>

using namespace tradecast::backoff;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

BackoffOptions options(milliseconds initial, milliseconds max, double multiplier,
                       BackoffType type = BackoffType::EXPONENTIAL) {
    BackoffOptions o;
    o.type = type;
    o.initial_delay = initial;
    o.max_delay = max;
    o.multiplier = multiplier;
    return o;
}

}  // namespace

// ============================================================================
// EXPONENTIAL
// ============================================================================

TEST(ExponentialBackoff, DefaultSequenceDoublesUpToCap) {
    ExponentialBackoffStrategy strategy(BackoffOptions{});

    const std::vector<milliseconds> expected = {
        seconds(5), seconds(10), seconds(20), seconds(40), seconds(80),
        seconds(160), seconds(300), seconds(300)
    };
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(strategy.get_delay(static_cast<int>(i) + 1), expected[i]) << "attempt " << i + 1;
    }
}

TEST(ExponentialBackoff, FirstAttemptUsesInitialDelay) {
    ExponentialBackoffStrategy strategy(options(milliseconds(250), seconds(10), 3.0));
    EXPECT_EQ(strategy.get_delay(1), milliseconds(250));
    EXPECT_EQ(strategy.get_delay(2), milliseconds(750));
}

TEST(ExponentialBackoff, HugeAttemptNumbersStayAtMax) {
    ExponentialBackoffStrategy strategy(options(seconds(1), seconds(30), 2.0));
    EXPECT_EQ(strategy.get_delay(64), seconds(30));
    EXPECT_EQ(strategy.get_delay(5000), seconds(30));
}

TEST(ExponentialBackoff, MultiplierOfOneIsConstant) {
    ExponentialBackoffStrategy strategy(options(seconds(2), seconds(30), 1.0));
    EXPECT_EQ(strategy.get_delay(1), seconds(2));
    EXPECT_EQ(strategy.get_delay(10), seconds(2));
}

TEST(ExponentialBackoff, IsPure) {
    ExponentialBackoffStrategy strategy(BackoffOptions{});
    EXPECT_EQ(strategy.get_delay(3), strategy.get_delay(3));
}

TEST(ExponentialBackoff, RejectsAttemptBelowOne) {
    ExponentialBackoffStrategy strategy(BackoffOptions{});
    EXPECT_THROW(strategy.get_delay(0), std::invalid_argument);
    EXPECT_THROW(strategy.get_delay(-3), std::invalid_argument);
}

// ============================================================================
// LINEAR
// ============================================================================

TEST(LinearBackoff, GrowsByInitialEachAttempt) {
    LinearBackoffStrategy strategy(options(seconds(5), seconds(12), 2.0, BackoffType::LINEAR));
    EXPECT_EQ(strategy.get_delay(1), seconds(5));
    EXPECT_EQ(strategy.get_delay(2), seconds(10));
    EXPECT_EQ(strategy.get_delay(3), seconds(12));
}

// ============================================================================
// OPTIONS & FACTORY
// ============================================================================

TEST(BackoffOptions, Validation) {
    EXPECT_NO_THROW(BackoffOptions{}.validate());
    EXPECT_THROW(options(milliseconds(0), seconds(1), 2.0).validate(), std::invalid_argument);
    EXPECT_THROW(options(seconds(10), seconds(1), 2.0).validate(), std::invalid_argument);
    EXPECT_THROW(options(seconds(1), seconds(10), 0.5).validate(), std::invalid_argument);
}

TEST(BackoffFactory, BuildsRequestedType) {
    auto exponential = make_backoff_strategy(options(seconds(1), seconds(100), 2.0));
    EXPECT_EQ(exponential->get_delay(3), seconds(4));

    auto linear = make_backoff_strategy(options(seconds(1), seconds(100), 2.0, BackoffType::LINEAR));
    EXPECT_EQ(linear->get_delay(3), seconds(3));
}

TEST(BackoffFactory, RejectsInvalidOptions) {
    EXPECT_THROW(make_backoff_strategy(options(seconds(10), seconds(1), 2.0)), std::invalid_argument);
}

TEST(BackoffFactory, RejectsUnsupportedType) {
    EXPECT_THROW(make_backoff_strategy(options(seconds(1), seconds(10), 2.0, static_cast<BackoffType>(42))),
                 std::invalid_argument);
}

TEST(BackoffType, ToString) {
    EXPECT_EQ(to_string(BackoffType::EXPONENTIAL), "EXPONENTIAL");
    EXPECT_EQ(to_string(BackoffType::LINEAR), "LINEAR");
}
