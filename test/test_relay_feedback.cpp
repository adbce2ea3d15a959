#include <gtest/gtest.h>

#include <relay_feedback.h>

#include <chrono>
#include <future>
#include <thread>

using namespace SHADY;
using namespace std::chrono_literals;

TEST(RelayFeedback, StartsWithBothRelaysOff) {
    RelayFeedback feedback;
    EXPECT_FALSE(feedback.isOn(Relay::Open));
    EXPECT_FALSE(feedback.isOn(Relay::Close));
    EXPECT_TRUE(feedback.matches(false, false));
}

TEST(RelayFeedback, KeepsLatestValuePerRelay) {
    RelayFeedback feedback;
    feedback.update(Relay::Open, true);
    feedback.update(Relay::Close, true);
    feedback.update(Relay::Close, false);
    EXPECT_TRUE(feedback.isOn(Relay::Open));
    EXPECT_FALSE(feedback.isOn(Relay::Close));
    EXPECT_TRUE(feedback.matches(true, false));
}

TEST(RelayFeedback, WaitReturnsAtOnceWhenAlreadyMatching) {
    RelayFeedback feedback;
    EXPECT_EQ(WaitResult::Confirmed, feedback.waitFor(false, false, 10ms, 0ms));
}

TEST(RelayFeedback, WaitWakesOnUpdate) {
    RelayFeedback feedback;
    auto result = std::async(std::launch::async, [&] { return feedback.waitFor(true, false, 1000ms, 0ms); });
    std::this_thread::sleep_for(20ms);
    feedback.update(Relay::Open, true);
    ASSERT_EQ(std::future_status::ready, result.wait_for(2s));
    EXPECT_EQ(WaitResult::Confirmed, result.get());
}

TEST(RelayFeedback, WaitNeedsBothRelays) {
    RelayFeedback feedback;
    feedback.update(Relay::Close, true);
    auto result = std::async(std::launch::async, [&] { return feedback.waitFor(false, false, 5ms, 0ms); });
    std::this_thread::sleep_for(20ms);
    feedback.update(Relay::Open, false);
    EXPECT_EQ(std::future_status::timeout, result.wait_for(30ms));
    feedback.update(Relay::Close, false);
    ASSERT_EQ(std::future_status::ready, result.wait_for(2s));
    EXPECT_EQ(WaitResult::Confirmed, result.get());
}

TEST(RelayFeedback, WaitTimesOut) {
    RelayFeedback feedback;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(WaitResult::TimedOut, feedback.waitFor(true, false, 10ms, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(RelayFeedback, CancelWakesPendingAndFutureWaits) {
    RelayFeedback feedback;
    auto result = std::async(std::launch::async, [&] { return feedback.waitFor(true, false, 1000ms, 0ms); });
    std::this_thread::sleep_for(20ms);
    feedback.cancel();
    ASSERT_EQ(std::future_status::ready, result.wait_for(2s));
    EXPECT_EQ(WaitResult::Cancelled, result.get());
    EXPECT_TRUE(feedback.isCancelled());
    EXPECT_EQ(WaitResult::Cancelled, feedback.waitFor(false, false, 10ms, 0ms));
}
