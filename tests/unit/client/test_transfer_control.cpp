/**
 * @file test_transfer_control.cpp
 * @brief Unit tests for the pause and cancel gate
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/client/transfer_control.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace kcenon::chunked_upload::test {

using namespace std::chrono_literals;

class TransferControlTest : public ::testing::Test {
protected:
    transfer_control control_;
};

TEST_F(TransferControlTest, InitialState) {
    EXPECT_FALSE(control_.is_paused());
    EXPECT_FALSE(control_.is_cancelled());
    EXPECT_EQ(control_.in_flight(), 0u);
    EXPECT_TRUE(control_.wait_while_paused());
}

TEST_F(TransferControlTest, PauseWithNothingInFlightTakesEffect) {
    EXPECT_TRUE(control_.pause());
    EXPECT_TRUE(control_.is_paused());
}

TEST_F(TransferControlTest, PauseWithSendInFlightWaitsForIt) {
    ASSERT_TRUE(control_.begin_send());
    EXPECT_EQ(control_.in_flight(), 1u);

    EXPECT_FALSE(control_.pause());
    EXPECT_TRUE(control_.end_send());
    EXPECT_EQ(control_.in_flight(), 0u);
}

TEST_F(TransferControlTest, EndSendWhileRunningDoesNotReportPause) {
    ASSERT_TRUE(control_.begin_send());
    ASSERT_TRUE(control_.begin_send());
    EXPECT_FALSE(control_.end_send());
    EXPECT_FALSE(control_.end_send());
}

TEST_F(TransferControlTest, BeginSendBlocksWhilePaused) {
    control_.pause();

    auto started = std::async(std::launch::async, [this] { return control_.begin_send(); });
    EXPECT_EQ(started.wait_for(50ms), std::future_status::timeout);

    control_.resume();
    ASSERT_EQ(started.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(started.get());
    EXPECT_EQ(control_.in_flight(), 1u);
}

TEST_F(TransferControlTest, CancelReleasesPausedWaiters) {
    control_.pause();

    auto waiting = std::async(std::launch::async, [this] { return control_.wait_while_paused(); });
    auto sending = std::async(std::launch::async, [this] { return control_.begin_send(); });
    std::this_thread::sleep_for(20ms);

    control_.cancel();
    ASSERT_EQ(waiting.wait_for(2s), std::future_status::ready);
    ASSERT_EQ(sending.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(waiting.get());
    EXPECT_FALSE(sending.get());
    EXPECT_EQ(control_.in_flight(), 0u);
}

TEST_F(TransferControlTest, SleepRunsFullDurationWithoutCancel) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(control_.sleep_for(30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST_F(TransferControlTest, CancelInterruptsSleep) {
    auto sleeping = std::async(std::launch::async, [this] { return control_.sleep_for(10s); });
    std::this_thread::sleep_for(20ms);

    auto start = std::chrono::steady_clock::now();
    control_.cancel();
    ASSERT_EQ(sleeping.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(sleeping.get());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(TransferControlTest, ResetClearsPauseAndCancel) {
    control_.pause();
    control_.cancel();
    EXPECT_FALSE(control_.begin_send());

    control_.reset();
    EXPECT_FALSE(control_.is_paused());
    EXPECT_FALSE(control_.is_cancelled());
    EXPECT_TRUE(control_.begin_send());
}

}  // namespace kcenon::chunked_upload::test
