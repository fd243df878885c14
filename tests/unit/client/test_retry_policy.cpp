/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for chunk send retries and backoff
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/client/retry_policy.h>
#include <kcenon/chunked_upload/core/logging.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = get_logger().get_level();
        get_logger().set_level(log_level::fatal);
    }

    void TearDown() override { get_logger().set_level(saved_level_); }

    static auto fast_config() -> retry_config {
        retry_config config;
        config.base_delay = 1ms;
        config.large_object_extra_delay = 2ms;
        return config;
    }

    static auto failure(error_code code = error_code::transmission_error) -> result<void> {
        return unexpected(error(code, "simulated"));
    }

    transfer_control control_;
    log_level saved_level_{log_level::info};
};

// =============================================================================
// delay_for
// =============================================================================

TEST_F(RetryPolicyTest, DelayGrowsWithEachRetry) {
    retry_policy policy(3, 10);

    EXPECT_EQ(policy.delay_for(3), 1000ms);
    EXPECT_EQ(policy.delay_for(2), 2000ms);
    EXPECT_EQ(policy.delay_for(1), 3000ms);
}

TEST_F(RetryPolicyTest, LargeObjectsWaitLonger) {
    retry_policy at_threshold(3, 100);
    retry_policy above_threshold(3, 101);

    EXPECT_EQ(at_threshold.delay_for(3), 1000ms);
    EXPECT_EQ(above_threshold.delay_for(3), 3000ms);
    EXPECT_EQ(above_threshold.delay_for(1), 5000ms);
}

TEST_F(RetryPolicyTest, CustomConfigDelays) {
    retry_policy policy(2, 500, fast_config());
    EXPECT_EQ(policy.delay_for(2), 3ms);
    EXPECT_EQ(policy.delay_for(1), 4ms);
}

// =============================================================================
// execute
// =============================================================================

TEST_F(RetryPolicyTest, SuccessOnFirstAttempt) {
    retry_policy policy(3, 10, fast_config());
    int calls = 0;

    auto r = policy.execute(0, [&] { ++calls; return result<void>{}; }, control_);

    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, RecoversAfterTransientFailures) {
    retry_policy policy(3, 10, fast_config());
    int calls = 0;

    auto r = policy.execute(4, [&] {
        return ++calls <= 2 ? failure() : result<void>{};
    }, control_);

    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryPolicyTest, ExhaustsAfterMaxRetriesPlusOne) {
    retry_policy policy(3, 10, fast_config());
    int calls = 0;

    auto r = policy.execute(5, [&] { ++calls; return failure(); }, control_);

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(r.error().code, error_code::chunk_upload_exhausted);
    ASSERT_TRUE(r.error().chunk_index.has_value());
    EXPECT_EQ(*r.error().chunk_index, 5u);
    EXPECT_NE(r.error().message.find("chunk 5"), std::string::npos);
    EXPECT_NE(r.error().message.find("simulated"), std::string::npos);
}

TEST_F(RetryPolicyTest, ZeroRetriesMeansOneAttempt) {
    retry_policy policy(0, 1, fast_config());
    int calls = 0;

    auto r = policy.execute(0, [&] { ++calls; return failure(); }, control_);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(r.error().code, error_code::chunk_upload_exhausted);
}

TEST_F(RetryPolicyTest, NonRetryableErrorsReturnImmediately) {
    retry_policy policy(3, 10, fast_config());

    for (auto code : {error_code::session_not_found,
                      error_code::invalid_argument,
                      error_code::invalid_chunk_index}) {
        int calls = 0;
        auto r = policy.execute(2, [&] { ++calls; return failure(code); }, control_);

        EXPECT_EQ(calls, 1);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, code);
        EXPECT_EQ(r.error().chunk_index.value_or(99), 2u);
    }
}

TEST_F(RetryPolicyTest, CancelledSendIsNotRetried) {
    retry_policy policy(3, 10, fast_config());
    int calls = 0;

    auto r = policy.execute(1, [&] {
        ++calls;
        return result<void>(unexpected(error(error_code::transfer_cancelled)));
    }, control_);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(r.error().code, error_code::transfer_cancelled);
}

TEST_F(RetryPolicyTest, CancelDuringBackoffStopsRetrying) {
    retry_config slow;
    slow.base_delay = 10s;
    retry_policy policy(3, 10, slow);
    std::atomic<int> calls{0};

    auto running = std::async(std::launch::async, [&] {
        return policy.execute(0, [&] { ++calls; return failure(); }, control_);
    });
    std::this_thread::sleep_for(50ms);
    control_.cancel();

    ASSERT_EQ(running.wait_for(2s), std::future_status::ready);
    auto r = running.get();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(r.error().code, error_code::transfer_cancelled);
}

TEST_F(RetryPolicyTest, PauseHoldsTheResend) {
    retry_policy policy(3, 10, fast_config());
    std::atomic<int> calls{0};

    control_.pause();
    auto running = std::async(std::launch::async, [&] {
        return policy.execute(0, [&] {
            return ++calls == 1 ? failure() : result<void>{};
        }, control_);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(running.wait_for(0ms), std::future_status::timeout);

    control_.resume();
    ASSERT_EQ(running.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(running.get().has_value());
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(RetryPolicyTest, RetryLogsCarryAttemptsLeft) {
    get_logger().set_level(log_level::warn);
    std::vector<uint32_t> attempts;
    std::mutex mutex;
    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view, const upload_log_context* ctx) {
        if (level == log_level::warn && category == log_category::retry && ctx &&
            ctx->attempts_left) {
            std::lock_guard lock(mutex);
            attempts.push_back(*ctx->attempts_left);
        }
    });

    retry_policy policy(2, 10, fast_config());
    auto r = policy.execute(0, [&] { return failure(); }, control_);
    get_logger().set_callback(nullptr);

    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(attempts, (std::vector<uint32_t>{2, 1}));
}

}  // namespace kcenon::chunked_upload::test
