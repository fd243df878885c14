/**
 * @file retry_policy.cpp
 * @brief Implementation of chunk send retries
 */

#include "kcenon/chunked_upload/client/retry_policy.h"
#include "kcenon/chunked_upload/core/logging.h"

#include <string>

namespace kcenon::chunked_upload {

retry_policy::retry_policy(uint8_t max_retries, uint64_t total_chunks, retry_config config)
    : max_retries_(max_retries), total_chunks_(total_chunks), config_(config) {}

auto retry_policy::delay_for(uint32_t attempts_left) const -> std::chrono::milliseconds {
    uint32_t retry_number = attempts_left >= max_retries_ ? 1 : max_retries_ - attempts_left + 1;
    auto delay = config_.base_delay * retry_number;
    if (total_chunks_ > config_.large_object_chunk_threshold) {
        delay += config_.large_object_extra_delay;
    }
    return delay;
}

auto retry_policy::execute(uint32_t index,
                           const send_function& send,
                           transfer_control& control) const -> result<void> {
    uint32_t attempts_left = max_retries_;

    while (true) {
        auto sent = send();
        if (sent) {
            return {};
        }

        const auto& err = sent.error();
        if (err.code == error_code::transfer_cancelled) {
            return sent;
        }
        if (!is_retryable(err.code)) {
            auto final_error = err;
            final_error.chunk_index = index;
            return unexpected(std::move(final_error));
        }

        upload_log_context ctx;
        ctx.chunk_index = index;
        ctx.attempts_left = attempts_left;
        ctx.error_message = err.message;

        if (attempts_left == 0) {
            CU_LOG_ERROR_CTX(log_category::retry, "Chunk retries exhausted", ctx);
            return unexpected(error(
                error_code::chunk_upload_exhausted,
                "chunk " + std::to_string(index) + " failed after " +
                    std::to_string(static_cast<uint32_t>(max_retries_) + 1) +
                    " attempts: " + err.message,
                index));
        }

        auto delay = delay_for(attempts_left);
        ctx.duration_ms = static_cast<uint64_t>(delay.count());
        CU_LOG_WARN_CTX(log_category::retry, "Chunk send failed, retrying", ctx);

        if (!control.sleep_for(delay) || !control.wait_while_paused()) {
            return unexpected(error(error_code::transfer_cancelled,
                                    "transfer cancelled", index));
        }
        --attempts_left;
    }
}

}  // namespace kcenon::chunked_upload
