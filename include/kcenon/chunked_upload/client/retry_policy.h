/**
 * @file retry_policy.h
 * @brief Bounded retries with increasing backoff for single chunk sends
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_RETRY_POLICY_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_RETRY_POLICY_H

#include <chrono>
#include <cstdint>
#include <functional>

#include "kcenon/chunked_upload/client/client_types.h"
#include "kcenon/chunked_upload/client/transfer_control.h"
#include "kcenon/chunked_upload/core/types.h"

namespace kcenon::chunked_upload {

/**
 * @brief Runs a chunk send up to max_retries + 1 times
 *
 * A failed attempt with attempts left is followed by a backoff sleep that
 * cancel interrupts, then by a wait while paused. Errors that a resend
 * cannot fix (see is_retryable()) end the loop at once.
 */
class retry_policy {
public:
    using send_function = std::function<result<void>()>;

    /**
     * @param max_retries Attempts allowed after the first one
     * @param total_chunks Chunk count of the object, selects the extra delay
     */
    retry_policy(uint8_t max_retries, uint64_t total_chunks, retry_config config = {});

    /**
     * @brief Backoff before the attempt that follows a failure with
     *        @p attempts_left attempts remaining
     */
    [[nodiscard]] auto delay_for(uint32_t attempts_left) const -> std::chrono::milliseconds;

    /**
     * @brief Send chunk @p index until it succeeds or the budget is spent
     *
     * @return success, or
     *         - chunk_upload_exhausted carrying @p index once every attempt failed
     *         - transfer_cancelled if @p control was cancelled
     *         - the send's own error when it is not retryable
     */
    [[nodiscard]] auto execute(uint32_t index,
                               const send_function& send,
                               transfer_control& control) const -> result<void>;

    [[nodiscard]] auto max_retries() const -> uint8_t { return max_retries_; }

private:
    uint8_t max_retries_;
    uint64_t total_chunks_;
    retry_config config_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_RETRY_POLICY_H
