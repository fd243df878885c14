/**
 * @file transfer_control.h
 * @brief Pause and cancel signal shared by the workers of one upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_TRANSFER_CONTROL_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_TRANSFER_CONTROL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace kcenon::chunked_upload {

/**
 * @brief Gate that every chunk send passes through
 *
 * A send starts with begin_send(), which blocks while paused, and ends
 * with end_send(). The gate counts sends in flight, so pausing is
 * observed to have taken effect exactly when the count reaches zero.
 * Waits wake immediately on resume or cancel.
 *
 * One instance belongs to one upload; nothing is shared between uploads.
 */
class transfer_control {
public:
    transfer_control() = default;

    transfer_control(const transfer_control&) = delete;
    auto operator=(const transfer_control&) -> transfer_control& = delete;

    /**
     * @brief Stop new sends from starting
     * @return true if no send is in flight, so the pause is already in effect
     */
    auto pause() -> bool;

    void resume();

    /**
     * @brief Release every waiter; subsequent gates fail until reset()
     */
    void cancel();

    /**
     * @brief Clear pause and cancel before a new run
     */
    void reset();

    [[nodiscard]] auto is_paused() const -> bool;
    [[nodiscard]] auto is_cancelled() const -> bool;
    [[nodiscard]] auto in_flight() const -> std::size_t;

    /**
     * @brief Block while paused
     * @return false if cancelled
     */
    auto wait_while_paused() -> bool;

    /**
     * @brief Wait until not paused, then count a send as in flight
     * @return false if cancelled; no send is counted then
     */
    auto begin_send() -> bool;

    /**
     * @brief Count a send as finished
     * @return true if this was the last send in flight while paused
     */
    auto end_send() -> bool;

    /**
     * @brief Sleep for @p duration unless cancelled first
     * @return false if cancelled
     */
    auto sleep_for(std::chrono::milliseconds duration) -> bool;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
    bool cancelled_ = false;
    std::size_t in_flight_ = 0;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_TRANSFER_CONTROL_H
