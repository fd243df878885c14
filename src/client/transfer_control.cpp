/**
 * @file transfer_control.cpp
 * @brief Implementation of the pause and cancel gate
 */

#include "kcenon/chunked_upload/client/transfer_control.h"

namespace kcenon::chunked_upload {

auto transfer_control::pause() -> bool {
    std::lock_guard lock(mutex_);
    paused_ = true;
    return in_flight_ == 0;
}

void transfer_control::resume() {
    {
        std::lock_guard lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

void transfer_control::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void transfer_control::reset() {
    {
        std::lock_guard lock(mutex_);
        paused_ = false;
        cancelled_ = false;
    }
    cv_.notify_all();
}

auto transfer_control::is_paused() const -> bool {
    std::lock_guard lock(mutex_);
    return paused_;
}

auto transfer_control::is_cancelled() const -> bool {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

auto transfer_control::in_flight() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

auto transfer_control::wait_while_paused() -> bool {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !paused_ || cancelled_; });
    return !cancelled_;
}

auto transfer_control::begin_send() -> bool {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !paused_ || cancelled_; });
    if (cancelled_) {
        return false;
    }
    ++in_flight_;
    return true;
}

auto transfer_control::end_send() -> bool {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) {
        --in_flight_;
    }
    return paused_ && in_flight_ == 0;
}

auto transfer_control::sleep_for(std::chrono::milliseconds duration) -> bool {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return cancelled_; });
    return !cancelled_;
}

}  // namespace kcenon::chunked_upload
