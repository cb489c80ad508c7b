// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/queue_control.hpp>

namespace vodfetch::core {

void QueueControl::pause() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = true;
        bump();
    }
    cv_.notify_all();
}

void QueueControl::resume() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
        stopped_ = false;
        bump();
    }
    cv_.notify_all();
}

void QueueControl::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        paused_ = false;
        bump();
    }
    cv_.notify_all();
}

void QueueControl::notify() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bump();
    }
    cv_.notify_all();
}

ControlState QueueControl::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return {paused_, stopped_};
}

std::uint64_t QueueControl::epoch() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

void QueueControl::wait_for_change(std::uint64_t seen, std::stop_token stoken) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, stoken, [&] { return epoch_ != seen; });
}

bool QueueControl::wait_while_paused(std::stop_token stoken) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, stoken, [&] { return !paused_ || stopped_; });
    return !stopped_ && !stoken.stop_requested();
}

void QueueControl::hold(std::chrono::milliseconds duration, std::stop_token stoken) {
    if (duration.count() <= 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    // Only a thread exit cuts the hold short
    cv_.wait_for(lock, stoken, duration, [] { return false; });
}

void QueueControl::bump() noexcept {
    ++epoch_;
}

} // namespace vodfetch::core
