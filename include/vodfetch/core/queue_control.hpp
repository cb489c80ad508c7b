// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace vodfetch::core {

struct ControlState {
    bool paused{false};
    bool stopped{false};
};

// Pause/stop flags shared by the command surface and the worker.
// Each transition bumps an epoch and wakes whoever is waiting for a change.
class QueueControl {
public:
    QueueControl() = default;

    QueueControl(const QueueControl&) = delete;
    QueueControl& operator=(const QueueControl&) = delete;

    void pause() noexcept;

    // Clears both paused and stopped
    void resume() noexcept;

    void stop() noexcept;

    // Wake the worker without changing flags (new work was queued)
    void notify() noexcept;

    [[nodiscard]] ControlState state() const noexcept;
    [[nodiscard]] std::uint64_t epoch() const noexcept;

    // Block until the epoch moves past `seen` or stop is requested
    void wait_for_change(std::uint64_t seen, std::stop_token stoken);

    // Block while paused. Returns false if the queue was stopped or the
    // thread was asked to exit, true once transfers may continue.
    [[nodiscard]] bool wait_while_paused(std::stop_token stoken);

    // Sleep for up to `duration`, returning early on stop request
    void hold(std::chrono::milliseconds duration, std::stop_token stoken);

private:
    void bump() noexcept;

    bool paused_{false};
    bool stopped_{false};
    std::uint64_t epoch_{0};

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace vodfetch::core
