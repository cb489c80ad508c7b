// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace vodfetch::core {

// Worker activity
enum class ProgressStatus : std::uint8_t {
    idle,        // Queue empty, nothing in flight
    starting,    // Opening the transfer
    downloading, // Writing chunks
    paused,      // Suspended by pause()
    stopped,     // Suspended by stop()
    complete,    // Last job finished
    error        // Last job failed
};

// Snapshot of the current download
struct ProgressState {
    std::string current_file;
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};         // 0 when not advertised
    std::optional<int> percent;           // Unset while total is unknown
    ProgressStatus status{ProgressStatus::idle};
    std::size_t queue_depth{0};
    std::string error_message;

    [[nodiscard]] double downloaded_mb() const noexcept;
    [[nodiscard]] double total_mb() const noexcept;

    // "Downloading", "Error: <message>", ...
    [[nodiscard]] std::string status_text() const;
};

[[nodiscard]] std::string_view to_string(ProgressStatus status) noexcept;

// floor(downloaded * 100 / total), unset when total is 0
[[nodiscard]] std::optional<int> percent_of(std::uint64_t downloaded, std::uint64_t total) noexcept;

using ProgressCallback = std::function<void(const ProgressState&)>;

// Single live ProgressState. Writers replace fields under a mutex and
// readers get a whole copy, never a torn update.
class ProgressTracker {
public:
    ProgressTracker() = default;

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    [[nodiscard]] ProgressState snapshot() const;

    // Apply a modification and notify the observer with the result
    void update(const std::function<void(ProgressState&)>& fn);

    // Convenience for status-only transitions
    void status(ProgressStatus s);

    // Set progress callback (thread-safe)
    void callback(ProgressCallback cb);

private:
    ProgressState state_;
    ProgressCallback callback_;
    mutable std::mutex mutex_;
    std::mutex callback_mutex_;  // Protects callback_ access
};

} // namespace vodfetch::core
