// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/progress.hpp>
#include <vodfetch/core/config.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace vodfetch::core {

double ProgressState::downloaded_mb() const noexcept {
    return static_cast<double>(bytes_downloaded) / BYTES_PER_MB;
}

double ProgressState::total_mb() const noexcept {
    return static_cast<double>(total_bytes) / BYTES_PER_MB;
}

std::string ProgressState::status_text() const {
    if (status == ProgressStatus::error && !error_message.empty()) {
        return "Error: " + error_message;
    }
    return std::string(to_string(status));
}

std::string_view to_string(ProgressStatus status) noexcept {
    switch (status) {
        case ProgressStatus::idle:        return "Idle";
        case ProgressStatus::starting:    return "Starting";
        case ProgressStatus::downloading: return "Downloading";
        case ProgressStatus::paused:      return "Paused";
        case ProgressStatus::stopped:     return "Stopped";
        case ProgressStatus::complete:    return "Complete";
        case ProgressStatus::error:       return "Error";
        default:                          return "Unknown";
    }
}

std::optional<int> percent_of(std::uint64_t downloaded, std::uint64_t total) noexcept {
    if (total == 0) {
        return std::nullopt;
    }
    return static_cast<int>(downloaded * 100 / total);
}

//=============================================================================
// ProgressTracker
//=============================================================================

ProgressState ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ProgressTracker::update(const std::function<void(ProgressState&)>& fn) {
    ProgressState snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(state_);
        snap = state_;
    }

    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> cb_lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) {
        try {
            cb(snap);
        } catch (const std::exception& e) {
            spdlog::warn("Progress observer threw: {}", e.what());
        }
    }
}

void ProgressTracker::status(ProgressStatus s) {
    update([s](ProgressState& p) { p.status = s; });
}

void ProgressTracker::callback(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(cb);
}

} // namespace vodfetch::core
