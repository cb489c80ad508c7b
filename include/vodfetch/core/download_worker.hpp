// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/config.hpp>
#include <vodfetch/core/download_store.hpp>
#include <vodfetch/core/job_queue.hpp>
#include <vodfetch/core/media_source.hpp>
#include <vodfetch/core/progress.hpp>
#include <vodfetch/core/queue_control.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <thread>

namespace vodfetch::core {

struct WorkerOptions {
    std::chrono::milliseconds complete_hold{DEFAULT_COMPLETE_HOLD};   // Complete stays visible
    std::chrono::milliseconds error_cooldown{DEFAULT_ERROR_COOLDOWN}; // Pause after a failure
};

// The single consumer of the JobQueue.
//
// Jobs are taken one at a time and streamed to their destination. Pause and
// stop are checked before every chunk; a stopped transfer leaves its partial
// file and records nothing. Failed jobs are dropped, never requeued.
class DownloadWorker {
public:
    DownloadWorker(JobQueue& queue,
                   QueueControl& control,
                   ProgressTracker& progress,
                   DownloadStore& store,
                   MediaSource& source,
                   WorkerOptions options = {});
    ~DownloadWorker();

    // Non-copyable, non-movable
    DownloadWorker(const DownloadWorker&) = delete;
    DownloadWorker& operator=(const DownloadWorker&) = delete;

    // Launch the worker thread (no-op if already running)
    void start();

    // Request stop, wake the thread and join it
    void shutdown() noexcept;

    // True from the moment a job is taken until it has been handled
    [[nodiscard]] bool in_flight() const noexcept {
        return in_flight_.load(std::memory_order_acquire);
    }

    // Transfers that ended in the Error status since construction
    [[nodiscard]] std::uint64_t failures() const noexcept {
        return failures_.load(std::memory_order_relaxed);
    }

private:
    enum class Outcome { complete, stopped, failed };

    void run(std::stop_token stoken);
    void process(const Job& job, std::stop_token stoken);
    [[nodiscard]] Outcome transfer(const Job& job, std::stop_token stoken, std::string& error);
    void finish_complete(const Job& job, std::stop_token stoken);
    void finish_failed(const Job& job, const std::string& error, std::stop_token stoken);

    JobQueue& queue_;
    QueueControl& control_;
    ProgressTracker& progress_;
    DownloadStore& store_;
    MediaSource& source_;
    WorkerOptions options_;

    std::atomic<bool> in_flight_{false};
    std::atomic<std::uint64_t> failures_{0};
    std::jthread thread_;
};

} // namespace vodfetch::core
