// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/download_worker.hpp>
#include <vodfetch/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>

namespace vodfetch::core {

DownloadWorker::DownloadWorker(JobQueue& queue,
                               QueueControl& control,
                               ProgressTracker& progress,
                               DownloadStore& store,
                               MediaSource& source,
                               WorkerOptions options)
    : queue_(queue)
    , control_(control)
    , progress_(progress)
    , store_(store)
    , source_(source)
    , options_(options) {}

DownloadWorker::~DownloadWorker() {
    shutdown();
}

void DownloadWorker::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stoken) { run(stoken); });
    spdlog::debug("Download worker started");
}

void DownloadWorker::shutdown() noexcept {
    if (!thread_.joinable()) {
        return;
    }
    // The stop callback registered by condition_variable_any wakes any wait
    thread_.request_stop();
    thread_.join();
    spdlog::debug("Download worker stopped");
}

void DownloadWorker::run(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        // Read the epoch first so a change made after this point always wakes the wait
        const std::uint64_t seen = control_.epoch();
        const ControlState state = control_.state();

        if (state.stopped) {
            const std::size_t depth = queue_.size();
            progress_.update([depth](ProgressState& p) {
                p.status = ProgressStatus::stopped;
                p.queue_depth = depth;
            });
            control_.wait_for_change(seen, stoken);
            continue;
        }

        if (state.paused) {
            const std::size_t depth = queue_.size();
            progress_.update([depth](ProgressState& p) {
                p.status = ProgressStatus::paused;
                p.queue_depth = depth;
            });
            control_.wait_for_change(seen, stoken);
            continue;
        }

        in_flight_.store(true, std::memory_order_release);
        auto job = queue_.dequeue_front();
        if (!job) {
            in_flight_.store(false, std::memory_order_release);
            progress_.update([](ProgressState& p) {
                p.status = ProgressStatus::idle;
                p.queue_depth = 0;
            });
            control_.wait_for_change(seen, stoken);
            continue;
        }

        process(*job, stoken);
        in_flight_.store(false, std::memory_order_release);
    }
}

void DownloadWorker::process(const Job& job, std::stop_token stoken) {
    const std::size_t depth = queue_.size();
    progress_.update([&job, depth](ProgressState& p) {
        p.current_file = job.display_name;
        p.bytes_downloaded = 0;
        p.total_bytes = 0;
        p.percent = 0;
        p.status = ProgressStatus::starting;
        p.queue_depth = depth;
        p.error_message.clear();
    });
    spdlog::info("Starting download: {} -> {}", job.display_name, job.destination);

    std::string error;
    switch (transfer(job, stoken, error)) {
        case Outcome::complete:
            finish_complete(job, stoken);
            break;
        case Outcome::stopped:
            progress_.status(ProgressStatus::stopped);
            spdlog::info("Download stopped: {}", job.display_name);
            break;
        case Outcome::failed:
            finish_failed(job, error, stoken);
            break;
    }

    const std::size_t remaining = queue_.size();
    progress_.update([remaining](ProgressState& p) {
        p.percent = 0;
        p.queue_depth = remaining;
    });
}

DownloadWorker::Outcome DownloadWorker::transfer(const Job& job, std::stop_token stoken, std::string& error) {
    // Opened on the first chunk so a refused response never touches the destination
    disk::FileWriter writer;
    std::error_code open_ec;
    std::error_code write_ec;

    auto on_length = [this](std::uint64_t total) {
        progress_.update([total](ProgressState& p) {
            p.total_bytes = total;
            p.percent = percent_of(0, total);
        });
    };

    auto on_chunk = [&](std::span<const std::byte> chunk) -> bool {
        if (stoken.stop_requested()) {
            return false;
        }

        ControlState state = control_.state();
        if (state.stopped) {
            return false;
        }
        if (state.paused) {
            progress_.status(ProgressStatus::paused);
            spdlog::info("Paused: {}", job.display_name);
            if (!control_.wait_while_paused(stoken)) {
                return false;
            }
            spdlog::info("Resumed: {}", job.display_name);
        }

        if (!writer.is_open()) {
            if (auto ec = writer.open(job.destination)) {
                open_ec = ec;
                return false;
            }
        }
        if (auto ec = writer.write(chunk)) {
            write_ec = ec;
            return false;
        }

        const std::uint64_t written = writer.written();
        progress_.update([written](ProgressState& p) {
            p.bytes_downloaded = written;
            p.percent = percent_of(written, p.total_bytes);
            p.status = ProgressStatus::downloading;
        });
        return true;
    };

    std::error_code ec = source_.fetch(job.url, on_length, on_chunk, stoken);
    std::error_code flush_ec;
    if (writer.is_open()) {
        flush_ec = writer.flush();
        writer.close();
    }

    if (open_ec) {
        error = "cannot open " + job.destination + ": " + open_ec.message();
        return Outcome::failed;
    }
    if (write_ec) {
        error = "write to " + job.destination + " failed: " + write_ec.message();
        return Outcome::failed;
    }
    if (ec == QueueErrc::cancelled) {
        return Outcome::stopped;
    }
    if (ec) {
        error = ec.message();
        return Outcome::failed;
    }
    if (flush_ec) {
        error = "flush of " + job.destination + " failed: " + flush_ec.message();
        return Outcome::failed;
    }
    return Outcome::complete;
}

void DownloadWorker::finish_complete(const Job& job, std::stop_token stoken) {
    std::error_code fs_ec;
    const auto size = std::filesystem::file_size(job.destination, fs_ec);

    if (!fs_ec && size > MIN_VALID_FILE_SIZE) {
        const double size_mb = std::round(static_cast<double>(size) / BYTES_PER_MB * 100.0) / 100.0;
        if (auto ec = store_.record(job.item_id(), job.filename(), size_mb)) {
            spdlog::error("Could not record {}: {}", job.item_id(), ec.message());
        }
    } else {
        spdlog::warn("Not recording {}: {} is missing or too small", job.item_id(), job.destination);
    }

    progress_.update([](ProgressState& p) {
        p.status = ProgressStatus::complete;
        p.percent = 100;
    });
    spdlog::info("Download complete: {}", job.display_name);

    control_.hold(options_.complete_hold, stoken);
}

void DownloadWorker::finish_failed(const Job& job, const std::string& error, std::stop_token stoken) {
    progress_.update([&error](ProgressState& p) {
        p.status = ProgressStatus::error;
        p.error_message = error;
    });
    failures_.fetch_add(1, std::memory_order_relaxed);
    spdlog::error("Download failed: {}: {}", job.display_name, error);

    control_.hold(options_.error_cooldown, stoken);
}

} // namespace vodfetch::core
