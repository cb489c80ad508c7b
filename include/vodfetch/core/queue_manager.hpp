// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/catalog_provider.hpp>
#include <vodfetch/core/download_store.hpp>
#include <vodfetch/core/download_worker.hpp>
#include <vodfetch/core/error.hpp>
#include <vodfetch/core/file_matcher.hpp>
#include <vodfetch/core/job.hpp>
#include <vodfetch/core/job_queue.hpp>
#include <vodfetch/core/media_source.hpp>
#include <vodfetch/core/progress.hpp>
#include <vodfetch/core/queue_control.hpp>
#include <vodfetch/core/settings.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vodfetch::core {

// One row of list_queue()
struct QueueEntry {
    JobId id{0};
    std::string display_name;
    MediaKind kind{MediaKind::movie};
    std::string item_id;
};

// A catalog row annotated with local state. Series rows are containers and
// are never marked downloaded or queued.
struct StreamStatus {
    StreamInfo info;
    bool downloaded{false};
    bool queued{false};
};

struct EpisodeStatus {
    EpisodeInfo info;
    bool downloaded{false};
    bool queued{false};
};

// Owner of the download subsystem and the only way to mutate it.
//
// Enqueue refuses items that are already downloaded (by record or by a
// matching file on disk) before it refuses items that are already queued.
// The catalog and media source are borrowed and must outlive the manager.
class QueueManager {
public:
    QueueManager(Settings settings, CatalogProvider& catalog, MediaSource& source);
    ~QueueManager();

    // Non-copyable, non-movable
    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    // Create the download directory, load the store, scan existing files
    // and launch the worker
    [[nodiscard]] std::error_code start();

    // Stop the worker thread (an in-flight transfer is abandoned)
    void shutdown() noexcept;

    // Queue a catalog item. `title` names the destination file and is used
    // to look for an existing copy on disk; the catalog id is used when empty.
    [[nodiscard]] std::expected<JobId, std::error_code>
    enqueue(MediaKind kind, std::string_view catalog_id, std::string_view extension,
            std::string_view title = {});

    [[nodiscard]] std::expected<JobId, std::error_code>
    enqueue_episode(std::string_view series_id, const EpisodeInfo& episode);

    // Queue every episode of a series that is neither downloaded nor queued.
    // Returns the number added.
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    enqueue_series(std::string_view series_id);

    // Flow control
    void pause() noexcept;
    void resume() noexcept;
    void stop() noexcept;
    void clear_queue() noexcept;

    [[nodiscard]] std::error_code remove_job(JobId id);
    void reorder(const std::vector<JobId>& order);
    [[nodiscard]] std::vector<QueueEntry> list_queue() const;

    [[nodiscard]] bool is_queued(std::string_view item_id) const;
    [[nodiscard]] bool is_downloaded(std::string_view item_id) const;

    // Store lookup, then file lookup. A file hit is recorded in the store.
    [[nodiscard]] bool check_downloaded(MediaKind kind, std::string_view catalog_id,
                                        std::string_view title);

    // Catalog browsing. Movie categories come before series categories.
    [[nodiscard]] std::expected<std::vector<CategoryInfo>, std::error_code> list_categories();

    [[nodiscard]] std::expected<std::vector<StreamStatus>, std::error_code>
    list_streams(CatalogSection section, std::string_view category_id);

    [[nodiscard]] std::expected<std::vector<EpisodeStatus>, std::error_code>
    list_episodes(std::string_view series_id);

    // Record an item fetched out of band. The size is read from `filepath`
    // when it names an existing file.
    [[nodiscard]] std::error_code mark_downloaded(std::string_view item_id,
                                                  std::string_view filename,
                                                  const std::filesystem::path& filepath = {});
    [[nodiscard]] std::error_code unmark_downloaded(std::string_view item_id);

    // Re-index the download directory
    std::size_t scan_files();

    [[nodiscard]] std::vector<DownloadRecord> downloaded() const;

    // Snapshot with the live queue depth
    [[nodiscard]] ProgressState current_progress() const;
    void on_progress(ProgressCallback cb);

    // Jobs are queued or one is being processed
    [[nodiscard]] bool busy() const noexcept;

    // Transfers that ended in error since start
    [[nodiscard]] std::uint64_t failed_count() const noexcept { return worker_.failures(); }

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
    [[nodiscard]] std::expected<JobId, std::error_code>
    enqueue_item(CatalogItem item, std::string_view title, std::string_view series_name);

    [[nodiscard]] std::optional<ScannedFile>
    find_on_disk(const CatalogItem& item, std::string_view title, std::string_view series_name) const;

    [[nodiscard]] bool check_item(const CatalogItem& item, std::string_view title,
                                  std::string_view series_name);

    // Record a file hit so the next lookup is a store hit
    void adopt(const std::string& item_id, const ScannedFile& file);

    Settings settings_;
    CatalogProvider& catalog_;
    MediaSource& source_;

    DownloadStore store_;
    FileMatcher matcher_;
    JobQueue queue_;
    QueueControl control_;
    ProgressTracker progress_;
    std::atomic<JobId> next_id_{1};

    DownloadWorker worker_;  // Declared last: joined before the rest is destroyed
};

} // namespace vodfetch::core
