// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/queue_manager.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <iterator>
#include <utility>

namespace vodfetch::core {

namespace {

std::string destination_name(std::string_view title, std::string_view catalog_id,
                             std::string_view extension) {
    std::string stem = sanitize_filename(title);
    if (stem.empty()) {
        stem = sanitize_filename(catalog_id);
    }
    stem += '.';
    stem += extension;
    return stem;
}

const std::string& item_extension(const CatalogItem& item) {
    return std::visit([](const auto& i) -> const std::string& { return i.extension; }, item);
}

std::string item_id_of(const CatalogItem& item) {
    MediaKind kind = std::holds_alternative<MovieItem>(item) ? MediaKind::movie : MediaKind::episode;
    return make_item_id(kind, std::visit([](const auto& i) -> const std::string& { return i.catalog_id; }, item));
}

} // namespace

QueueManager::QueueManager(Settings settings, CatalogProvider& catalog, MediaSource& source)
    : settings_(std::move(settings))
    , catalog_(catalog)
    , source_(source)
    , store_(settings_.store_path())
    , matcher_(settings_.match_tolerance)
    , worker_(queue_, control_, progress_, store_, source_,
              WorkerOptions{settings_.complete_hold, settings_.error_cooldown}) {}

QueueManager::~QueueManager() {
    shutdown();
}

std::error_code QueueManager::start() {
    std::error_code ec;
    std::filesystem::create_directories(settings_.download_dir, ec);
    if (ec) {
        spdlog::error("Cannot create download directory {}: {}",
                      settings_.download_dir.string(), ec.message());
        return make_error_code(QueueErrc::file_error);
    }

    std::size_t records = store_.load();
    std::size_t files = matcher_.scan(settings_.download_dir);
    spdlog::info("Loaded {} download records, indexed {} files in {}",
                 records, files, settings_.download_dir.string());

    worker_.start();
    return {};
}

void QueueManager::shutdown() noexcept {
    worker_.shutdown();
}

//=============================================================================
// Enqueue
//=============================================================================

std::expected<JobId, std::error_code>
QueueManager::enqueue(MediaKind kind, std::string_view catalog_id, std::string_view extension,
                      std::string_view title) {
    if (kind == MediaKind::movie) {
        return enqueue_item(MovieItem{std::string(catalog_id), std::string(extension)}, title, {});
    }

    ParsedName parsed = parse_title(title);
    EpisodeItem item{std::string(catalog_id), {}, parsed.season, parsed.episode, std::string(extension)};
    return enqueue_item(std::move(item), title, parsed.series_name);
}

std::expected<JobId, std::error_code>
QueueManager::enqueue_episode(std::string_view series_id, const EpisodeInfo& episode) {
    EpisodeItem item{episode.id, std::string(series_id), episode.season, episode.episode, episode.extension};
    return enqueue_item(std::move(item), episode.title, episode.series_name);
}

std::expected<std::size_t, std::error_code>
QueueManager::enqueue_series(std::string_view series_id) {
    auto episodes = catalog_.series_episodes(series_id);
    if (!episodes) {
        return std::unexpected(episodes.error());
    }

    std::size_t added = 0;
    for (const auto& ep : *episodes) {
        auto result = enqueue_episode(series_id, ep);
        if (result) {
            ++added;
        } else if (result.error() != QueueErrc::already_queued &&
                   result.error() != QueueErrc::already_downloaded) {
            spdlog::warn("Skipping episode {} of series {}: {}", ep.id, series_id, result.error().message());
        }
    }

    spdlog::info("Queued {} of {} episodes of series {}", added, episodes->size(), series_id);
    return added;
}

std::expected<JobId, std::error_code>
QueueManager::enqueue_item(CatalogItem item, std::string_view title, std::string_view series_name) {
    Job job;
    job.item = std::move(item);

    if (job.catalog_id().empty() || item_extension(job.item).empty()) {
        return std::unexpected(make_error_code(QueueErrc::invalid_item));
    }

    const std::string item_id = job.item_id();

    if (store_.contains(item_id)) {
        spdlog::debug("{} already downloaded", item_id);
        return std::unexpected(make_error_code(QueueErrc::already_downloaded));
    }
    if (auto hit = find_on_disk(job.item, title, series_name)) {
        adopt(item_id, *hit);
        return std::unexpected(make_error_code(QueueErrc::already_downloaded));
    }
    if (queue_.contains(item_id)) {
        spdlog::debug("{} already queued", item_id);
        return std::unexpected(make_error_code(QueueErrc::already_queued));
    }

    const std::string& extension = item_extension(job.item);
    std::string filename = destination_name(title, job.catalog_id(), extension);

    job.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    job.url = catalog_.stream_url(job.kind(), job.catalog_id(), extension);
    job.destination = (settings_.download_dir / filename).string();
    job.display_name = title.empty() ? filename : std::string(title);

    std::string display = job.display_name;
    auto id = queue_.enqueue(std::move(job));
    if (!id) {
        spdlog::debug("{} already queued", item_id);
        return id;
    }

    spdlog::info("Queued {} ({})", display, item_id);
    control_.notify();
    return id;
}

std::optional<ScannedFile>
QueueManager::find_on_disk(const CatalogItem& item, std::string_view title,
                           std::string_view series_name) const {
    if (const auto* episode = std::get_if<EpisodeItem>(&item)) {
        if (!series_name.empty() && episode->season && episode->episode) {
            return matcher_.match_episode(series_name, *episode->season, *episode->episode);
        }
        if (title.empty()) {
            return std::nullopt;
        }
        return matcher_.match(title, MediaKind::episode);
    }

    if (title.empty()) {
        return std::nullopt;
    }
    return matcher_.match(title, MediaKind::movie);
}

void QueueManager::adopt(const std::string& item_id, const ScannedFile& file) {
    spdlog::info("{} found on disk as {}", item_id, file.filename);
    if (auto ec = store_.record(item_id, file.filename, file.size_mb)) {
        spdlog::warn("Could not record {}: {}", item_id, ec.message());
    }
}

//=============================================================================
// Control
//=============================================================================

void QueueManager::pause() noexcept {
    control_.pause();
    spdlog::info("Queue paused");
}

void QueueManager::resume() noexcept {
    control_.resume();
    spdlog::info("Queue resumed");
}

void QueueManager::stop() noexcept {
    control_.stop();
    spdlog::info("Queue stopped");
}

void QueueManager::clear_queue() noexcept {
    queue_.clear();
    control_.notify();
    spdlog::info("Queue cleared");
}

std::error_code QueueManager::remove_job(JobId id) {
    auto ec = queue_.remove(id);
    if (!ec) {
        control_.notify();
    }
    return ec;
}

void QueueManager::reorder(const std::vector<JobId>& order) {
    queue_.reorder(order);
}

std::vector<QueueEntry> QueueManager::list_queue() const {
    std::vector<QueueEntry> entries;
    for (const auto& job : queue_.list()) {
        entries.push_back(QueueEntry{job.id, job.display_name, job.kind(), job.item_id()});
    }
    return entries;
}

//=============================================================================
// Download records
//=============================================================================

bool QueueManager::is_queued(std::string_view item_id) const {
    return queue_.contains(item_id);
}

bool QueueManager::is_downloaded(std::string_view item_id) const {
    return store_.contains(item_id);
}

bool QueueManager::check_downloaded(MediaKind kind, std::string_view catalog_id,
                                    std::string_view title) {
    if (kind == MediaKind::movie) {
        return check_item(MovieItem{std::string(catalog_id), {}}, title, {});
    }
    return check_item(EpisodeItem{std::string(catalog_id), {}, {}, {}, {}}, title, {});
}

bool QueueManager::check_item(const CatalogItem& item, std::string_view title,
                              std::string_view series_name) {
    const std::string item_id = item_id_of(item);
    if (store_.contains(item_id)) {
        return true;
    }

    auto hit = find_on_disk(item, title, series_name);
    if (!hit) {
        return false;
    }
    adopt(item_id, *hit);
    return true;
}

//=============================================================================
// Catalog browsing
//=============================================================================

std::expected<std::vector<CategoryInfo>, std::error_code> QueueManager::list_categories() {
    auto movies = catalog_.categories(CatalogSection::movies);
    if (!movies) {
        return std::unexpected(movies.error());
    }
    auto series = catalog_.categories(CatalogSection::series);
    if (!series) {
        return std::unexpected(series.error());
    }

    std::vector<CategoryInfo> result = std::move(*movies);
    result.insert(result.end(), std::make_move_iterator(series->begin()),
                  std::make_move_iterator(series->end()));
    return result;
}

std::expected<std::vector<StreamStatus>, std::error_code>
QueueManager::list_streams(CatalogSection section, std::string_view category_id) {
    auto streams = catalog_.streams(section, category_id);
    if (!streams) {
        return std::unexpected(streams.error());
    }

    std::vector<StreamStatus> result;
    result.reserve(streams->size());
    for (auto& stream : *streams) {
        StreamStatus row{std::move(stream), false, false};
        if (section == CatalogSection::movies) {
            row.downloaded = check_downloaded(MediaKind::movie, row.info.id, row.info.name);
            row.queued = queue_.contains(make_item_id(MediaKind::movie, row.info.id));
        }
        result.push_back(std::move(row));
    }
    return result;
}

std::expected<std::vector<EpisodeStatus>, std::error_code>
QueueManager::list_episodes(std::string_view series_id) {
    auto episodes = catalog_.series_episodes(series_id);
    if (!episodes) {
        return std::unexpected(episodes.error());
    }

    std::vector<EpisodeStatus> result;
    result.reserve(episodes->size());
    for (auto& ep : *episodes) {
        EpisodeItem item{ep.id, std::string(series_id), ep.season, ep.episode, ep.extension};
        EpisodeStatus row;
        row.downloaded = check_item(item, ep.title, ep.series_name);
        row.queued = queue_.contains(make_item_id(MediaKind::episode, ep.id));
        row.info = std::move(ep);
        result.push_back(std::move(row));
    }
    return result;
}

//=============================================================================
// Manual records
//=============================================================================

std::error_code QueueManager::mark_downloaded(std::string_view item_id,
                                              std::string_view filename,
                                              const std::filesystem::path& filepath) {
    if (item_id.empty()) {
        return make_error_code(QueueErrc::invalid_item);
    }

    double size_mb = 0.0;
    if (!filepath.empty()) {
        std::error_code fs_ec;
        auto size = std::filesystem::file_size(filepath, fs_ec);
        if (!fs_ec) {
            size_mb = std::round(static_cast<double>(size) / BYTES_PER_MB * 100.0) / 100.0;
        }
    }

    auto ec = store_.record(item_id, filename, size_mb);
    if (!ec) {
        spdlog::info("Marked {} as downloaded ({})", item_id, filename);
    }
    return ec;
}

std::error_code QueueManager::unmark_downloaded(std::string_view item_id) {
    auto ec = store_.remove(item_id);
    if (!ec) {
        spdlog::info("Unmarked {}", item_id);
    }
    return ec;
}

std::size_t QueueManager::scan_files() {
    return matcher_.scan(settings_.download_dir);
}

std::vector<DownloadRecord> QueueManager::downloaded() const {
    return store_.all();
}

//=============================================================================
// Progress
//=============================================================================

ProgressState QueueManager::current_progress() const {
    ProgressState snap = progress_.snapshot();
    snap.queue_depth = queue_.size();
    return snap;
}

void QueueManager::on_progress(ProgressCallback cb) {
    progress_.callback(std::move(cb));
}

bool QueueManager::busy() const noexcept {
    // Queue first: the worker raises in_flight before it dequeues
    return !queue_.empty() || worker_.in_flight();
}

} // namespace vodfetch::core
