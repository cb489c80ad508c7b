// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/download_store.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace vodfetch::core {

namespace {

std::int64_t now_epoch_seconds() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

nlohmann::json to_json(const std::map<std::string, DownloadRecord, std::less<>>& records) {
    auto j = nlohmann::json::object();
    for (const auto& [id, rec] : records) {
        j[id] = {
            {"downloaded_at", rec.downloaded_at},
            {"filename", rec.filename},
            {"size_mb", rec.size_mb},
        };
    }
    return j;
}

} // namespace

DownloadStore::DownloadStore(fs::path path)
    : path_(std::move(path)) {}

fs::path DownloadStore::temp_path(const fs::path& path) {
    auto p = path;
    p += ".tmp";
    return p;
}

fs::path DownloadStore::backup_path(const fs::path& path) {
    auto p = path;
    p += ".backup";
    return p;
}

std::size_t DownloadStore::load() noexcept {
    auto lock = std::unique_lock(mutex_);
    records_.clear();

    std::error_code ec;

    // A leftover temp file means a writer died before rename; the backing
    // file still holds the last complete snapshot.
    if (fs::exists(temp_path(path_), ec)) {
        spdlog::debug("Discarding stale store temp file {}", temp_path(path_).string());
        fs::remove(temp_path(path_), ec);
    }

    if (!fs::exists(path_, ec)) {
        spdlog::info("No download store at {}, starting empty", path_.string());
        return 0;
    }

    std::string content;
    {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            quarantine("unreadable");
            return 0;
        }
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    auto j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        quarantine("not a JSON object");
        return 0;
    }

    for (const auto& [id, entry] : j.items()) {
        if (!entry.is_object()) {
            spdlog::warn("Skipping malformed store entry '{}'", id);
            continue;
        }
        DownloadRecord rec;
        rec.item_id = id;
        try {
            rec.downloaded_at = entry.value("downloaded_at", std::int64_t{0});
            rec.filename = entry.value("filename", std::string{});
            rec.size_mb = entry.value("size_mb", 0.0);
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed store entry '{}': {}", id, e.what());
            continue;
        }
        records_.emplace(id, std::move(rec));
    }

    spdlog::info("Loaded {} download records from {}", records_.size(), path_.string());
    return records_.size();
}

void DownloadStore::quarantine(std::string_view reason) noexcept {
    const auto backup = backup_path(path_);
    std::error_code ec;
    fs::rename(path_, backup, ec);
    if (ec) {
        spdlog::error("Download store {} is corrupt ({}) and could not be moved aside: {}",
                      path_.string(), reason, ec.message());
        return;
    }
    spdlog::warn("Download store {} is corrupt ({}); moved to {} and starting empty",
                 path_.string(), reason, backup.string());
}

std::error_code DownloadStore::save() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return save_locked();
}

std::error_code DownloadStore::save_locked() const noexcept {
    const auto tmp = temp_path(path_);
    std::error_code ec;

    try {
        auto text = to_json(records_).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                spdlog::error("Cannot open {} for writing", tmp.string());
                return make_error_code(QueueErrc::store_write_failed);
            }
            file << text << '\n';
            file.flush();
            if (!file) {
                file.close();
                fs::remove(tmp, ec);
                spdlog::error("Short write to {}", tmp.string());
                return make_error_code(QueueErrc::store_write_failed);
            }
        }

        fs::rename(tmp, path_, ec);
        if (ec) {
            spdlog::error("Cannot replace {}: {}", path_.string(), ec.message());
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return make_error_code(QueueErrc::store_write_failed);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to save download store: {}", e.what());
        fs::remove(tmp, ec);
        return make_error_code(QueueErrc::store_write_failed);
    }

    return {};
}

std::error_code DownloadStore::record(std::string_view item_id,
                                      std::string_view filename,
                                      double size_mb) noexcept {
    auto lock = std::unique_lock(mutex_);

    std::optional<DownloadRecord> previous;
    if (auto it = records_.find(item_id); it != records_.end()) {
        previous = it->second;
    }

    DownloadRecord rec{std::string(item_id), now_epoch_seconds(), std::string(filename), size_mb};
    records_.insert_or_assign(std::string(item_id), std::move(rec));

    auto ec = save_locked();
    if (ec) {
        if (previous) {
            records_.insert_or_assign(std::string(item_id), std::move(*previous));
        } else {
            records_.erase(records_.find(item_id));
        }
    }
    return ec;
}

std::error_code DownloadStore::remove(std::string_view item_id) noexcept {
    auto lock = std::unique_lock(mutex_);

    auto it = records_.find(item_id);
    if (it == records_.end()) {
        return make_error_code(QueueErrc::record_not_found);
    }

    std::string key = it->first;
    DownloadRecord previous = std::move(it->second);
    records_.erase(it);

    auto ec = save_locked();
    if (ec) {
        records_.emplace(std::move(key), std::move(previous));
    }
    return ec;
}

bool DownloadStore::contains(std::string_view item_id) const {
    auto lock = std::unique_lock(mutex_);
    return records_.find(item_id) != records_.end();
}

std::optional<DownloadRecord> DownloadStore::get(std::string_view item_id) const {
    auto lock = std::unique_lock(mutex_);
    auto it = records_.find(item_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DownloadRecord> DownloadStore::all() const {
    auto lock = std::unique_lock(mutex_);
    std::vector<DownloadRecord> result;
    result.reserve(records_.size());
    for (const auto& [_, rec] : records_) {
        result.push_back(rec);
    }
    return result;
}

std::size_t DownloadStore::size() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return records_.size();
}

} // namespace vodfetch::core
