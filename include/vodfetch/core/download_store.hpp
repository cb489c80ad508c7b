// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/error.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace vodfetch::core {

// Proof that an item was fetched
struct DownloadRecord {
    std::string item_id;
    std::int64_t downloaded_at{0};   // Epoch seconds
    std::string filename;
    double size_mb{0.0};
};

// Durable item id -> DownloadRecord map mirrored to a JSON file.
//
// Writes go to "<file>.tmp" in the same directory and are renamed over the
// backing file, so the file on disk is always a complete snapshot. An
// unparseable file is moved to "<file>.backup" on load and the store starts
// empty.
class DownloadStore {
public:
    explicit DownloadStore(std::filesystem::path path);

    DownloadStore(const DownloadStore&) = delete;
    DownloadStore& operator=(const DownloadStore&) = delete;

    // Replace the in-memory map with the file contents. Never fails: a
    // missing file yields an empty store, a corrupt one is set aside.
    // Returns the number of records loaded.
    std::size_t load() noexcept;

    // Write the whole map atomically
    [[nodiscard]] std::error_code save() const noexcept;

    // Upsert a record stamped with the current time, then save. The
    // in-memory change is rolled back if the save fails.
    [[nodiscard]] std::error_code record(std::string_view item_id,
                                         std::string_view filename,
                                         double size_mb) noexcept;

    // Remove a record, then save (rolled back on failure)
    [[nodiscard]] std::error_code remove(std::string_view item_id) noexcept;

    [[nodiscard]] bool contains(std::string_view item_id) const;
    [[nodiscard]] std::optional<DownloadRecord> get(std::string_view item_id) const;
    [[nodiscard]] std::vector<DownloadRecord> all() const;
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static std::filesystem::path temp_path(const std::filesystem::path& path);
    [[nodiscard]] static std::filesystem::path backup_path(const std::filesystem::path& path);

private:
    [[nodiscard]] std::error_code save_locked() const noexcept;
    void quarantine(std::string_view reason) noexcept;

    std::filesystem::path path_;
    std::map<std::string, DownloadRecord, std::less<>> records_;
    mutable std::mutex mutex_;
};

} // namespace vodfetch::core
