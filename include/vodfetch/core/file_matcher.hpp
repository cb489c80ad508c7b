// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/config.hpp>
#include <vodfetch/core/job.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vodfetch::core {

// Metadata recovered from a file or catalog name
struct ParsedName {
    MediaKind kind{MediaKind::movie};
    std::string name;                // Normalized match key
    std::string series_name;         // Episodes only, case preserved
    std::optional<int> season;
    std::optional<int> episode;
};

// A file already present in the download directory
struct ScannedFile {
    std::string key;
    std::string filename;
    std::filesystem::path path;
    double size_mb{0.0};
    std::int64_t scanned_at{0};
    ParsedName parsed;
};

// Lowercase, collapse runs of spaces, dashes and underscores, trim
[[nodiscard]] std::string normalize_title(std::string_view text);

// normalize_title() of the name with its extension removed
[[nodiscard]] std::string normalize(std::string_view filename);

// Classify a file name as an episode (S<n>E<n> marker) or a movie
[[nodiscard]] ParsedName parse(std::string_view filename);

// Same as parse() for catalog titles, which carry no extension
[[nodiscard]] ParsedName parse_title(std::string_view title);

// True when one name contains the other and their lengths differ by less
// than `tolerance` of the longer one. Both names must already be normalized.
[[nodiscard]] bool names_match(std::string_view a, std::string_view b, double tolerance) noexcept;

// Index of media files in the download directory, used to recognise
// catalog items that were fetched out of band.
class FileMatcher {
public:
    explicit FileMatcher(double tolerance = DEFAULT_MATCH_TOLERANCE) noexcept;

    // Rebuild the index from regular files larger than MIN_SCAN_FILE_SIZE.
    // Hidden files are skipped. The previous index is replaced, not merged.
    std::size_t scan(const std::filesystem::path& directory);

    // Find a file for a catalog title. Episode titles must carry an
    // S<n>E<n> marker.
    [[nodiscard]] std::optional<ScannedFile> match(std::string_view title, MediaKind kind) const;

    [[nodiscard]] std::optional<ScannedFile> match_episode(std::string_view series_name,
                                                           int season,
                                                           int episode) const;

    [[nodiscard]] std::vector<ScannedFile> files() const;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::unordered_map<std::string, ScannedFile> index_;
    double tolerance_;
    mutable std::shared_mutex mutex_;
};

} // namespace vodfetch::core
