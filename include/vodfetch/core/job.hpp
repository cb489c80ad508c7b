// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vodfetch::core {

// Catalog item classification
enum class MediaKind : std::uint8_t {
    movie,
    episode
};

struct MovieItem {
    std::string catalog_id;
    std::string extension;
};

struct EpisodeItem {
    std::string catalog_id;
    std::string series_id;
    std::optional<int> season;
    std::optional<int> episode;
    std::string extension;
};

using CatalogItem = std::variant<MovieItem, EpisodeItem>;

using JobId = std::uint64_t;

// A queued request to fetch one catalog item
struct Job {
    JobId id{0};
    std::string url;
    std::string destination;
    std::string display_name;
    CatalogItem item;

    [[nodiscard]] MediaKind kind() const noexcept;
    [[nodiscard]] const std::string& catalog_id() const noexcept;
    [[nodiscard]] std::string item_id() const;

    // File name component of destination
    [[nodiscard]] std::string filename() const;
};

// "movie" or "series", the prefix used in item ids
[[nodiscard]] std::string_view kind_prefix(MediaKind kind) noexcept;

// "Movie" or "Episode"
[[nodiscard]] std::string_view to_string(MediaKind kind) noexcept;

// "<kind>:<catalog_id>"
[[nodiscard]] std::string make_item_id(MediaKind kind, std::string_view catalog_id);

// Remove characters that are illegal in paths and trim whitespace
[[nodiscard]] std::string sanitize_filename(std::string_view name);

} // namespace vodfetch::core
