// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/error.hpp>
#include <vodfetch/core/job.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vodfetch::core {

// Top-level catalog partitions
enum class CatalogSection : std::uint8_t {
    movies,
    series
};

struct CategoryInfo {
    CatalogSection section{CatalogSection::movies};
    std::string id;
    std::string name;
};

// A movie (downloadable) or a series (a container of episodes)
struct StreamInfo {
    CatalogSection section{CatalogSection::movies};
    std::string id;
    std::string name;
    std::string extension;   // Movies only
};

// One downloadable episode of a series
struct EpisodeInfo {
    std::string id;
    std::string title;
    std::string extension;
    std::string series_name;
    int season{0};
    int episode{0};
};

// Source of catalog metadata and direct media URLs
class CatalogProvider {
public:
    virtual ~CatalogProvider() = default;

    // Direct download URL for an item
    [[nodiscard]] virtual std::string stream_url(MediaKind kind,
                                                 std::string_view catalog_id,
                                                 std::string_view extension) const = 0;

    [[nodiscard]] virtual std::expected<std::vector<CategoryInfo>, std::error_code>
    categories(CatalogSection section) = 0;

    // Movies or series filed under one category
    [[nodiscard]] virtual std::expected<std::vector<StreamInfo>, std::error_code>
    streams(CatalogSection section, std::string_view category_id) = 0;

    // All episodes of a series, ordered by season then episode
    [[nodiscard]] virtual std::expected<std::vector<EpisodeInfo>, std::error_code>
    series_episodes(std::string_view series_id) = 0;
};

// "movie" or "series", the prefix used by the streams command
[[nodiscard]] std::string_view section_prefix(CatalogSection section) noexcept;

} // namespace vodfetch::core
