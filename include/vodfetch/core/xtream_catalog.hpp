// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/catalog_provider.hpp>
#include <vodfetch/core/http_session.hpp>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vodfetch::core {

struct XtreamCredentials {
    std::string base_url;   // e.g. "http://provider:8080"
    std::string username;
    std::string password;
};

// Catalog backed by an Xtream Codes style player_api.php endpoint
class XtreamCatalog : public CatalogProvider {
public:
    XtreamCatalog(XtreamCredentials credentials, std::shared_ptr<HttpSession> session);

    // <base>/movie/<user>/<pass>/<id>.<ext> or <base>/series/...
    [[nodiscard]] std::string stream_url(MediaKind kind,
                                         std::string_view catalog_id,
                                         std::string_view extension) const override;

    // get_vod_categories / get_series_categories
    [[nodiscard]] std::expected<std::vector<CategoryInfo>, std::error_code>
    categories(CatalogSection section) override;

    // get_vod_streams / get_series
    [[nodiscard]] std::expected<std::vector<StreamInfo>, std::error_code>
    streams(CatalogSection section, std::string_view category_id) override;

    [[nodiscard]] std::expected<std::vector<EpisodeInfo>, std::error_code>
    series_episodes(std::string_view series_id) override;

    // player_api.php?username=..&password=..&action=<action>[&key=value...]
    [[nodiscard]] std::string api_url(std::string_view action,
                                      const std::map<std::string, std::string>& params = {}) const;

private:
    [[nodiscard]] std::expected<std::string, std::error_code>
    call(std::string_view action, const std::map<std::string, std::string>& params = {});

    XtreamCredentials credentials_;
    std::shared_ptr<HttpSession> session_;
};

// Parse a category listing. Panels answer a rejected login with an object
// instead of an array; that yields an empty list.
[[nodiscard]] std::expected<std::vector<CategoryInfo>, std::error_code>
parse_categories(std::string_view json_text, CatalogSection section);

// Parse get_vod_streams (stream_id) or get_series (series_id) output
[[nodiscard]] std::expected<std::vector<StreamInfo>, std::error_code>
parse_streams(std::string_view json_text, CatalogSection section);

// Flatten a get_series_info response into episodes sorted by season then
// episode. A body without an "episodes" member yields an empty list.
[[nodiscard]] std::expected<std::vector<EpisodeInfo>, std::error_code>
parse_series_info(std::string_view json_text);

} // namespace vodfetch::core
