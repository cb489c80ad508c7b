// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/xtream_catalog.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <optional>
#include <utility>

namespace vodfetch::core {

namespace {

using nlohmann::json;

constexpr std::string_view DEFAULT_EXTENSION = "mp4";

// Xtream panels send ids and numbers either as JSON numbers or strings
std::string as_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_unsigned()) return std::to_string(value.get<std::uint64_t>());
    if (value.is_number_integer()) return std::to_string(value.get<std::int64_t>());
    return {};
}

std::optional<int> as_int(const json& value) {
    if (value.is_number_integer()) return static_cast<int>(value.get<std::int64_t>());
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        int out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if (ec == std::errc{} && ptr == s.data() + s.size()) return out;
    }
    return std::nullopt;
}

const json& member(const json& obj, const char* key) {
    static const json null_value;
    auto it = obj.find(key);
    return it != obj.end() ? *it : null_value;
}

std::optional<int> key_as_int(std::string_view key) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), out);
    if (ec == std::errc{} && ptr == key.data() + key.size()) return out;
    return std::nullopt;
}

void append_season(const json& episodes, std::optional<int> season_key,
                   const std::string& series_name, std::vector<EpisodeInfo>& out) {
    if (!episodes.is_array()) return;

    for (const auto& ep : episodes) {
        if (!ep.is_object()) continue;

        EpisodeInfo info;
        info.id = as_string(member(ep, "id"));
        if (info.id.empty()) {
            spdlog::debug("Skipping episode without id");
            continue;
        }
        info.title = ep.value("title", std::string{});
        info.extension = as_string(member(ep, "container_extension"));
        if (info.extension.empty()) {
            info.extension = DEFAULT_EXTENSION;
        }
        info.series_name = series_name;
        info.season = as_int(member(ep, "season")).value_or(season_key.value_or(0));
        info.episode = as_int(member(ep, "episode_num")).value_or(0);
        out.push_back(std::move(info));
    }
}

std::string_view id_member(CatalogSection section) noexcept {
    return section == CatalogSection::movies ? "stream_id" : "series_id";
}

} // namespace

std::string_view section_prefix(CatalogSection section) noexcept {
    return section == CatalogSection::movies ? "movie" : "series";
}

//=============================================================================
// Response parsing
//=============================================================================

std::expected<std::vector<CategoryInfo>, std::error_code>
parse_categories(std::string_view json_text, CatalogSection section) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(make_error_code(QueueErrc::catalog_error));
    }

    std::vector<CategoryInfo> result;
    if (!doc.is_array()) {
        return result;
    }

    for (const auto& entry : doc) {
        if (!entry.is_object()) continue;

        CategoryInfo info;
        info.section = section;
        info.id = as_string(member(entry, "category_id"));
        if (info.id.empty()) continue;
        info.name = as_string(member(entry, "category_name"));
        result.push_back(std::move(info));
    }
    return result;
}

std::expected<std::vector<StreamInfo>, std::error_code>
parse_streams(std::string_view json_text, CatalogSection section) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(make_error_code(QueueErrc::catalog_error));
    }

    std::vector<StreamInfo> result;
    if (!doc.is_array()) {
        return result;
    }

    const std::string key(id_member(section));
    for (const auto& entry : doc) {
        if (!entry.is_object()) continue;

        StreamInfo info;
        info.section = section;
        info.id = as_string(member(entry, key.c_str()));
        if (info.id.empty()) {
            spdlog::debug("Skipping {} entry without {}", section_prefix(section), key);
            continue;
        }
        info.name = as_string(member(entry, "name"));
        if (section == CatalogSection::movies) {
            info.extension = as_string(member(entry, "container_extension"));
            if (info.extension.empty()) {
                info.extension = DEFAULT_EXTENSION;
            }
        }
        result.push_back(std::move(info));
    }
    return result;
}

std::expected<std::vector<EpisodeInfo>, std::error_code>
parse_series_info(std::string_view json_text) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(make_error_code(QueueErrc::catalog_error));
    }

    std::vector<EpisodeInfo> result;
    if (!doc.is_object() || !doc.contains("episodes")) {
        return result;
    }

    try {
        std::string series_name;
        if (auto info = doc.find("info"); info != doc.end() && info->is_object()) {
            series_name = info->value("name", std::string{});
        }

        const json& episodes = doc["episodes"];
        if (episodes.is_object()) {
            for (const auto& [season, list] : episodes.items()) {
                append_season(list, key_as_int(season), series_name, result);
            }
        } else if (episodes.is_array()) {
            // Some panels send consecutive seasons as a plain array
            int season = 1;
            for (const auto& list : episodes) {
                append_season(list, season++, series_name, result);
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("Malformed series info: {}", e.what());
        return std::unexpected(make_error_code(QueueErrc::catalog_error));
    }

    std::stable_sort(result.begin(), result.end(), [](const EpisodeInfo& a, const EpisodeInfo& b) {
        return std::pair(a.season, a.episode) < std::pair(b.season, b.episode);
    });
    return result;
}

//=============================================================================
// XtreamCatalog
//=============================================================================

XtreamCatalog::XtreamCatalog(XtreamCredentials credentials, std::shared_ptr<HttpSession> session)
    : credentials_(std::move(credentials))
    , session_(std::move(session)) {
    while (!credentials_.base_url.empty() && credentials_.base_url.back() == '/') {
        credentials_.base_url.pop_back();
    }
}

std::string XtreamCatalog::stream_url(MediaKind kind,
                                      std::string_view catalog_id,
                                      std::string_view extension) const {
    std::string url = credentials_.base_url;
    url += '/';
    url += kind_prefix(kind);
    url += '/';
    url += credentials_.username;
    url += '/';
    url += credentials_.password;
    url += '/';
    url += catalog_id;
    url += '.';
    url += extension;
    return url;
}

std::string XtreamCatalog::api_url(std::string_view action,
                                   const std::map<std::string, std::string>& params) const {
    std::string url = credentials_.base_url + "/player_api.php";
    url += "?username=" + HttpSession::escape(credentials_.username);
    url += "&password=" + HttpSession::escape(credentials_.password);
    url += "&action=" + HttpSession::escape(action);
    for (const auto& [key, value] : params) {
        url += '&';
        url += HttpSession::escape(key);
        url += '=';
        url += HttpSession::escape(value);
    }
    return url;
}

std::expected<std::string, std::error_code>
XtreamCatalog::call(std::string_view action, const std::map<std::string, std::string>& params) {
    auto body = session_->get_text(api_url(action, params));
    if (!body) {
        spdlog::error("API error ({}): {}", action, body.error().message());
        return std::unexpected(make_error_code(QueueErrc::catalog_error));
    }
    return body;
}

std::expected<std::vector<CategoryInfo>, std::error_code>
XtreamCatalog::categories(CatalogSection section) {
    std::string_view action = section == CatalogSection::movies ? "get_vod_categories"
                                                                : "get_series_categories";
    auto body = call(action);
    if (!body) {
        return std::unexpected(body.error());
    }

    auto result = parse_categories(*body, section);
    if (!result) {
        spdlog::error("API error ({}): unparseable response", action);
    }
    return result;
}

std::expected<std::vector<StreamInfo>, std::error_code>
XtreamCatalog::streams(CatalogSection section, std::string_view category_id) {
    std::string_view action = section == CatalogSection::movies ? "get_vod_streams" : "get_series";
    auto body = call(action, {{"category_id", std::string(category_id)}});
    if (!body) {
        return std::unexpected(body.error());
    }

    auto result = parse_streams(*body, section);
    if (!result) {
        spdlog::error("API error ({} {}): unparseable response", action, category_id);
        return result;
    }

    spdlog::debug("Category {} has {} entries", category_id, result->size());
    return result;
}

std::expected<std::vector<EpisodeInfo>, std::error_code>
XtreamCatalog::series_episodes(std::string_view series_id) {
    auto body = call("get_series_info", {{"series_id", std::string(series_id)}});
    if (!body) {
        return std::unexpected(body.error());
    }

    auto episodes = parse_series_info(*body);
    if (!episodes) {
        spdlog::error("API error (get_series_info {}): unparseable response", series_id);
        return episodes;
    }

    spdlog::debug("Series {} has {} episodes", series_id, episodes->size());
    return episodes;
}

} // namespace vodfetch::core
