// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/job.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace vodfetch::core {

namespace {

constexpr std::string_view ILLEGAL_PATH_CHARS = "<>:\"/\\|?*";

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

MediaKind Job::kind() const noexcept {
    return std::holds_alternative<MovieItem>(item) ? MediaKind::movie : MediaKind::episode;
}

const std::string& Job::catalog_id() const noexcept {
    return std::visit(overloaded{
        [](const MovieItem& m) -> const std::string& { return m.catalog_id; },
        [](const EpisodeItem& e) -> const std::string& { return e.catalog_id; },
    }, item);
}

std::string Job::item_id() const {
    return make_item_id(kind(), catalog_id());
}

std::string Job::filename() const {
    return std::filesystem::path(destination).filename().string();
}

std::string_view kind_prefix(MediaKind kind) noexcept {
    return kind == MediaKind::movie ? "movie" : "series";
}

std::string_view to_string(MediaKind kind) noexcept {
    return kind == MediaKind::movie ? "Movie" : "Episode";
}

std::string make_item_id(MediaKind kind, std::string_view catalog_id) {
    std::string id(kind_prefix(kind));
    id += ':';
    id += catalog_id;
    return id;
}

std::string sanitize_filename(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (ILLEGAL_PATH_CHARS.find(c) != std::string_view::npos || std::iscntrl(uc)) {
            continue;
        }
        result += c;
    }

    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    result.erase(result.begin(), std::find_if(result.begin(), result.end(), not_space));
    result.erase(std::find_if(result.rbegin(), result.rend(), not_space).base(), result.end());
    return result;
}

} // namespace vodfetch::core
