// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/file_matcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <regex>

namespace fs = std::filesystem;

namespace vodfetch::core {

namespace {

bool is_separator(char c, bool dots) noexcept {
    return c == ' ' || c == '-' || c == '_' || c == '\t' || (dots && c == '.');
}

// Collapse separator runs into single spaces and trim the ends
std::string collapse(std::string_view text, bool lower, bool dots = false) {
    std::string out;
    out.reserve(text.size());
    bool pending = false;
    for (char c : text) {
        if (is_separator(c, dots)) {
            pending = true;
            continue;
        }
        if (pending && !out.empty()) {
            out += ' ';
        }
        pending = false;
        out += lower ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : c;
    }
    return out;
}

std::string strip_extension(std::string_view filename) {
    return fs::path(std::string(filename)).filename().stem().string();
}

std::string trim_series(std::string_view text) {
    auto first = text.find_first_not_of(" .-_");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" .-_");
    return std::string(text.substr(first, last - first + 1));
}

// Series names compare with dots treated as separators ("Show.Name")
std::string series_key(std::string_view series) {
    return collapse(series, true, true);
}

const std::regex& episode_marker() {
    static const std::regex re(R"(\bs(\d{1,3})e(\d{1,4}))", std::regex::icase);
    return re;
}

ParsedName parse_base(std::string_view base) {
    ParsedName parsed;
    parsed.name = collapse(base, true);

    const std::string cleaned = collapse(base, false);
    std::smatch m;
    if (std::regex_search(cleaned, m, episode_marker())) {
        parsed.kind = MediaKind::episode;
        parsed.season = std::stoi(m[1].str());
        parsed.episode = std::stoi(m[2].str());
        parsed.series_name = trim_series(std::string_view(cleaned).substr(0, m.position(0)));
    }
    return parsed;
}

std::int64_t now_epoch_seconds() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

std::string normalize_title(std::string_view text) {
    return collapse(text, true);
}

std::string normalize(std::string_view filename) {
    return collapse(strip_extension(filename), true);
}

ParsedName parse(std::string_view filename) {
    return parse_base(strip_extension(filename));
}

ParsedName parse_title(std::string_view title) {
    return parse_base(title);
}

bool names_match(std::string_view a, std::string_view b, double tolerance) noexcept {
    if (a.empty() || b.empty()) {
        return false;
    }
    if (a.find(b) == std::string_view::npos && b.find(a) == std::string_view::npos) {
        return false;
    }

    const auto longer = static_cast<double>(std::max(a.size(), b.size()));
    const auto diff = static_cast<double>(a.size() > b.size() ? a.size() - b.size() : b.size() - a.size());
    return diff < tolerance * longer;
}

//=============================================================================
// FileMatcher
//=============================================================================

FileMatcher::FileMatcher(double tolerance) noexcept
    : tolerance_(tolerance) {}

std::size_t FileMatcher::scan(const fs::path& directory) {
    std::unordered_map<std::string, ScannedFile> index;
    const auto now = now_epoch_seconds();

    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", directory.string(), ec.message());
    } else {
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                spdlog::warn("Scan of {} stopped early: {}", directory.string(), ec.message());
                break;
            }

            const auto& entry = *it;
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) continue;

            auto filename = entry.path().filename().string();
            if (filename.empty() || filename.front() == '.') continue;

            auto size = entry.file_size(entry_ec);
            if (entry_ec || size <= MIN_SCAN_FILE_SIZE) continue;

            ScannedFile file;
            file.key = normalize(filename);
            file.filename = filename;
            file.path = entry.path();
            file.size_mb = static_cast<double>(size) / BYTES_PER_MB;
            file.scanned_at = now;
            file.parsed = parse(filename);
            index.insert_or_assign(file.key, std::move(file));
        }
    }

    std::size_t count = index.size();
    {
        std::unique_lock lock(mutex_);
        index_ = std::move(index);
    }
    spdlog::info("Scanned {}: {} media files indexed", directory.string(), count);
    return count;
}

std::optional<ScannedFile> FileMatcher::match(std::string_view title, MediaKind kind) const {
    if (kind == MediaKind::episode) {
        auto parsed = parse_title(title);
        if (parsed.kind != MediaKind::episode) {
            return std::nullopt;
        }
        return match_episode(parsed.series_name, *parsed.season, *parsed.episode);
    }

    const auto wanted = normalize_title(title);
    std::shared_lock lock(mutex_);
    for (const auto& [_, file] : index_) {
        if (file.parsed.kind != MediaKind::movie) continue;
        if (names_match(file.parsed.name, wanted, tolerance_)) {
            return file;
        }
    }
    return std::nullopt;
}

std::optional<ScannedFile> FileMatcher::match_episode(std::string_view series_name,
                                                      int season,
                                                      int episode) const {
    const auto wanted = series_key(series_name);
    if (wanted.empty()) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    for (const auto& [_, file] : index_) {
        const auto& p = file.parsed;
        if (p.kind != MediaKind::episode) continue;
        if (p.season != season || p.episode != episode) continue;

        const auto have = series_key(p.series_name);
        if (have.empty()) continue;
        if (have.find(wanted) != std::string::npos || wanted.find(have) != std::string::npos) {
            return file;
        }
    }
    return std::nullopt;
}

std::vector<ScannedFile> FileMatcher::files() const {
    std::shared_lock lock(mutex_);
    std::vector<ScannedFile> result;
    result.reserve(index_.size());
    for (const auto& [_, file] : index_) {
        result.push_back(file);
    }
    return result;
}

std::size_t FileMatcher::size() const noexcept {
    std::shared_lock lock(mutex_);
    return index_.size();
}

} // namespace vodfetch::core
