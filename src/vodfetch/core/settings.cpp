// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/settings.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>

namespace vodfetch::core {

namespace {

using nlohmann::json;

bool read_string(const json& doc, const char* key, std::string& out) {
    auto it = doc.find(key);
    if (it == doc.end()) return true;
    if (!it->is_string()) {
        spdlog::error("Setting '{}' must be a string", key);
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_millis(const json& doc, const char* key, std::chrono::milliseconds& out) {
    auto it = doc.find(key);
    if (it == doc.end()) return true;
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        spdlog::error("Setting '{}' must be a non-negative integer", key);
        return false;
    }
    out = std::chrono::milliseconds(it->get<std::int64_t>());
    return true;
}

} // namespace

std::filesystem::path Settings::store_path() const {
    if (!store_file.empty()) {
        return store_file;
    }
    return download_dir / std::string(DEFAULT_STORE_FILENAME);
}

std::expected<Settings, std::error_code> Settings::from_json(std::string_view text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::error("Settings are not a JSON object");
        return std::unexpected(make_error_code(QueueErrc::config_error));
    }

    Settings s;
    std::string download_dir = s.download_dir.string();
    std::string store_file;

    bool ok = read_string(doc, "provider_url", s.provider_url)
           && read_string(doc, "username", s.username)
           && read_string(doc, "password", s.password)
           && read_string(doc, "download_dir", download_dir)
           && read_string(doc, "store_file", store_file)
           && read_string(doc, "user_agent", s.user_agent)
           && read_string(doc, "log_level", s.log_level)
           && read_millis(doc, "complete_hold_ms", s.complete_hold)
           && read_millis(doc, "error_cooldown_ms", s.error_cooldown);
    if (!ok) {
        return std::unexpected(make_error_code(QueueErrc::config_error));
    }

    // spdlog maps unknown names to "off"
    if (s.log_level != "off" && spdlog::level::from_str(s.log_level) == spdlog::level::off) {
        spdlog::error("Setting 'log_level' has unknown value '{}'", s.log_level);
        return std::unexpected(make_error_code(QueueErrc::config_error));
    }

    if (auto it = doc.find("match_tolerance"); it != doc.end()) {
        if (!it->is_number()) {
            spdlog::error("Setting 'match_tolerance' must be a number");
            return std::unexpected(make_error_code(QueueErrc::config_error));
        }
        s.match_tolerance = it->get<double>();
    }
    if (s.match_tolerance <= 0.0 || s.match_tolerance > 1.0) {
        spdlog::error("Setting 'match_tolerance' must be in (0, 1], got {}", s.match_tolerance);
        return std::unexpected(make_error_code(QueueErrc::config_error));
    }

    if (download_dir.empty()) {
        spdlog::error("Setting 'download_dir' must not be empty");
        return std::unexpected(make_error_code(QueueErrc::config_error));
    }
    s.download_dir = download_dir;
    s.store_file = store_file;
    return s;
}

std::expected<Settings, std::error_code> Settings::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("Cannot open settings file {}", path.string());
        return std::unexpected(make_error_code(QueueErrc::config_error));
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto settings = from_json(text);
    if (settings) {
        spdlog::debug("Loaded settings from {}", path.string());
    }
    return settings;
}

} // namespace vodfetch::core
