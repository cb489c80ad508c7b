// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/config.hpp>
#include <vodfetch/core/error.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace vodfetch::core {

// Runtime configuration. Every field has a compile-time default so an
// empty settings file is valid.
struct Settings {
    std::string provider_url;
    std::string username;
    std::string password;
    std::filesystem::path download_dir{std::string(DEFAULT_DOWNLOAD_DIR)};
    std::filesystem::path store_file;            // Empty: <download_dir>/DEFAULT_STORE_FILENAME
    double match_tolerance{DEFAULT_MATCH_TOLERANCE};
    std::chrono::milliseconds complete_hold{DEFAULT_COMPLETE_HOLD};
    std::chrono::milliseconds error_cooldown{DEFAULT_ERROR_COOLDOWN};
    std::string user_agent{DEFAULT_USER_AGENT};
    std::string log_level{"info"};

    // Effective store location
    [[nodiscard]] std::filesystem::path store_path() const;

    // Parse a JSON object. Unknown keys are ignored; a key holding the wrong
    // type or an out-of-range value fails with QueueErrc::config_error.
    [[nodiscard]] static std::expected<Settings, std::error_code> from_json(std::string_view text);

    // Read and parse a settings file
    [[nodiscard]] static std::expected<Settings, std::error_code> load(const std::filesystem::path& path);
};

} // namespace vodfetch::core
