// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace vodfetch::core {

constexpr std::size_t CHUNK_SIZE = 1024 * 1024;                    // 1 MiB per write
constexpr std::uint64_t MIN_VALID_FILE_SIZE = 1024 * 1024;          // Smaller files are error pages
constexpr std::uint64_t MIN_SCAN_FILE_SIZE = 1024 * 1024;

constexpr double DEFAULT_MATCH_TOLERANCE = 0.5;                     // Movie name length ratio

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t API_TIMEOUT_SEC = 15;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::chrono::milliseconds DEFAULT_COMPLETE_HOLD{2000};
constexpr std::chrono::milliseconds DEFAULT_ERROR_COOLDOWN{5000};

constexpr std::string_view DEFAULT_DOWNLOAD_DIR = "/downloads";
constexpr std::string_view DEFAULT_STORE_FILENAME = ".vodfetch_downloads.json";
constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

} // namespace vodfetch::core
