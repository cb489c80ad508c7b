// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>

namespace vodfetch::disk {

// Sequential writer for a single download destination
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create parent directories and truncate the file for writing
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append data
    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close; safe to call twice
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }

private:
    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    std::uint64_t written_{0};
};

} // namespace vodfetch::disk
