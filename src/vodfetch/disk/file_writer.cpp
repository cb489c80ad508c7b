// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/disk/file_writer.hpp>
#include <cerrno>
#include <utility>

namespace vodfetch::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
            return make_error_code(DiskErrc::disk_full);
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG:
            return make_error_code(DiskErrc::invalid_path);
        default:
            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : file_(std::exchange(other.file_, nullptr))
    , path_(std::move(other.path_))
    , written_(std::exchange(other.written_, 0)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        file_ = std::exchange(other.file_, nullptr);
        path_ = std::move(other.path_);
        written_ = std::exchange(other.written_, 0);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    close();

    if (path.empty() || !path.has_filename()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error_code(DiskErrc::invalid_path);
        }
    }

    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        return from_errno(errno, DiskErrc::open_failed);
    }

    path_ = path;
    written_ = 0;
    return {};
}

std::error_code FileWriter::write(std::span<const std::byte> data) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (data.empty()) {
        return {};
    }

    std::size_t n = std::fwrite(data.data(), 1, data.size(), file_);
    if (n != data.size()) {
        return from_errno(errno, DiskErrc::write_error);
    }

    written_ += n;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (!file_) {
        return;
    }
    (void)std::fflush(file_);
    std::fclose(file_);
    file_ = nullptr;
}

} // namespace vodfetch::disk
