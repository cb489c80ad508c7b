// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace vodfetch::core {

enum class QueueErrc {
    success = 0,
    already_queued,
    already_downloaded,
    job_not_found,
    record_not_found,
    queue_empty,
    invalid_item,
    transfer_failed,
    http_error,
    cancelled,
    store_write_failed,
    catalog_error,
    file_error,
    config_error,
};

namespace detail {

struct QueueErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "vodfetch::queue";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<QueueErrc>(ev)) {
            case QueueErrc::success:            return "Success";
            case QueueErrc::already_queued:     return "Item is already queued";
            case QueueErrc::already_downloaded: return "Item is already downloaded";
            case QueueErrc::job_not_found:      return "Job not found";
            case QueueErrc::record_not_found:   return "Download record not found";
            case QueueErrc::queue_empty:        return "Queue is empty";
            case QueueErrc::invalid_item:       return "Invalid catalog item";
            case QueueErrc::transfer_failed:    return "Transfer failed";
            case QueueErrc::http_error:         return "HTTP error response";
            case QueueErrc::cancelled:          return "Transfer cancelled";
            case QueueErrc::store_write_failed: return "Failed to write download store";
            case QueueErrc::catalog_error:      return "Catalog request failed";
            case QueueErrc::file_error:         return "File error";
            case QueueErrc::config_error:       return "Invalid configuration";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::QueueErrcCategory& queue_errc_category() noexcept {
    static detail::QueueErrcCategory category;
    return category;
}

inline std::error_code make_error_code(QueueErrc e) noexcept {
    return {static_cast<int>(e), queue_errc_category()};
}

} // namespace vodfetch::core

namespace std {

template<>
struct is_error_code_enum<vodfetch::core::QueueErrc> : true_type {};

} // namespace std
