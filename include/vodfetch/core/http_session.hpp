// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/config.hpp>
#include <vodfetch/core/error.hpp>
#include <vodfetch/core/media_source.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace vodfetch::core {

// libcurl-backed HTTP client: small API requests and streamed media
class HttpSession : public MediaSource {
public:
    explicit HttpSession(std::string user_agent = std::string(DEFAULT_USER_AGENT));
    ~HttpSession() override = default;

    // Non-copyable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // GET a small resource into memory (API_TIMEOUT_SEC total timeout)
    [[nodiscard]] std::expected<std::string, std::error_code>
    get_text(const std::string& url) const noexcept;

    // Stream a resource in CHUNK_SIZE blocks
    [[nodiscard]] std::error_code fetch(const std::string& url,
                                        const LengthCallback& on_length,
                                        const ChunkCallback& on_chunk,
                                        std::stop_token stoken) override;

    // Percent-encode a query component
    [[nodiscard]] static std::string escape(std::string_view value);

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string user_agent_;
};

} // namespace vodfetch::core
