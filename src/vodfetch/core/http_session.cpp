// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <vector>

namespace vodfetch::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// State shared with the streaming callbacks
struct StreamContext {
    CURL* curl{nullptr};
    const LengthCallback* on_length{nullptr};
    const ChunkCallback* on_chunk{nullptr};
    std::stop_token stoken;
    std::vector<std::byte> buffer;
    bool length_reported{false};
    bool aborted{false};

    void report_length() {
        if (length_reported) return;
        length_reported = true;

        curl_off_t cl = -1;
        if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) != CURLE_OK || cl < 0) {
            cl = 0;
        }
        if (*on_length) {
            (*on_length)(static_cast<std::uint64_t>(cl));
        }
    }

    bool deliver() {
        bool keep_going = (*on_chunk)(std::span<const std::byte>(buffer.data(), buffer.size()));
        buffer.clear();
        return keep_going;
    }
};

// Regroup curl's writes into CHUNK_SIZE blocks
std::size_t stream_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<StreamContext*>(userdata);
    const std::size_t total = size * nmemb;

    try {
        ctx->report_length();

        std::size_t offset = 0;
        while (offset < total) {
            const std::size_t take = std::min(CHUNK_SIZE - ctx->buffer.size(), total - offset);
            const auto* first = reinterpret_cast<const std::byte*>(ptr + offset);
            ctx->buffer.insert(ctx->buffer.end(), first, first + take);
            offset += take;

            if (ctx->buffer.size() == CHUNK_SIZE && !ctx->deliver()) {
                ctx->aborted = true;
                return 0;  // Abort the transfer
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Chunk handler failed: {}", e.what());
        return 0;
    }

    return total;
}

// libcurl progress callback - aborts once the worker thread is asked to exit
int stream_xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<StreamContext*>(userdata);
    return ctx->stoken.stop_requested() ? 1 : 0;
}

std::size_t text_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* out = static_cast<std::string*>(userdata);
    const std::size_t total = size * nmemb;
    try {
        out->append(ptr, total);
    } catch (const std::exception&) {
        return 0;
    }
    return total;
}

void apply_common_options(CURL* curl, const std::string& url, const std::string& user_agent) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
}

std::error_code map_result(CURL* curl, CURLcode result, const std::string& url) {
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        spdlog::warn("HTTP {} from {}", http_code, url);
        return make_error_code(QueueErrc::http_error);
    }
    spdlog::warn("curl error {} ({}) for {}", static_cast<int>(result), curl_easy_strerror(result), url);
    return make_error_code(QueueErrc::transfer_failed);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

std::expected<std::string, std::error_code>
HttpSession::get_text(const std::string& url) const noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(QueueErrc::transfer_failed));
    }

    std::string body;
    apply_common_options(curl.ptr, url, user_agent_);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(API_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, text_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(map_result(curl.ptr, result, url));
    }
    return body;
}

std::error_code HttpSession::fetch(const std::string& url,
                                   const LengthCallback& on_length,
                                   const ChunkCallback& on_chunk,
                                   std::stop_token stoken) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(QueueErrc::transfer_failed);
    }

    StreamContext ctx;
    ctx.curl = curl.ptr;
    ctx.on_length = &on_length;
    ctx.on_chunk = &on_chunk;
    ctx.stoken = std::move(stoken);
    ctx.buffer.reserve(CHUNK_SIZE);

    apply_common_options(curl.ptr, url, user_agent_);

    // Abort a stream that stalls; a long pause may also trip the server side
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, stream_xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);  // Enable progress callback

    CURLcode result = curl_easy_perform(curl.ptr);

    // Cancellation (not an error)
    if (ctx.aborted || result == CURLE_ABORTED_BY_CALLBACK) {
        return make_error_code(QueueErrc::cancelled);
    }
    if (result != CURLE_OK) {
        return map_result(curl.ptr, result, url);
    }

    try {
        ctx.report_length();  // Empty bodies never reach the write callback
        if (!ctx.buffer.empty() && !ctx.deliver()) {
            return make_error_code(QueueErrc::cancelled);
        }
    } catch (const std::exception& e) {
        spdlog::error("Chunk handler failed: {}", e.what());
        return make_error_code(QueueErrc::transfer_failed);
    }

    return {};
}

std::string HttpSession::escape(std::string_view value) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += HEX[uc >> 4];
            out += HEX[uc & 0x0F];
        }
    }
    return out;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace vodfetch::core
