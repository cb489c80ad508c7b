// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <string>

namespace vodfetch::core {

// Called once with the advertised Content-Length (0 when unknown)
using LengthCallback = std::function<void(std::uint64_t)>;

// Called with each CHUNK_SIZE block (the last one may be shorter).
// Returning false aborts the transfer.
using ChunkCallback = std::function<bool(std::span<const std::byte>)>;

// Streams a media URL to the caller in fixed-size chunks
class MediaSource {
public:
    virtual ~MediaSource() = default;

    // Returns {} on a complete transfer, QueueErrc::cancelled when the chunk
    // callback or the stop token aborted it, and http_error/transfer_failed
    // on failure.
    [[nodiscard]] virtual std::error_code fetch(const std::string& url,
                                                const LengthCallback& on_length,
                                                const ChunkCallback& on_chunk,
                                                std::stop_token stoken) = 0;
};

} // namespace vodfetch::core
