//
// Created by cv2 on 23.12.2025.
//

#include "chunk_stream.hpp"
#include "crypto.hpp"
#include <algorithm>
#include <format>
#include <print>

namespace comb {

std::string_view to_string(StreamError e) {
    switch (e) {
        case StreamError::StreamUnavailable: return "stream unavailable";
        case StreamError::OffsetBeyondEnd:   return "source ended before chunk offset";
        case StreamError::ReadFailed:        return "read failed";
        case StreamError::WriteFailed:       return "write failed";
        case StreamError::DigestFailed:      return "digest failed";
        case StreamError::Cancelled:         return "cancelled";
    }
    return "unknown";
}

std::vector<Chunk> plan_chunks(uint64_t file_size, uint64_t chunk_size) {
    std::vector<Chunk> chunks;
    if (chunk_size == 0) return chunks;

    chunks.reserve(static_cast<size_t>((file_size + chunk_size - 1) / chunk_size));
    for (uint64_t offset = 0; offset < file_size; offset += chunk_size) {
        chunks.push_back(Chunk{offset, std::min(chunk_size, file_size - offset)});
    }
    return chunks;
}

std::string chunk_file_name(const std::string& file_name, size_t index, size_t total) {
    if (total <= 1) return file_name;
    return std::format("{}.chunk_{}_of_{}", file_name, index, total);
}

// --- ChunkStreamCodec ---

ChunkStreamCodec::ChunkStreamCodec(ByteSource& source, Chunk chunk, size_t buffer_size)
    : source_(source), chunk_(std::move(chunk)), buffer_(std::max<size_t>(buffer_size, 1)) {}

// Skip by reading: the stream may not support seeking at all.
std::expected<void, StreamError> ChunkStreamCodec::skip_to_offset(ByteStream& stream) {
    uint64_t skipped = 0;
    while (skipped < chunk_.offset) {
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), chunk_.offset - skipped));
        auto n = stream.read(buffer_.data(), to_read);
        if (!n) return std::unexpected(StreamError::ReadFailed);
        if (*n == 0) {
            std::println(stderr, "[Chunk] EOF while seeking to offset {} (at {}) in {}",
                         chunk_.offset, skipped, source_.name());
            return std::unexpected(StreamError::OffsetBeyondEnd);
        }
        skipped += *n;
    }
    return {};
}

std::expected<uint64_t, StreamError> ChunkStreamCodec::write_chunk(ByteSink& sink, std::stop_token stop) {
    auto stream = source_.open();
    if (!stream) {
        std::println(stderr, "[Chunk] Cannot open stream for {}", source_.name());
        return std::unexpected(StreamError::StreamUnavailable);
    }

    if (auto res = skip_to_offset(*stream); !res) return std::unexpected(res.error());

    uint64_t remaining = chunk_.length;
    uint64_t written = 0;

    while (remaining > 0) {
        if (stop.stop_requested()) return std::unexpected(StreamError::Cancelled);

        size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining));
        auto n = stream->read(buffer_.data(), to_read);
        if (!n) return std::unexpected(StreamError::ReadFailed);

        if (*n == 0) {
            std::println(stderr, "[Chunk] EOF reached early at {}/{} bytes", written, chunk_.length);
            break;
        }

        if (!sink.write(buffer_.data(), *n)) return std::unexpected(StreamError::WriteFailed);
        remaining -= *n;
        written += *n;
    }

    if (!sink.flush()) return std::unexpected(StreamError::WriteFailed);
    return written;
}

std::expected<std::string, StreamError> ChunkStreamCodec::compute_digest() {
    if (cached_digest_) return *cached_digest_;

    auto stream = source_.open();
    if (!stream) {
        std::println(stderr, "[Chunk] Cannot open stream for digest of {}", source_.name());
        return std::unexpected(StreamError::StreamUnavailable);
    }

    if (auto res = skip_to_offset(*stream); !res) return std::unexpected(res.error());

    crypto::Sha256 sha;
    uint64_t remaining = chunk_.length;
    while (remaining > 0) {
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining));
        auto n = stream->read(buffer_.data(), to_read);
        if (!n) return std::unexpected(StreamError::ReadFailed);
        if (*n == 0) break;

        if (!sha.update(buffer_.data(), *n)) return std::unexpected(StreamError::DigestFailed);
        remaining -= *n;
    }

    auto digest = sha.finish();
    if (!digest) return std::unexpected(StreamError::DigestFailed);

    std::string hex = crypto::to_hex(*digest);
    hex.resize(DIGEST_HEX_LENGTH);
    cached_digest_ = hex;
    return hex;
}

} // namespace comb
