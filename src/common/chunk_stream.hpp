//
// Created by cv2 on 23.12.2025.
//

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <stop_token>
#include "byte_stream.hpp"

namespace comb {

    // Chunk size used when splitting files for the remote store (4MB)
    constexpr uint64_t FILE_CHUNK_SIZE = 4 * 1024 * 1024;
    // Copy/digest buffer. Small on purpose: memory per transfer stays at ~8KB
    // no matter how many chunks are in flight.
    constexpr size_t STREAM_BUFFER_SIZE = 8 * 1024;
    // Digest length carried in chunk manifests
    constexpr size_t DIGEST_HEX_LENGTH = 16;

    enum class StreamError {
        StreamUnavailable,
        OffsetBeyondEnd,
        ReadFailed,
        WriteFailed,
        DigestFailed,
        Cancelled
    };

    std::string_view to_string(StreamError e);

    struct Chunk {
        uint64_t offset = 0;
        uint64_t length = 0;
        std::string media_type = "application/octet-stream";
    };

    // Split [0, file_size) into chunk_size pieces. The last one may be shorter.
    std::vector<Chunk> plan_chunks(uint64_t file_size, uint64_t chunk_size = FILE_CHUNK_SIZE);

    // "<name>.chunk_<index>_of_<total>" or just the name for single-chunk files
    std::string chunk_file_name(const std::string& file_name, size_t index, size_t total);

    // Streams one byte range of a source into a sink, and hashes the same range,
    // both with a single fixed-size buffer. The two are separate read passes.
    class ChunkStreamCodec {
    public:
        ChunkStreamCodec(ByteSource& source, Chunk chunk, size_t buffer_size = STREAM_BUFFER_SIZE);

        const Chunk& chunk() const { return chunk_; }
        uint64_t content_length() const { return chunk_.length; }
        const std::string& media_type() const { return chunk_.media_type; }

        // Copy up to chunk.length bytes into the sink and flush it.
        // Returns bytes written; a short count means the source ended early,
        // which the caller must treat as an incomplete chunk.
        std::expected<uint64_t, StreamError> write_chunk(ByteSink& sink, std::stop_token stop = {});

        // First DIGEST_HEX_LENGTH hex chars of the SHA-256 of the range.
        // Cached after the first successful call.
        std::expected<std::string, StreamError> compute_digest();

        void reset_digest_cache() { cached_digest_.reset(); }

    private:
        std::expected<void, StreamError> skip_to_offset(ByteStream& stream);

        ByteSource& source_;
        Chunk chunk_;
        std::vector<uint8_t> buffer_;
        std::optional<std::string> cached_digest_;
    };

} // namespace comb
