//
// Created by cv2 on 18.01.2026.
//

#pragma once
#include <string>
#include <cstdint>
#include <expected>
#include <stop_token>
#include "chunk_stream.hpp"

namespace comb {

    enum class StoreError {
        Unreachable,
        Timeout,
        RateLimited,
        Rejected,
        ProtocolError,
        SourceFailed,
        SinkFailed,
        Cancelled
    };

    std::string_view to_string(StoreError e);

    // What the remote side gets told about a chunk besides its bytes
    struct ChunkDescriptor {
        std::string chunk_name;
        std::string file_id;
        uint32_t index = 0;
        uint32_t total = 1;
        std::string digest;
    };

    struct StoredChunk {
        int64_t message_id = 0;
        std::string remote_file_id;
        uint64_t bytes_sent = 0;
    };

    // The remote chunk store. Every call runs under a credential the caller
    // already holds from the balancer; implementations never pick one themselves.
    class ChunkStore {
    public:
        virtual ~ChunkStore() = default;

        // Streams the codec's range to the store. bytes_sent is what the codec
        // actually produced, which can be short of content_length().
        virtual std::expected<StoredChunk, StoreError> send_chunk(const std::string& credential,
                                                                  const ChunkDescriptor& chunk,
                                                                  ChunkStreamCodec& codec,
                                                                  std::stop_token stop) = 0;

        // Streams a stored chunk into the sink; returns bytes written
        virtual std::expected<uint64_t, StoreError> fetch_chunk(const std::string& credential,
                                                                const std::string& remote_file_id,
                                                                ByteSink& sink,
                                                                std::stop_token stop) = 0;
    };

} // namespace comb
