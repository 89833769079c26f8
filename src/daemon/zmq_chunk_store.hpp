//
// Created by cv2 on 19.01.2026.
//

#pragma once
#include <string>
#include <chrono>
#include <zmq.hpp>

#include "chunk_store.hpp"

namespace comb {

    // ChunkStore backed by the chunk gateway, a separate process that speaks
    // the messaging API. One REQ socket per call; chunk bytes travel as
    // STREAM_BUFFER_SIZE frames after the protobuf header frame.
    class ZmqChunkStore : public ChunkStore {
    public:
        ZmqChunkStore(std::string endpoint, std::string channel_id,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

        std::expected<StoredChunk, StoreError> send_chunk(const std::string& credential,
                                                          const ChunkDescriptor& chunk,
                                                          ChunkStreamCodec& codec,
                                                          std::stop_token stop) override;

        std::expected<uint64_t, StoreError> fetch_chunk(const std::string& credential,
                                                        const std::string& remote_file_id,
                                                        ByteSink& sink,
                                                        std::stop_token stop) override;

        const std::string& endpoint() const { return endpoint_; }

    private:
        zmq::socket_t connect();

        zmq::context_t ctx_;
        std::string endpoint_;
        std::string channel_id_;
        std::chrono::milliseconds timeout_;
    };

} // namespace comb
