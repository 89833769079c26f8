//
// Created by cv2 on 19.01.2026.
//

#include "zmq_chunk_store.hpp"
#include "cell.pb.h"
#include <print>

namespace comb {

namespace {

constexpr uint32_t STATUS_OK = 200;
constexpr uint32_t STATUS_RATE_LIMITED = 429;

std::string short_token(const std::string& token) {
    return token.substr(0, 10) + "...";
}

// Every write becomes one frame of the pending multipart message
class FrameSink : public ByteSink {
public:
    explicit FrameSink(zmq::socket_t& socket) : socket_(socket) {}

    std::expected<void, IoError> write(const uint8_t* data, size_t len) override {
        auto sent = socket_.send(zmq::const_buffer(data, len), zmq::send_flags::sndmore);
        if (!sent) return std::unexpected(IoError::WriteFailed);
        return {};
    }

    std::expected<void, IoError> flush() override { return {}; }

private:
    zmq::socket_t& socket_;
};

StoreError from_status(const cell::ChunkResponse& resp) {
    if (resp.status() == STATUS_RATE_LIMITED) return StoreError::RateLimited;
    return StoreError::Rejected;
}

} // namespace

ZmqChunkStore::ZmqChunkStore(std::string endpoint, std::string channel_id, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), channel_id_(std::move(channel_id)), timeout_(timeout) {}

zmq::socket_t ZmqChunkStore::connect() {
    zmq::socket_t sock(ctx_, zmq::socket_type::req);
    sock.set(zmq::sockopt::linger, 0);
    sock.set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_.count()));
    sock.set(zmq::sockopt::sndtimeo, static_cast<int>(timeout_.count()));
    sock.connect(endpoint_);
    return sock;
}

std::expected<StoredChunk, StoreError> ZmqChunkStore::send_chunk(const std::string& credential,
                                                                 const ChunkDescriptor& chunk,
                                                                 ChunkStreamCodec& codec,
                                                                 std::stop_token stop) {
    cell::ChunkRequest req;
    req.set_type(cell::ChunkRequest::SEND);
    req.set_credential(credential);
    req.set_channel_id(channel_id_);
    req.set_chunk_name(chunk.chunk_name);
    req.set_file_id(chunk.file_id);
    req.set_chunk_index(chunk.index);
    req.set_total_chunks(chunk.total);
    req.set_digest(chunk.digest);
    req.set_media_type(codec.media_type());
    req.set_size_bytes(codec.content_length());

    std::string header;
    if (!req.SerializeToString(&header)) return std::unexpected(StoreError::ProtocolError);

    try {
        auto sock = connect();
        if (!sock.send(zmq::buffer(header), zmq::send_flags::sndmore)) return std::unexpected(StoreError::Timeout);

        FrameSink sink(sock);
        auto written = codec.write_chunk(sink, stop);

        // The empty frame ends the message whatever happened above; a body shorter
        // than size_bytes is rejected on the other side.
        if (!sock.send(zmq::message_t{}, zmq::send_flags::none)) return std::unexpected(StoreError::Timeout);

        if (!written) {
            std::println(stderr, "[Store] Streaming {} failed: {}", chunk.chunk_name, to_string(written.error()));
            return std::unexpected(written.error() == StreamError::Cancelled ? StoreError::Cancelled
                                                                             : StoreError::SourceFailed);
        }

        zmq::message_t reply;
        if (!sock.recv(reply, zmq::recv_flags::none)) {
            std::println(stderr, "[Store] No reply for {} via {}", chunk.chunk_name, short_token(credential));
            return std::unexpected(StoreError::Timeout);
        }

        cell::ChunkResponse resp;
        if (!resp.ParseFromArray(reply.data(), static_cast<int>(reply.size()))) {
            return std::unexpected(StoreError::ProtocolError);
        }
        if (resp.status() != STATUS_OK) {
            std::println(stderr, "[Store] {} refused ({}): {}", chunk.chunk_name, resp.status(), resp.error_msg());
            return std::unexpected(from_status(resp));
        }

        return StoredChunk{resp.message_id(), resp.remote_file_id(), *written};
    } catch (const zmq::error_t& e) {
        std::println(stderr, "[Store] ZMQ error sending {}: {}", chunk.chunk_name, e.what());
        return std::unexpected(StoreError::Unreachable);
    }
}

std::expected<uint64_t, StoreError> ZmqChunkStore::fetch_chunk(const std::string& credential,
                                                               const std::string& remote_file_id,
                                                               ByteSink& sink,
                                                               std::stop_token stop) {
    cell::ChunkRequest req;
    req.set_type(cell::ChunkRequest::FETCH);
    req.set_credential(credential);
    req.set_channel_id(channel_id_);
    req.set_remote_file_id(remote_file_id);

    std::string data;
    if (!req.SerializeToString(&data)) return std::unexpected(StoreError::ProtocolError);

    try {
        auto sock = connect();
        if (!sock.send(zmq::buffer(data), zmq::send_flags::none)) return std::unexpected(StoreError::Timeout);

        zmq::message_t header;
        if (!sock.recv(header, zmq::recv_flags::none)) {
            std::println(stderr, "[Store] No reply fetching {} via {}", remote_file_id, short_token(credential));
            return std::unexpected(StoreError::Timeout);
        }

        cell::ChunkResponse resp;
        if (!resp.ParseFromArray(header.data(), static_cast<int>(header.size()))) {
            return std::unexpected(StoreError::ProtocolError);
        }
        if (resp.status() != STATUS_OK) {
            std::println(stderr, "[Store] Fetch of {} refused ({}): {}", remote_file_id, resp.status(), resp.error_msg());
            return std::unexpected(from_status(resp));
        }

        uint64_t received = 0;
        while (header.more()) {
            if (stop.stop_requested()) return std::unexpected(StoreError::Cancelled);

            zmq::message_t frame;
            if (!sock.recv(frame, zmq::recv_flags::none)) return std::unexpected(StoreError::Timeout);
            if (frame.size() > 0) {
                if (!sink.write(static_cast<const uint8_t*>(frame.data()), frame.size())) {
                    return std::unexpected(StoreError::SinkFailed);
                }
                received += frame.size();
            }
            header = std::move(frame);
        }
        return received;
    } catch (const zmq::error_t& e) {
        std::println(stderr, "[Store] ZMQ error fetching {}: {}", remote_file_id, e.what());
        return std::unexpected(StoreError::Unreachable);
    }
}

} // namespace comb
