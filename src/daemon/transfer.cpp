//
// Created by cv2 on 18.01.2026.
//

#include "transfer.hpp"
#include <mutex>
#include <print>
#include <atomic>
#include <random>
#include <format>
#include <thread>
#include <optional>
#include <algorithm>
#include <filesystem>

namespace comb {

namespace {

std::string make_file_id() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) | rd());
    return std::format("{:016x}{:016x}", gen(), gen());
}

TransferError from_store(StoreError e) {
    switch (e) {
        case StoreError::Cancelled:    return TransferError::Cancelled;
        case StoreError::RateLimited:  return TransferError::RateLimited;
        case StoreError::SourceFailed: return TransferError::SourceUnavailable;
        case StoreError::SinkFailed:   return TransferError::SinkUnavailable;
        case StoreError::Unreachable:
        case StoreError::Timeout:
        case StoreError::Rejected:
        case StoreError::ProtocolError:
            return TransferError::StoreFailed;
    }
    return TransferError::StoreFailed;
}

TransferError from_balancer(BalancerError e) {
    switch (e) {
        case BalancerError::EmptyCredentialPool: return TransferError::NoCredentials;
        case BalancerError::Cancelled:           return TransferError::Cancelled;
    }
    return TransferError::Cancelled;
}

} // namespace

std::string_view to_string(StoreError e) {
    switch (e) {
        case StoreError::Unreachable:   return "store unreachable";
        case StoreError::Timeout:       return "store timed out";
        case StoreError::RateLimited:   return "rate limited";
        case StoreError::Rejected:      return "rejected by store";
        case StoreError::ProtocolError: return "malformed store reply";
        case StoreError::SourceFailed:  return "reading the chunk failed";
        case StoreError::SinkFailed:    return "writing the chunk failed";
        case StoreError::Cancelled:     return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(TransferError e) {
    switch (e) {
        case TransferError::NoCredentials:        return "no credentials configured";
        case TransferError::TooManyOperations:    return "too many concurrent operations";
        case TransferError::SourceUnavailable:    return "source unavailable";
        case TransferError::SinkUnavailable:      return "target unavailable";
        case TransferError::PrematureEndOfStream: return "premature end of stream";
        case TransferError::DigestFailed:         return "digest failed";
        case TransferError::IntegrityMismatch:    return "chunk digest mismatch";
        case TransferError::InvalidManifest:      return "invalid chunk manifest";
        case TransferError::RateLimited:          return "rate limited";
        case TransferError::StoreFailed:          return "remote store failed";
        case TransferError::Cancelled:            return "cancelled";
    }
    return "unknown";
}

// --- Upload ---

ChunkedUploader::ChunkedUploader(CredentialBalancer& balancer, ChunkStore& store, std::vector<std::string> credentials)
    : balancer_(balancer), store_(store), credentials_(std::move(credentials)) {}

std::expected<UploadResult, TransferError> ChunkedUploader::upload(ByteSource& source,
                                                                   const std::string& display_name,
                                                                   uint64_t size_bytes,
                                                                   const UploadOptions& options,
                                                                   const TransferHooks& hooks,
                                                                   std::stop_token stop) {
    if (credentials_.empty()) return std::unexpected(TransferError::NoCredentials);

    UploadResult result;
    result.file_id = options.file_id.empty() ? make_file_id() : options.file_id;
    result.name = display_name;
    result.size_bytes = size_bytes;

    auto plan = plan_chunks(size_bytes, options.chunk_size);
    if (plan.empty()) plan.push_back(Chunk{0, 0}); // empty file still gets one (empty) chunk
    result.total_chunks = plan.size();

    std::set<size_t> skip;
    for (const auto& c : options.completed) {
        if (c.index < plan.size()) {
            skip.insert(c.index);
            result.chunks.push_back(c);
        }
    }

    std::vector<size_t> pending;
    for (size_t i = 0; i < plan.size(); ++i) {
        if (!skip.contains(i)) pending.push_back(i);
    }

    std::println("[Upload] Starting chunked upload: {}", display_name);
    std::println("[Upload]   size {} bytes, {} chunks, {} credentials, file id {}",
                 size_bytes, plan.size(), credentials_.size(), result.file_id);
    if (!skip.empty()) {
        std::println("[Upload]   resuming, {} chunks already stored", skip.size());
    }

    OperationRegistration registration(balancer_);
    if (!registration.admitted()) {
        std::println(stderr, "[Upload] Too many concurrent operations, cannot start {}", display_name);
        return std::unexpected(TransferError::TooManyOperations);
    }

    // First failure stops all workers; an external stop does the same
    std::stop_source abort;
    std::stop_callback forward(stop, [&abort] { abort.request_stop(); });

    std::mutex result_mutex;
    std::optional<TransferError> failure;
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{skip.size()};

    auto fail = [&](TransferError e) {
        {
            std::lock_guard lock(result_mutex);
            if (!failure) failure = e;
        }
        abort.request_stop();
    };

    auto worker = [&](int worker_id) {
        auto token = abort.get_token();
        while (!token.stop_requested()) {
            size_t slot = next.fetch_add(1);
            if (slot >= pending.size()) break;
            size_t index = pending[slot];

            if (hooks.checkpoint && !hooks.checkpoint()) {
                fail(TransferError::Cancelled);
                break;
            }

            ChunkStreamCodec codec(source, plan[index]);
            ChunkDescriptor desc;
            desc.chunk_name = chunk_file_name(display_name, index, plan.size());
            desc.file_id = result.file_id;
            desc.index = static_cast<uint32_t>(index);
            desc.total = static_cast<uint32_t>(plan.size());

            auto sent = balancer_.with_credential(credentials_, result.file_id,
                [&](const std::string& credential) -> std::expected<UploadedChunk, TransferError> {
                    auto digest = codec.compute_digest();
                    if (!digest) {
                        std::println(stderr, "[Upload] Digest of chunk {} failed: {}", index, to_string(digest.error()));
                        switch (digest.error()) {
                            case StreamError::StreamUnavailable: return std::unexpected(TransferError::SourceUnavailable);
                            case StreamError::OffsetBeyondEnd:   return std::unexpected(TransferError::PrematureEndOfStream);
                            default:                             return std::unexpected(TransferError::DigestFailed);
                        }
                    }
                    desc.digest = *digest;

                    auto stored = store_.send_chunk(credential, desc, codec, token);
                    if (!stored) {
                        std::println(stderr, "[Upload] Chunk {} failed: {}", index, to_string(stored.error()));
                        return std::unexpected(from_store(stored.error()));
                    }
                    if (stored->bytes_sent != codec.content_length()) {
                        std::println(stderr, "[Upload] Chunk {} incomplete: sent {} of {} bytes",
                                     index, stored->bytes_sent, codec.content_length());
                        return std::unexpected(TransferError::PrematureEndOfStream);
                    }

                    return UploadedChunk{index, stored->message_id, stored->remote_file_id,
                                         *digest, credential, stored->bytes_sent};
                }, token);

            if (!sent) {
                fail(from_balancer(sent.error()));
                break;
            }
            if (!*sent) {
                fail(sent->error());
                break;
            }

            {
                std::lock_guard lock(result_mutex);
                result.chunks.push_back(**sent);
            }
            size_t completed = ++done;
            std::println("[Upload] Worker {}: chunk {} stored ({}/{})", worker_id, index, completed, plan.size());
            if (hooks.on_progress) hooks.on_progress(completed, plan.size());
            if (hooks.on_chunk_completed) hooks.on_chunk_completed(**sent);
        }
    };

    int workers = std::clamp<int>(balancer_.recommended_workers(static_cast<int>(credentials_.size())),
                                  1, static_cast<int>(std::max<size_t>(pending.size(), 1)));
    std::println("[Upload] Using {} workers (active operations: {})", workers, balancer_.active_operations());
    {
        std::vector<std::jthread> threads;
        threads.reserve(workers);
        for (int i = 0; i < workers; ++i) threads.emplace_back(worker, i);
    }

    if (!failure && stop.stop_requested()) failure = TransferError::Cancelled;
    if (failure) {
        std::println(stderr, "[Upload] {} failed: {}", display_name, to_string(*failure));
        return std::unexpected(*failure);
    }

    std::ranges::sort(result.chunks, {}, &UploadedChunk::index);
    std::println("[Upload] Chunked upload completed: {}", display_name);
    return result;
}

// --- Download ---

ChunkedDownloader::ChunkedDownloader(CredentialBalancer& balancer, ChunkStore& store, std::vector<std::string> credentials)
    : balancer_(balancer), store_(store), credentials_(std::move(credentials)) {}

std::expected<uint64_t, TransferError> ChunkedDownloader::download(const DownloadRequest& request,
                                                                   const TransferHooks& hooks,
                                                                   std::stop_token stop) {
    if (credentials_.empty()) return std::unexpected(TransferError::NoCredentials);

    uint64_t declared = 0;
    for (const auto& c : request.chunks) declared += c.size_bytes;
    if (request.target_path.empty() || (request.chunks.empty() && request.size_bytes > 0) ||
        (request.size_bytes > 0 && declared > 0 && declared != request.size_bytes)) {
        std::println(stderr, "[Download] Invalid manifest for {}", request.file_name);
        return std::unexpected(TransferError::InvalidManifest);
    }

    OperationRegistration registration(balancer_);
    if (!registration.admitted()) {
        std::println(stderr, "[Download] Too many concurrent operations, cannot start {}", request.file_name);
        return std::unexpected(TransferError::TooManyOperations);
    }

    const std::filesystem::path target(request.target_path);
    std::println("[Download] {} ({} chunks) -> {}", request.file_name, request.chunks.size(), target.string());

    uint64_t offset = 0;
    const auto operation = std::format("download_{}", request.message_id);

    for (size_t i = 0; i < request.chunks.size(); ++i) {
        const auto& remote = request.chunks[i];

        if (stop.stop_requested()) return std::unexpected(TransferError::Cancelled);
        if (hooks.checkpoint && !hooks.checkpoint()) return std::unexpected(TransferError::Cancelled);

        std::expected<std::expected<uint64_t, TransferError>, BalancerError> fetched;
        {
            FileSink sink(target, offset);
            if (!sink.is_open()) {
                std::println(stderr, "[Download] Cannot open {} for writing", target.string());
                return std::unexpected(TransferError::SinkUnavailable);
            }

            fetched = balancer_.with_credential(credentials_, operation,
                [&](const std::string& credential) -> std::expected<uint64_t, TransferError> {
                    auto n = store_.fetch_chunk(credential, remote.remote_file_id, sink, stop);
                    if (!n) {
                        std::println(stderr, "[Download] Chunk {} failed: {}", i, to_string(n.error()));
                        return std::unexpected(from_store(n.error()));
                    }
                    if (auto flushed = sink.flush(); !flushed) return std::unexpected(TransferError::SinkUnavailable);
                    return *n;
                }, stop);
        }

        if (!fetched) return std::unexpected(from_balancer(fetched.error()));
        if (!*fetched) return std::unexpected(fetched->error());

        uint64_t written = **fetched;
        if (remote.size_bytes > 0 && written != remote.size_bytes) {
            std::println(stderr, "[Download] Chunk {} incomplete: got {} of {} bytes", i, written, remote.size_bytes);
            return std::unexpected(TransferError::PrematureEndOfStream);
        }

        // Verify what actually landed on disk
        if (!remote.digest.empty()) {
            FileSource written_file(target);
            ChunkStreamCodec codec(written_file, Chunk{offset, written});
            auto digest = codec.compute_digest();
            if (!digest) return std::unexpected(TransferError::DigestFailed);
            if (*digest != remote.digest) {
                std::println(stderr, "[Download] Chunk {} digest mismatch: {} != {}", i, *digest, remote.digest);
                return std::unexpected(TransferError::IntegrityMismatch);
            }
        }

        offset += written;
        if (hooks.on_progress) hooks.on_progress(i + 1, request.chunks.size());
    }

    // Drop whatever an older, longer file left past the end
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        FileSink touch(target, 0);
        if (!touch.is_open()) return std::unexpected(TransferError::SinkUnavailable);
    }
    std::filesystem::resize_file(target, offset, ec);
    if (ec) {
        std::println(stderr, "[Download] Cannot truncate {}: {}", target.string(), ec.message());
        return std::unexpected(TransferError::SinkUnavailable);
    }

    std::println("[Download] Complete: {} ({} bytes)", target.string(), offset);
    return offset;
}

} // namespace comb
