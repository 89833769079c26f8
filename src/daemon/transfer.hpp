//
// Created by cv2 on 18.01.2026.
//

#pragma once
#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>

#include "balancer.hpp"
#include "chunk_store.hpp"
#include "task.hpp"

namespace comb {

    enum class TransferError {
        NoCredentials,
        TooManyOperations,
        SourceUnavailable,
        SinkUnavailable,
        PrematureEndOfStream,
        DigestFailed,
        IntegrityMismatch,
        InvalidManifest,
        RateLimited,
        StoreFailed,
        Cancelled
    };

    std::string_view to_string(TransferError e);

    struct UploadedChunk {
        size_t index = 0;
        int64_t message_id = 0;
        std::string remote_file_id;
        std::string digest;
        std::string credential; // the one that uploaded it
        uint64_t size_bytes = 0;
    };

    struct UploadResult {
        std::string file_id;
        std::string name;
        uint64_t size_bytes = 0;
        size_t total_chunks = 0;
        std::vector<UploadedChunk> chunks; // ordered by index
    };

    struct UploadOptions {
        uint64_t chunk_size = FILE_CHUNK_SIZE;
        // Reused when resuming, generated otherwise
        std::string file_id;
        // Chunks a previous attempt already stored; they are not sent again
        std::vector<UploadedChunk> completed;
    };

    // Called from worker threads, possibly concurrently
    struct TransferHooks {
        std::function<void(size_t done, size_t total)> on_progress;
        std::function<void(const UploadedChunk&)> on_chunk_completed;
        // Runs before each chunk; may block (paused task). false aborts with Cancelled.
        std::function<bool()> checkpoint;
    };

    // Splits a source into chunks and sends them with several workers, each
    // chunk under its own balancer credential. No retries: the first failing
    // chunk stops the rest.
    class ChunkedUploader {
    public:
        ChunkedUploader(CredentialBalancer& balancer, ChunkStore& store, std::vector<std::string> credentials);

        std::expected<UploadResult, TransferError> upload(ByteSource& source,
                                                          const std::string& display_name,
                                                          uint64_t size_bytes,
                                                          const UploadOptions& options,
                                                          const TransferHooks& hooks = {},
                                                          std::stop_token stop = {});

    private:
        CredentialBalancer& balancer_;
        ChunkStore& store_;
        std::vector<std::string> credentials_;
    };

    // Fetches the chunks of a file one after another into the target path,
    // checking each against its recorded digest.
    class ChunkedDownloader {
    public:
        ChunkedDownloader(CredentialBalancer& balancer, ChunkStore& store, std::vector<std::string> credentials);

        // Returns the number of bytes written
        std::expected<uint64_t, TransferError> download(const DownloadRequest& request,
                                                        const TransferHooks& hooks = {},
                                                        std::stop_token stop = {});

    private:
        CredentialBalancer& balancer_;
        ChunkStore& store_;
        std::vector<std::string> credentials_;
    };

} // namespace comb
