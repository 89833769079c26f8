//
// Created by cv2 on 18.01.2026.
//

#pragma once
#include <string>
#include <functional>
#include <stop_token>

#include "transfer.hpp"
#include "task_queue_manager.hpp"
#include "cancellation_registry.hpp"

namespace comb {

    // Executes scheduler jobs: one JobDescriptor in, one terminal outcome
    // reported back to the manager.
    class TransferRunner {
    public:
        // Chunk manifest of a finished upload, needed later to download the file
        using ManifestCallback = std::function<void(const std::string& task_id, const UploadResult&)>;

        TransferRunner(TaskQueueManager& manager, CancellationRegistry& cancellations,
                       ChunkedUploader& uploader, ChunkedDownloader& downloader,
                       uint64_t chunk_size = FILE_CHUNK_SIZE);

        void set_manifest_callback(ManifestCallback cb) { on_manifest_ = std::move(cb); }

        // LocalJobScheduler handler
        void run(const cell::JobDescriptor& job, std::stop_token scheduler_stop);

    private:
        void run_upload(const std::string& task_id, const UploadRequest& request, std::stop_token stop);
        void run_download(const std::string& task_id, const DownloadRequest& request, std::stop_token stop);
        TransferHooks hooks_for(const std::string& task_id, std::stop_token stop);

        TaskQueueManager& manager_;
        CancellationRegistry& cancellations_;
        ChunkedUploader& uploader_;
        ChunkedDownloader& downloader_;
        uint64_t chunk_size_;
        ManifestCallback on_manifest_;
    };

} // namespace comb
