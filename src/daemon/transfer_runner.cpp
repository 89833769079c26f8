//
// Created by cv2 on 18.01.2026.
//

#include "transfer_runner.hpp"
#include <print>
#include <filesystem>

namespace comb {

namespace {

// Unregisters the task from the cancellation registry when the job ends
class RegistrationGuard {
public:
    RegistrationGuard(CancellationRegistry& registry, const std::string& task_id)
        : registry_(registry), task_id_(task_id) {}
    ~RegistrationGuard() { registry_.unregister_task(task_id_); }

    RegistrationGuard(const RegistrationGuard&) = delete;
    RegistrationGuard& operator=(const RegistrationGuard&) = delete;

private:
    CancellationRegistry& registry_;
    const std::string& task_id_;
};

} // namespace

TransferRunner::TransferRunner(TaskQueueManager& manager, CancellationRegistry& cancellations,
                               ChunkedUploader& uploader, ChunkedDownloader& downloader,
                               uint64_t chunk_size)
    : manager_(manager),
      cancellations_(cancellations),
      uploader_(uploader),
      downloader_(downloader),
      chunk_size_(chunk_size) {}

void TransferRunner::run(const cell::JobDescriptor& job, std::stop_token scheduler_stop) {
    const std::string& task_id = job.task_id();

    auto payload = payload_from_job(job);
    if (!payload) {
        std::println(stderr, "[Runner] Job for task {} has no payload ({})", task_id,
                     cell::Category_Name(job.category()));
        return;
    }

    // Either the user cancelling the task or the scheduler dropping the job stops the transfer
    std::stop_source stop;
    auto task_token = cancellations_.register_task(task_id);
    RegistrationGuard guard(cancellations_, task_id);
    std::stop_callback on_cancel(task_token, [&stop] { stop.request_stop(); });
    std::stop_callback on_drop(scheduler_stop, [&stop] { stop.request_stop(); });

    if (!manager_.await_active(task_id, stop.get_token())) {
        std::println("[Runner] Task {} not started (cancelled or removed)", task_id);
        return;
    }

    std::visit(overloaded{
        [&](const UploadRequest& r) { run_upload(task_id, r, stop.get_token()); },
        [&](const DownloadRequest& r) { run_download(task_id, r, stop.get_token()); },
        [&](const GallerySyncRequest&) {
            std::println("[Runner] Gallery sync task {} is handled separately", task_id);
        },
    }, *payload);
}

TransferHooks TransferRunner::hooks_for(const std::string& task_id, std::stop_token stop) {
    TransferHooks hooks;
    hooks.on_progress = [this, task_id](size_t done, size_t total) {
        if (total == 0) return;
        manager_.update_task_progress(task_id, static_cast<float>(done) / static_cast<float>(total));
    };
    // A paused task holds its workers here (between chunks, no credential held)
    hooks.checkpoint = [this, task_id, stop] {
        return manager_.await_active(task_id, stop);
    };
    return hooks;
}

void TransferRunner::run_upload(const std::string& task_id, const UploadRequest& request, std::stop_token stop) {
    uint64_t size = request.size_bytes;
    if (size == 0) {
        std::error_code ec;
        auto actual = std::filesystem::file_size(request.source_path, ec);
        if (ec) {
            std::println(stderr, "[Runner] Cannot stat {}: {}", request.source_path, ec.message());
            manager_.mark_upload_task_failed(task_id, std::string(to_string(TransferError::SourceUnavailable)));
            return;
        }
        size = actual;
    }

    FileSource source(request.source_path);
    UploadOptions options;
    options.chunk_size = chunk_size_;

    auto display = request.display_name.empty()
        ? std::filesystem::path(request.source_path).filename().string()
        : request.display_name;

    auto result = uploader_.upload(source, display, size, options, hooks_for(task_id, stop), stop);
    if (!result) {
        // A cancelled task is already terminal in its queue, this is then a no-op
        manager_.mark_upload_task_failed(task_id, std::string(to_string(result.error())));
        return;
    }

    if (on_manifest_) on_manifest_(task_id, *result);
    manager_.mark_upload_task_completed(task_id);
}

void TransferRunner::run_download(const std::string& task_id, const DownloadRequest& request, std::stop_token stop) {
    auto result = downloader_.download(request, hooks_for(task_id, stop), stop);
    if (!result) {
        manager_.mark_download_task_failed(task_id, std::string(to_string(result.error())));
        return;
    }
    manager_.mark_download_task_completed(task_id);
}

} // namespace comb
