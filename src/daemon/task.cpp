//
// Created by cv2 on 13.01.2026.
//

#include "task.hpp"
#include <atomic>
#include <random>
#include <format>

namespace comb {

std::string_view to_string(TaskCategory c) {
    switch (c) {
        case TaskCategory::Upload:      return "upload";
        case TaskCategory::Download:    return "download";
        case TaskCategory::GallerySync: return "gallery_sync";
    }
    return "unknown";
}

std::string_view to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Queued:    return "queued";
        case TaskStatus::Active:    return "active";
        case TaskStatus::Paused:    return "paused";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

TaskCategory Task::category() const {
    return std::visit(overloaded{
        [](const UploadRequest&)      { return TaskCategory::Upload; },
        [](const DownloadRequest&)    { return TaskCategory::Download; },
        [](const GallerySyncRequest&) { return TaskCategory::GallerySync; },
    }, payload);
}

// Counter keeps ids unique within the process, the random part keeps them
// from colliding with ids of a previous run.
std::string next_task_id() {
    static std::atomic<uint64_t> counter{0};
    static const uint32_t session = std::random_device{}();
    return std::format("{:08x}-{:06x}", session, ++counter);
}

Task make_task(UploadRequest request) {
    Task t;
    t.id = next_task_id();
    t.display_name = request.display_name;
    t.size_bytes = request.size_bytes;
    t.payload = std::move(request);
    return t;
}

Task make_task(DownloadRequest request) {
    Task t;
    t.id = next_task_id();
    t.display_name = request.file_name;
    t.size_bytes = request.size_bytes;
    t.payload = std::move(request);
    return t;
}

Task make_task(GallerySyncRequest request) {
    Task t;
    t.id = next_task_id();
    t.display_name = request.media_path;
    t.size_bytes = request.size_bytes;
    t.payload = std::move(request);
    return t;
}

} // namespace comb
