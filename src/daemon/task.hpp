//
// Created by cv2 on 13.01.2026.
//

#pragma once
#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <optional>
#include <string_view>

namespace comb {

    enum class TaskCategory {
        Upload,
        Download,
        GallerySync
    };

    enum class TaskStatus {
        Queued,
        Active,
        Paused,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(TaskCategory c);
    std::string_view to_string(TaskStatus s);

    inline bool is_terminal(TaskStatus s) {
        return s == TaskStatus::Completed || s == TaskStatus::Failed || s == TaskStatus::Cancelled;
    }

    // One chunk already stored remotely, as recorded by the upload that produced it
    struct RemoteChunk {
        std::string remote_file_id;
        std::string digest; // 16 hex chars
        uint64_t size_bytes = 0;
    };

    struct UploadRequest {
        std::string source_path;
        std::string display_name;
        uint64_t size_bytes = 0;
    };

    struct DownloadRequest {
        std::string file_name;
        uint64_t size_bytes = 0;
        int64_t message_id = 0;
        std::string target_path;
        std::vector<RemoteChunk> chunks;
    };

    struct GallerySyncRequest {
        std::string media_path;
        uint64_t size_bytes = 0;
    };

    using TaskPayload = std::variant<UploadRequest, DownloadRequest, GallerySyncRequest>;

    template <typename... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <typename... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    struct Task {
        std::string id;
        TaskPayload payload;
        TaskStatus status = TaskStatus::Queued;
        float progress = 0.0f;
        std::string display_name;
        uint64_t size_bytes = 0;
        std::optional<std::string> error;

        TaskCategory category() const;
    };

    // Fresh, process-unique id
    std::string next_task_id();

    Task make_task(UploadRequest request);
    Task make_task(DownloadRequest request);
    Task make_task(GallerySyncRequest request);

} // namespace comb
