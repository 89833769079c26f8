//
// Created by cv2 on 17.01.2026.
//

#include "job_scheduler.hpp"

namespace comb {

cell::JobDescriptor to_job_descriptor(const Task& task) {
    cell::JobDescriptor job;
    job.set_task_id(task.id);

    std::visit(overloaded{
        [&](const UploadRequest& r) {
            job.set_category(cell::UPLOAD);
            auto* up = job.mutable_upload();
            up->set_source_path(r.source_path);
            up->set_display_name(r.display_name);
            up->set_size_bytes(r.size_bytes);
        },
        [&](const DownloadRequest& r) {
            job.set_category(cell::DOWNLOAD);
            auto* down = job.mutable_download();
            down->set_file_name(r.file_name);
            down->set_message_id(r.message_id);
            down->set_target_path(r.target_path);
            down->set_size_bytes(r.size_bytes);
            for (const auto& c : r.chunks) {
                auto* ref = down->add_chunks();
                ref->set_remote_file_id(c.remote_file_id);
                ref->set_digest(c.digest);
                ref->set_size_bytes(c.size_bytes);
            }
        },
        [&](const GallerySyncRequest&) {
            // Gallery sync has no payload in the job, the worker rescans on its own
            job.set_category(cell::GALLERY_SYNC);
        },
    }, task.payload);

    return job;
}

std::optional<TaskPayload> payload_from_job(const cell::JobDescriptor& job) {
    switch (job.payload_case()) {
        case cell::JobDescriptor::kUpload: {
            const auto& up = job.upload();
            return UploadRequest{up.source_path(), up.display_name(), up.size_bytes()};
        }
        case cell::JobDescriptor::kDownload: {
            const auto& down = job.download();
            DownloadRequest r;
            r.file_name = down.file_name();
            r.size_bytes = down.size_bytes();
            r.message_id = down.message_id();
            r.target_path = down.target_path();
            for (const auto& c : down.chunks()) {
                r.chunks.push_back(RemoteChunk{c.remote_file_id(), c.digest(), c.size_bytes()});
            }
            return r;
        }
        case cell::JobDescriptor::PAYLOAD_NOT_SET:
            break;
    }
    return std::nullopt;
}

} // namespace comb
