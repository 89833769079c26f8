//
// Created by cv2 on 17.01.2026.
//

#pragma once
#include <map>
#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <stop_token>
#include <condition_variable>

#include "task_queue.hpp"
#include "event_channel.hpp"
#include "job_scheduler.hpp"
#include "cancellation_registry.hpp"

namespace comb {

    struct TaskProgress {
        std::string task_id;
        TaskCategory category = TaskCategory::Upload;
        float progress = 0.0f;
        std::string display_name;
    };

    struct ManagerOptions {
        size_t max_concurrent_uploads = 3;
        size_t max_concurrent_downloads = 3;
        size_t progress_capacity = 32;
        size_t completion_capacity = 16;
    };

    // Front door for transfers: one upload queue, one download queue, the
    // merged task view and the event channels. Jobs go out to the scheduler;
    // whoever runs them reports back through the mark_* calls.
    class TaskQueueManager {
    public:
        using AllTasksListener = std::function<void(const std::vector<Task>&)>;
        using SubscriptionId = size_t;

        // Hard-resets the scheduler (cancel everything, prune) before anything is queued
        TaskQueueManager(JobScheduler& scheduler, CancellationRegistry& cancellations,
                         ManagerOptions options = {});
        ~TaskQueueManager();

        TaskQueueManager(const TaskQueueManager&) = delete;
        TaskQueueManager& operator=(const TaskQueueManager&) = delete;

        // Returns the ids of the created tasks, in request order
        std::vector<std::string> add_upload_tasks(std::vector<UploadRequest> requests);
        std::vector<std::string> add_download_tasks(std::vector<DownloadRequest> requests);
        void add_gallery_sync_tasks(std::vector<GallerySyncRequest> requests);

        void pause_task(const std::string& task_id);
        void resume_task(const std::string& task_id);
        void cancel_task(const std::string& task_id);
        void update_task_progress(const std::string& task_id, float progress);

        void mark_upload_task_completed(const std::string& task_id);
        void mark_upload_task_failed(const std::string& task_id, const std::string& error);
        void mark_download_task_completed(const std::string& task_id);
        void mark_download_task_failed(const std::string& task_id, const std::string& error);

        // Blocks until the task holds an Active slot in its queue. Queued tasks are
        // promoted oldest first as slots free up, Paused ones wait for resume.
        // False if the task is gone, terminal, or `stop` fires.
        bool await_active(const std::string& task_id, std::stop_token stop = {});

        std::optional<Task> find_task(const std::string& task_id) const;
        std::vector<Task> all_tasks() const;
        SubscriptionId subscribe_all_tasks(AllTasksListener listener);
        void unsubscribe_all_tasks(SubscriptionId id);

        EventChannel<TaskProgress>& progress_updates() { return progress_; }
        EventChannel<Task>& completed_events() { return completed_; }

        size_t active_tasks_count() const;
        size_t queued_tasks_count() const;

        // Also drops pending cancellations of the removed tasks
        void clear_upload_queue();
        void clear_download_queue();

        TaskQueue& upload_queue() { return upload_queue_; }
        TaskQueue& download_queue() { return download_queue_; }

        void dispose();

    private:
        void prune_orphaned_jobs();
        TaskQueue* queue_for(TaskCategory category);
        void on_queue_changed(TaskCategory category, const std::vector<Task>& items);
        void mark_completed(TaskQueue& queue, const std::string& task_id);
        void emit_progress(const Task& task);
        void forget_cancellations(const TaskQueue& queue);

        JobScheduler& scheduler_;
        CancellationRegistry& cancellations_;

        TaskQueue upload_queue_;
        TaskQueue download_queue_;

        EventChannel<TaskProgress> progress_;
        EventChannel<Task> completed_;

        // Merged view, rebuilt from queue notifications
        mutable std::recursive_mutex view_mutex_;
        std::vector<Task> upload_items_;
        std::vector<Task> download_items_;
        std::map<SubscriptionId, AllTasksListener> listeners_;
        SubscriptionId next_subscription_ = 1;

        // Wakes await_active() on any queue change
        std::mutex state_mutex_;
        std::condition_variable_any state_cv_;
        uint64_t state_generation_ = 0;

        std::atomic<bool> disposed_{false};
    };

} // namespace comb
