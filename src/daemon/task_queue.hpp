//
// Created by cv2 on 13.01.2026.
//

#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <iterator>
#include "task.hpp"

namespace comb {

    // Tasks of one category plus a concurrency ceiling.
    //
    // The queue never starts work by itself. An external driver asks for
    // next_queued()/has_free_slot() and promotes with start_task(), which refuses
    // to go past max_concurrent. Every mutating call notifies subscribers.
    //
    // Ids that are unknown (or already terminal) are ignored, never an error.
    class TaskQueue {
    public:
        using TaskCallback = std::function<void(const Task&)>;
        using FailureCallback = std::function<void(const Task&, const std::string&)>;
        using Listener = std::function<void(const std::vector<Task>& queue_items,
                                            const std::vector<Task>& active_items)>;
        using SubscriptionId = size_t;

        struct Callbacks {
            TaskCallback on_status_changed;
            TaskCallback on_completed;
            FailureCallback on_failed;
        };

        TaskQueue(std::string id, std::string name, TaskCategory category,
                  size_t max_concurrent, Callbacks callbacks = {});

        TaskQueue(const TaskQueue&) = delete;
        TaskQueue& operator=(const TaskQueue&) = delete;

        const std::string& id() const { return id_; }
        const std::string& name() const { return name_; }
        TaskCategory category() const { return category_; }
        size_t max_concurrent() const { return max_concurrent_; }

        // Appends in Queued state. Ids already present are skipped.
        void add_tasks(std::vector<Task> tasks);

        // Queued -> Active, only if a slot is free. Returns whether it happened.
        bool start_task(const std::string& task_id);
        // Like start_task(), but only for the oldest Queued task
        bool start_if_next(const std::string& task_id);

        // Oldest Queued task, the one eligible for the next free slot
        std::optional<std::string> next_queued() const;
        bool has_free_slot() const;
        size_t available_slots() const;

        void pause_task(const std::string& task_id);   // Active -> Paused
        void resume_task(const std::string& task_id);  // Paused -> Queued
        void cancel_task(const std::string& task_id);  // non-terminal -> Cancelled

        // Clamped to [0, 1]
        void update_task_progress(const std::string& task_id, float progress);

        // Terminal transitions; the matching callback fires once. Return false if nothing changed.
        bool complete_task(const std::string& task_id);
        bool fail_task(const std::string& task_id, const std::string& message);

        std::optional<Task> get_task(const std::string& task_id) const;

        void clear();
        // Drops Completed/Failed/Cancelled tasks
        size_t prune_finished();

        std::vector<Task> queue_items() const;
        std::vector<Task> active_items() const;

        // The listener gets called right away with the current state
        SubscriptionId subscribe(Listener listener);
        void unsubscribe(SubscriptionId id);

        // Drops subscribers; later mutations no longer notify. Idempotent.
        void dispose();

    private:
        Task* find(const std::string& task_id); // mutex_ held
        const Task* find(const std::string& task_id) const;
        size_t active_count() const;            // mutex_ held
        bool promote(Task* t);                  // mutex_ held
        void status_changed(const Task& task);

        // Both views from one lock; callers hold delivery_mutex_
        void snapshot(std::vector<Task>& items, std::vector<Task>& active) const;
        void notify();

        const std::string id_;
        const std::string name_;
        const TaskCategory category_;
        const size_t max_concurrent_;
        Callbacks callbacks_;

        mutable std::mutex mutex_;
        std::vector<Task> tasks_;

        // Serializes deliveries so subscribers never see an older snapshot after a newer one
        std::recursive_mutex delivery_mutex_;
        std::map<SubscriptionId, Listener> listeners_;
        SubscriptionId next_subscription_ = 1;
        bool disposed_ = false;
    };

} // namespace comb
