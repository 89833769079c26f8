//
// Created by cv2 on 16.01.2026.
//

#pragma once
#include <map>
#include <set>
#include <mutex>
#include <string>
#include <stop_token>

namespace comb {

    // Links task ids to the stop source of whatever is executing them.
    // The balancer and codec only see stop tokens; this is where a task id
    // turns into one.
    class CancellationRegistry {
    public:
        // Token for the executing job. Already stopped if the task was
        // cancelled before its job started.
        std::stop_token register_task(const std::string& task_id);

        // Job finished (any outcome)
        void unregister_task(const std::string& task_id);

        // Returns true if a running job was signalled. Unknown ids are remembered
        // so a job that starts later sees the cancellation.
        bool cancel(const std::string& task_id);

        // Drops a pending cancellation for a task whose job will never start.
        // Running jobs are left alone.
        void forget(const std::string& task_id);

        bool is_cancelled(const std::string& task_id) const;
        size_t active_count() const;
        // Cancellations not yet consumed by a job start or finish
        size_t pending_count() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::stop_source> active_;
        std::set<std::string> cancelled_;
    };

} // namespace comb
