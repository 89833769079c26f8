//
// Created by cv2 on 17.01.2026.
//

#include "task_queue_manager.hpp"
#include <print>
#include <chrono>
#include <format>
#include <algorithm>
#include <exception>

namespace comb {

namespace {

TaskQueue::Callbacks queue_callbacks(std::string_view tag) {
    std::string label(tag);
    return TaskQueue::Callbacks{
        .on_status_changed = nullptr,
        .on_completed = [label](const Task& t) {
            std::println("[Manager] {} task {} completed: {}", label, t.id, t.display_name);
        },
        .on_failed = [label](const Task& t, const std::string& error) {
            std::println(stderr, "[Manager] {} task {} failed: {}", label, t.id, error);
        },
    };
}

} // namespace

TaskQueueManager::TaskQueueManager(JobScheduler& scheduler, CancellationRegistry& cancellations,
                                   ManagerOptions options)
    : scheduler_(scheduler),
      cancellations_(cancellations),
      upload_queue_("upload_queue", "Upload Queue", TaskCategory::Upload,
                    options.max_concurrent_uploads, queue_callbacks("Upload")),
      download_queue_("download_queue", "Download Queue", TaskCategory::Download,
                      options.max_concurrent_downloads, queue_callbacks("Download")),
      progress_(options.progress_capacity),
      completed_(options.completion_capacity) {

    prune_orphaned_jobs();

    upload_queue_.subscribe([this](const std::vector<Task>& items, const std::vector<Task>&) {
        on_queue_changed(TaskCategory::Upload, items);
    });
    download_queue_.subscribe([this](const std::vector<Task>& items, const std::vector<Task>&) {
        on_queue_changed(TaskCategory::Download, items);
    });
}

TaskQueueManager::~TaskQueueManager() {
    dispose();
}

void TaskQueueManager::prune_orphaned_jobs() {
    // Jobs left over from an earlier instance have no task here to report to
    try {
        std::println("[Manager] Pruning orphaned jobs for a clean start");
        scheduler_.cancel_all();
        scheduler_.prune_completed();
    } catch (const std::exception& e) {
        std::println(stderr, "[Manager] Error pruning orphaned jobs: {}", e.what());
    }
}

TaskQueue* TaskQueueManager::queue_for(TaskCategory category) {
    switch (category) {
        case TaskCategory::Upload: return &upload_queue_;
        case TaskCategory::Download: return &download_queue_;
        case TaskCategory::GallerySync: return nullptr;
    }
    return nullptr;
}

void TaskQueueManager::on_queue_changed(TaskCategory category, const std::vector<Task>& items) {
    {
        std::lock_guard lock(view_mutex_);
        if (category == TaskCategory::Upload) {
            upload_items_ = items;
        } else {
            download_items_ = items;
        }

        if (!listeners_.empty()) {
            auto merged = all_tasks();
            auto listeners = listeners_;
            for (auto& [sid, listener] : listeners) listener(merged);
        }
    }

    {
        std::lock_guard lock(state_mutex_);
        ++state_generation_;
    }
    state_cv_.notify_all();
}

// --- Adding work ---

std::vector<std::string> TaskQueueManager::add_upload_tasks(std::vector<UploadRequest> requests) {
    std::vector<Task> tasks;
    tasks.reserve(requests.size());
    for (auto& r : requests) tasks.push_back(make_task(std::move(r)));

    std::vector<std::string> ids;
    std::vector<cell::JobDescriptor> jobs;
    for (const auto& t : tasks) {
        ids.push_back(t.id);
        jobs.push_back(to_job_descriptor(t));
    }

    upload_queue_.add_tasks(std::move(tasks));

    // One independent job per upload; the balancer spreads them over the credentials
    for (size_t i = 0; i < jobs.size(); ++i) {
        scheduler_.enqueue_unique(std::format("upload_{}", ids[i]), ExistingJobPolicy::Replace, {jobs[i]});
    }

    std::println("[Manager] Added {} upload tasks to queue", ids.size());
    return ids;
}

std::vector<std::string> TaskQueueManager::add_download_tasks(std::vector<DownloadRequest> requests) {
    std::vector<Task> tasks;
    tasks.reserve(requests.size());
    for (auto& r : requests) tasks.push_back(make_task(std::move(r)));

    std::vector<std::string> ids;
    std::vector<cell::JobDescriptor> chain;
    for (const auto& t : tasks) {
        ids.push_back(t.id);
        chain.push_back(to_job_descriptor(t));
    }

    download_queue_.add_tasks(std::move(tasks));
    if (chain.empty()) return ids;

    // Parallel fetches against the remote API get rate limited, so a batch
    // runs as one strictly sequential chain whatever the queue allows.
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto name = std::format("batch_download_{}", epoch_ms);
    size_t chained = chain.size();
    scheduler_.enqueue_unique(name, ExistingJobPolicy::AppendOrReplace, std::move(chain));

    std::println("[Manager] Chained {} download tasks sequentially as '{}'", chained, name);
    return ids;
}

void TaskQueueManager::add_gallery_sync_tasks(std::vector<GallerySyncRequest> requests) {
    // Gallery sync runs its own pipeline; nothing is queued here
    std::println("[Manager] Ignoring {} gallery sync requests (handled separately)", requests.size());
}

// --- Routing ---

void TaskQueueManager::pause_task(const std::string& task_id) {
    auto task = find_task(task_id);
    if (!task) return;
    if (auto* q = queue_for(task->category())) q->pause_task(task_id);
}

void TaskQueueManager::resume_task(const std::string& task_id) {
    auto task = find_task(task_id);
    if (!task) return;
    if (auto* q = queue_for(task->category())) q->resume_task(task_id);
}

void TaskQueueManager::cancel_task(const std::string& task_id) {
    auto task = find_task(task_id);
    if (!task || is_terminal(task->status)) return;

    auto* q = queue_for(task->category());
    if (!q) return;

    // Stop the in-flight transfer first so it stops taking credentials
    cancellations_.cancel(task_id);
    q->cancel_task(task_id);
    std::println("[Manager] Task {} cancelled", task_id);
}

void TaskQueueManager::update_task_progress(const std::string& task_id, float progress) {
    auto task = find_task(task_id);
    if (!task) return;

    auto* q = queue_for(task->category());
    if (!q) return;

    q->update_task_progress(task_id, progress);

    // Cancelled or finished tasks stay silent
    auto updated = q->get_task(task_id);
    if (!updated || is_terminal(updated->status)) return;
    emit_progress(*updated);
}

void TaskQueueManager::emit_progress(const Task& task) {
    progress_.emit(TaskProgress{task.id, task.category(), task.progress, task.display_name});
}

// --- Outcomes ---

void TaskQueueManager::mark_completed(TaskQueue& queue, const std::string& task_id) {
    if (!queue.complete_task(task_id)) return;
    if (auto task = queue.get_task(task_id)) {
        completed_.emit(*task);
        std::println("[Manager] {} task {} completed, emitted completion event", to_string(queue.category()), task_id);
    }
}

void TaskQueueManager::mark_upload_task_completed(const std::string& task_id) {
    mark_completed(upload_queue_, task_id);
}

void TaskQueueManager::mark_upload_task_failed(const std::string& task_id, const std::string& error) {
    upload_queue_.fail_task(task_id, error);
}

void TaskQueueManager::mark_download_task_completed(const std::string& task_id) {
    mark_completed(download_queue_, task_id);
}

void TaskQueueManager::mark_download_task_failed(const std::string& task_id, const std::string& error) {
    download_queue_.fail_task(task_id, error);
}

// --- Admission ---

bool TaskQueueManager::await_active(const std::string& task_id, std::stop_token stop) {
    while (!stop.stop_requested()) {
        uint64_t seen = 0;
        {
            std::lock_guard lock(state_mutex_);
            seen = state_generation_;
        }

        auto task = find_task(task_id);
        if (!task || is_terminal(task->status)) return false;
        if (task->status == TaskStatus::Active) return true;

        if (task->status == TaskStatus::Queued) {
            auto* q = queue_for(task->category());
            if (!q) return false;
            // Slots go to the oldest Queued task first
            if (q->start_if_next(task_id)) return true;
        }

        std::unique_lock lock(state_mutex_);
        state_cv_.wait(lock, stop, [&] { return state_generation_ != seen; });
    }
    return false;
}

// --- Views ---

std::optional<Task> TaskQueueManager::find_task(const std::string& task_id) const {
    std::lock_guard lock(view_mutex_);
    for (const auto* items : {&upload_items_, &download_items_}) {
        auto it = std::find_if(items->begin(), items->end(), [&](const Task& t) { return t.id == task_id; });
        if (it != items->end()) return *it;
    }
    return std::nullopt;
}

std::vector<Task> TaskQueueManager::all_tasks() const {
    std::lock_guard lock(view_mutex_);
    std::vector<Task> merged = upload_items_;
    merged.insert(merged.end(), download_items_.begin(), download_items_.end());
    return merged;
}

TaskQueueManager::SubscriptionId TaskQueueManager::subscribe_all_tasks(AllTasksListener listener) {
    std::lock_guard lock(view_mutex_);
    if (disposed_) return 0;

    SubscriptionId sid = next_subscription_++;
    listeners_.emplace(sid, listener);
    listener(all_tasks());
    return sid;
}

void TaskQueueManager::unsubscribe_all_tasks(SubscriptionId sid) {
    std::lock_guard lock(view_mutex_);
    listeners_.erase(sid);
}

size_t TaskQueueManager::active_tasks_count() const {
    return upload_queue_.active_items().size() + download_queue_.active_items().size();
}

size_t TaskQueueManager::queued_tasks_count() const {
    auto queued = [](const std::vector<Task>& items) {
        return static_cast<size_t>(std::count_if(items.begin(), items.end(),
            [](const Task& t) { return t.status == TaskStatus::Queued; }));
    };
    return queued(upload_queue_.queue_items()) + queued(download_queue_.queue_items());
}

void TaskQueueManager::forget_cancellations(const TaskQueue& queue) {
    for (const auto& t : queue.queue_items()) cancellations_.forget(t.id);
}

void TaskQueueManager::clear_upload_queue() {
    forget_cancellations(upload_queue_);
    upload_queue_.clear();
}

void TaskQueueManager::clear_download_queue() {
    forget_cancellations(download_queue_);
    download_queue_.clear();
}

void TaskQueueManager::dispose() {
    if (disposed_.exchange(true)) return;

    forget_cancellations(upload_queue_);
    forget_cancellations(download_queue_);
    upload_queue_.dispose();
    download_queue_.dispose();
    {
        std::lock_guard lock(view_mutex_);
        listeners_.clear();
    }
    std::println("[Manager] Disposed");
}

} // namespace comb
