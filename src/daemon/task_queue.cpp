//
// Created by cv2 on 13.01.2026.
//

#include "task_queue.hpp"
#include <algorithm>
#include <cmath>
#include <print>

namespace comb {

TaskQueue::TaskQueue(std::string id, std::string name, TaskCategory category,
                     size_t max_concurrent, Callbacks callbacks)
    : id_(std::move(id)),
      name_(std::move(name)),
      category_(category),
      max_concurrent_(std::max<size_t>(max_concurrent, 1)),
      callbacks_(std::move(callbacks)) {}

Task* TaskQueue::find(const std::string& task_id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Task& t) { return t.id == task_id; });
    return it == tasks_.end() ? nullptr : &*it;
}

const Task* TaskQueue::find(const std::string& task_id) const {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Task& t) { return t.id == task_id; });
    return it == tasks_.end() ? nullptr : &*it;
}

size_t TaskQueue::active_count() const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [](const Task& t) { return t.status == TaskStatus::Active; }));
}

void TaskQueue::status_changed(const Task& task) {
    std::println("[Queue] {}: task {} -> {}", name_, task.id, to_string(task.status));
    if (callbacks_.on_status_changed) callbacks_.on_status_changed(task);
}

// --- Mutations ---

void TaskQueue::add_tasks(std::vector<Task> tasks) {
    size_t added = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto& t : tasks) {
            if (find(t.id)) continue;
            t.status = TaskStatus::Queued;
            t.progress = std::clamp(t.progress, 0.0f, 1.0f);
            t.error.reset();
            tasks_.push_back(std::move(t));
            ++added;
        }
    }
    if (added == 0) return;

    std::println("[Queue] {}: added {} task(s)", name_, added);
    notify();
}

bool TaskQueue::promote(Task* t) {
    if (!t || t->status != TaskStatus::Queued) return false;
    if (active_count() >= max_concurrent_) return false;

    t->status = TaskStatus::Active;
    return true;
}

bool TaskQueue::start_task(const std::string& task_id) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!promote(t)) return false;
        changed = *t;
    }
    status_changed(changed);
    notify();
    return true;
}

bool TaskQueue::start_if_next(const std::string& task_id) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        auto head = std::find_if(tasks_.begin(), tasks_.end(),
                                 [](const Task& t) { return t.status == TaskStatus::Queued; });
        if (head == tasks_.end() || head->id != task_id) return false;
        if (!promote(&*head)) return false;
        changed = *head;
    }
    status_changed(changed);
    notify();
    return true;
}

void TaskQueue::pause_task(const std::string& task_id) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!t || t->status != TaskStatus::Active) return;

        t->status = TaskStatus::Paused;
        changed = *t;
    }
    status_changed(changed);
    notify();
}

void TaskQueue::resume_task(const std::string& task_id) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!t || t->status != TaskStatus::Paused) return;

        // Back in line, not straight to Active
        t->status = TaskStatus::Queued;
        changed = *t;
    }
    status_changed(changed);
    notify();
}

void TaskQueue::cancel_task(const std::string& task_id) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!t || is_terminal(t->status)) return;

        t->status = TaskStatus::Cancelled;
        changed = *t;
    }
    status_changed(changed);
    notify();
}

void TaskQueue::update_task_progress(const std::string& task_id, float progress) {
    if (std::isnan(progress)) progress = 0.0f;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!t || is_terminal(t->status)) return;

        t->progress = std::clamp(progress, 0.0f, 1.0f);
    }
    notify();
}

bool TaskQueue::complete_task(const std::string& task_id) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!t || is_terminal(t->status)) return false;

        t->status = TaskStatus::Completed;
        t->progress = 1.0f;
        changed = *t;
    }
    status_changed(changed);
    if (callbacks_.on_completed) callbacks_.on_completed(changed);
    notify();
    return true;
}

bool TaskQueue::fail_task(const std::string& task_id, const std::string& message) {
    Task changed;
    {
        std::lock_guard lock(mutex_);
        Task* t = find(task_id);
        if (!t || is_terminal(t->status)) return false;

        t->status = TaskStatus::Failed;
        t->error = message;
        changed = *t;
    }
    status_changed(changed);
    if (callbacks_.on_failed) callbacks_.on_failed(changed, message);
    notify();
    return true;
}

void TaskQueue::clear() {
    {
        std::lock_guard lock(mutex_);
        if (tasks_.empty()) return;
        tasks_.clear();
    }
    std::println("[Queue] {}: cleared", name_);
    notify();
}

size_t TaskQueue::prune_finished() {
    size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        removed = std::erase_if(tasks_, [](const Task& t) { return is_terminal(t.status); });
    }
    if (removed > 0) notify();
    return removed;
}

// --- Queries ---

std::optional<std::string> TaskQueue::next_queued() const {
    std::lock_guard lock(mutex_);
    for (const auto& t : tasks_) {
        if (t.status == TaskStatus::Queued) return t.id;
    }
    return std::nullopt;
}

bool TaskQueue::has_free_slot() const {
    return available_slots() > 0;
}

size_t TaskQueue::available_slots() const {
    std::lock_guard lock(mutex_);
    size_t active = active_count();
    return active >= max_concurrent_ ? 0 : max_concurrent_ - active;
}

std::optional<Task> TaskQueue::get_task(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    const Task* t = find(task_id);
    if (!t) return std::nullopt;
    return *t;
}

std::vector<Task> TaskQueue::queue_items() const {
    std::lock_guard lock(mutex_);
    return tasks_;
}

std::vector<Task> TaskQueue::active_items() const {
    std::lock_guard lock(mutex_);
    std::vector<Task> out;
    std::copy_if(tasks_.begin(), tasks_.end(), std::back_inserter(out),
                 [](const Task& t) { return t.status == TaskStatus::Active; });
    return out;
}

// --- Subscribers ---

TaskQueue::SubscriptionId TaskQueue::subscribe(Listener listener) {
    std::lock_guard delivery(delivery_mutex_);
    if (disposed_) return 0;

    std::vector<Task> items;
    std::vector<Task> active;
    snapshot(items, active);

    SubscriptionId sid = next_subscription_++;
    listeners_.emplace(sid, listener);
    listener(items, active);
    return sid;
}

void TaskQueue::unsubscribe(SubscriptionId sid) {
    std::lock_guard delivery(delivery_mutex_);
    listeners_.erase(sid);
}

void TaskQueue::dispose() {
    std::lock_guard delivery(delivery_mutex_);
    if (disposed_) return;
    disposed_ = true;
    listeners_.clear();
}

void TaskQueue::snapshot(std::vector<Task>& items, std::vector<Task>& active) const {
    std::lock_guard lock(mutex_);
    items = tasks_;
    std::copy_if(tasks_.begin(), tasks_.end(), std::back_inserter(active),
                 [](const Task& t) { return t.status == TaskStatus::Active; });
}

void TaskQueue::notify() {
    std::lock_guard delivery(delivery_mutex_);
    if (disposed_ || listeners_.empty()) return;

    std::vector<Task> items;
    std::vector<Task> active;
    snapshot(items, active);

    // Copy: a listener may unsubscribe while we iterate
    auto listeners = listeners_;
    for (auto& [sid, listener] : listeners) listener(items, active);
}

} // namespace comb
