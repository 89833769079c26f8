//
// Created by cv2 on 16.01.2026.
//

#include "cancellation_registry.hpp"
#include <print>

namespace comb {

std::stop_token CancellationRegistry::register_task(const std::string& task_id) {
    std::lock_guard lock(mutex_);

    std::stop_source source;
    if (cancelled_.erase(task_id) > 0) {
        std::println("[Cancel] Task {} was cancelled before starting", task_id);
        source.request_stop();
        return source.get_token();
    }

    auto [it, inserted] = active_.insert_or_assign(task_id, std::move(source));
    return it->second.get_token();
}

void CancellationRegistry::unregister_task(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    active_.erase(task_id);
    cancelled_.erase(task_id);
}

bool CancellationRegistry::cancel(const std::string& task_id) {
    std::lock_guard lock(mutex_);

    auto it = active_.find(task_id);
    if (it == active_.end()) {
        cancelled_.insert(task_id);
        std::println("[Cancel] No running job for task {} (marked for cancellation)", task_id);
        return false;
    }

    std::println("[Cancel] Cancelling job for task {}", task_id);
    it->second.request_stop();
    active_.erase(it);
    cancelled_.insert(task_id);
    return true;
}

void CancellationRegistry::forget(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    if (active_.contains(task_id)) return;
    cancelled_.erase(task_id);
}

bool CancellationRegistry::is_cancelled(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    return cancelled_.contains(task_id);
}

size_t CancellationRegistry::active_count() const {
    std::lock_guard lock(mutex_);
    return active_.size();
}

size_t CancellationRegistry::pending_count() const {
    std::lock_guard lock(mutex_);
    return cancelled_.size();
}

} // namespace comb
