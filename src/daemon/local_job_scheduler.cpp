//
// Created by cv2 on 17.01.2026.
//

#include "local_job_scheduler.hpp"
#include <print>
#include <algorithm>
#include <exception>

namespace comb {

LocalJobScheduler::LocalJobScheduler(size_t workers, Handler handler)
    : handler_(std::move(handler)) {
    if (workers == 0) workers = 1;
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
    }
    std::println("[Scheduler] Started with {} workers", workers);
}

LocalJobScheduler::~LocalJobScheduler() {
    shutdown();
}

void LocalJobScheduler::shutdown() {
    cancel_all();
    for (auto& w : workers_) {
        w.request_stop();
    }
    cv_.notify_all();
    workers_.clear(); // joins
}

std::shared_ptr<LocalJobScheduler::Chain> LocalJobScheduler::live_chain(const std::string& name) const {
    for (auto it = chains_.rbegin(); it != chains_.rend(); ++it) {
        const auto& c = *it;
        if (c->name == name && !c->finished && !c->stop.stop_requested()) return c;
    }
    return nullptr;
}

std::shared_ptr<LocalJobScheduler::Chain> LocalJobScheduler::next_runnable() const {
    for (const auto& chain : chains_) {
        if (!chain->running && !chain->finished && !chain->jobs.empty()) return chain;
    }
    return nullptr;
}

void LocalJobScheduler::stop_chain(Chain& chain) {
    chain.stop.request_stop();
    chain.jobs.clear();
    if (!chain.running) chain.finished = true;
}

void LocalJobScheduler::enqueue_unique(const std::string& name,
                                       ExistingJobPolicy policy,
                                       std::vector<cell::JobDescriptor> chain) {
    if (chain.empty()) return;

    {
        std::lock_guard lock(mutex_);
        auto existing = live_chain(name);

        if (existing) {
            switch (policy) {
                case ExistingJobPolicy::Keep:
                    std::println("[Scheduler] '{}' already scheduled, keeping it", name);
                    return;
                case ExistingJobPolicy::AppendOrReplace:
                    std::println("[Scheduler] Appending {} jobs to '{}'", chain.size(), name);
                    for (auto& job : chain) existing->jobs.push_back(std::move(job));
                    cv_.notify_all();
                    return;
                case ExistingJobPolicy::Replace:
                    std::println("[Scheduler] Replacing '{}'", name);
                    stop_chain(*existing);
                    break;
            }
        }

        auto fresh = std::make_shared<Chain>();
        fresh->name = name;
        for (auto& job : chain) fresh->jobs.push_back(std::move(job));
        chains_.push_back(std::move(fresh));
        std::println("[Scheduler] Enqueued '{}' ({} jobs)", name, chain.size());
    }
    cv_.notify_all();
}

void LocalJobScheduler::cancel_all() {
    {
        std::lock_guard lock(mutex_);
        for (auto& chain : chains_) {
            if (!chain->finished) stop_chain(*chain);
        }
    }
    idle_cv_.notify_all();
}

void LocalJobScheduler::prune_completed() {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(chains_, [](const auto& c) { return c->finished; });
    if (removed > 0) std::println("[Scheduler] Pruned {} finished chains", removed);
}

size_t LocalJobScheduler::pending_jobs() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& chain : chains_) total += chain->jobs.size();
    return total;
}

size_t LocalJobScheduler::known_chains() const {
    std::lock_guard lock(mutex_);
    return chains_.size();
}

void LocalJobScheduler::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] {
        return std::ranges::all_of(chains_, [](const auto& c) { return c->finished; });
    });
}

void LocalJobScheduler::worker_loop(std::stop_token st) {
    while (!st.stop_requested()) {
        std::unique_lock lock(mutex_);

        std::shared_ptr<Chain> chain;
        cv_.wait(lock, st, [&] {
            chain = next_runnable();
            return chain != nullptr;
        });
        if (!chain) break; // stop requested

        auto job = std::move(chain->jobs.front());
        chain->jobs.pop_front();
        chain->running = true;
        auto token = chain->stop.get_token();
        lock.unlock();

        try {
            handler_(job, token);
        } catch (const std::exception& e) {
            std::println(stderr, "[Scheduler] Job for task {} in '{}' threw: {}", job.task_id(), chain->name, e.what());
        }

        lock.lock();
        chain->running = false;
        if (chain->jobs.empty()) chain->finished = true;
        lock.unlock();

        cv_.notify_all();
        idle_cv_.notify_all();
    }
}

} // namespace comb
