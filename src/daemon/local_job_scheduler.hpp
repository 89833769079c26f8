//
// Created by cv2 on 17.01.2026.
//

#pragma once
#include <list>
#include <deque>
#include <mutex>
#include <memory>
#include <thread>
#include <vector>
#include <functional>
#include <stop_token>
#include <condition_variable>

#include "job_scheduler.hpp"

namespace comb {

    // In-process scheduler: a fixed pool of worker threads running named chains.
    // Different chains run in parallel, jobs inside one chain never do.
    // Nothing is persisted; a restart loses pending jobs.
    class LocalJobScheduler : public JobScheduler {
    public:
        // Runs one job. The token is stopped when the job's chain is replaced or cancelled.
        using Handler = std::function<void(const cell::JobDescriptor&, std::stop_token)>;

        LocalJobScheduler(size_t workers, Handler handler);
        ~LocalJobScheduler() override;

        LocalJobScheduler(const LocalJobScheduler&) = delete;
        LocalJobScheduler& operator=(const LocalJobScheduler&) = delete;

        void enqueue_unique(const std::string& name,
                            ExistingJobPolicy policy,
                            std::vector<cell::JobDescriptor> chain) override;
        void cancel_all() override;
        void prune_completed() override;

        // Jobs not yet started, over all chains
        size_t pending_jobs() const;
        // Chains the scheduler still remembers (finished ones until pruned)
        size_t known_chains() const;

        // Blocks until no job is pending or running
        void wait_idle();

        void shutdown();

    private:
        struct Chain {
            std::string name;
            std::deque<cell::JobDescriptor> jobs;
            std::stop_source stop;
            bool running = false;
            bool finished = false;
        };

        void worker_loop(std::stop_token st);
        std::shared_ptr<Chain> live_chain(const std::string& name) const;
        std::shared_ptr<Chain> next_runnable() const;
        static void stop_chain(Chain& chain);

        Handler handler_;

        mutable std::mutex mutex_;
        std::condition_variable_any cv_;
        std::condition_variable_any idle_cv_;
        std::list<std::shared_ptr<Chain>> chains_; // submission order

        std::vector<std::jthread> workers_;
    };

} // namespace comb
