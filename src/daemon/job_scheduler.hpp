//
// Created by cv2 on 17.01.2026.
//

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "task.hpp"
#include "cell.pb.h"

namespace comb {

    // What to do when a unique name is already scheduled and not finished
    enum class ExistingJobPolicy {
        Keep,            // ignore the new jobs
        Replace,         // stop the old chain, run the new one
        AppendOrReplace  // run the new jobs after the old chain (replace if it already finished)
    };

    // Background execution of task jobs. The core only emits descriptors and
    // chaining directives; running them, retrying and persisting them is the
    // implementation's business.
    class JobScheduler {
    public:
        virtual ~JobScheduler() = default;

        // Jobs in `chain` run strictly one after another, in vector order:
        // job k+1 is not started before job k has finished.
        virtual void enqueue_unique(const std::string& name,
                                    ExistingJobPolicy policy,
                                    std::vector<cell::JobDescriptor> chain) = 0;

        // Stop everything that is running and drop everything pending
        virtual void cancel_all() = 0;

        // Forget finished jobs
        virtual void prune_completed() = 0;
    };

    cell::JobDescriptor to_job_descriptor(const Task& task);

    // nullopt when the descriptor carries no payload
    std::optional<TaskPayload> payload_from_job(const cell::JobDescriptor& job);

} // namespace comb
