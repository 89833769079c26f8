//
// Created by cv2 on 21.01.2026.
//

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "task_queue.hpp"

using namespace comb;

namespace {

Task upload_task(const std::string& name) {
    return make_task(UploadRequest{"/tmp/" + name, name, 1024});
}

std::vector<Task> upload_tasks(size_t count) {
    std::vector<Task> tasks;
    for (size_t i = 0; i < count; ++i) tasks.push_back(upload_task("file" + std::to_string(i)));
    return tasks;
}

} // namespace

TEST(TaskQueue, CeilingHoldsAcrossTenTasks) {
    TaskQueue queue("upload_queue", "Upload Queue", TaskCategory::Upload, 3);
    auto tasks = upload_tasks(10);
    queue.add_tasks(tasks);

    size_t started = 0;
    for (const auto& t : tasks) {
        if (queue.start_task(t.id)) ++started;
    }

    EXPECT_EQ(started, 3u);
    EXPECT_EQ(queue.active_items().size(), 3u);
    EXPECT_FALSE(queue.has_free_slot());
    EXPECT_EQ(queue.available_slots(), 0u);
    EXPECT_EQ(queue.next_queued(), tasks[3].id);

    ASSERT_TRUE(queue.complete_task(tasks[0].id));
    EXPECT_TRUE(queue.has_free_slot());
    EXPECT_TRUE(queue.start_task(tasks[3].id));
    EXPECT_EQ(queue.active_items().size(), 3u);
}

TEST(TaskQueue, CeilingHoldsThroughInterleavedCompletions) {
    TaskQueue queue("upload_queue", "Upload Queue", TaskCategory::Upload, 3);
    size_t most_active = 0;
    queue.subscribe([&](const std::vector<Task>&, const std::vector<Task>& active) {
        most_active = std::max(most_active, active.size());
    });
    auto tasks = upload_tasks(10);
    queue.add_tasks(tasks);

    size_t finished = 0;
    while (finished < tasks.size()) {
        while (auto next = queue.next_queued()) {
            if (!queue.start_if_next(*next)) break;
        }
        auto active = queue.active_items();
        ASSERT_LE(active.size(), 3u);
        ASSERT_FALSE(active.empty());

        // Alternate outcomes and finish the newest active task every third round
        const auto& victim = finished % 3 == 2 ? active.back() : active.front();
        if (finished % 2 == 0) {
            ASSERT_TRUE(queue.complete_task(victim.id));
        } else {
            ASSERT_TRUE(queue.fail_task(victim.id, "network"));
        }
        ++finished;
    }

    EXPECT_EQ(most_active, 3u);
    EXPECT_TRUE(queue.active_items().empty());
    EXPECT_FALSE(queue.next_queued());
    for (const auto& t : queue.queue_items()) EXPECT_TRUE(is_terminal(t.status));
}

TEST(TaskQueue, StartIfNextFollowsQueueOrder) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2);
    auto tasks = upload_tasks(3);
    queue.add_tasks(tasks);

    EXPECT_FALSE(queue.start_if_next(tasks[2].id));
    EXPECT_TRUE(queue.start_if_next(tasks[0].id));
    EXPECT_FALSE(queue.start_if_next(tasks[2].id));
    EXPECT_TRUE(queue.start_if_next(tasks[1].id));

    // Head of the line but no free slot
    EXPECT_FALSE(queue.start_if_next(tasks[2].id));
    ASSERT_TRUE(queue.complete_task(tasks[0].id));
    EXPECT_TRUE(queue.start_if_next(tasks[2].id));
    EXPECT_FALSE(queue.start_if_next("nope"));
}

TEST(TaskQueue, SubscribeSnapshotAgreesWithItself) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2);
    auto tasks = upload_tasks(3);
    queue.add_tasks(tasks);
    ASSERT_TRUE(queue.start_task(tasks[1].id));

    std::vector<Task> items;
    std::vector<Task> active;
    queue.subscribe([&](const std::vector<Task>& i, const std::vector<Task>& a) {
        items = i;
        active = a;
    });

    ASSERT_EQ(items.size(), 3u);
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].id, tasks[1].id);
    EXPECT_EQ(items[1].status, TaskStatus::Active);
}

TEST(TaskQueue, DuplicateIdsAreSkipped) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2);
    auto task = upload_task("a");
    queue.add_tasks({task});
    queue.add_tasks({task});
    EXPECT_EQ(queue.queue_items().size(), 1u);
}

TEST(TaskQueue, UnknownIdsAreIgnored) {
    int notifications = 0;
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2);
    queue.subscribe([&](const auto&, const auto&) { ++notifications; });
    ASSERT_EQ(notifications, 1);

    EXPECT_FALSE(queue.start_task("nope"));
    queue.pause_task("nope");
    queue.resume_task("nope");
    queue.cancel_task("nope");
    queue.update_task_progress("nope", 0.5f);
    EXPECT_FALSE(queue.complete_task("nope"));
    EXPECT_FALSE(queue.fail_task("nope", "x"));
    EXPECT_FALSE(queue.get_task("nope"));

    EXPECT_EQ(notifications, 1);
}

TEST(TaskQueue, PauseSendsTaskBackToQueued) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 1);
    auto task = upload_task("a");
    queue.add_tasks({task});

    queue.pause_task(task.id); // not active yet
    EXPECT_EQ(queue.get_task(task.id)->status, TaskStatus::Queued);

    ASSERT_TRUE(queue.start_task(task.id));
    queue.pause_task(task.id);
    EXPECT_EQ(queue.get_task(task.id)->status, TaskStatus::Paused);
    EXPECT_TRUE(queue.has_free_slot());

    queue.resume_task(task.id);
    EXPECT_EQ(queue.get_task(task.id)->status, TaskStatus::Queued);
    EXPECT_TRUE(queue.start_task(task.id));
}

TEST(TaskQueue, TerminalStatesAreFinal) {
    int completed = 0;
    int failed = 0;
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2, TaskQueue::Callbacks{
        .on_status_changed = nullptr,
        .on_completed = [&](const Task&) { ++completed; },
        .on_failed = [&](const Task&, const std::string&) { ++failed; },
    });
    auto a = upload_task("a");
    auto b = upload_task("b");
    queue.add_tasks({a, b});

    EXPECT_TRUE(queue.complete_task(a.id));
    EXPECT_FALSE(queue.complete_task(a.id));
    EXPECT_FALSE(queue.fail_task(a.id, "late"));
    queue.cancel_task(a.id);
    EXPECT_EQ(queue.get_task(a.id)->status, TaskStatus::Completed);
    EXPECT_FLOAT_EQ(queue.get_task(a.id)->progress, 1.0f);

    EXPECT_TRUE(queue.fail_task(b.id, "disk full"));
    EXPECT_FALSE(queue.fail_task(b.id, "again"));
    EXPECT_EQ(queue.get_task(b.id)->error, "disk full");

    EXPECT_EQ(completed, 1);
    EXPECT_EQ(failed, 1);
}

TEST(TaskQueue, CancelledTaskIgnoresProgress) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2);
    auto task = upload_task("a");
    queue.add_tasks({task});
    queue.update_task_progress(task.id, 0.25f);
    queue.cancel_task(task.id);
    queue.update_task_progress(task.id, 0.75f);

    auto got = queue.get_task(task.id);
    EXPECT_EQ(got->status, TaskStatus::Cancelled);
    EXPECT_FLOAT_EQ(got->progress, 0.25f);
}

TEST(TaskQueue, ProgressIsClamped) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 2);
    auto task = upload_task("a");
    queue.add_tasks({task});

    queue.update_task_progress(task.id, 3.0f);
    EXPECT_FLOAT_EQ(queue.get_task(task.id)->progress, 1.0f);
    queue.update_task_progress(task.id, -1.0f);
    EXPECT_FLOAT_EQ(queue.get_task(task.id)->progress, 0.0f);
}

TEST(TaskQueue, SubscriberSeesEveryChange) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 1);
    std::vector<size_t> active_sizes;
    auto sid = queue.subscribe([&](const std::vector<Task>&, const std::vector<Task>& active) {
        active_sizes.push_back(active.size());
    });

    auto task = upload_task("a");
    queue.add_tasks({task});
    queue.start_task(task.id);
    queue.complete_task(task.id);

    EXPECT_EQ(active_sizes, (std::vector<size_t>{0, 0, 1, 0}));

    queue.unsubscribe(sid);
    queue.clear();
    EXPECT_EQ(active_sizes.size(), 4u);
}

TEST(TaskQueue, PruneDropsFinishedOnly) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 3);
    auto tasks = upload_tasks(3);
    queue.add_tasks(tasks);
    queue.complete_task(tasks[0].id);
    queue.cancel_task(tasks[1].id);

    EXPECT_EQ(queue.prune_finished(), 2u);
    ASSERT_EQ(queue.queue_items().size(), 1u);
    EXPECT_EQ(queue.queue_items().front().id, tasks[2].id);
}

TEST(TaskQueue, DisposeSilencesSubscribers) {
    TaskQueue queue("q", "Q", TaskCategory::Upload, 3);
    int notifications = 0;
    queue.subscribe([&](const auto&, const auto&) { ++notifications; });
    queue.dispose();
    queue.dispose();

    queue.add_tasks(upload_tasks(2));
    EXPECT_EQ(notifications, 1);
    EXPECT_EQ(queue.subscribe([](const auto&, const auto&) {}), 0u);
    EXPECT_EQ(queue.queue_items().size(), 2u);
}
