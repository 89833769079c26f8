//
// Created by cv2 on 22.01.2026.
//

#include <gtest/gtest.h>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <stdexcept>

#include "task_queue_manager.hpp"

using namespace comb;
using namespace std::chrono_literals;

namespace {

// Records what the manager asks for, runs nothing
class RecordingScheduler : public JobScheduler {
public:
    struct Call {
        std::string name;
        ExistingJobPolicy policy;
        std::vector<cell::JobDescriptor> chain;
    };

    void enqueue_unique(const std::string& name, ExistingJobPolicy policy,
                        std::vector<cell::JobDescriptor> chain) override {
        std::lock_guard lock(mutex);
        calls.push_back(Call{name, policy, std::move(chain)});
    }
    void cancel_all() override { ++cancel_all_calls; }
    void prune_completed() override { ++prune_calls; }

    std::mutex mutex;
    std::vector<Call> calls;
    int cancel_all_calls = 0;
    int prune_calls = 0;
};

class ThrowingScheduler : public RecordingScheduler {
public:
    void cancel_all() override { throw std::runtime_error("scheduler offline"); }
};

UploadRequest upload(const std::string& name) {
    return UploadRequest{"/data/" + name, name, 4096};
}

DownloadRequest download(const std::string& name) {
    DownloadRequest r;
    r.file_name = name;
    r.size_bytes = 10;
    r.message_id = 77;
    r.target_path = "/downloads/" + name;
    r.chunks.push_back(RemoteChunk{"remote-" + name, "0123456789abcdef", 10});
    return r;
}

class TaskQueueManagerTest : public ::testing::Test {
protected:
    RecordingScheduler scheduler;
    CancellationRegistry cancellations;
};

} // namespace

TEST_F(TaskQueueManagerTest, ResetsSchedulerOnConstruction) {
    TaskQueueManager manager(scheduler, cancellations);
    EXPECT_EQ(scheduler.cancel_all_calls, 1);
    EXPECT_EQ(scheduler.prune_calls, 1);
    EXPECT_TRUE(scheduler.calls.empty());
}

TEST(TaskQueueManager, SchedulerFailureDuringResetIsNotFatal) {
    ThrowingScheduler scheduler;
    CancellationRegistry cancellations;
    TaskQueueManager manager(scheduler, cancellations);

    auto ids = manager.add_upload_tasks({upload("a")});
    EXPECT_EQ(ids.size(), 1u);
}

TEST_F(TaskQueueManagerTest, EachUploadIsItsOwnReplaceJob) {
    TaskQueueManager manager(scheduler, cancellations);
    auto ids = manager.add_upload_tasks({upload("a.bin"), upload("b.bin")});

    ASSERT_EQ(ids.size(), 2u);
    ASSERT_EQ(scheduler.calls.size(), 2u);
    for (size_t i = 0; i < ids.size(); ++i) {
        const auto& call = scheduler.calls[i];
        EXPECT_EQ(call.name, "upload_" + ids[i]);
        EXPECT_EQ(call.policy, ExistingJobPolicy::Replace);
        ASSERT_EQ(call.chain.size(), 1u);
        EXPECT_EQ(call.chain[0].task_id(), ids[i]);
        EXPECT_EQ(call.chain[0].category(), cell::UPLOAD);
        EXPECT_EQ(call.chain[0].upload().display_name(), i == 0 ? "a.bin" : "b.bin");
    }

    EXPECT_EQ(manager.upload_queue().queue_items().size(), 2u);
    EXPECT_EQ(manager.queued_tasks_count(), 2u);
}

TEST_F(TaskQueueManagerTest, DownloadBatchIsOneSequentialChain) {
    TaskQueueManager manager(scheduler, cancellations);
    auto ids = manager.add_download_tasks({download("1.jpg"), download("2.jpg"), download("3.jpg")});

    ASSERT_EQ(ids.size(), 3u);
    ASSERT_EQ(scheduler.calls.size(), 1u);

    const auto& call = scheduler.calls.front();
    EXPECT_TRUE(call.name.starts_with("batch_download_"));
    EXPECT_EQ(call.policy, ExistingJobPolicy::AppendOrReplace);
    ASSERT_EQ(call.chain.size(), 3u);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(call.chain[i].task_id(), ids[i]);
        EXPECT_EQ(call.chain[i].category(), cell::DOWNLOAD);
    }
    EXPECT_EQ(call.chain[1].download().chunks(0).remote_file_id(), "remote-2.jpg");
}

TEST_F(TaskQueueManagerTest, EmptyBatchesScheduleNothing) {
    TaskQueueManager manager(scheduler, cancellations);
    EXPECT_TRUE(manager.add_download_tasks({}).empty());
    EXPECT_TRUE(manager.add_upload_tasks({}).empty());
    manager.add_gallery_sync_tasks({GallerySyncRequest{"/dcim/1.jpg", 1}});

    EXPECT_TRUE(scheduler.calls.empty());
    EXPECT_TRUE(manager.all_tasks().empty());
}

TEST_F(TaskQueueManagerTest, CommandsRouteToTheOwningQueue) {
    TaskQueueManager manager(scheduler, cancellations);
    auto up = manager.add_upload_tasks({upload("a")}).front();
    auto down = manager.add_download_tasks({download("b")}).front();

    ASSERT_TRUE(manager.await_active(up));
    ASSERT_TRUE(manager.await_active(down));
    EXPECT_EQ(manager.active_tasks_count(), 2u);

    manager.pause_task(down);
    EXPECT_EQ(manager.download_queue().get_task(down)->status, TaskStatus::Paused);
    EXPECT_EQ(manager.upload_queue().get_task(up)->status, TaskStatus::Active);

    manager.resume_task(down);
    EXPECT_EQ(manager.find_task(down)->status, TaskStatus::Queued);

    manager.cancel_task(up);
    EXPECT_EQ(manager.find_task(up)->status, TaskStatus::Cancelled);
    EXPECT_TRUE(cancellations.is_cancelled(up));

    manager.pause_task("unknown");
    manager.cancel_task("unknown");
    EXPECT_FALSE(cancellations.is_cancelled("unknown"));
}

TEST_F(TaskQueueManagerTest, CancellingFinishedTaskDoesNothing) {
    TaskQueueManager manager(scheduler, cancellations);
    auto id = manager.add_upload_tasks({upload("a")}).front();
    manager.mark_upload_task_completed(id);

    manager.cancel_task(id);
    EXPECT_EQ(manager.find_task(id)->status, TaskStatus::Completed);
    EXPECT_FALSE(cancellations.is_cancelled(id));
}

TEST_F(TaskQueueManagerTest, CompletionIsEmittedOnce) {
    TaskQueueManager manager(scheduler, cancellations);
    auto completed = manager.completed_events().subscribe();
    auto id = manager.add_download_tasks({download("a")}).front();

    manager.mark_download_task_completed(id);
    manager.mark_download_task_completed(id);
    manager.mark_download_task_failed(id, "too late");

    auto events = completed->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].id, id);
    EXPECT_EQ(events[0].status, TaskStatus::Completed);
    EXPECT_EQ(manager.find_task(id)->status, TaskStatus::Completed);
}

TEST_F(TaskQueueManagerTest, FailureRecordsMessage) {
    TaskQueueManager manager(scheduler, cancellations);
    auto completed = manager.completed_events().subscribe();
    auto id = manager.add_upload_tasks({upload("a")}).front();

    manager.mark_upload_task_failed(id, "premature end of stream");

    auto task = manager.find_task(id);
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->error, "premature end of stream");
    EXPECT_EQ(completed->pending(), 0u);
}

TEST_F(TaskQueueManagerTest, ProgressIsPublished) {
    TaskQueueManager manager(scheduler, cancellations);
    auto progress = manager.progress_updates().subscribe();
    auto id = manager.add_upload_tasks({upload("movie.mkv")}).front();

    manager.update_task_progress(id, 0.5f);

    auto event = progress->try_next();
    ASSERT_TRUE(event);
    EXPECT_EQ(event->task_id, id);
    EXPECT_EQ(event->category, TaskCategory::Upload);
    EXPECT_FLOAT_EQ(event->progress, 0.5f);
    EXPECT_EQ(event->display_name, "movie.mkv");
    EXPECT_FLOAT_EQ(manager.find_task(id)->progress, 0.5f);
}

TEST_F(TaskQueueManagerTest, CancelledTaskPublishesNoProgress) {
    TaskQueueManager manager(scheduler, cancellations);
    auto progress = manager.progress_updates().subscribe();
    auto ids = manager.add_upload_tasks({upload("a.bin"), upload("b.bin")});
    ASSERT_TRUE(manager.await_active(ids[0]));

    manager.cancel_task(ids[0]);
    manager.update_task_progress(ids[0], 0.9f);
    EXPECT_FALSE(progress->try_next());
    EXPECT_EQ(manager.find_task(ids[0])->status, TaskStatus::Cancelled);

    manager.mark_upload_task_completed(ids[1]);
    manager.update_task_progress(ids[1], 0.5f);
    EXPECT_FALSE(progress->try_next());
}

TEST_F(TaskQueueManagerTest, MergedViewListsUploadsFirst) {
    TaskQueueManager manager(scheduler, cancellations);
    std::vector<size_t> sizes;
    auto sid = manager.subscribe_all_tasks([&](const std::vector<Task>& tasks) { sizes.push_back(tasks.size()); });
    ASSERT_EQ(sizes, (std::vector<size_t>{0}));

    auto down = manager.add_download_tasks({download("d")}).front();
    auto up = manager.add_upload_tasks({upload("u")}).front();

    auto all = manager.all_tasks();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, up);
    EXPECT_EQ(all[1].id, down);
    EXPECT_EQ(sizes.back(), 2u);

    manager.unsubscribe_all_tasks(sid);
    manager.clear_download_queue();
    EXPECT_EQ(sizes.back(), 2u);
    EXPECT_EQ(manager.all_tasks().size(), 1u);
}

TEST_F(TaskQueueManagerTest, AwaitActiveWaitsForAFreeSlot) {
    TaskQueueManager manager(scheduler, cancellations, ManagerOptions{.max_concurrent_uploads = 1});
    auto ids = manager.add_upload_tasks({upload("first"), upload("second")});

    ASSERT_TRUE(manager.await_active(ids[0]));

    std::atomic<bool> admitted{false};
    std::jthread waiter([&] { admitted = manager.await_active(ids[1]); });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(admitted);
    EXPECT_EQ(manager.find_task(ids[1])->status, TaskStatus::Queued);

    manager.mark_upload_task_completed(ids[0]);
    waiter.join();

    EXPECT_TRUE(admitted);
    EXPECT_EQ(manager.find_task(ids[1])->status, TaskStatus::Active);
}

TEST_F(TaskQueueManagerTest, AwaitActivePromotesOldestFirst) {
    TaskQueueManager manager(scheduler, cancellations, ManagerOptions{.max_concurrent_uploads = 1});
    auto ids = manager.add_upload_tasks({upload("a"), upload("b"), upload("c")});
    ASSERT_TRUE(manager.await_active(ids[0]));

    std::atomic<bool> admitted{false};
    std::jthread late([&] { admitted = manager.await_active(ids[2]); });

    manager.mark_upload_task_completed(ids[0]);
    std::this_thread::sleep_for(50ms);

    // The free slot belongs to b, which is older
    EXPECT_FALSE(admitted);
    EXPECT_EQ(manager.find_task(ids[2])->status, TaskStatus::Queued);
    ASSERT_TRUE(manager.await_active(ids[1]));
    EXPECT_FALSE(admitted);

    manager.mark_upload_task_completed(ids[1]);
    late.join();
    EXPECT_TRUE(admitted);
    EXPECT_EQ(manager.find_task(ids[2])->status, TaskStatus::Active);
}

TEST_F(TaskQueueManagerTest, ClearingQueueForgetsPendingCancellations) {
    TaskQueueManager manager(scheduler, cancellations);
    auto up = manager.add_upload_tasks({upload("never-started")}).front();
    auto down = manager.add_download_tasks({download("never-fetched")}).front();

    manager.cancel_task(up);
    manager.cancel_task(down);
    EXPECT_EQ(cancellations.pending_count(), 2u);

    manager.clear_upload_queue();
    EXPECT_FALSE(cancellations.is_cancelled(up));
    EXPECT_TRUE(cancellations.is_cancelled(down));

    manager.dispose();
    EXPECT_EQ(cancellations.pending_count(), 0u);
}

TEST_F(TaskQueueManagerTest, AwaitActiveGivesUpOnCancel) {
    TaskQueueManager manager(scheduler, cancellations, ManagerOptions{.max_concurrent_uploads = 1});
    auto ids = manager.add_upload_tasks({upload("first"), upload("second")});
    ASSERT_TRUE(manager.await_active(ids[0]));

    std::atomic<bool> admitted{true};
    std::jthread waiter([&] { admitted = manager.await_active(ids[1]); });

    std::this_thread::sleep_for(20ms);
    manager.cancel_task(ids[1]);
    waiter.join();
    EXPECT_FALSE(admitted);

    EXPECT_FALSE(manager.await_active("unknown"));
}

TEST_F(TaskQueueManagerTest, AwaitActiveHonoursStopToken) {
    TaskQueueManager manager(scheduler, cancellations, ManagerOptions{.max_concurrent_uploads = 1});
    auto ids = manager.add_upload_tasks({upload("first"), upload("second")});
    ASSERT_TRUE(manager.await_active(ids[0]));

    std::stop_source stop;
    std::atomic<bool> admitted{true};
    std::jthread waiter([&] { admitted = manager.await_active(ids[1], stop.get_token()); });

    std::this_thread::sleep_for(20ms);
    stop.request_stop();
    waiter.join();
    EXPECT_FALSE(admitted);
}

TEST_F(TaskQueueManagerTest, DisposedManagerStopsNotifying) {
    TaskQueueManager manager(scheduler, cancellations);
    int calls = 0;
    manager.subscribe_all_tasks([&](const std::vector<Task>&) { ++calls; });
    manager.dispose();
    manager.dispose();

    manager.add_upload_tasks({upload("late")});
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(manager.subscribe_all_tasks([](const std::vector<Task>&) {}), 0u);
}
