#include <gtest/gtest.h>
#include "FakeTransfer.hpp"
#include "core/EventBus.hpp"
#include "core/tasks/TaskService.hpp"

#include <atomic>
#include <future>
#include <stdexcept>

using namespace collector::core;
using namespace collector::core::tasks;
using namespace collector::test;

class TaskServiceTest : public ::testing::Test {
protected:
    EventBus bus;
    MemoryStore store;
    std::shared_ptr<FakeTransfer> fake;
    std::unique_ptr<TaskService> service;
    std::vector<GatePtr> gates;

    void SetUp() override {
        fake = std::make_shared<FakeTransfer>(std::vector<FakeItem>{
            {"dataset_description.json", "{\"Name\":\"x\"}"},
            {"sub-01/anat/T1w.nii.gz", "0123456789abcdef"},
            {"participants.tsv", "participant_id\nsub-01\n"}
        });
    }

    void TearDown() override {
        for (auto& gate : gates) {
            gate->open();
        }
        service.reset();
    }

    void build(TaskSettings settings = fastSettings()) {
        service = std::make_unique<TaskService>(settings, factoryFor(fake), store.factory(), bus);
    }

    GatePtr gate() {
        auto g = std::make_shared<Gate>();
        gates.push_back(g);
        return g;
    }

    TaskState waitTerminal(const std::string& id) {
        EXPECT_TRUE(eventually([&] {
            auto state = service->getProgress(id);
            return state && state->isTerminal();
        }));
        return service->getProgress(id).value_or(TaskState{});
    }
};

TEST_F(TaskServiceTest, EndToEndCompletion) {
    build();
    auto stream = service->subscribe();

    ASSERT_EQ(service->startTask("t1", jobSpec("/data/ds000001")), StartResult::Accepted);
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Completed);
    EXPECT_EQ(final.progressPercent, 100);
    EXPECT_EQ(final.completedItems, 3u);
    EXPECT_EQ(store.files().count("/data/ds000001/sub-01/anat/T1w.nii.gz"), 1u);

    std::vector<uint64_t> steps;
    while (auto event = stream->next(std::chrono::milliseconds(200))) {
        if (steps.empty() || steps.back() != event->state.completedItems) {
            steps.push_back(event->state.completedItems);
        }
        if (event->kind == TaskEvent::Kind::Completed) {
            EXPECT_EQ(event->state.status, TaskStatus::Completed);
            break;
        }
    }
    EXPECT_EQ(steps, (std::vector<uint64_t>{0, 1, 2, 3}));
}

TEST_F(TaskServiceTest, DuplicateStartWhileLive) {
    auto listing = gate();
    fake->holdListing(listing);
    build();

    EXPECT_EQ(service->startTask("t1", jobSpec()), StartResult::Accepted);
    EXPECT_EQ(service->startTask("t1", jobSpec()), StartResult::AlreadyRunning);

    listing->open();
    EXPECT_EQ(waitTerminal("t1").status, TaskStatus::Completed);
}

TEST_F(TaskServiceTest, StartAfterCleanupCreatesFreshEntry) {
    build();
    service->startTask("t1", jobSpec());
    TaskState first = waitTerminal("t1");
    ASSERT_EQ(service->cleanupTask("t1"), CleanupResult::Ok);

    auto listing = gate();
    fake->holdListing(listing);

    ASSERT_EQ(service->startTask("t1", jobSpec()), StartResult::Accepted);
    auto fresh = service->getProgress("t1");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->status, TaskStatus::Pending);
    EXPECT_EQ(fresh->progressPercent, 0);
    EXPECT_EQ(fresh->completedItems, 0u);
    EXPECT_FALSE(fresh->completedAt.has_value());
    EXPECT_NE(fresh->generation, first.generation);

    listing->open();
    EXPECT_EQ(waitTerminal("t1").status, TaskStatus::Completed);
}

TEST_F(TaskServiceTest, CancelBeforeAnyProgress) {
    auto listing = gate();
    fake->holdListing(listing);
    build();

    service->startTask("t2", jobSpec());
    ASSERT_TRUE(listing->waitArrived());
    EXPECT_EQ(service->cancelTask("t2"), CancelResult::Ok);
    listing->open();

    TaskState final = waitTerminal("t2");
    EXPECT_EQ(final.status, TaskStatus::Cancelled);
    EXPECT_EQ(final.transferredBytes, 0u);
    EXPECT_TRUE(final.completedAt.has_value());
    EXPECT_TRUE(store.files().empty());
}

TEST_F(TaskServiceTest, CancelIsIdempotentOnTerminalTasks) {
    build();
    service->startTask("t1", jobSpec());
    TaskState done = waitTerminal("t1");

    EXPECT_EQ(service->cancelTask("t1"), CancelResult::Ok);
    EXPECT_EQ(service->cancelTask("t1"), CancelResult::Ok);

    auto after = service->getProgress("t1");
    EXPECT_EQ(after->status, TaskStatus::Completed);
    EXPECT_EQ(after->completedAt, done.completedAt);
}

TEST_F(TaskServiceTest, CancelUnknownTask) {
    build();
    EXPECT_EQ(service->cancelTask("nope"), CancelResult::NotFound);
}

TEST_F(TaskServiceTest, CleanupRefusesLiveTask) {
    auto held = gate();
    fake->holdItem("sub-01/anat/T1w.nii.gz", held);
    build();

    service->startTask("t1", jobSpec());
    ASSERT_TRUE(held->waitArrived());
    ASSERT_EQ(service->getProgress("t1")->status, TaskStatus::Running);

    EXPECT_EQ(service->cleanupTask("t1"), CleanupResult::StillRunning);
    EXPECT_TRUE(service->getProgress("t1").has_value());

    held->open();
    waitTerminal("t1");

    EXPECT_EQ(service->cleanupTask("t1"), CleanupResult::Ok);
    EXPECT_FALSE(service->getProgress("t1").has_value());
    EXPECT_EQ(service->cleanupTask("t1"), CleanupResult::NotFound);
}

TEST_F(TaskServiceTest, FailedTaskStaysQueryableUntilCleanup) {
    fake->failFatal("sub-01/anat/T1w.nii.gz");
    build();

    service->startTask("t3", jobSpec());
    TaskState final = waitTerminal("t3");

    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_EQ(final.completedItems, 1u);
    ASSERT_TRUE(final.errorDetail.has_value());
    EXPECT_TRUE(final.completedAt.has_value());

    auto all = service->getAllProgress();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].errorDetail, final.errorDetail);

    EXPECT_EQ(service->cleanupTask("t3"), CleanupResult::Ok);
    EXPECT_TRUE(service->getAllProgress().empty());
}

TEST_F(TaskServiceTest, PushedStateIsAlreadyVisibleToPull) {
    build();
    std::atomic<int> mismatches{0};
    std::atomic<int> seen{0};

    TaskListener listener = service->listen([&](const TaskEvent& event) {
        ++seen;
        auto pulled = service->getProgress(event.state.taskId);
        if (!pulled || pulled->toJson() != event.state.toJson()) {
            ++mismatches;
        }
    });

    service->startTask("t1", jobSpec());
    waitTerminal("t1");
    ASSERT_TRUE(service->executor().awaitTermination("t1", std::chrono::seconds(2)));
    service->unlisten(listener);

    EXPECT_GT(seen.load(), 3);
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(TaskServiceTest, ManyTasksRunConcurrently) {
    build();
    for (int i = 0; i < 20; ++i) {
        std::string id = "ds" + std::to_string(i);
        ASSERT_EQ(service->startTask(id, jobSpec("/data/" + id)), StartResult::Accepted);
    }

    EXPECT_TRUE(service->waitForIdle(std::chrono::seconds(10)));
    auto all = service->getAllProgress();
    ASSERT_EQ(all.size(), 20u);
    for (const auto& state : all) {
        EXPECT_EQ(state.status, TaskStatus::Completed) << state.taskId;
    }
    EXPECT_EQ(store.files().size(), 60u);
}

TEST_F(TaskServiceTest, CancelAllAndShutdown) {
    TaskSettings settings = fastSettings();
    settings.backoffBase = std::chrono::seconds(30);
    settings.backoffMax = std::chrono::seconds(30);
    fake->failTransient("dataset_description.json", 2);
    build(settings);

    service->startTask("a", jobSpec("/data/a"));
    service->startTask("b", jobSpec("/data/b"));
    ASSERT_TRUE(eventually([&] { return fake->fetchCalls("dataset_description.json") == 2; }));

    EXPECT_EQ(service->cancelAll(), 2u);
    EXPECT_TRUE(service->waitForIdle(std::chrono::seconds(5)));

    service->shutdown();
    EXPECT_EQ(service->getProgress("a")->status, TaskStatus::Cancelled);
    EXPECT_EQ(service->getProgress("b")->status, TaskStatus::Cancelled);
    EXPECT_THROW(service->startTask("c", jobSpec()), std::runtime_error);
}

TEST_F(TaskServiceTest, EveryTaskGetsItsOwnRun) {
    auto late = std::make_shared<FakeTransfer>(std::vector<FakeItem>{{"README", "late arrival"}});
    auto lateListing = gate();
    late->holdListing(lateListing);

    service = std::make_unique<TaskService>(fastSettings(),
        [this, late](const JobSpec& spec) -> transfer::TransferCapabilityPtr {
            if (spec.source == "fake://late") {
                return late;
            }
            return fake;
        },
        store.factory(), bus);

    auto busy = gate();
    fake->holdItem("dataset_description.json", busy);

    const int busyCount = 16;
    for (int i = 0; i < busyCount; ++i) {
        std::string id = "busy-" + std::to_string(i);
        ASSERT_EQ(service->startTask(id, jobSpec("/data/" + id)), StartResult::Accepted);
    }
    ASSERT_TRUE(eventually([&] { return fake->fetchCalls("dataset_description.json") == busyCount; }));

    JobSpec lateSpec = jobSpec("/data/late");
    lateSpec.source = "fake://late";
    ASSERT_EQ(service->startTask("late", lateSpec), StartResult::Accepted);

    // Reaching the listing proves it was not queued behind the busy runs
    ASSERT_TRUE(lateListing->waitArrived());
    EXPECT_EQ(service->cancelTask("late"), CancelResult::Ok);
    lateListing->open();

    TaskState final = waitTerminal("late");
    EXPECT_EQ(final.status, TaskStatus::Cancelled);
    EXPECT_EQ(service->cleanupTask("late"), CleanupResult::Ok);

    auto stillBusy = service->getProgress("busy-0");
    ASSERT_TRUE(stillBusy.has_value());
    EXPECT_EQ(stillBusy->status, TaskStatus::Running);
}

TEST_F(TaskServiceTest, ListenerMayStartTaskFromPendingEvent) {
    build();

    std::atomic<bool> followUpTried{false};
    std::atomic<bool> followUpAccepted{false};
    TaskListener listener = service->listen([&](const TaskEvent& event) {
        if (event.state.taskId != "first" || event.state.status != TaskStatus::Pending) {
            return;
        }
        if (!followUpTried.exchange(true)) {
            followUpAccepted = service->startTask("second", jobSpec("/data/second")) == StartResult::Accepted;
        }
    });

    auto starting = std::async(std::launch::async, [&] {
        return service->startTask("first", jobSpec("/data/first"));
    });
    ASSERT_EQ(starting.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(starting.get(), StartResult::Accepted);
    EXPECT_TRUE(followUpAccepted);

    EXPECT_EQ(waitTerminal("first").status, TaskStatus::Completed);
    EXPECT_EQ(waitTerminal("second").status, TaskStatus::Completed);
    service->unlisten(listener);
}
