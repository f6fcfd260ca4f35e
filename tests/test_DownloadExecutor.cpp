#include <gtest/gtest.h>
#include "FakeTransfer.hpp"
#include "core/EventBus.hpp"
#include "core/tasks/DownloadExecutor.hpp"
#include "core/transfer/TransferFactory.hpp"

#include <stdexcept>

using namespace collector::core;
using namespace collector::core::tasks;
using namespace collector::test;

class DownloadExecutorTest : public ::testing::Test {
protected:
    TaskRegistry registry;
    CancellationController cancellation;
    EventBus bus;
    TaskBridge bridge{registry, bus};
    MemoryStore store;
    std::shared_ptr<FakeTransfer> fake;
    std::unique_ptr<DownloadExecutor> executor;
    std::vector<GatePtr> gates;

    void SetUp() override {
        fake = std::make_shared<FakeTransfer>(std::vector<FakeItem>{
            {"a.txt", "alpha-data"},
            {"sub-01/b.txt", "bravo-data-2"},
            {"c.txt", "charlie"}
        });
    }

    void TearDown() override {
        for (auto& gate : gates) {
            gate->open();
        }
        executor.reset();
    }

    void build(TaskSettings settings = fastSettings()) {
        executor = std::make_unique<DownloadExecutor>(registry, cancellation, bridge, settings,
                                                      factoryFor(fake), store.factory());
    }

    void build(TaskSettings settings, transfer::TransferFactory factory) {
        executor = std::make_unique<DownloadExecutor>(registry, cancellation, bridge, settings,
                                                      std::move(factory), store.factory());
    }

    GatePtr gate() {
        auto g = std::make_shared<Gate>();
        gates.push_back(g);
        return g;
    }

    TaskState waitTerminal(const std::string& id) {
        EXPECT_TRUE(eventually([&] {
            auto state = registry.get(id);
            return state && state->isTerminal();
        })) << id << " never finished";
        return registry.get(id).value_or(TaskState{});
    }

    static std::vector<TaskEvent> drain(EventStream& stream) {
        std::vector<TaskEvent> events;
        while (auto event = stream.next(std::chrono::milliseconds(200))) {
            events.push_back(*event);
            if (event->kind == TaskEvent::Kind::Completed) {
                break;
            }
        }
        return events;
    }
};

TEST_F(DownloadExecutorTest, ThreeItemJobCompletes) {
    build();
    auto stream = bridge.subscribe();

    ASSERT_EQ(executor->start("t1", jobSpec()), StartResult::Accepted);
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Completed);
    EXPECT_EQ(final.progressPercent, 100);
    EXPECT_EQ(final.totalItems, 3u);
    EXPECT_EQ(final.completedItems, 3u);
    ASSERT_TRUE(final.totalBytes.has_value());
    EXPECT_EQ(*final.totalBytes, 29u);
    EXPECT_EQ(final.transferredBytes, 29u);
    EXPECT_TRUE(final.startedAt.has_value());
    EXPECT_TRUE(final.completedAt.has_value());
    EXPECT_FALSE(final.currentItem.has_value());
    EXPECT_FALSE(final.errorDetail.has_value());

    auto files = store.files();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files["/data/out/a.txt"], "alpha-data");
    EXPECT_EQ(files["/data/out/sub-01/b.txt"], "bravo-data-2");

    auto events = drain(*stream);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().state.status, TaskStatus::Pending);
    EXPECT_EQ(events.back().kind, TaskEvent::Kind::Completed);
    EXPECT_EQ(events.back().state.progressPercent, 100);

    std::vector<uint64_t> itemSteps;
    int lastPercent = 0;
    for (const auto& event : events) {
        EXPECT_GE(event.state.progressPercent, lastPercent);
        lastPercent = event.state.progressPercent;
        if (event.kind == TaskEvent::Kind::Progress) {
            EXPECT_LT(event.state.progressPercent, 100);
        }
        if (itemSteps.empty() || itemSteps.back() != event.state.completedItems) {
            itemSteps.push_back(event.state.completedItems);
        }
    }
    EXPECT_EQ(itemSteps, (std::vector<uint64_t>{0, 1, 2, 3}));
}

TEST_F(DownloadExecutorTest, PercentFollowsBytes) {
    build();
    auto stream = bridge.subscribe();

    executor->start("t1", jobSpec());
    waitTerminal("t1");

    std::vector<int> percents;
    for (const auto& event : drain(*stream)) {
        percents.push_back(event.state.progressPercent);
    }
    // 10 of 29 bytes, then 22 of 29
    EXPECT_NE(std::find(percents.begin(), percents.end(), 34), percents.end());
    EXPECT_NE(std::find(percents.begin(), percents.end(), 75), percents.end());
}

TEST_F(DownloadExecutorTest, UnknownSizesFallBackToItemCount) {
    fake = std::make_shared<FakeTransfer>(std::vector<FakeItem>{
        {"a.bin", "1111", false},
        {"b.bin", "2222", false},
        {"c.bin", "3333", false}
    });
    build();
    auto stream = bridge.subscribe();

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Completed);
    EXPECT_FALSE(final.totalBytes.has_value());
    EXPECT_EQ(final.transferredBytes, 12u);

    std::vector<int> percents;
    for (const auto& event : drain(*stream)) {
        percents.push_back(event.state.progressPercent);
    }
    EXPECT_NE(std::find(percents.begin(), percents.end(), 33), percents.end());
    EXPECT_NE(std::find(percents.begin(), percents.end(), 66), percents.end());
}

TEST_F(DownloadExecutorTest, FatalErrorOnSecondItemFailsTask) {
    fake->failFatal("sub-01/b.txt");
    build();

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_EQ(final.completedItems, 1u);
    EXPECT_EQ(final.transferredBytes, 10u);
    EXPECT_LT(final.progressPercent, 100);
    EXPECT_TRUE(final.completedAt.has_value());
    ASSERT_TRUE(final.errorDetail.has_value());
    EXPECT_EQ(final.errorDetail->code, error_codes::Fatal);
    EXPECT_EQ(final.errorDetail->item, std::optional<std::string>("sub-01/b.txt"));
    EXPECT_EQ(final.errorDetail->attempts, 1);
    EXPECT_NE(final.errorDetail->message.find("access denied"), std::string::npos);

    EXPECT_EQ(fake->fetchCalls("c.txt"), 0);
    EXPECT_EQ(store.files().size(), 1u);
    EXPECT_EQ(store.aborted(), 1);
}

TEST_F(DownloadExecutorTest, TransientErrorsAreRetriedWithinTheUnit) {
    fake->failTransient("sub-01/b.txt", 2);
    build();

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Completed);
    EXPECT_EQ(fake->fetchCalls("sub-01/b.txt"), 3);
    // Bytes of the failed attempts are not counted
    EXPECT_EQ(final.transferredBytes, 29u);
    EXPECT_EQ(store.aborted(), 2);
    EXPECT_EQ(store.files()["/data/out/sub-01/b.txt"], "bravo-data-2");
}

TEST_F(DownloadExecutorTest, ExhaustedRetriesFailTask) {
    fake->failTransient("sub-01/b.txt", 10);
    build();

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Failed);
    ASSERT_TRUE(final.errorDetail.has_value());
    EXPECT_EQ(final.errorDetail->code, error_codes::RetriesExhausted);
    EXPECT_EQ(final.errorDetail->attempts, 3);
    EXPECT_EQ(final.completedItems, 1u);
    EXPECT_EQ(final.transferredBytes, 10u);
}

TEST_F(DownloadExecutorTest, ListingIsRetried) {
    fake->failListingTransient(1);
    build();

    executor->start("t1", jobSpec());
    EXPECT_EQ(waitTerminal("t1").status, TaskStatus::Completed);
    EXPECT_EQ(fake->listCalls(), 2);
}

TEST_F(DownloadExecutorTest, CancelBeforeAnyProgress) {
    auto listing = gate();
    fake->holdListing(listing);
    build();

    executor->start("t2", jobSpec());
    ASSERT_TRUE(listing->waitArrived());

    EXPECT_EQ(cancellation.signal("t2"), SignalResult::Ok);
    listing->open();

    TaskState final = waitTerminal("t2");
    EXPECT_EQ(final.status, TaskStatus::Cancelled);
    EXPECT_EQ(final.transferredBytes, 0u);
    EXPECT_EQ(final.completedItems, 0u);
    EXPECT_TRUE(final.completedAt.has_value());
    EXPECT_EQ(fake->fetchCalls("a.txt"), 0);

    EXPECT_TRUE(executor->awaitTermination("t2", std::chrono::seconds(2)));
    EXPECT_EQ(cancellation.size(), 0u);
}

TEST_F(DownloadExecutorTest, CancelDuringUnitLetsItFinish) {
    auto second = gate();
    fake->holdItem("sub-01/b.txt", second);
    build();

    executor->start("t2", jobSpec());
    ASSERT_TRUE(second->waitArrived());

    cancellation.signal("t2");
    second->open();

    TaskState final = waitTerminal("t2");
    EXPECT_EQ(final.status, TaskStatus::Cancelled);
    EXPECT_EQ(final.completedItems, 2u);
    EXPECT_EQ(final.transferredBytes, 22u);
    EXPECT_EQ(fake->fetchCalls("c.txt"), 0);
}

TEST_F(DownloadExecutorTest, CancelWakesBackoff) {
    TaskSettings settings = fastSettings();
    settings.backoffBase = std::chrono::seconds(30);
    settings.backoffMax = std::chrono::seconds(30);
    fake->failTransient("a.txt", 1);
    build(settings);

    auto started = std::chrono::steady_clock::now();
    executor->start("t2", jobSpec());
    ASSERT_TRUE(eventually([&] { return fake->fetchCalls("a.txt") == 1; }));

    cancellation.signal("t2");
    TaskState final = waitTerminal("t2");

    EXPECT_EQ(final.status, TaskStatus::Cancelled);
    EXPECT_EQ(final.transferredBytes, 0u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(DownloadExecutorTest, SecondStartWhileLiveIsRejected) {
    auto listing = gate();
    fake->holdListing(listing);
    build();

    EXPECT_EQ(executor->start("t1", jobSpec()), StartResult::Accepted);
    EXPECT_EQ(executor->start("t1", jobSpec()), StartResult::AlreadyRunning);
    EXPECT_EQ(registry.size(), 1u);

    listing->open();
    EXPECT_EQ(waitTerminal("t1").status, TaskStatus::Completed);
    EXPECT_EQ(fake->listCalls(), 1);
}

TEST_F(DownloadExecutorTest, RestartAfterTerminalGetsFreshGeneration) {
    fake->failFatal("a.txt");
    build();

    executor->start("t1", jobSpec());
    TaskState failed = waitTerminal("t1");
    ASSERT_EQ(failed.status, TaskStatus::Failed);
    ASSERT_TRUE(executor->awaitTermination("t1", std::chrono::seconds(2)));

    fake->clearFailures();
    ASSERT_EQ(executor->start("t1", jobSpec()), StartResult::Accepted);

    auto fresh = registry.get("t1");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_NE(fresh->generation, failed.generation);
    EXPECT_FALSE(fresh->errorDetail.has_value());

    EXPECT_TRUE(eventually([&] { return registry.get("t1")->status == TaskStatus::Completed; }));
}

TEST_F(DownloadExecutorTest, EmptyJobCompletes) {
    fake = std::make_shared<FakeTransfer>(std::vector<FakeItem>{});
    build();

    executor->start("empty", jobSpec());
    TaskState final = waitTerminal("empty");

    EXPECT_EQ(final.status, TaskStatus::Completed);
    EXPECT_EQ(final.progressPercent, 100);
    EXPECT_EQ(final.totalItems, 0u);
}

TEST_F(DownloadExecutorTest, ItemEscapingDestinationFails) {
    fake = std::make_shared<FakeTransfer>(std::vector<FakeItem>{{"../escape.txt", "x"}});
    build();

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_EQ(final.errorDetail->code, error_codes::Fatal);
    EXPECT_TRUE(store.files().empty());
}

TEST_F(DownloadExecutorTest, UnsupportedSchemeFailsTask) {
    build(fastSettings(), transfer::makeTransferFactory(transfer::S3Options{}));

    JobSpec spec = jobSpec();
    spec.source = "ftp://mirror.example.org/ds000001";
    executor->start("t1", spec);

    TaskState final = waitTerminal("t1");
    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_EQ(final.errorDetail->code, error_codes::Fatal);
    EXPECT_FALSE(final.startedAt.has_value());
}

TEST_F(DownloadExecutorTest, UnexpectedExceptionIsRecordedAsInternal) {
    build(fastSettings(), [](const JobSpec&) -> transfer::TransferCapabilityPtr {
        throw std::runtime_error("catalog offline");
    });

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");

    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_EQ(final.errorDetail->code, error_codes::Internal);
    EXPECT_EQ(final.errorDetail->message, "catalog offline");
}

TEST_F(DownloadExecutorTest, InFlightBytesRefreshActivity) {
    fake = std::make_shared<FakeTransfer>(std::vector<FakeItem>{{"big.bin", std::string(4096, 'x')}}, 16);
    build();
    auto stream = bridge.subscribe();

    executor->start("t1", jobSpec());
    TaskState final = waitTerminal("t1");
    EXPECT_TRUE(final.lastActivityAt.has_value());

    // Pending, Running, current item, unit done, Completed, plus in-flight updates
    EXPECT_GT(drain(*stream).size(), 5u);
}

TEST_F(DownloadExecutorTest, AwaitTermination) {
    auto first = gate();
    fake->holdItem("a.txt", first);
    build();

    EXPECT_TRUE(executor->awaitTermination("unknown", std::chrono::milliseconds(0)));

    executor->start("t1", jobSpec());
    ASSERT_TRUE(first->waitArrived());
    EXPECT_FALSE(executor->awaitTermination("t1", std::chrono::milliseconds(50)));
    EXPECT_EQ(executor->activeCount(), 1u);

    first->open();
    EXPECT_TRUE(executor->awaitTermination("t1", std::chrono::seconds(2)));
    EXPECT_EQ(executor->activeCount(), 0u);
}

TEST_F(DownloadExecutorTest, ShutdownCancelsEveryRun) {
    TaskSettings settings = fastSettings();
    settings.backoffBase = std::chrono::seconds(30);
    settings.backoffMax = std::chrono::seconds(30);
    fake->failTransient("a.txt", 2);
    build(settings);

    executor->start("t1", jobSpec());
    executor->start("t2", jobSpec());
    ASSERT_TRUE(eventually([&] { return fake->fetchCalls("a.txt") == 2; }));
    EXPECT_EQ(executor->activeCount(), 2u);

    executor->shutdown();

    EXPECT_EQ(registry.get("t1")->status, TaskStatus::Cancelled);
    EXPECT_EQ(registry.get("t2")->status, TaskStatus::Cancelled);
    EXPECT_THROW(executor->start("t3", jobSpec()), std::runtime_error);
}
