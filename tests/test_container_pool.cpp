#include "warden/pool/container_pool.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace warden;
using warden::pool::ContainerPool;
using warden::pool::ContainerState;
using warden::pool::PoolConfig;
using warden::pool::PooledContainer;

namespace {

std::chrono::steady_clock::time_point In(std::chrono::milliseconds delay) {
    return std::chrono::steady_clock::now() + delay;
}

class ContainerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<test::FakeContainerRuntime>();
    }

    std::unique_ptr<ContainerPool> MakePool(std::size_t max_size,
                                            std::chrono::milliseconds idle = std::chrono::milliseconds(60000),
                                            bool sweeper = false) {
        PoolConfig config;
        config.max_size = max_size;
        config.idle_timeout = idle;
        config.run_sweeper = sweeper;
        return std::make_unique<ContainerPool>(runtime_, config);
    }

    std::shared_ptr<test::FakeContainerRuntime> runtime_;
    runtime::ContainerCreateOptions options_;
};

} // namespace

TEST_F(ContainerPoolTest, RejectsInvalidConfiguration) {
    PoolConfig config;
    config.run_sweeper = false;
    EXPECT_THROW(ContainerPool(nullptr, config), std::invalid_argument);

    config.max_size = 0;
    EXPECT_THROW(ContainerPool(runtime_, config), std::invalid_argument);

    config.max_size = 1;
    config.idle_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(ContainerPool(runtime_, config), std::invalid_argument);
}

TEST_F(ContainerPoolTest, ReleasedContainerIsReused) {
    auto pool = MakePool(2);

    auto first = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(first);
    EXPECT_EQ(first.Value().state, ContainerState::IN_USE);
    pool->Release(first.Value());

    auto second = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(second);
    EXPECT_EQ(second.Value().id, first.Value().id);
    EXPECT_EQ(runtime_->create_count.load(), 1);

    auto stats = pool->GetStats();
    EXPECT_EQ(stats.in_use, 1u);
    EXPECT_EQ(stats.total_created, 1u);
    EXPECT_EQ(stats.total_reused, 1u);
}

TEST_F(ContainerPoolTest, InUseContainerIsNeverLentTwice) {
    auto pool = MakePool(3);

    auto first = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    auto second = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first.Value().id, second.Value().id);
}

TEST_F(ContainerPoolTest, DifferentImagesGetDifferentContainers) {
    auto pool = MakePool(3);

    auto alpine = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(alpine);
    pool->Release(alpine.Value());

    auto python = pool->Acquire("python:3.12", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(python);
    EXPECT_NE(python.Value().id, alpine.Value().id);
    EXPECT_EQ(python.Value().image, "python:3.12");

    auto created = runtime_->CreatedOptions();
    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(created[1].image, "python:3.12");
}

TEST_F(ContainerPoolTest, DifferentCreationOptionsAreDifferentFamilies) {
    auto pool = MakePool(3);

    auto plain = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(plain);
    pool->Release(plain.Value());

    auto bridged_options = options_;
    bridged_options.network_mode = NetworkMode::BRIDGE;
    auto bridged = pool->Acquire("alpine:3.19", bridged_options, In(std::chrono::seconds(5)));
    ASSERT_TRUE(bridged);
    EXPECT_NE(bridged.Value().id, plain.Value().id);
    EXPECT_NE(bridged.Value().family_key, plain.Value().family_key);
}

TEST_F(ContainerPoolTest, FamilyKeyIsStableAndOptionSensitive) {
    runtime::ContainerCreateOptions a;
    a.image = "alpine:3.19";
    a.memory_limit_bytes = 1024;
    auto b = a;

    EXPECT_EQ(ContainerPool::ComputeFamilyKey(a), ContainerPool::ComputeFamilyKey(b));
    EXPECT_EQ(ContainerPool::ComputeFamilyKey(a).rfind("alpine:3.19@", 0), 0u);

    b.mounts = {{"/srv", "/data", true}};
    EXPECT_NE(ContainerPool::ComputeFamilyKey(a), ContainerPool::ComputeFamilyKey(b));

    auto c = a;
    c.user = "1000";
    EXPECT_NE(ContainerPool::ComputeFamilyKey(a), ContainerPool::ComputeFamilyKey(c));
}

TEST_F(ContainerPoolTest, FullPoolWaitsForRelease) {
    auto pool = MakePool(1);

    auto held = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(held);

    auto waiter = std::async(std::launch::async, [&] {
        return pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    });

    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);
    pool->Release(held.Value());

    auto acquired = waiter.get();
    ASSERT_TRUE(acquired);
    EXPECT_EQ(acquired.Value().id, held.Value().id);
    EXPECT_EQ(runtime_->create_count.load(), 1);
}

TEST_F(ContainerPoolTest, WaitPastDeadlineIsPoolExhausted) {
    auto pool = MakePool(1);

    auto held = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(held);

    auto start = std::chrono::steady_clock::now();
    auto result = pool->Acquire("alpine:3.19", options_, In(std::chrono::milliseconds(200)));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().kind, ErrorKind::POOL_EXHAUSTED);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(150));
}

TEST_F(ContainerPoolTest, CancellationStopsWaiting) {
    auto pool = MakePool(1);
    auto held = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(held);

    auto cancel = CancellationToken::Create();
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.Cancel();
    });

    auto result = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(10)), cancel);
    canceller.join();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().kind, ErrorKind::CANCELLED);
}

TEST_F(ContainerPoolTest, CorruptedReleaseDestroysContainer) {
    auto pool = MakePool(1);

    auto first = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(first);
    pool->Release(first.Value(), true);

    EXPECT_EQ(runtime_->LiveContainers().count(first.Value().id), 0u);

    auto second = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(second);
    EXPECT_NE(second.Value().id, first.Value().id);
    EXPECT_EQ(pool->GetStats().total_destroyed, 1u);
}

TEST_F(ContainerPoolTest, ReleaseOfUnknownContainerIsIgnored) {
    auto pool = MakePool(1);

    PooledContainer stranger;
    stranger.id = "not-ours";
    pool->Release(stranger);
    pool->Release(stranger, true);

    EXPECT_TRUE(runtime_->RemovedContainers().empty());
}

TEST_F(ContainerPoolTest, SweepRemovesOnlyExpiredIdleContainers) {
    auto pool = MakePool(3, std::chrono::milliseconds(100));

    auto idle = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    auto busy = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(idle);
    ASSERT_TRUE(busy);
    pool->Release(idle.Value());

    EXPECT_EQ(pool->SweepIdle(), 0u);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(pool->SweepIdle(), 1u);

    auto live = runtime_->LiveContainers();
    EXPECT_EQ(live.count(idle.Value().id), 0u);
    EXPECT_EQ(live.count(busy.Value().id), 1u);
    EXPECT_EQ(pool->GetStats().in_use, 1u);
}

TEST_F(ContainerPoolTest, BackgroundSweeperEvictsIdleContainers) {
    auto pool = MakePool(2, std::chrono::milliseconds(100), true);

    auto container = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(container);
    pool->Release(container.Value());

    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!runtime_->LiveContainers().empty() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(runtime_->LiveContainers().empty());
}

TEST_F(ContainerPoolTest, FullPoolEvictsIdleContainerOfAnotherImage) {
    auto pool = MakePool(1);

    auto alpine = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(alpine);
    pool->Release(alpine.Value());

    auto python = pool->Acquire("python:3.12", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(python);

    auto live = runtime_->LiveContainers();
    EXPECT_EQ(live.size(), 1u);
    EXPECT_EQ(live.count(python.Value().id), 1u);
    EXPECT_EQ(runtime_->MaxLive(), 1u);
}

TEST_F(ContainerPoolTest, DestroyAllIsRepeatable) {
    auto pool = MakePool(3);

    auto a = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    auto b = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    pool->Release(a.Value());

    pool->DestroyAll();
    EXPECT_TRUE(runtime_->LiveContainers().empty());
    EXPECT_EQ(runtime_->RemovedContainers().size(), 2u);

    pool->DestroyAll();
    EXPECT_EQ(runtime_->RemovedContainers().size(), 2u);

    // A container lent before DestroyAll comes back as a stranger
    pool->Release(b.Value());
    EXPECT_EQ(pool->GetStats().idle, 0u);
}

TEST_F(ContainerPoolTest, DestroyAllStopsBeforeRemoving) {
    auto pool = MakePool(3);

    auto corrupted = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    auto kept = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_TRUE(corrupted);
    ASSERT_TRUE(kept);
    pool->Release(corrupted.Value(), true);
    pool->Release(kept.Value());

    EXPECT_TRUE(runtime_->StoppedContainers().empty());

    pool->DestroyAll();

    auto stopped = runtime_->StoppedContainers();
    ASSERT_EQ(stopped.size(), 1u);
    EXPECT_EQ(stopped[0], kept.Value().id);
    EXPECT_TRUE(runtime_->LiveContainers().empty());
}

TEST_F(ContainerPoolTest, CreateFailureFreesTheSlot) {
    auto pool = MakePool(1);
    runtime_->fail_create = true;

    auto failed = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.GetError().kind, ErrorKind::EXECUTION_FAILED);

    runtime_->fail_create = false;
    auto ok = pool->Acquire("alpine:3.19", options_, In(std::chrono::milliseconds(500)));
    EXPECT_TRUE(ok);
}

TEST_F(ContainerPoolTest, StartFailureRemovesContainerAndFreesTheSlot) {
    auto pool = MakePool(1);
    runtime_->fail_start = true;

    auto failed = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
    ASSERT_FALSE(failed);
    EXPECT_TRUE(runtime_->LiveContainers().empty());
    EXPECT_EQ(runtime_->RemovedContainers().size(), 1u);

    runtime_->fail_start = false;
    EXPECT_TRUE(pool->Acquire("alpine:3.19", options_, In(std::chrono::milliseconds(500))));
}

TEST_F(ContainerPoolTest, ConcurrentAcquiresNeverExceedCapacity) {
    auto pool = MakePool(3);
    runtime_->create_delay = std::chrono::milliseconds(20);

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 12; ++i) {
        workers.emplace_back([&, i] {
            std::string image = (i % 2 == 0) ? "alpine:3.19" : "python:3.12";
            for (int round = 0; round < 3; ++round) {
                auto container = pool->Acquire(image, options_, In(std::chrono::seconds(20)));
                if (!container) {
                    failures++;
                    continue;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                pool->Release(container.Value(), round == 1);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(runtime_->MaxLive(), 3u);

    auto stats = pool->GetStats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.creating, 0u);
    EXPECT_EQ(stats.removing, 0u);
}

TEST_F(ContainerPoolTest, DestructorRemovesEverything) {
    {
        auto pool = MakePool(2);
        auto container = pool->Acquire("alpine:3.19", options_, In(std::chrono::seconds(5)));
        ASSERT_TRUE(container);
        pool->Release(container.Value());
    }
    EXPECT_TRUE(runtime_->LiveContainers().empty());
}
