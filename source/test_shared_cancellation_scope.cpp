#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <type_traits>
#include <vector>

#include "ManualExecutor.h"
#include "SimpleThreadPool.h"
#include "shared_cancellation_scope.h"

TEST(scopeActivationTest, activatesForItsLifetime)
{
    ManualExecutor executor;
    SharedCancellationScope scope(executor);
    CancellationToken token;

    {
        ScopeActivation activation(scope);
        ASSERT_TRUE(activation.active());
        ASSERT_EQ(1u, scope.observerCount());

        scope.submit([&](CancellationToken ct) { token = ct; });
        executor.runAll();
        ASSERT_FALSE(token.is_canceled());
    }

    ASSERT_EQ(0u, scope.observerCount());
    ASSERT_EQ(0u, scope.anonymousTaskCount());
    ASSERT_TRUE(token.is_canceled());
}

TEST(scopeActivationTest, releaseDeactivatesOnce)
{
    ManualExecutor executor;
    SharedCancellationScope scope(executor);

    ScopeActivation first(scope);
    ScopeActivation second(scope);
    ASSERT_EQ(2u, scope.observerCount());

    first.release();
    first.release();
    ASSERT_FALSE(first.active());
    ASSERT_EQ(1u, scope.observerCount());

    second.release();
    ASSERT_EQ(0u, scope.observerCount());
    ASSERT_EQ(0u, scope.protocolViolations());
}

TEST(scopeActivationTest, moveTransfersObserver)
{
    static_assert(std::is_nothrow_move_constructible<ScopeActivation>::value, "activations are moved in containers");
    static_assert(std::is_nothrow_move_assignable<ScopeActivation>::value, "activations are moved in containers");

    ManualExecutor executor;
    SharedCancellationScope scope(executor);

    ScopeActivation first(scope);
    ScopeActivation moved(std::move(first));
    ASSERT_FALSE(first.active());
    ASSERT_TRUE(moved.active());
    ASSERT_EQ(1u, scope.observerCount());

    ScopeActivation assigned(scope);
    ASSERT_EQ(2u, scope.observerCount());
    // The observer held by the target is released
    assigned = std::move(moved);
    ASSERT_EQ(1u, scope.observerCount());

    std::vector<ScopeActivation> activations;
    activations.push_back(std::move(assigned));
    activations.clear();
    ASSERT_EQ(0u, scope.observerCount());
}

TEST(sharedCancellationScopeTest, destructionCancelsHeldTasks)
{
    ManualExecutor executor;
    CancellationToken anonymous;
    CancellationToken keyed;

    {
        SharedCancellationScope scope(executor);
        scope.activate();
        scope.submit([&](CancellationToken ct) { anonymous = ct; });
        scope.submit([&](CancellationToken ct) { keyed = ct; }, SubmitOptions::keyed("x"));
        executor.runAll();

        ASSERT_TRUE(scope.hasTask("x"));
        ASSERT_EQ(1u, scope.keyedTaskCount());
        ASSERT_FALSE(anonymous.is_canceled());
        ASSERT_FALSE(keyed.is_canceled());
    }

    ASSERT_TRUE(anonymous.is_canceled());
    ASSERT_TRUE(keyed.is_canceled());
}

TEST(sharedCancellationScopeTest, tasksMaySubmitFromPoolThreads)
{
    SimpleThreadPool thPool(4);
    thPool.start();
    std::atomic<int> executed{0};

    {
        SharedCancellationScope scope(thPool);
        ScopeActivation activation(scope);

        for (int idx = 0; idx < 16; ++idx)
        {
            scope.submit([&, idx](CancellationToken) {
                scope.submit([&](CancellationToken) { ++executed; }, SubmitOptions::keyed(idx));
                ++executed;
            });
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
        while (executed < 32 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        ASSERT_EQ(16u, scope.anonymousTaskCount());
        ASSERT_EQ(16u, scope.keyedTaskCount());
        activation.release();
        ASSERT_EQ(0u, scope.anonymousTaskCount());
        ASSERT_EQ(0u, scope.keyedTaskCount());
    }

    thPool.stop();
    ASSERT_EQ(32, executed.load());
    ASSERT_TRUE(thPool.popExceptions().empty());
}

TEST(sharedCancellationScopeTest, concurrentObserversKeepInvariant)
{
    constexpr int threadCount{4};
    constexpr int iterations{500};

    ManualExecutor executor;
    SharedCancellationScope scope(executor);
    std::atomic_bool violated{false};

    std::vector<std::thread> threads;
    for (int threadNr = 0; threadNr < threadCount; ++threadNr)
    {
        threads.emplace_back([&]() {
            for (int idx = 0; idx < iterations; ++idx)
            {
                ScopeActivation activation(scope);
                // Submissions are discarded or dispatched, the ManualExecutor keeps them queued
                scope.submit([](CancellationToken) {}, SubmitOptions::keyed(idx % 3));
                if (scope.observerCount() == 0)
                    violated = true;
            }
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    ASSERT_FALSE(violated);
    ASSERT_EQ(0u, scope.observerCount());
    ASSERT_EQ(0u, scope.keyedTaskCount());
    ASSERT_EQ(0u, scope.protocolViolations());
}

TEST(sharedCancellationScopeTest, immediateWorkDoesNotBlockOtherThreads)
{
    ManualExecutor executor;
    SharedCancellationScope scope(executor);
    std::atomic_bool started{false};
    std::atomic_bool sawCancellation{false};

    scope.activate();
    std::thread submitter([&]() {
        SubmitOptions options;
        options.mode = DispatchMode::immediate;
        scope.submit(
            [&](CancellationToken ct) {
                started = true;
                // Only another thread deactivating the scope ends the wait
                const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
                while (!ct.is_canceled() && std::chrono::steady_clock::now() < deadline)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                sawCancellation = ct.is_canceled();
            },
            options);
    });

    while (!started)
    {
        std::this_thread::yield();
    }

    EXPECT_EQ(1u, scope.anonymousTaskCount());
    scope.deactivate();
    EXPECT_EQ(0u, scope.anonymousTaskCount());

    submitter.join();
    ASSERT_TRUE(sawCancellation);
    ASSERT_EQ(0u, scope.observerCount());
}

TEST(sharedCancellationScopeTest, immediateWorkMayUseItsScope)
{
    ManualExecutor executor;
    SharedCancellationScope scope(executor);
    std::size_t observersInside{0};
    bool nestedRan{false};

    ScopeActivation activation(scope);
    scope.submit(
        [&](CancellationToken) {
            observersInside = scope.observerCount();
            scope.submit([&](CancellationToken) { nestedRan = true; }, SubmitOptions::keyed("nested"));
        },
        SubmitOptions::keyed("outer", DispatchMode::immediate));

    ASSERT_EQ(1u, observersInside);
    ASSERT_EQ(2u, scope.keyedTaskCount());
    executor.runAll();
    ASSERT_TRUE(nestedRan);
}
