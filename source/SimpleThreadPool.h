#pragma once

#include "IExecutor.h"

#include <array>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/// General purpose executor running scheduled methods on a fixed set of threads.
/// Methods with higher TaskPriority are taken first, methods with equal priority in FIFO order.
class SimpleThreadPool final : public IExecutor
{
public:
    using ExceptContainerType = std::vector<std::exception_ptr>;

    /// \param threadCount number of worker threads, zero is replaced by the hardware concurrency
    explicit SimpleThreadPool(std::size_t threadCount);
    /// Destroys the instance.
    /// \note Internally calls SimpleThreadPool::stop().
    /// \note Un-popped exceptions will be swallowed, for DEBUG and assertion is made.
    /// \note It is recommended to call SimpleThreadPool::stop() and SimpleThreadPool::popExceptions() methods before instance destruction.
    ~SimpleThreadPool() override;

    /// Starts the threads in the thread pool.
    /// \note Successive calls without call to SimpleThreadPool::stop() in between has no effect.
    void start();
    /// Stops the threads in the thread pool.
    /// \note Methods being executed are finished, queued methods stay queued until the next start.
    void stop();
    ExceptContainerType popExceptions();

    std::size_t threadCount() const noexcept;
    std::size_t pendingCount() const;

private:
    static constexpr std::size_t PriorityLevels{4};
    using QueueType = std::queue<MethodType>;

    void scheduleInner(MethodType&& method, TaskPriority priority) override;
    void threadPoolMethod() noexcept;
    bool hasPending() const noexcept;
    MethodType popHighest();

    std::vector<std::unique_ptr<std::thread>> _threads;
    mutable std::mutex _threadWaitMtx;
    std::condition_variable _threadWait;
    std::array<QueueType, PriorityLevels> _taskQueues;
    std::size_t _threadCount;
    bool _run;

    std::mutex _exceptMtx;
    ExceptContainerType _exceptions;
};
