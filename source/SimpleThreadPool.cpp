#include "SimpleThreadPool.h"

#include <cassert>

namespace
{
    std::size_t resolveThreadCount(std::size_t requested)
    {
        if (requested != 0)
            return requested;

        const auto hardware = static_cast<std::size_t>(std::thread::hardware_concurrency());
        return hardware != 0 ? hardware : 1;
    }
}

SimpleThreadPool::SimpleThreadPool(std::size_t threadCount)
    : _threadCount{resolveThreadCount(threadCount)}
    , _run{false}
{
}

SimpleThreadPool::~SimpleThreadPool()
{
    stop();

    {
        std::lock_guard<std::mutex> lk(_exceptMtx);
        // Destructor is noexcept
        assert(_exceptions.empty());
    }
}

void SimpleThreadPool::start()
{
    if (!_threads.empty())
        return;

    {
        std::lock_guard<std::mutex> lk(_threadWaitMtx);
        _run = true;
    }

    for (std::size_t threadNr = 0; threadNr < _threadCount; ++threadNr)
    {
        _threads.emplace_back(std::make_unique<std::thread>(&SimpleThreadPool::threadPoolMethod, this));
    }
}

void SimpleThreadPool::stop()
{
    {
        std::lock_guard<std::mutex> lk(_threadWaitMtx);
        _run = false;
        _threadWait.notify_all();
    }

    for (auto& thread : _threads)
    {
        if (thread->joinable())
        {
            thread->join();
        }
    }

    _threads.clear();
}

SimpleThreadPool::ExceptContainerType SimpleThreadPool::popExceptions()
{
    ExceptContainerType exceptions;

    {
        std::lock_guard<std::mutex> lk(_exceptMtx);
        exceptions = std::move(_exceptions);
        _exceptions.clear();
    }

    return exceptions;
}

std::size_t SimpleThreadPool::threadCount() const noexcept
{
    return _threadCount;
}

std::size_t SimpleThreadPool::pendingCount() const
{
    std::lock_guard<std::mutex> lk(_threadWaitMtx);

    std::size_t count{0};
    for (const auto& queue : _taskQueues)
    {
        count += queue.size();
    }

    return count;
}

void SimpleThreadPool::scheduleInner(MethodType&& method, TaskPriority priority)
{
    const auto level = static_cast<std::size_t>(priority);
    assert(level < PriorityLevels);

    std::lock_guard<std::mutex> lk(_threadWaitMtx);
    _taskQueues[level].push(std::move(method));
    _threadWait.notify_one();
}

bool SimpleThreadPool::hasPending() const noexcept
{
    for (const auto& queue : _taskQueues)
    {
        if (!queue.empty())
            return true;
    }

    return false;
}

SimpleThreadPool::MethodType SimpleThreadPool::popHighest()
{
    for (auto level = PriorityLevels; level > 0; --level)
    {
        auto& queue = _taskQueues[level - 1];
        if (!queue.empty())
        {
            MethodType method = std::move(queue.front());
            queue.pop();
            return method;
        }
    }

    return nullptr;
}

void SimpleThreadPool::threadPoolMethod() noexcept
{
    while (true)
    {
        try
        {
            MethodType task;

            {
                std::unique_lock<std::mutex> lk(_threadWaitMtx);
                _threadWait.wait(lk, [&] { return hasPending() || !_run; });
                if (!_run)
                    break;

                task = popHighest();
            }

            assert(task);
            (*task)();
        }
        catch (...)
        {
            std::lock_guard<std::mutex> lk(_exceptMtx);
            _exceptions.push_back(std::current_exception());
        }
    }
}
