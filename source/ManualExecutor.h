#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <utility>
#include <vector>
#include "IExecutor.h"

/// Executor for tests, keeps scheduled methods until they are run explicitly on the calling thread.
class ManualExecutor final : public IExecutor
{
public:
    using ScheduleHook = std::function<void(std::size_t scheduledIndex)>;

    /// @p hook is invoked before a method is queued, with the index of the method among all scheduled ones.
    void setOnSchedule(ScheduleHook hook)
    {
        _onSchedule = std::move(hook);
    }

    /// Runs the oldest pending method.
    /// @returns false when nothing was pending.
    bool runOne()
    {
        if (_pending.empty())
            return false;

        MethodType method = std::move(_pending.front());
        _pending.pop_front();
        (*method)();
        return true;
    }

    /// Runs pending methods, including the ones scheduled meanwhile, until the queue is empty.
    /// @returns Number of methods run.
    std::size_t runAll()
    {
        std::size_t count{0};
        while (runOne())
        {
            ++count;
        }

        return count;
    }

    std::size_t pendingCount() const noexcept
    {
        return _pending.size();
    }

    std::size_t scheduledCount() const noexcept
    {
        return _priorities.size();
    }

    /// Priorities of all scheduled methods in scheduling order.
    const std::vector<TaskPriority>& priorities() const noexcept
    {
        return _priorities;
    }

private:
    void scheduleInner(MethodType&& method, TaskPriority priority) override
    {
        const auto index = _priorities.size();
        _priorities.push_back(priority);
        if (_onSchedule)
            _onSchedule(index);

        _pending.push_back(std::move(method));
    }

    std::deque<MethodType> _pending;
    std::vector<TaskPriority> _priorities;
    ScheduleHook _onSchedule;
};
