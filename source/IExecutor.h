#pragma once

#include <memory>
#include "bound_call.h"
#include "task_priority.h"

class IExecutor
{
public:
    virtual ~IExecutor() = default;

    template <typename Function, typename... Args>
    void schedule(Function&& f, Args&&... args);

    template <typename Function, typename... Args>
    void scheduleWithPriority(TaskPriority priority, Function&& f, Args&&... args);

protected:
    using MethodType = std::unique_ptr<BoundCall>;
    virtual void scheduleInner(MethodType&& method, TaskPriority priority) = 0;
};

template <typename Function, typename... Args>
void IExecutor::schedule(Function&& f, Args&&... args)
{
    scheduleWithPriority(TaskPriority::medium, std::forward<Function>(f), std::forward<Args>(args)...);
}

template <typename Function, typename... Args>
void IExecutor::scheduleWithPriority(TaskPriority priority, Function&& f, Args&&... args)
{
    MethodType method = bind_call(std::forward<Function>(f), std::forward<Args>(args)...);
    scheduleInner(std::move(method), priority);
}
