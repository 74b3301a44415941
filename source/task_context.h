#pragma once

#include <string>
#include "cancellation_token.h"
#include "task_priority.h"

class IExecutor;

/// Ambient context of the scope task running on the current thread.
struct TaskContext final
{
    /// Executor the task continues on after a suspension point.
    IExecutor* executor;
    TaskPriority priority;
    CancellationToken cancellation;
    std::string name;

    /// @returns The context of the task running on this thread or nullptr when no task is running.
    static const TaskContext* current() noexcept;

    /// Makes a context current for the lifetime of the instance, the previous one is restored afterwards.
    class Binding final
    {
    public:
        explicit Binding(const TaskContext& context) noexcept;
        ~Binding();

        Binding(const Binding&) = delete;
        Binding& operator=(const Binding&) = delete;

    private:
        const TaskContext* _previous;
    };
};
