#pragma once

#include <optional>
#include <string>
#include "task_key.h"
#include "task_priority.h"

class IExecutor;

enum class DispatchMode
{
    /// Queued on the executor, inherits priority and executor of the current TaskContext.
    normal,
    /// Queued on the executor, ignores the current TaskContext.
    detached,
    /// Runs on the calling thread until its first suspension point, inherits the current TaskContext.
    immediate,
    /// Runs on the calling thread until its first suspension point, ignores the current TaskContext.
    immediateDetached,
};

constexpr bool isDetached(DispatchMode mode) noexcept
{
    return mode == DispatchMode::detached || mode == DispatchMode::immediateDetached;
}

constexpr bool isImmediate(DispatchMode mode) noexcept
{
    return mode == DispatchMode::immediate || mode == DispatchMode::immediateDetached;
}

/// Options of CancellationScope::submit().
struct SubmitOptions final
{
    DispatchMode mode{DispatchMode::normal};
    /// A task submitted with a key cancels and replaces the live task with an equal key.
    std::optional<TaskKey> key;
    /// Unset means inherited or TaskPriority::medium.
    std::optional<TaskPriority> priority;
    /// Executor preference, nullptr means inherited or the default executor of the scope.
    IExecutor* executor{nullptr};
    std::string name;

    static SubmitOptions keyed(TaskKey key, DispatchMode mode = DispatchMode::normal);
};

inline SubmitOptions SubmitOptions::keyed(TaskKey key, DispatchMode mode /* = DispatchMode::normal*/)
{
    SubmitOptions options;
    options.mode = mode;
    options.key = std::move(key);
    return options;
}
