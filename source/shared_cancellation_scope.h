#pragma once

#include <cstddef>
#include <mutex>
#include "cancellation_scope.h"

/// Single owner of a CancellationScope shared between threads.
/// Every call is serialized on one mutex. The synchronous part of an immediate task runs
/// after the mutex is released, so that task may call back into the scope and other threads are not held up.
class SharedCancellationScope final
{
public:
    explicit SharedCancellationScope(IExecutor& executor);
    /// Cancels the tasks the scope still holds.
    ~SharedCancellationScope();

    SharedCancellationScope(const SharedCancellationScope&) = delete;
    SharedCancellationScope& operator=(const SharedCancellationScope&) = delete;

    void activate();
    void deactivate();
    void submit(CancellationScope::Work work, SubmitOptions options = {});

    std::size_t observerCount() const;
    std::size_t anonymousTaskCount() const;
    std::size_t keyedTaskCount() const;
    bool hasTask(const TaskKey& key) const;
    std::size_t protocolViolations() const;

private:
    mutable std::recursive_mutex _mutex;
    CancellationScope _scope;
};

/// Keeps one observer of a SharedCancellationScope active for its lifetime.
class ScopeActivation final
{
public:
    explicit ScopeActivation(SharedCancellationScope& scope);
    ScopeActivation(ScopeActivation&& other) noexcept;
    ScopeActivation& operator=(ScopeActivation&& other) noexcept;
    ~ScopeActivation();

    ScopeActivation(const ScopeActivation&) = delete;
    ScopeActivation& operator=(const ScopeActivation&) = delete;

    /// Deactivates the observer, successive calls have no effect.
    void release();
    bool active() const noexcept;

private:
    SharedCancellationScope* _scope;
};
