#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>
#include "cancellation_token.h"
#include "continuation_task.h"
#include "scoped_task.h"
#include "submit_options.h"
#include "task_key.h"

class IExecutor;
struct TaskContext;

/**
 * Owns asynchronous tasks for as long as at least one observer is active.
 *
 * Observers are counted by activate() and deactivate(). When the count drops to zero every task held by the scope
 * is canceled and forgotten. Work submitted while no observer is active is dropped without being dispatched.
 *
 * @note The scope is not thread safe, all calls are expected from its single owner.
 * SharedCancellationScope serializes access for owners shared between threads.
 */
class CancellationScope final
{
public:
    using Work = std::function<void(CancellationToken)>;

    /// Immediate task already held by the scope whose synchronous part was not run yet.
    class ImmediateStart final
    {
    public:
        ImmediateStart(ScopedTask task, ContinuationTask::TaskMethod method);

        const ScopedTask& task() const noexcept;
        /// Runs the task on the calling thread until its first suspension point.
        /// \note May be called once.
        void operator()();

    private:
        ScopedTask _task;
        ContinuationTask::TaskMethod _method;
    };

    /**
     * Creates an unobserved scope.
     * @param executor executor used when a submission neither prefers nor inherits one
     * @note The @p executor instance needs to stay alive as long as tasks dispatched to it may run.
     */
    explicit CancellationScope(IExecutor& executor);

    void activate();
    /// Cancels all tasks when the last observer deactivates.
    /// \note A call without a matching activate() is a protocol violation, the observer count stays at zero.
    void deactivate();

    /**
     * Dispatches @p work and keeps its handle until the scope is flushed.
     * Does nothing when no observer is active.
     * @param work receives the token canceled together with the task
     * @param options key, priority, executor preference, dispatch mode and name of the task
     * @throws Whatever the executor throws while scheduling, the task is forgotten first.
     */
    void submit(Work work, SubmitOptions options = {});

    /**
     * Same as submit(), except that an immediate task is returned instead of being run.
     * Lets an owner guarding the scope with a lock run the synchronous part after unlocking.
     * @returns The task to be run by the caller, empty when nothing is left to run.
     * @note When running the returned task throws, the caller passes its handle to discard().
     */
    std::optional<ImmediateStart> submitDeferred(Work work, SubmitOptions options = {});

    /// Cancels and forgets the handle of a task that could not be started.
    /// \note Does nothing when the scope no longer holds the task.
    void discard(const ScopedTask& task) noexcept;

    /// Cancels and forgets all tasks regardless of the observer count.
    void cancelAll() noexcept;

    std::size_t observerCount() const noexcept;
    std::size_t anonymousTaskCount() const noexcept;
    std::size_t keyedTaskCount() const noexcept;
    bool hasTask(const TaskKey& key) const;
    /// @returns Number of deactivate() calls that had no matching activate().
    std::size_t protocolViolations() const noexcept;

private:
    void flush() noexcept;
    void track(const ScopedTask& task, const SubmitOptions& options);
    std::shared_ptr<const TaskContext> makeContext(const ScopedTask& task, const SubmitOptions& options) const;

    IExecutor* _executor;
    std::size_t _observerCount;
    std::vector<ScopedTask> _anonymousTasks;
    std::unordered_map<TaskKey, ScopedTask> _keyedTasks;
    std::uint64_t _lastTaskId;
    std::size_t _protocolViolations;
};
