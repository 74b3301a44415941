#pragma once

#include <functional>
#include <future>
#include <memory>
#include "IExecutor.h"
#include "cancellation_token.h"
#include "task_priority.h"

/// Chain of methods executed one after another on an executor.
/// Every step checks the cancellation token before it is scheduled and before it runs,
/// a skipped step fulfills its future with CanceledException.
class ContinuationTask final
{
private:
    class Impl;

public:
    using TaskMethod = std::function<void()>;
    using CancelableTaskMethod = std::function<TaskMethod::result_type(CancellationToken)>;
    using Future = std::future<TaskMethod::result_type>;
    using Promise = std::promise<TaskMethod::result_type>;

    /**
     * Creates a new instance with a fulfilled future.
     * @param executor executor to be used for task scheduling
     * @param cancellation token for canceling the continuations of this task
     * @note The @p executor instance needs to stay alive as long as this instance and all instances created by the
     * ContinuationTask::continue_with(TaskMethod&&) method are alive.
     */
    explicit ContinuationTask(IExecutor& executor, CancellationToken cancellation = {});

    /**
     * Creates a new instance and schedules @p method.
     * @param executor executor to be used for task scheduling
     * @param method task to be executed on the executor
     * @param cancellation token for canceling this task
     * @param priority priority hint passed to the executor, inherited by continuations
     */
    ContinuationTask(IExecutor& executor,
                     TaskMethod&& method,
                     CancellationToken cancellation = {},
                     TaskPriority priority = TaskPriority::medium);

    /**
     * Creates a new instance and schedules @p method.
     * @param executor executor to be used for task scheduling
     * @param method cancelable task to be executed on the executor, receives @p cancellation
     * @param cancellation token for canceling this task
     * @param priority priority hint passed to the executor, inherited by continuations
     */
    ContinuationTask(IExecutor& executor,
                     CancelableTaskMethod&& method,
                     CancellationToken cancellation = {},
                     TaskPriority priority = TaskPriority::medium);

private:
    ContinuationTask(std::shared_ptr<Impl> sharedState);

public:
    /**
     * Schedules a new task for execution after the task represented by this instance is finished.
     * @param method task to be executed on the executor
     * @returns A new continuation instance representing the new task.
     */
    ContinuationTask continue_with(TaskMethod&& method);

    /**
     * @returns A future that will be fulfilled by the task.
     */
    Future& get_future();

private:
    std::shared_ptr<Impl> _pImpl;
};
