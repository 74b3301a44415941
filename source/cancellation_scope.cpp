#include "cancellation_scope.h"

#include <algorithm>
#include <cassert>
#include <exception>
#include <iterator>
#include <memory>
#include "InlineExecutor.h"
#include "canceled_exception.h"
#include "continuation_task.h"
#include "diagnostics.h"
#include "task_context.h"

namespace
{
    InlineExecutor& callingThreadExecutor()
    {
        static InlineExecutor executor;
        return executor;
    }

    void runStep(const TaskContext& context, const CancellationScope::Work& work)
    {
        TaskContext::Binding binding(context);

        try
        {
            work(context.cancellation);
        }
        catch (const CanceledException&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            reportTaskFailure(context.name, e.what());
            throw;
        }
        catch (...)
        {
            reportTaskFailure(context.name, "unknown exception");
            throw;
        }
    }
}

CancellationScope::ImmediateStart::ImmediateStart(ScopedTask task, ContinuationTask::TaskMethod method)
    : _task(std::move(task))
    , _method(std::move(method))
{
}

const ScopedTask& CancellationScope::ImmediateStart::task() const noexcept
{
    return _task;
}

void CancellationScope::ImmediateStart::operator()()
{
    assert(_method);
    auto method = std::move(_method);
    _method = nullptr;
    method();
}

CancellationScope::CancellationScope(IExecutor& executor)
    : _executor{&executor}
    , _observerCount{0}
    , _lastTaskId{0}
    , _protocolViolations{0}
{
}

void CancellationScope::activate()
{
    ++_observerCount;
    flush();
}

void CancellationScope::deactivate()
{
    if (_observerCount == 0)
    {
        ++_protocolViolations;
        reportProtocolViolation("deactivate() without a matching activate(), the observer count stays at zero");
        assert(false && "Observer count decremented below zero");
    }
    else
    {
        --_observerCount;
    }

    flush();
}

void CancellationScope::submit(Work work, SubmitOptions options /* = {}*/)
{
    auto start = submitDeferred(std::move(work), std::move(options));
    if (!start)
        return;

    try
    {
        (*start)();
    }
    catch (...)
    {
        discard(start->task());
        throw;
    }
}

std::optional<CancellationScope::ImmediateStart> CancellationScope::submitDeferred(Work work, SubmitOptions options /* = {}*/)
{
    if (_observerCount == 0)
        return std::nullopt;

    ScopedTask task(++_lastTaskId, options.name);
    auto context = makeContext(task, options);
    ContinuationTask::TaskMethod step = [context, work = std::move(work)]() { runStep(*context, work); };

    // The handle is stored first, an immediate task may deactivate the scope while running on this thread
    track(task, options);

    try
    {
        if (isImmediate(options.mode))
        {
            return ImmediateStart(task, [context, step = std::move(step)]() mutable {
                ContinuationTask started(callingThreadExecutor(), std::move(step), context->cancellation, context->priority);
            });
        }

        ContinuationTask dispatched(*context->executor, std::move(step), context->cancellation, context->priority);
    }
    catch (...)
    {
        discard(task);
        throw;
    }

    return std::nullopt;
}

void CancellationScope::discard(const ScopedTask& task) noexcept
{
    const auto sameTask = [&task](const ScopedTask& item) { return item.id() == task.id(); };

    auto anonymous = std::find_if(_anonymousTasks.rbegin(), _anonymousTasks.rend(), sameTask);
    if (anonymous != _anonymousTasks.rend())
    {
        anonymous->cancel();
        _anonymousTasks.erase(std::next(anonymous).base());
        return;
    }

    for (auto keyed = _keyedTasks.begin(); keyed != _keyedTasks.end(); ++keyed)
    {
        if (sameTask(keyed->second))
        {
            keyed->second.cancel();
            _keyedTasks.erase(keyed);
            return;
        }
    }
}

void CancellationScope::track(const ScopedTask& task, const SubmitOptions& options)
{
    if (!options.key)
    {
        _anonymousTasks.push_back(task);
        return;
    }

    auto found = _keyedTasks.find(*options.key);
    if (found != _keyedTasks.end())
    {
        // The superseded task is canceled before its replacement is dispatched
        found->second.cancel();
        found->second = task;
    }
    else
    {
        _keyedTasks.emplace(*options.key, task);
    }
}

std::shared_ptr<const TaskContext> CancellationScope::makeContext(const ScopedTask& task, const SubmitOptions& options) const
{
    const TaskContext* ambient = isDetached(options.mode) ? nullptr : TaskContext::current();

    IExecutor* executor = options.executor;
    if (executor == nullptr)
        executor = ambient != nullptr && ambient->executor != nullptr ? ambient->executor : _executor;

    TaskPriority priority = TaskPriority::medium;
    if (options.priority)
        priority = *options.priority;
    else if (ambient != nullptr)
        priority = ambient->priority;

    return std::make_shared<const TaskContext>(TaskContext{executor, priority, task.get_token(), task.name()});
}

void CancellationScope::cancelAll() noexcept
{
    // Detached from the scope first, cancellation must not observe half-cleared collections
    auto anonymousTasks = std::move(_anonymousTasks);
    auto keyedTasks = std::move(_keyedTasks);
    _anonymousTasks.clear();
    _keyedTasks.clear();

    for (auto& task : anonymousTasks)
    {
        task.cancel();
    }

    for (auto& item : keyedTasks)
    {
        item.second.cancel();
    }
}

void CancellationScope::flush() noexcept
{
    if (_observerCount != 0)
        return;

    cancelAll();
}

std::size_t CancellationScope::observerCount() const noexcept
{
    return _observerCount;
}

std::size_t CancellationScope::anonymousTaskCount() const noexcept
{
    return _anonymousTasks.size();
}

std::size_t CancellationScope::keyedTaskCount() const noexcept
{
    return _keyedTasks.size();
}

bool CancellationScope::hasTask(const TaskKey& key) const
{
    return _keyedTasks.find(key) != _keyedTasks.end();
}

std::size_t CancellationScope::protocolViolations() const noexcept
{
    return _protocolViolations;
}
