#include "continuation_task.h"

#include <exception>
#include <mutex>
#include <queue>
#include "canceled_exception.h"

namespace
{
    class PromiseMethod
    {
    public:
        PromiseMethod();
        explicit PromiseMethod(ContinuationTask::TaskMethod&& method);

        void operator()() noexcept;
        ContinuationTask::Future get_future();
        void cancel();

    private:
        ContinuationTask::TaskMethod _method;
        ContinuationTask::Promise _promise;
    };

    PromiseMethod::PromiseMethod()
    {
        _promise.set_value();
    }

    PromiseMethod::PromiseMethod(ContinuationTask::TaskMethod&& method)
        : _method(std::move(method))
    {
    }

    void PromiseMethod::operator()() noexcept
    {
        try
        {
            _method();
            _promise.set_value();
        }
        catch (...)
        {
            _promise.set_exception(std::current_exception());
        }
    }

    ContinuationTask::Future PromiseMethod::get_future()
    {
        return _promise.get_future();
    }

    void PromiseMethod::cancel()
    {
        _promise.set_exception(std::make_exception_ptr(CanceledException()));
    }
}

class ContinuationTask::Impl final
{
private:
    using MethodContainer = std::queue<std::shared_ptr<Impl>>;

public:
    Impl(IExecutor& executor, CancellationToken&& cancellation);
    Impl(IExecutor& executor, TaskMethod&& method, CancellationToken&& cancellation, TaskPriority priority);
    Impl(std::shared_ptr<Impl> parent, TaskMethod&& method);

    static void scheduleNow(std::shared_ptr<ContinuationTask::Impl> task);

    ContinuationTask continue_with(std::shared_ptr<Impl> parent, TaskMethod&& method);
    void schedule(std::shared_ptr<Impl>& task);
    Future& get_future();

private:
    static void threadMethod(std::shared_ptr<ContinuationTask::Impl> task);
    static void scheduleChildren(ContinuationTask::Impl& task);

    IExecutor& _executor;
    std::shared_ptr<Impl> _parent;
    PromiseMethod _method;
    MethodContainer _childs;
    std::mutex _scheduleLock;
    Future _future;
    CancellationToken _cancellation;
    TaskPriority _priority;
};

ContinuationTask::Impl::Impl(IExecutor& executor, CancellationToken&& cancellation)
    : _executor(executor)
    , _parent()
    , _method()
    , _future(_method.get_future())
    , _cancellation(std::move(cancellation))  // relevant only for children
    , _priority(TaskPriority::medium)
{
}

ContinuationTask::Impl::Impl(IExecutor& executor, TaskMethod&& method, CancellationToken&& cancellation, TaskPriority priority)
    : _executor(executor)
    , _parent()
    , _method(std::move(method))
    , _future(_method.get_future())
    , _cancellation(std::move(cancellation))
    , _priority(priority)
{
}

ContinuationTask::Impl::Impl(std::shared_ptr<Impl> parent, TaskMethod&& method)
    : _executor(parent->_executor)
    , _parent(std::move(parent))
    , _method(std::move(method))
    , _future(_method.get_future())
    , _cancellation(_parent->_cancellation)
    , _priority(_parent->_priority)
{
}

ContinuationTask ContinuationTask::Impl::continue_with(std::shared_ptr<Impl> parent, TaskMethod&& method)
{
    auto childImpl = std::make_shared<Impl>(std::move(parent), std::move(method));
    ContinuationTask child(childImpl);
    {
        std::lock_guard<std::mutex> lk(_scheduleLock);
        schedule(childImpl);
    }

    return child;
}

void ContinuationTask::Impl::schedule(std::shared_ptr<Impl>& task)
{
    if (get_future().wait_for(std::chrono::seconds(0)) == std::future_status::ready)
    {
        scheduleNow(task);
    }
    else
    {
        _childs.push(task);
    }
}

ContinuationTask::Future& ContinuationTask::Impl::get_future()
{
    return _future;
}

void ContinuationTask::Impl::scheduleNow(std::shared_ptr<ContinuationTask::Impl> task)
{
    if (task->_cancellation.is_canceled())
    {
        task->_parent.reset();
        task->_method.cancel();
        scheduleChildren(*task);
    }
    else
    {
        auto& executor = task->_executor;
        const auto priority = task->_priority;
        // Someone needs to hold the task instance till the threadMethod finishes
        // so the shared_ptr<Impl> is given as argument
        executor.scheduleWithPriority(priority, &ContinuationTask::Impl::threadMethod, std::move(task));
    }
}

void ContinuationTask::Impl::scheduleChildren(ContinuationTask::Impl& task)
{
    std::lock_guard<std::mutex> lk(task._scheduleLock);
    while (!task._childs.empty())
    {
        scheduleNow(std::move(task._childs.front()));
        task._childs.pop();
    }
}

void ContinuationTask::Impl::threadMethod(std::shared_ptr<ContinuationTask::Impl> task)
{
    auto method = std::move(*task)._method;

    task->_parent.reset();

    if (task->_cancellation.is_canceled())
    {
        method.cancel();
    }
    else
    {
        method();
    }

    // Children of a canceled step are canceled in scheduleNow
    scheduleChildren(*task);
}

ContinuationTask::ContinuationTask(IExecutor& executor, CancellationToken cancellation /* = {}*/)
    : _pImpl(std::make_shared<Impl>(executor, std::move(cancellation)))
{
}

ContinuationTask::ContinuationTask(IExecutor& executor,
                                   TaskMethod&& method,
                                   CancellationToken cancellation /* = {}*/,
                                   TaskPriority priority /* = TaskPriority::medium*/)
    : _pImpl(std::make_shared<Impl>(executor, std::move(method), std::move(cancellation), priority))
{
    // OPEN or inherit Impl class from std::enable_shared_from_this
    Impl::scheduleNow(_pImpl);
}

ContinuationTask::ContinuationTask(IExecutor& executor,
                                   CancelableTaskMethod&& method,
                                   CancellationToken cancellation /* = {}*/,
                                   TaskPriority priority /* = TaskPriority::medium*/)
    : _pImpl(std::make_shared<Impl>(executor, std::bind(std::move(method), cancellation), CancellationToken(cancellation), priority))
{
    // OPEN or inherit Impl class from std::enable_shared_from_this
    Impl::scheduleNow(_pImpl);
}

ContinuationTask::ContinuationTask(std::shared_ptr<Impl> sharedState)
    : _pImpl(std::move(sharedState))
{
    // Scheduling will be done by the caller
}

ContinuationTask ContinuationTask::continue_with(TaskMethod&& method)
{
    return _pImpl->continue_with(_pImpl, std::move(method));
}

ContinuationTask::Future& ContinuationTask::get_future()
{
    return _pImpl->get_future();
}
