#include "shared_cancellation_scope.h"

#include <optional>
#include <utility>

SharedCancellationScope::SharedCancellationScope(IExecutor& executor)
    : _scope(executor)
{
}

SharedCancellationScope::~SharedCancellationScope()
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    _scope.cancelAll();
}

void SharedCancellationScope::activate()
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    _scope.activate();
}

void SharedCancellationScope::deactivate()
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    _scope.deactivate();
}

void SharedCancellationScope::submit(CancellationScope::Work work, SubmitOptions options /* = {}*/)
{
    std::optional<CancellationScope::ImmediateStart> start;
    {
        std::lock_guard<std::recursive_mutex> lk(_mutex);
        start = _scope.submitDeferred(std::move(work), std::move(options));
    }

    if (!start)
        return;

    // Runs unlocked, other threads keep using the scope while immediate work is busy
    try
    {
        (*start)();
    }
    catch (...)
    {
        std::lock_guard<std::recursive_mutex> lk(_mutex);
        _scope.discard(start->task());
        throw;
    }
}

std::size_t SharedCancellationScope::observerCount() const
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    return _scope.observerCount();
}

std::size_t SharedCancellationScope::anonymousTaskCount() const
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    return _scope.anonymousTaskCount();
}

std::size_t SharedCancellationScope::keyedTaskCount() const
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    return _scope.keyedTaskCount();
}

bool SharedCancellationScope::hasTask(const TaskKey& key) const
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    return _scope.hasTask(key);
}

std::size_t SharedCancellationScope::protocolViolations() const
{
    std::lock_guard<std::recursive_mutex> lk(_mutex);
    return _scope.protocolViolations();
}

ScopeActivation::ScopeActivation(SharedCancellationScope& scope)
    : _scope{&scope}
{
    _scope->activate();
}

ScopeActivation::ScopeActivation(ScopeActivation&& other) noexcept
    : _scope{std::exchange(other._scope, nullptr)}
{
}

ScopeActivation& ScopeActivation::operator=(ScopeActivation&& other) noexcept
{
    if (this != &other)
    {
        release();
        _scope = std::exchange(other._scope, nullptr);
    }

    return *this;
}

ScopeActivation::~ScopeActivation()
{
    release();
}

void ScopeActivation::release()
{
    if (_scope == nullptr)
        return;

    std::exchange(_scope, nullptr)->deactivate();
}

bool ScopeActivation::active() const noexcept
{
    return _scope != nullptr;
}
