#include "task_context.h"

namespace
{
    thread_local const TaskContext* currentContext{nullptr};
}

const TaskContext* TaskContext::current() noexcept
{
    return currentContext;
}

TaskContext::Binding::Binding(const TaskContext& context) noexcept
    : _previous{currentContext}
{
    currentContext = &context;
}

TaskContext::Binding::~Binding()
{
    currentContext = _previous;
}
