#pragma once

#include "IExecutor.h"

/// Executes scheduled methods synchronously on the thread calling IExecutor::schedule().
/// \note Exceptions thrown by the method propagate to the caller of IExecutor::schedule().
class InlineExecutor final : public IExecutor
{
private:
    void scheduleInner(MethodType&& method, TaskPriority priority) override;
};
