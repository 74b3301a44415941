#include "InlineExecutor.h"

#include <cassert>

void InlineExecutor::scheduleInner(MethodType&& method, TaskPriority /*priority*/)
{
    assert(method);
    (*method)();
}
