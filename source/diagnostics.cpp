#include "diagnostics.h"

#include <iostream>

void reportProtocolViolation(const std::string& message)
{
    std::cerr << "[task_scope] PROTOCOL VIOLATION: " << message << std::endl;
}

void reportTaskFailure(const std::string& taskName, const std::string& what)
{
    std::cerr << "[task_scope] Task '" << (taskName.empty() ? "<unnamed>" : taskName) << "' failed: " << what
              << std::endl;
}
