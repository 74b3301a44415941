#pragma once

#include <string>

/// Reports a misuse of a CancellationScope by its owner, e.g. unpaired activate() and deactivate() calls.
void reportProtocolViolation(const std::string& message);

/// Reports an exception escaping the work of a scope task.
void reportTaskFailure(const std::string& taskName, const std::string& what);
