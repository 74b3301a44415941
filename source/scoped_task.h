#pragma once

#include <cstdint>
#include <string>
#include "cancellation_source.h"

/// Handle of a task dispatched by a CancellationScope.
/// Copies refer to the same task.
class ScopedTask final
{
public:
    ScopedTask(std::uint64_t id, std::string name);

    /// Requests cooperative cancellation of the task.
    /// \note Idempotent, the task is not waited for.
    void cancel() noexcept;
    bool is_canceled() const noexcept;
    CancellationToken get_token() const;

    std::uint64_t id() const noexcept;
    const std::string& name() const noexcept;

private:
    std::uint64_t _id;
    std::string _name;
    CancellationSource _cancellation;
};
