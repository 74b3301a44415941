#include "scoped_task.h"

ScopedTask::ScopedTask(std::uint64_t id, std::string name)
    : _id{id}
    , _name(std::move(name))
{
}

void ScopedTask::cancel() noexcept
{
    _cancellation.cancel();
}

bool ScopedTask::is_canceled() const noexcept
{
    return _cancellation.is_canceled();
}

CancellationToken ScopedTask::get_token() const
{
    return _cancellation.get_token();
}

std::uint64_t ScopedTask::id() const noexcept
{
    return _id;
}

const std::string& ScopedTask::name() const noexcept
{
    return _name;
}
