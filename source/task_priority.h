#pragma once

#include <cstdint>

/// Scheduling hint, higher values run first on executors that honour it.
enum class TaskPriority : std::uint8_t
{
    background = 0,
    low = 1,
    medium = 2,
    high = 3,
};
