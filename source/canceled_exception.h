#pragma once

#include <exception>

class CanceledException final : public std::exception
{
public:
    const char* what() const noexcept override
    {
        return "The task was canceled.";
    }
};
