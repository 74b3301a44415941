#pragma once

#include <atomic>
#include <memory>

class CancellationSource;

class CancellationToken final
{
    friend CancellationSource;

public:
    /// Creates a token that is never canceled.
    CancellationToken() = default;

    bool is_canceled() const noexcept;
    /// \throws CanceledException when cancellation was requested.
    void throw_if_canceled() const;

private:
    explicit CancellationToken(std::shared_ptr<const std::atomic_bool> canceled);

    std::shared_ptr<const std::atomic_bool> _canceled;
};
