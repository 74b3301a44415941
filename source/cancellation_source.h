#pragma once

#include <atomic>
#include <memory>
#include "cancellation_token.h"

/// Owner of a cancellation flag.
/// \note Tokens keep the flag alive, so they may outlive the source.
class CancellationSource final
{
public:
    CancellationSource();

    /// Requests cancellation. Successive calls have no effect.
    void cancel() noexcept;
    bool is_canceled() const noexcept;
    CancellationToken get_token() const;

private:
    std::shared_ptr<std::atomic_bool> _canceled;
};
