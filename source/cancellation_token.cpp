#include "cancellation_token.h"

#include "canceled_exception.h"

bool CancellationToken::is_canceled() const noexcept
{
    return _canceled && _canceled->load();
}

void CancellationToken::throw_if_canceled() const
{
    if (is_canceled())
        throw CanceledException();
}

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic_bool> canceled)
    : _canceled(std::move(canceled))
{
}
