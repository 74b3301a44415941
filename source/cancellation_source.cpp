#include "cancellation_source.h"

CancellationSource::CancellationSource()
    : _canceled{std::make_shared<std::atomic_bool>(false)}
{
}

void CancellationSource::cancel() noexcept
{
    _canceled->store(true);
}

bool CancellationSource::is_canceled() const noexcept
{
    return _canceled->load();
}

CancellationToken CancellationSource::get_token() const
{
    return CancellationToken(_canceled);
}
