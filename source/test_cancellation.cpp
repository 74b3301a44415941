#include <gtest/gtest.h>
#include "canceled_exception.h"
#include "cancellation_source.h"

#include <vector>

TEST(cancelationSource, cancelationSignalization)
{
    const std::size_t tokensCount{5};
    CancellationSource cancelSource;

    std::vector<CancellationToken> tokens;
    for (std::size_t idx = 0; idx < tokensCount; ++idx)
    {
        tokens.push_back(cancelSource.get_token());
    }

    for (auto& token : tokens)
    {
        ASSERT_FALSE(token.is_canceled());
    }

    cancelSource.cancel();

    ASSERT_TRUE(cancelSource.is_canceled());
    for (auto& token : tokens)
    {
        ASSERT_TRUE(token.is_canceled());
    }
}

TEST(cancelationSource, repeatedCancelHasNoFurtherEffect)
{
    CancellationSource cancelSource;
    const auto token = cancelSource.get_token();

    cancelSource.cancel();
    ASSERT_NO_THROW(cancelSource.cancel());

    ASSERT_TRUE(cancelSource.is_canceled());
    ASSERT_TRUE(token.is_canceled());
}

TEST(cancelationSource, tokenOutlivesSource)
{
    CancellationToken token;
    {
        CancellationSource cancelSource;
        token = cancelSource.get_token();
        cancelSource.cancel();
    }

    ASSERT_TRUE(token.is_canceled());
}

TEST(cancelationToken, defaultTokenIsNeverCanceled)
{
    const CancellationToken token;

    ASSERT_FALSE(token.is_canceled());
    ASSERT_NO_THROW(token.throw_if_canceled());
}

TEST(cancelationToken, throwIfCanceled)
{
    CancellationSource cancelSource;
    const auto token = cancelSource.get_token();

    ASSERT_NO_THROW(token.throw_if_canceled());
    cancelSource.cancel();
    ASSERT_THROW(token.throw_if_canceled(), CanceledException);
}
