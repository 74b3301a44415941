#pragma once

#include <cassert>
#include <memory>
#include <tuple>
#include <type_traits>

/// One-shot, type-erased call with its arguments stored by value.
class BoundCall
{
public:
    virtual ~BoundCall() = default;
    virtual void operator()() = 0;
};

template <typename Function, typename... Args>
class BoundCallImpl final : public BoundCall
{
public:
    template <typename F, typename... A>
    explicit BoundCallImpl(F&& function, A&&... args);

    void operator()() override;

private:
    bool _invoked;
    Function _function;
    std::tuple<Args...> _args;
};

/// Binds @p function to @p args.
/// Move-only arguments are supported, the call consumes them.
template <typename Function, typename... Args>
std::unique_ptr<BoundCall> bind_call(Function&& function, Args&&... args);

template <typename Function, typename... Args>
template <typename F, typename... A>
BoundCallImpl<Function, Args...>::BoundCallImpl(F&& function, A&&... args)
    : _invoked{false}
    , _function(std::forward<F>(function))
    , _args(std::forward<A>(args)...)
{
}

template <typename Function, typename... Args>
void BoundCallImpl<Function, Args...>::operator()()
{
    assert(!_invoked);
    _invoked = true;
    std::apply(_function, std::move(_args));
}

template <typename Function, typename... Args>
std::unique_ptr<BoundCall> bind_call(Function&& function, Args&&... args)
{
    using Impl = BoundCallImpl<std::decay_t<Function>, std::decay_t<Args>...>;
    return std::make_unique<Impl>(std::forward<Function>(function), std::forward<Args>(args)...);
}
