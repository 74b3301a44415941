#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

/// Maps the type a key is created from to the type it is stored as.
/// Character pointers and views are stored as std::string so they are compared by content.
template <typename T>
struct TaskKeyStorage
{
    using type = std::decay_t<T>;
};

template <>
struct TaskKeyStorage<const char*>
{
    using type = std::string;
};

template <>
struct TaskKeyStorage<char*>
{
    using type = std::string;
};

template <>
struct TaskKeyStorage<std::string_view>
{
    using type = std::string;
};

/// Type-erased identity of a keyed task.
/// Any value that is equality comparable and hashable by std::hash can be used.
/// Keys created from values of different types never compare equal.
class TaskKey final
{
public:
    template <typename T, typename = std::enable_if_t<!std::is_same<std::decay_t<T>, TaskKey>::value>>
    TaskKey(T&& value);

    bool operator==(const TaskKey& other) const;
    bool operator!=(const TaskKey& other) const;

    std::size_t hash() const noexcept;
    const std::type_info& type() const noexcept;

    /// @returns The stored value or nullptr when the key holds a value of another type.
    template <typename T>
    const T* get() const noexcept;

private:
    class Holder
    {
    public:
        virtual ~Holder() = default;
        virtual bool equals(const Holder& other) const = 0;
        virtual std::size_t hash() const noexcept = 0;
        virtual const std::type_info& type() const noexcept = 0;
    };

    template <typename Value>
    class HolderImpl final : public Holder
    {
    public:
        template <typename T>
        explicit HolderImpl(T&& value)
            : _value(std::forward<T>(value))
        {
        }

        bool equals(const Holder& other) const override
        {
            return type() == other.type() && _value == static_cast<const HolderImpl&>(other)._value;
        }

        std::size_t hash() const noexcept override
        {
            const std::size_t typeHash = std::type_index(typeid(Value)).hash_code();
            const std::size_t valueHash = std::hash<Value>{}(_value);
            return typeHash ^ (valueHash + 0x9e3779b9 + (typeHash << 6) + (typeHash >> 2));
        }

        const std::type_info& type() const noexcept override
        {
            return typeid(Value);
        }

        const Value& value() const noexcept
        {
            return _value;
        }

    private:
        Value _value;
    };

    // Keys are immutable, copies share the holder
    std::shared_ptr<const Holder> _holder;
};

template <typename T, typename>
TaskKey::TaskKey(T&& value)
    : _holder(std::make_shared<HolderImpl<typename TaskKeyStorage<std::decay_t<T>>::type>>(std::forward<T>(value)))
{
}

inline bool TaskKey::operator==(const TaskKey& other) const
{
    return _holder == other._holder || _holder->equals(*other._holder);
}

inline bool TaskKey::operator!=(const TaskKey& other) const
{
    return !(*this == other);
}

inline std::size_t TaskKey::hash() const noexcept
{
    return _holder->hash();
}

inline const std::type_info& TaskKey::type() const noexcept
{
    return _holder->type();
}

template <typename T>
const T* TaskKey::get() const noexcept
{
    if (type() != typeid(T))
        return nullptr;

    return &static_cast<const HolderImpl<T>&>(*_holder).value();
}

namespace std
{
    template <>
    struct hash<TaskKey>
    {
        std::size_t operator()(const TaskKey& key) const noexcept
        {
            return key.hash();
        }
    };
}
