#pragma once

#include <ident-core/assert.hh>
#include <ident-core/fwd.hh>

#include <concepts>
#include <type_traits>

/// Tag for an empty ic::optional: `return ic::nullopt;`
/// Not default constructible so that `opt = {}` stays unambiguous.
struct ic::nullopt_t
{
    struct tag_t
    {
    };
    explicit constexpr nullopt_t(tag_t) {}
};

namespace ic
{
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::tag_t{}};
}

/// Result of a lookup that may miss, e.g. flat_map::try_get.
///
///   if (auto v = map.try_get(id); v.has_value())
///       use(v.value());
///   auto w = map.try_get(id).value_or(0.f);
///
/// Only holds trivially copyable T (the same restriction as flat_map values),
/// which keeps optional<T> itself trivially copyable.
/// No operator* / operator->: access goes through value(), which asserts on empty.
template <class T>
struct ic::optional
{
    static_assert(std::is_trivially_copyable_v<T> && std::is_trivially_destructible_v<T>,
                  "ic::optional only holds trivially copyable types");

    constexpr optional() = default;
    constexpr optional(nullopt_t) {}

    // implicit so that `return value;` works in functions returning optional<T>
    constexpr optional(T const& value) : _value(value), _has_value(true) {} // NOLINT

    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Precondition: has_value()
    [[nodiscard]] constexpr T& value()
    {
        IC_ASSERT(_has_value, "optional::value() called on an empty optional");
        return _value;
    }
    [[nodiscard]] constexpr T const& value() const
    {
        IC_ASSERT(_has_value, "optional::value() called on an empty optional");
        return _value;
    }

    [[nodiscard]] constexpr T value_or(T const& fallback) const { return _has_value ? _value : fallback; }

    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires std::equality_comparable<T>
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return !lhs._has_value || lhs._value == rhs._value;
    }

    /// False if lhs is empty
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
        requires std::equality_comparable<T>
    {
        return lhs._has_value && lhs._value == rhs;
    }

    // `opt == true` would silently compare against the held value
    bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    // the empty member keeps the inactive state initialized without requiring T to be default constructible
    union
    {
        char _empty = 0;
        T _value;
    };
    bool _has_value = false;
};
