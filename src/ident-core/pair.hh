#pragma once

#include <ident-core/fwd.hh>

#include <compare>

/// One (key, value) entry as flat_map hands it out: by value, from iteration and copy_to.
///
///   for (auto [id, weight] : map) ...
///   ic::pair<ic::snowflake_id, float> entries[16];
///   map.copy_to(entries, 0);
///
/// A plain aggregate, so structured bindings, designated initializers and the
/// defaulted comparisons need no extra machinery.
/// Comparison is lexicographic (first, then second), matching the map's iteration order.
template <class T, class U>
struct ic::pair
{
    T first;
    U second;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
    [[nodiscard]] friend constexpr auto operator<=>(pair const&, pair const&) = default;
};
