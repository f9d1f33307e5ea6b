#pragma once

#include <ident-core/fwd.hh>

#include <compare>
#include <cstddef>
#include <functional>

/// Time-based identifier, the typical key of an ic::flat_map.
///
/// `ticks` counts 100 ns intervals since the Unix epoch, `shift` disambiguates
/// ids created within the same tick. A zero `ticks` marks an id that was never created
/// (the default-constructed state).
///
/// Ordering: created ids sort before non-created ones, created ids order by (ticks, shift),
/// non-created ids order by shift. This keeps operator<=> a strong order that agrees with ==.
struct ic::snowflake_id
{
    i64 ticks = 0;
    i64 shift = 0;

    /// An id with the current time and a fresh shift value
    /// Two ids created by this function never compare equal.
    [[nodiscard]] static snowflake_id create_new();

    [[nodiscard]] constexpr bool is_created() const { return ticks != 0; }

    [[nodiscard]] friend constexpr bool operator==(snowflake_id const&, snowflake_id const&) = default;

    [[nodiscard]] friend constexpr std::strong_ordering operator<=>(snowflake_id const& lhs, snowflake_id const& rhs)
    {
        if (lhs.is_created() != rhs.is_created())
            return lhs.is_created() ? std::strong_ordering::less : std::strong_ordering::greater;

        if (lhs.ticks != rhs.ticks)
            return lhs.ticks <=> rhs.ticks;

        return lhs.shift <=> rhs.shift;
    }
};

template <>
struct std::hash<ic::snowflake_id>
{
    [[nodiscard]] std::size_t operator()(ic::snowflake_id const& id) const noexcept
    {
        auto const h = std::hash<ic::i64>{}(id.ticks);
        // boost::hash_combine mixing
        return h ^ (std::hash<ic::i64>{}(id.shift) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
    }
};
