#include <ident-core/optional.hh>
#include <ident-core/snowflake_id.hh>

#include <nexus/test.hh>

#include "test-asserts.hh"

// optional of a trivial type stays trivial, which is what flat_map::try_get hands out
static_assert(std::is_constructible_v<ic::optional<int>, int>);
static_assert(std::is_constructible_v<ic::optional<int>, ic::nullopt_t>);
static_assert(std::is_trivially_copyable_v<ic::optional<int>>);
static_assert(std::is_trivially_copyable_v<ic::optional<ic::snowflake_id>>);
static_assert(std::is_trivially_destructible_v<ic::optional<float>>);

namespace
{
// no default constructor, like many key types
struct grid_cell
{
    int x;
    int y;
    grid_cell(int x, int y) : x(x), y(y) {}
    friend bool operator==(grid_cell const&, grid_cell const&) = default;
};

ic::optional<float> weight_of(int id)
{
    if (id < 0)
        return ic::nullopt;
    return float(id) * 0.5f;
}
} // namespace

TEST("optional - trivial types")
{
    ic::optional<int> empty;
    CHECK(!empty.has_value());
    CHECK(empty.value_or(-1) == -1);

    ic::optional<int> five = 5;
    CHECK(five.has_value());
    CHECK(five.value() == 5);
    CHECK(five.value_or(-1) == 5);

    five.value() = 6;
    CHECK(five.value() == 6);

    ic::optional<int> none = ic::nullopt;
    CHECK(!none.has_value());

    auto copy = five;
    CHECK(copy.value() == 6);

    copy = ic::nullopt;
    CHECK(!copy.has_value());
    CHECK(five.has_value());
}

TEST("optional - as a return value")
{
    CHECK(!weight_of(-1).has_value());
    CHECK(weight_of(4).value() == 2.f);
    CHECK(weight_of(-3).value_or(1.f) == 1.f);
}

TEST("optional - without default constructor")
{
    ic::optional<grid_cell> empty;
    CHECK(!empty.has_value());

    ic::optional<grid_cell> cell = grid_cell(2, 3);
    REQUIRE(cell.has_value());
    CHECK(cell.value().y == 3);
    CHECK(cell == grid_cell(2, 3));
    CHECK(empty.value_or(grid_cell(0, 0)) == grid_cell(0, 0));
}

TEST("optional - snowflake ids")
{
    auto const id = ic::snowflake_id::create_new();

    ic::optional<ic::snowflake_id> found = id;
    ic::optional<ic::snowflake_id> missing;

    CHECK(found == id);
    CHECK(missing != id);
    CHECK(!missing.value_or(ic::snowflake_id{}).is_created());
}

TEST("optional - equality")
{
    ic::optional<int> const a = 1;
    ic::optional<int> const b = 1;
    ic::optional<int> const c = 2;
    ic::optional<int> const none;

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != none);
    CHECK(none == ic::optional<int>());

    CHECK(a == 1);
    CHECK(a != 2);
    CHECK(none != 0);
}

TEST("optional - value on empty asserts")
{
#if IC_ASSERT_ENABLED
    ic::optional<int> empty;
    CHECK_ASSERTS(empty.value());

    ic::optional<int> full = 3;
    CHECK_NOT_ASSERTS(full.value());
#endif
}
