#include <ident-core/utility.hh>

#include <nexus/test.hh>

#include "test-asserts.hh"

#include <memory>
#include <string>

namespace
{
struct Box
{
    int v;
    bool operator<(Box const& rhs) const { return v < rhs.v; }
};

int add(int a, int b) { return a + b; }
} // namespace

TEST("utility - move and exchange")
{
    auto p = std::make_unique<int>(3);
    auto q = ic::move(p);
    CHECK(p == nullptr); // NOLINT(bugprone-use-after-move)
    CHECK(*q == 3);

    bool disposed = false;
    CHECK(!ic::exchange(disposed, true));
    CHECK(disposed);
    CHECK(ic::exchange(disposed, true));

    std::string s = "old";
    auto const old = ic::exchange(s, "new");
    CHECK(old == "old");
    CHECK(s == "new");
}

TEST("utility - max")
{
    CHECK(ic::max(2, 7) == 7);
    CHECK(ic::max(-1, -5) == -1);

    // equal values return the second argument
    Box const a{4};
    Box const b{4};
    CHECK(&ic::max(a, b) == &b);

    // growth policy used by flat_map
    ic::isize const capacity = 0;
    CHECK(ic::max(capacity * 2, capacity + 1) == 1);
}

TEST("utility - memcpy and memmove")
{
    int src[] = {1, 2, 3, 4};
    int dst[4] = {};

    ic::memcpy(dst, src, sizeof(src));
    CHECK(dst[3] == 4);

    // overlapping shift right by one, the way an insertion opens a gap
    ic::memmove(src + 1, src, 3 * sizeof(int));
    CHECK(src[0] == 1);
    CHECK(src[1] == 1);
    CHECK(src[2] == 2);
    CHECK(src[3] == 3);

    // zero bytes with null pointers is fine
    ic::memcpy(nullptr, nullptr, 0);
    ic::memmove(nullptr, nullptr, 0);

#if IC_ASSERT_ENABLED
    CHECK_ASSERTS(ic::memcpy(dst, src, -1));
#endif
}

TEST("utility - alignment")
{
    CHECK(ic::is_power_of_two(1));
    CHECK(ic::is_power_of_two(64));
    CHECK(!ic::is_power_of_two(12));

    CHECK(ic::align_up(0, 16) == 0);
    CHECK(ic::align_up(1, 16) == 16);
    CHECK(ic::align_up(300, 16) == 304);
    CHECK(ic::align_up(42, 1) == 42);
    CHECK(ic::align_up_masked(17, 15) == 32);

    CHECK(ic::is_aligned(32, 16));
    CHECK(!ic::is_aligned(33, 16));

    alignas(64) ic::byte buffer[128];
    auto* const p = ic::align_up(buffer + 1, 64);
    CHECK(p == buffer + 64);
    CHECK(ic::is_aligned(p, 64));

#if IC_ASSERT_ENABLED
    CHECK_ASSERTS(ic::is_power_of_two(0));
    CHECK_ASSERTS(ic::align_up(5, 3));
    CHECK_ASSERTS(ic::is_aligned(5, 0));
#endif
}

TEST("utility - function_ptr")
{
    static_assert(std::is_same_v<ic::function_ptr<int(int, int)>, int (*)(int, int)>);
    static_assert(std::is_same_v<ic::function_ptr<void() noexcept>, void (*)() noexcept>);

    ic::function_ptr<int(int, int)> f = &add;
    CHECK(f(2, 3) == 5);
}

TEST("utility - placement new")
{
    alignas(std::string) ic::byte storage[sizeof(std::string)];
    auto* s = new (ic::placement_new, storage) std::string("placed");
    CHECK(*s == "placed");
    s->~basic_string();
}
