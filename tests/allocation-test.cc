#include <ident-core/allocation.hh>
#include <ident-core/arena.hh>
#include <ident-core/span.hh>
#include <ident-core/utility.hh>

#include <nexus/test.hh>

#include <vector>

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    static void reset_counters()
    {
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
        destruction_order = nullptr;
    }

    Tracked() = default;
    explicit Tracked(int v) : value(v) {}

    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    Tracked(Tracked&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    Tracked& operator=(Tracked const& rhs) = default;
    Tracked& operator=(Tracked&& rhs) noexcept = default;

    ~Tracked()
    {
        ++dtor_count;
        if (destruction_order)
            destruction_order->push_back(value);
    }
};
} // namespace

TEST("allocation - default construction")
{
    ic::allocation<int> alloc;

    CHECK(alloc.obj_start == nullptr);
    CHECK(alloc.obj_end == nullptr);
    CHECK(alloc.alloc_start == nullptr);
    CHECK(alloc.alloc_end == nullptr);
    CHECK(alloc.alignment == 0);
    CHECK(alloc.custom_resource == nullptr);
    CHECK(!alloc.is_valid());
    CHECK(alloc.obj_span().size() == 0);
    CHECK(alloc.obj_size() == 0);
    CHECK(alloc.obj_capacity() == 0);
    CHECK(alloc.alloc_size_bytes() == 0);
    CHECK(&alloc.resource() == ic::default_memory_resource);
}

TEST("allocation - create_empty")
{
    auto alloc = ic::allocation<int>::create_empty(10, alignof(int), nullptr);

    CHECK(alloc.is_valid());
    CHECK(alloc.alloc_size_bytes() == 10 * ic::isize(sizeof(int)));
    CHECK(alloc.obj_start == (int*)alloc.alloc_start);
    CHECK(alloc.obj_end == alloc.obj_start);
    CHECK(alloc.obj_capacity() == 10);
    CHECK(alloc.alignment == alignof(int));

    SECTION("zero size allocates nothing but keeps the resource")
    {
        auto arena = ic::linear_arena::create(256);
        auto empty = ic::allocation<int>::create_empty(0, alignof(int), arena.resource());

        CHECK(!empty.is_valid());
        CHECK(empty.obj_capacity() == 0);
        CHECK(empty.custom_resource == arena.resource());
        CHECK(arena.live_allocations() == 0);
    }

    SECTION("over-alignment")
    {
        auto aligned = ic::allocation<int>::create_empty(10, 64, nullptr);
        CHECK(aligned.alignment == 64);
        CHECK(ic::is_aligned(aligned.alloc_start, 64));
    }
}

TEST("allocation - create_copy_of")
{
    Tracked::reset_counters();

    {
        Tracked source[3] = {Tracked(10), Tracked(20), Tracked(30)};
        Tracked::reset_counters();

        auto alloc = ic::allocation<Tracked>::create_copy_of(ic::span<Tracked const>(source, 3), 5, nullptr);

        CHECK(alloc.obj_size() == 3);
        CHECK(alloc.obj_capacity() == 5);
        CHECK(Tracked::copy_ctor_count == 3);
        CHECK(alloc.obj_start[0].value == 10);
        CHECK(alloc.obj_start[2].value == 30);
    }

    // copies and sources
    CHECK(Tracked::dtor_count == 3 + 3);
}

TEST("allocation - move construction and assignment")
{
    auto src = ic::allocation<int>::create_empty(4, alignof(int), nullptr);
    src.obj_end += 2;
    auto const* original_start = src.alloc_start;

    auto dst = ic::move(src);
    CHECK(dst.alloc_start == original_start);
    CHECK(dst.obj_size() == 2);
    CHECK(!src.is_valid()); // NOLINT(bugprone-use-after-move)

    auto other = ic::allocation<int>::create_empty(8, alignof(int), nullptr);
    other = ic::move(dst);
    CHECK(other.alloc_start == original_start);
    CHECK(!dst.is_valid()); // NOLINT(bugprone-use-after-move)
}

TEST("allocation - destruction order")
{
    std::vector<int> order;
    Tracked::reset_counters();

    {
        Tracked source[3] = {Tracked(0), Tracked(1), Tracked(2)};
        auto alloc = ic::allocation<Tracked>::create_copy_of(ic::span<Tracked const>(source, 3), 3, nullptr);
        Tracked::destruction_order = &order;
        // alloc is destroyed before source (reverse declaration order)
    }

    REQUIRE(order.size() == 6);
    CHECK(order[0] == 2);
    CHECK(order[1] == 1);
    CHECK(order[2] == 0);

    Tracked::destruction_order = nullptr;
}

TEST("allocation - resize_alloc")
{
    SECTION("system resource always relocates")
    {
        auto alloc = ic::allocation<int>::create_empty(2, alignof(int), nullptr);
        alloc.obj_start[0] = 7;
        alloc.obj_start[1] = 8;
        alloc.obj_end += 2;

        CHECK(!alloc.try_resize_alloc_inplace(16, 16));

        alloc.resize_alloc(16, 16, alignof(int));
        CHECK(alloc.obj_capacity() == 4);
        CHECK(alloc.obj_size() == 2);
        CHECK(alloc.obj_start[0] == 7);
        CHECK(alloc.obj_start[1] == 8);
    }

    SECTION("non-trivial objects are moved over")
    {
        Tracked::reset_counters();
        {
            Tracked source[2] = {Tracked(1), Tracked(2)};
            auto alloc = ic::allocation<Tracked>::create_copy_of(ic::span<Tracked const>(source, 2), 2, nullptr);
            Tracked::reset_counters();

            alloc.resize_alloc(8 * sizeof(Tracked), 8 * sizeof(Tracked), alignof(Tracked));

            CHECK(Tracked::move_ctor_count == 2);
            CHECK(Tracked::dtor_count == 2); // moved-from originals
            CHECK(alloc.obj_start[1].value == 2);
        }
    }

    SECTION("arena grows the most recent block in place")
    {
        auto arena = ic::linear_arena::create(1024);
        {
            auto alloc = ic::allocation<int>::create_empty(4, alignof(int), arena.resource());
            auto* const start = alloc.alloc_start;

            alloc.resize_alloc(32 * sizeof(int), 32 * sizeof(int), alignof(int));
            CHECK(alloc.alloc_start == start);
            CHECK(alloc.obj_capacity() == 32);
            CHECK(arena.live_allocations() == 1);
        }
        CHECK(arena.live_allocations() == 0);
        CHECK(arena.used_bytes() == 0);
    }

    SECTION("from empty")
    {
        ic::allocation<int> alloc;
        alloc.resize_alloc(8 * sizeof(int), 8 * sizeof(int), alignof(int));
        CHECK(alloc.is_valid());
        CHECK(alloc.obj_capacity() == 8);
    }
}
