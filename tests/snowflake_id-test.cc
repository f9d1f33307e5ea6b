#include <ident-core/snowflake_id.hh>

#include <nexus/test.hh>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

TEST("snowflake_id - default is not created")
{
    ic::snowflake_id id;
    CHECK(!id.is_created());
    CHECK(id.ticks == 0);
    CHECK(id.shift == 0);
    CHECK(id == ic::snowflake_id{});

    static_assert(!ic::snowflake_id{}.is_created());
    static_assert(ic::snowflake_id{1, 0}.is_created());
}

TEST("snowflake_id - create_new")
{
    auto const before = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    auto const id = ic::snowflake_id::create_new();

    CHECK(id.is_created());

    // 100 ns ticks since the unix epoch
    auto const seconds = id.ticks / 10'000'000;
    CHECK(seconds >= before);
    CHECK(seconds <= before + 5);

    SECTION("never equal")
    {
        auto const a = ic::snowflake_id::create_new();
        auto const b = ic::snowflake_id::create_new();
        CHECK(a != b);
        CHECK(a.shift != b.shift);
    }

    SECTION("non-decreasing in creation order")
    {
        auto prev = ic::snowflake_id::create_new();
        for (auto i = 0; i < 1000; ++i)
        {
            auto next = ic::snowflake_id::create_new();
            CHECK(prev.ticks <= next.ticks);
            prev = next;
        }
    }
}

TEST("snowflake_id - ordering")
{
    ic::snowflake_id const a{100, 5};
    ic::snowflake_id const b{100, 6};
    ic::snowflake_id const c{200, 0};
    ic::snowflake_id const none{};
    ic::snowflake_id const none_shifted{0, 3};

    CHECK(a < b);
    CHECK(b < c);
    CHECK(a < c);
    CHECK(!(b < a));
    CHECK((a <=> a) == std::strong_ordering::equal);

    // created ids sort first
    CHECK(c < none);
    CHECK(a < none_shifted);

    // non-created ids order by shift, consistent with ==
    CHECK(none < none_shifted);
    CHECK(none != none_shifted);

    std::vector<ic::snowflake_id> ids = {none_shifted, c, none, b, a};
    std::sort(ids.begin(), ids.end());
    CHECK((ids == std::vector<ic::snowflake_id>{a, b, c, none, none_shifted}));
}

TEST("snowflake_id - hash")
{
    std::hash<ic::snowflake_id> const h;
    CHECK(h({100, 5}) == h({100, 5}));

    std::unordered_set<ic::snowflake_id> set;
    for (auto i = 0; i < 500; ++i)
        set.insert(ic::snowflake_id::create_new());
    CHECK(set.size() == 500);
}

TEST("snowflake_id - unique across threads")
{
    std::vector<ic::snowflake_id> all;
    std::mutex m;

    std::vector<std::thread> threads;
    for (auto t = 0; t < 4; ++t)
        threads.emplace_back(
            [&]
            {
                std::vector<ic::snowflake_id> local;
                for (auto i = 0; i < 1000; ++i)
                    local.push_back(ic::snowflake_id::create_new());

                std::lock_guard lock(m);
                all.insert(all.end(), local.begin(), local.end());
            });

    for (auto& t : threads)
        t.join();

    std::sort(all.begin(), all.end());
    CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
    CHECK(all.size() == 4000);
}
