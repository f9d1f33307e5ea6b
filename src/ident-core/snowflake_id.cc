#include "snowflake_id.hh"

#include <atomic>
#include <chrono>

namespace
{
// process-wide, shared by all threads
std::atomic<ic::i64> g_shift_counter = 0;

using tick_duration = std::chrono::duration<ic::i64, std::ratio<1, 10'000'000>>;
} // namespace

ic::snowflake_id ic::snowflake_id::create_new()
{
    auto const now = std::chrono::system_clock::now().time_since_epoch();

    snowflake_id id;
    id.ticks = std::chrono::duration_cast<tick_duration>(now).count();
    id.shift = g_shift_counter.fetch_add(1, std::memory_order_relaxed);
    return id;
}
