#pragma once

#include <ident-core/allocation.hh>
#include <ident-core/fwd.hh>
#include <ident-core/span.hh>

/// Bump allocator over one fixed byte block, exposed as an ic::memory_resource.
///
/// Typical use is to back a set of short-lived containers and drop everything at once:
///
///   auto arena = ic::linear_arena::create(64 * 1024);
///   auto map = ic::flat_map<ic::snowflake_id, float>::create(64, arena.resource());
///   ...
///   map.dispose();
///   arena.reset();
///
/// - allocations bump an offset; there is no per-block header
/// - deallocation only gives memory back if it is the most recent block, other blocks come back on reset()
/// - the most recent block can grow and shrink in place
/// - only one level is tracked: after the most recent block was rolled back, the block below it
///   can neither be rolled back nor resized in place
/// - a flat_map allocates its key and value buffers alternately, so its growth always relocates
///   and the old buffers stay in the arena until reset(). Size the arena for the sum of all
///   capacities the map passes through, or reserve() up front.
/// - allocate_bytes fails fatally when the block is exhausted, try_allocate_bytes returns -1
///
/// The arena is its own resource userdata, so it is neither copyable nor movable.
/// Not thread-safe.
struct ic::linear_arena
{
    // construction
public:
    /// Takes a block of `capacity_bytes` from `upstream` (nullptr: default resource)
    [[nodiscard]] static linear_arena create(isize capacity_bytes, memory_resource const* upstream = nullptr);

    /// Allocates from caller-owned memory, which must outlive the arena
    explicit linear_arena(span<byte> buffer);

    linear_arena(linear_arena const&) = delete;
    linear_arena(linear_arena&&) = delete;
    linear_arena& operator=(linear_arena const&) = delete;
    linear_arena& operator=(linear_arena&&) = delete;

    ~linear_arena();

    // api
public:
    /// The resource to hand to containers, valid for the lifetime of the arena
    [[nodiscard]] memory_resource const* resource() const { return &_resource; }

    /// Discards all allocations at once
    /// Precondition: nothing allocated from this arena is still in use
    void reset();

    [[nodiscard]] isize used_bytes() const { return _head - _begin; }
    [[nodiscard]] isize capacity_bytes() const { return _end - _begin; }
    [[nodiscard]] isize remaining_bytes() const { return _end - _head; }

    /// Number of allocations handed out and not yet deallocated (since the last reset)
    [[nodiscard]] isize live_allocations() const { return _live_allocations; }

private:
    explicit linear_arena(allocation<byte> block);

    void init_resource();

    static isize try_allocate_bytes(byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata);
    static isize allocate_bytes(byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata);
    static void deallocate_bytes(byte* p, isize bytes, isize alignment, void* userdata);
    static isize try_resize_bytes_in_place(byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata);

    // owned block, empty when wrapping caller memory
    allocation<byte> _block;

    byte* _begin = nullptr;
    byte* _head = nullptr;
    byte* _end = nullptr;

    // start of the most recent block, nullptr if it can't be rolled back
    byte* _last_block = nullptr;

    isize _live_allocations = 0;

    memory_resource _resource;
};
