#pragma once

#include <ident-core/fwd.hh>
#include <ident-core/impl/object_lifetime_util.hh>
#include <ident-core/span.hh>
#include <ident-core/utility.hh>

// ic::allocation<T> is the owning "storage + liveness" handle underneath ic::flat_map.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from an ic::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// A flat_map owns two of these, one per parallel buffer (keys and values). The map decides the policy
// (where the live window ends, when to grow); allocation ownership, resizing and alignment live here.
//
// Memory is obtained from a polymorphic ic::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*, not as a template argument. A null resource
// means "use ic::default_memory_resource". This avoids allocator-typed container variants.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - obj_start and obj_end are always aligned to alignof(T), even when empty.
// - custom_resource == nullptr implies use of ic::default_memory_resource.

namespace ic
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// This is a system allocator stored in the data segment, making the pointer valid even during
/// static initialization in other translation units.
extern ic::memory_resource const* const default_memory_resource;
} // namespace ic

/// Polymorphic memory resource interface powering ic::allocation<T>.
/// Custom allocators (e.g. ic::linear_arena) implement this interface to provide pluggable allocation strategies.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct ic::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal.
    ic::function_ptr<isize(ic::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Attempt to allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size on success, or -1 on failure (with *out_ptr set to nullptr).
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    ic::function_ptr<isize(ic::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> try_allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource.
    /// `p` must be the exact pointer returned by allocate_bytes or try_allocate_bytes.
    /// `bytes` and `alignment` must match the canonical size (last successful allocate/resize) and alignment.
    /// Must not throw on exhaustion; only programmer bugs may terminate.
    ic::function_ptr<void(ic::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing allocation in place without moving or freeing it.
    ///
    /// Preconditions:
    /// `p` was allocated from this resource with `old_bytes` and `alignment`.
    /// `1 <= min_bytes <= max_bytes`.
    ///
    /// Success (returns new_bytes in [min_bytes, max_bytes]):
    /// The allocation remains at address `p`, the first min(old_bytes, new_bytes) bytes are preserved,
    /// and the returned size becomes the canonical size for future resize/deallocate calls.
    ///
    /// Failure (returns -1):
    /// The allocation remains valid and unchanged at `p` with size `old_bytes`.
    ///
    /// May be nullptr for resources that never resize in place.
    ic::function_ptr<isize(ic::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed "live window" inside it.
///
/// Capacity is implicit: the number of T that fit between obj_start and alloc_end.
/// Containers grow by resize_alloc, which first asks the resource to extend in place
/// and otherwise moves the live window into a fresh block.
///
/// Invariants:
/// - [obj_start, obj_end) is the live object range; obj_end is exclusive.
/// - [alloc_start, alloc_end) is the owned byte allocation; alloc_end is exclusive.
/// - alloc_start <= obj_start <= obj_end <= alloc_end (even for empty ranges or empty allocations).
/// - obj_start and obj_end must be aligned to alignof(T) (even when the range is empty).
/// - custom_resource == nullptr means the global default memory resource is used.
template <class T>
struct ic::allocation
{
    /// Pointer to the first live object.
    /// INVARIANT: Must always be aligned to alignof(T), even if the range is empty.
    T* obj_start = nullptr;

    /// Pointer one past the last live object (exclusive end).
    /// INVARIANT: Must always be aligned to alignof(T), even if the range is empty.
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    ic::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    ic::byte* alloc_end = nullptr;

    /// Alignment that was used when allocating [alloc_start, alloc_end) from the resource.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    /// The all-zero state is a valid empty allocation.
    /// An empty allocation seeded with a non-null resource makes all later growth use that resource.
    ic::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    /// Resolves custom_resource if non-null, otherwise falls back to default_memory_resource.
    [[nodiscard]] ic::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this is a valid non-defaulted allocation
    /// Implies byte size > 0, i.e. alloc_start < alloc_end
    /// But obj_span might still be empty
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    /// Note: proper mutability ("const correctness") is user responsibility
    [[nodiscard]] ic::span<T> obj_span() const { return ic::span<T>(obj_start, obj_end); }

    /// Number of live objects
    [[nodiscard]] isize obj_size() const { return obj_end - obj_start; }

    /// Number of objects that fit between obj_start and the end of the allocation
    [[nodiscard]] isize obj_capacity() const
    {
        if (alloc_start == nullptr)
            return 0;
        return (alloc_end - (ic::byte const*)obj_start) / isize(sizeof(T));
    }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Attempt to resize the allocation in place to a size between min_bytes and max_bytes.
    /// Returns true if the resize succeeded, false otherwise (including resources without in-place resize).
    /// On success, alloc_end is updated to reflect the new allocation size.
    /// On failure, the allocation remains unchanged.
    /// IMPORTANT: Cannot resize below the size needed by live objects (obj_end).
    [[nodiscard]] bool try_resize_alloc_inplace(isize min_bytes, isize max_bytes)
    {
        IC_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "try_resize_alloc_inplace: invalid size range");

        isize const obj_end_bytes = (byte const*)obj_end - alloc_start;
        IC_ASSERT(min_bytes >= obj_end_bytes, "try_resize_alloc_inplace: cannot resize below live object range");

        if (alloc_start == nullptr || min_bytes == 0)
            return false;

        auto const& res = resource();
        if (res.try_resize_bytes_in_place == nullptr)
            return false;

        auto const old_bytes = alloc_end - alloc_start;
        isize const new_bytes
            = res.try_resize_bytes_in_place(alloc_start, old_bytes, min_bytes, max_bytes, alignment, res.userdata);

        if (new_bytes == -1)
            return false;

        alloc_end = alloc_start + new_bytes;
        return true;
    }

    /// Resize the allocation to a size between min_bytes and max_bytes with a new alignment.
    /// Always tries to resize in-place first. If that fails, allocates a new buffer,
    /// moves the live objects over, and replaces the current allocation.
    /// IMPORTANT: Cannot resize below the size needed by live objects (obj_end).
    void resize_alloc(isize min_bytes, isize max_bytes, isize new_alignment)
    {
        IC_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "resize_alloc: invalid size range");
        IC_ASSERT(new_alignment >= isize(alignof(T)), "new_alignment must be at least alignof(T)");

        isize const obj_end_bytes = (byte const*)obj_end - alloc_start;
        IC_ASSERT(min_bytes >= obj_end_bytes, "resize_alloc: cannot resize below live object range");

        if (alloc_start != nullptr && ic::is_aligned(alloc_start, new_alignment) && try_resize_alloc_inplace(min_bytes, max_bytes))
        {
            alignment = new_alignment;
            return;
        }

        auto new_alloc = allocation::create_empty_bytes(min_bytes, max_bytes, new_alignment, custom_resource);

        impl::move_create_objects_to(new_alloc.obj_end, obj_start, obj_end);

        // destroys the moved-from objects and returns the old block
        *this = ic::move(new_alloc);
    }

    // factories
public:
    /// Creates an empty allocation with reserved capacity but no live objects.
    ///
    /// Allocates between min_bytes and max_bytes with the specified alignment, but does not construct any objects.
    /// The result has obj_start == obj_end == alloc_start (zero live objects, full capacity available).
    /// min_bytes == 0 results in nullptr with no real allocation call, but the resource is still recorded.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes,
                                                       isize max_bytes, // NOLINT
                                                       isize alignment, // NOLINT
                                                       memory_resource const* resource)
    {
        IC_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        IC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        if (min_bytes > 0)
        {
            auto const& res = resource ? *resource : *default_memory_resource;
            auto const actual_byte_size
                = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, result.alignment, res.userdata);
            result.alloc_end = result.alloc_start + actual_byte_size;
        }

        result.obj_start = (T*)result.alloc_start;
        result.obj_end = result.obj_start;

        return result;
    }

    /// Creates an empty allocation with room for exactly `size` objects.
    /// size == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty(isize size, isize alignment, memory_resource const* resource) // NOLINT
    {
        IC_ASSERT(size >= 0, "size must be non-negative");
        auto const byte_size = size * isize(sizeof(T));
        return create_empty_bytes(byte_size, byte_size, alignment, resource);
    }

    /// Creates a copy of a span of objects with room for `capacity` objects using the specified memory resource.
    /// Requires capacity >= source.size().
    [[nodiscard]] static allocation create_copy_of(span<T const> source, isize capacity, memory_resource const* resource)
    {
        IC_ASSERT(capacity >= source.size(), "capacity must hold the copied objects");
        auto result = allocation::create_empty(capacity, alignof(T), resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    // downstream containers need to handle this explicitly!
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(ic::exchange(rhs.obj_start, nullptr)),
        obj_end(ic::exchange(rhs.obj_end, nullptr)),
        alloc_start(ic::exchange(rhs.alloc_start, nullptr)),
        alloc_end(ic::exchange(rhs.alloc_end, nullptr)),
        alignment(ic::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Move assignment, safe even when rhs is nested inside one of the objects destroyed in 'this':
    /// rhs is first moved into a local, then the old contents are destroyed, then ownership is transferred.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = ic::move(rhs);

            release_storage();

            obj_start = ic::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = ic::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = ic::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = ic::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = ic::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource; // rhs resource stays
        }

        return *this;
    }

    ~allocation() { release_storage(); }

private:
    void release_storage() noexcept
    {
        // end life and call dtor of live objects
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        // return allocation
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
