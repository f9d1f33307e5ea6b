#include "allocation.hh"

#include <ident-core/macros.hh>
#include <ident-core/utility.hh>

#include <cstdlib>

namespace
{
// Static function implementations for the system memory resource.
// These ignore the userdata parameter as the system allocator is stateless.

ic::byte* system_aligned_malloc(ic::isize bytes, ic::isize alignment)
{
#ifdef IC_OS_WINDOWS
    return static_cast<ic::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign does not require bytes % alignment == 0 (unlike std::aligned_alloc),
    // but it requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    ic::isize const effective_alignment = alignment < ic::isize(sizeof(void*)) ? ic::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    return result == 0 ? static_cast<ic::byte*>(raw_ptr) : nullptr;
#endif
}

ic::isize system_allocate_bytes(ic::byte** out_ptr, ic::isize min_bytes, ic::isize max_bytes, ic::isize alignment, void* userdata)
{
    IC_UNUSED(userdata);
    IC_UNUSED(max_bytes);

    IC_ASSERT(alignment > 0 && ic::is_power_of_two(alignment), "alignment must be a power of 2");
    IC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    // Contract: min_bytes == 0 always returns nullptr
    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    *out_ptr = system_aligned_malloc(min_bytes, alignment);
    IC_ASSERT_ALWAYS(*out_ptr != nullptr, "system allocation failed");
    return min_bytes;
}

ic::isize system_try_allocate_bytes(ic::byte** out_ptr, ic::isize min_bytes, ic::isize max_bytes, ic::isize alignment, void* userdata)
{
    IC_UNUSED(userdata);
    IC_UNUSED(max_bytes);

    IC_ASSERT(alignment > 0 && ic::is_power_of_two(alignment), "alignment must be a power of 2");
    IC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    *out_ptr = system_aligned_malloc(min_bytes, alignment);
    return *out_ptr != nullptr ? min_bytes : -1;
}

void system_deallocate_bytes(ic::byte* p, ic::isize bytes, ic::isize alignment, void* userdata)
{
    IC_UNUSED(bytes);
    IC_UNUSED(alignment);
    IC_UNUSED(userdata);

    // size and alignment are provided for resources that need them (e.g. arenas),
    // malloc/free don't require them
#ifdef IC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

// malloc does not support in-place resize, and realloc may move the block.
// try_resize_bytes_in_place stays nullptr, so containers always allocate a new block to grow.

/// System memory resource instance stored in the data segment.
/// This is the default fallback when ic::allocation<T>::custom_resource is nullptr.
constinit ic::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = nullptr,
    .userdata = nullptr,
};

} // namespace

constinit ic::memory_resource const* const ic::default_memory_resource = &system_memory_resource;
