#include "arena.hh"

#include <ident-core/assert.hh>
#include <ident-core/utility.hh>

#include <cstddef>

ic::linear_arena ic::linear_arena::create(isize capacity_bytes, memory_resource const* upstream)
{
    IC_ASSERT(capacity_bytes > 0, "arena capacity must be positive");
    return linear_arena(allocation<byte>::create_empty(capacity_bytes, alignof(std::max_align_t), upstream));
}

ic::linear_arena::linear_arena(span<byte> buffer)
  : _begin(buffer.data()), _head(buffer.data()), _end(buffer.data() + buffer.size())
{
    init_resource();
}

ic::linear_arena::linear_arena(allocation<byte> block) : _block(ic::move(block))
{
    _begin = _block.alloc_start;
    _head = _begin;
    _end = _block.alloc_end;
    init_resource();
}

ic::linear_arena::~linear_arena()
{
    IC_ASSERT(_live_allocations == 0, "linear_arena destroyed while allocations are still live");
}

void ic::linear_arena::init_resource()
{
    _resource.allocate_bytes = &linear_arena::allocate_bytes;
    _resource.try_allocate_bytes = &linear_arena::try_allocate_bytes;
    _resource.deallocate_bytes = &linear_arena::deallocate_bytes;
    _resource.try_resize_bytes_in_place = &linear_arena::try_resize_bytes_in_place;
    _resource.userdata = this;
}

void ic::linear_arena::reset()
{
    _head = _begin;
    _last_block = nullptr;
    _live_allocations = 0;
}

ic::isize ic::linear_arena::try_allocate_bytes(byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)
{
    IC_UNUSED(max_bytes);
    IC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");
    IC_ASSERT(alignment > 0 && ic::is_power_of_two(alignment), "alignment must be a power of 2");

    auto* self = static_cast<linear_arena*>(userdata);

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    auto* const start = ic::align_up(self->_head, alignment);
    if (start > self->_end || self->_end - start < min_bytes)
    {
        *out_ptr = nullptr;
        return -1;
    }

    self->_head = start + min_bytes;
    self->_last_block = start;
    ++self->_live_allocations;

    *out_ptr = start;
    return min_bytes;
}

ic::isize ic::linear_arena::allocate_bytes(byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)
{
    auto const bytes = try_allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, userdata);
    IC_ASSERT_ALWAYS(bytes >= 0, "linear_arena exhausted");
    return bytes;
}

void ic::linear_arena::deallocate_bytes(byte* p, isize bytes, isize alignment, void* userdata)
{
    IC_UNUSED(alignment);

    auto* self = static_cast<linear_arena*>(userdata);

    if (p == nullptr)
        return;

    IC_ASSERT(self->_begin <= p && p + bytes <= self->_head, "block does not belong to this arena");
    IC_ASSERT(self->_live_allocations > 0, "more deallocations than allocations");
    --self->_live_allocations;

    // only the most recent block can be rolled back
    if (p == self->_last_block && p + bytes == self->_head)
    {
        self->_head = p;
        self->_last_block = nullptr;
    }
}

ic::isize ic::linear_arena::try_resize_bytes_in_place(
    byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)
{
    IC_UNUSED(alignment);
    IC_UNUSED(max_bytes);
    IC_ASSERT(p != nullptr, "cannot resize null pointer");
    IC_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    auto* self = static_cast<linear_arena*>(userdata);

    if (p != self->_last_block || p + old_bytes != self->_head)
        return -1;

    if (self->_end - p < min_bytes)
        return -1;

    self->_head = p + min_bytes;
    return min_bytes;
}
