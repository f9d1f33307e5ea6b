#pragma once

#include <ident-core/assert.hh>
#include <ident-core/fwd.hh>

#include <cstring>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//
// Raw memory:
//   placement_new               - tag for ic's own placement new (avoids <new>)
//   memcpy(dest, src, bytes)    - non-overlapping byte copy, bytes == 0 is a no-op even for nullptr
//   memmove(dest, src, bytes)   - overlapping byte copy, bytes == 0 is a no-op even for nullptr
//
// Alignment (value or pointer):
//   is_power_of_two(value)           - check if value is a power of 2
//   align_up(value, alignment)       - increment to next aligned boundary (power of 2)
//   align_up_masked(value, mask)     - increment using pre-computed mask
//   is_aligned(value, alignment)     - check if aligned at boundary (power of 2)
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   function_ptr<Signature>          - convert function signature to function pointer type
//

namespace ic
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto b = ic::move(a);              // move construct b from a
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ptr = ic::exchange(p, nullptr);     // take ownership of p, set p to null
///   bool was_disposed = ic::exchange(_disposed, true);
template <class T, class U = T>
[[nodiscard]] IC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b
/// Usage:
///   isize new_capacity = ic::max(capacity * 2, capacity + 1);
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter) - returning reference is intentional
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag type for ic's placement new overload
/// Usage:
///   new (ic::placement_new, ptr) T(args...);
struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new = {};

/// Copies `bytes` bytes from src to dest, ranges must not overlap
/// Unlike std::memcpy, bytes == 0 with null pointers is well-defined
IC_FORCE_INLINE void memcpy(void* dest, void const* src, isize bytes)
{
    IC_ASSERT(bytes >= 0, "memcpy: byte count must be non-negative");
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

/// Copies `bytes` bytes from src to dest, ranges may overlap
/// This is the bulk shift primitive of the sorted containers
IC_FORCE_INLINE void memmove(void* dest, void const* src, isize bytes)
{
    IC_ASSERT(bytes >= 0, "memmove: byte count must be non-negative");
    if (bytes > 0)
        std::memmove(dest, src, size_t(bytes));
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    IC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given pre-computed mask
/// mask should be (alignment - 1) where alignment is a power of 2
template <class T>
[[nodiscard]] constexpr T align_up_masked(T value, isize mask)
{
    return (T)(((isize)value + mask) & ~mask);
}

/// Increment value to align at the given boundary
/// Usage:
///   auto* aligned = ic::align_up(ptr, 256);      // align pointer to 256 bytes
///   isize val = ic::align_up(300, 16);           // = 304 (next multiple of 16)
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    IC_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    return align_up_masked(value, alignment - 1);
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    IC_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   ic::function_ptr<void(ic::byte*, isize)>    -> void (*)(ic::byte*, isize)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace ic

/// Placement new without <new>
/// NOTE: a distinct tag type keeps this from colliding with the global placement new
inline void* operator new(std::size_t, ic::placement_new_tag, void* ptr) noexcept
{
    return ptr;
}

/// Matching delete, only called if a constructor throws during placement new
inline void operator delete(void*, ic::placement_new_tag, void*) noexcept {}
