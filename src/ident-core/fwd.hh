#pragma once

#include <cstddef>
#include <cstdint>


namespace ic
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout.
// Plain "int" is fine for loop counters and other small counts.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and indices are signed:
// * "size - 1" on an empty range stays -1 instead of wrapping to a huge value
// * no mixed signed/unsigned comparisons
// * negative values double as "not found" encodings (see flat_map::binary_search)
// * we only target 64-bit platforms, so i64 has plenty of range
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;
struct linear_arena;

//
// Views
//

template <class T>
struct span;

//
// Utility types
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class U>
struct pair;

//
// Containers
//

template <class K, class V>
struct flat_map;

//
// Identifiers
//

struct snowflake_id;

//
// Synchronization
//

struct completion_signal;

template <class T>
struct mutex;

} // namespace ic
