#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: IC_COMPILER_MSVC, IC_COMPILER_CLANG, IC_COMPILER_GCC, IC_COMPILER_MINGW, IC_COMPILER_POSIX

#if defined(_MSC_VER)
#define IC_COMPILER_MSVC
#elif defined(__clang__)
#define IC_COMPILER_CLANG
#elif defined(__GNUC__)
#define IC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define IC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(IC_COMPILER_CLANG) || defined(IC_COMPILER_GCC) || defined(IC_COMPILER_MINGW)
#define IC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: IC_OS_WINDOWS, IC_OS_LINUX, IC_OS_APPLE, IC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define IC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define IC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define IC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define IC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: IC_DEBUG, IC_RELEASE, IC_RELWITHDEBINFO, IC_ENABLE_ASSERT_IN_RELEASE
// Derived here: IC_ASSERT_ENABLED (0 or 1)

#if defined(IC_DEBUG) || defined(IC_RELWITHDEBINFO) || defined(IC_ENABLE_ASSERT_IN_RELEASE)
#define IC_ASSERT_ENABLED 1
#else
#define IC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// IC_FORCE_INLINE - Force function to be inlined
#define IC_FORCE_INLINE IC_IMPL_FORCE_INLINE

// IC_COLD_FUNC - Mark function as rarely executed (error paths, growth, assertions)
// Usage: IC_COLD_FUNC void handle_error() { ... }
#define IC_COLD_FUNC IC_IMPL_COLD_FUNC

// IC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define IC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(IC_COMPILER_MSVC)

#define IC_IMPL_FORCE_INLINE __forceinline
#define IC_IMPL_COLD_FUNC

#elif defined(IC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define IC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define IC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
