#pragma once

// Lean header with minimal dependencies, cheap to include everywhere.
#include <ident-core/macros.hh>

#include <source_location>

// =========================================================================================================
// IC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Enabled in IC_DEBUG and IC_RELWITHDEBINFO builds.
//   In IC_RELEASE builds, disabled unless IC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   INVARIANTS, PRECONDITIONS, and POSTCONDITIONS. They catch PROGRAMMER ERRORS,
//   e.g. touching an ic::flat_map after dispose() or disposing it twice.
//
// What assertions are NOT for:
//   - NOT for expected outcomes (a missing key is a normal result, see flat_map::try_get)
//   - NOT for user input validation
//
// Error handling strategy:
//   - Assertions       -> programmer errors, violated invariants/preconditions
//   - bool / optional  -> expected "not found" style outcomes
//
// Usage:
//   IC_ASSERT(ptr != nullptr, "pointer must not be null");
//   IC_ASSERT(idx < size(), "index out of bounds");
//
#define IC_ASSERT(cond, msg) IC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// IC_ASSERT_ALWAYS - Always-active assertion
//
// Like IC_ASSERT but remains active in all build configurations, including release builds.
// Use this where continuing would read or write memory that does not exist
// (allocation failure, reading a missing entry).
//
#define IC_ASSERT_ALWAYS(cond, msg) IC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// IC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline so the debugger stops at the assertion site.
//
#define IC_DEBUG_BREAK() IC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// IC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define IC_BREAK_AND_ABORT() (IC_DEBUG_BREAK(), ::ic::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ic::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or reports to stderr
// Note: does not abort, caller must follow with IC_BREAK_AND_ABORT()
IC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ic::impl

#ifdef IC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define IC_IMPL_DEBUG_BREAK() (::ic::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(IC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define IC_IMPL_DEBUG_BREAK() (::ic::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define IC_IMPL_DEBUG_BREAK() void(0)

#endif

#define IC_IMPL_ASSERT_ALWAYS(cond, msg)                                                      \
    do                                                                                        \
    {                                                                                         \
        if (!(cond)) [[unlikely]]                                                             \
        {                                                                                     \
            ::ic::impl::handle_assert_failure(#cond, msg, ::std::source_location::current()); \
            IC_BREAK_AND_ABORT();                                                             \
        }                                                                                     \
    } while (false)

#if IC_ASSERT_ENABLED

#define IC_IMPL_ASSERT(cond, msg) IC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// Stripped, but the expression and message still have to compile
#define IC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        IC_UNUSED(cond);          \
        IC_UNUSED(msg);           \
    } while (false)

#endif
