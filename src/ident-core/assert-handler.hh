#pragma once

#include <ident-core/macros.hh>

#include <functional>
#include <source_location>
#include <string>

namespace ic::impl
{
/// What a failed IC_ASSERT / IC_ASSERT_ALWAYS reports
struct assertion_info
{
    std::string expression; ///< stringified condition
    std::string message;
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// Failed assertions go to the most recently pushed handler.
// With no handler installed, the failure is printed to stderr.
// Either way the process aborts afterwards unless the handler throws.
//
// The tests use this to turn contract violations into exceptions:
//
//   auto handler = ic::impl::scoped_assertion_handler([](ic::impl::assertion_info const&) { throw contract_violation{}; });
//   map.dispose();
//   map.dispose(); // throws instead of aborting
//
// NOTE: the handler stack is global and not synchronized
void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

/// Pushes on construction, pops on destruction (including unwinding from a throwing handler)
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ic::impl
