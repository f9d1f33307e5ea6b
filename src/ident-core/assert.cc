#include "assert.hh"

#include <ident-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef IC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef IC_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// topmost handler is back()
std::vector<ic::impl::assertion_handler> g_assertion_handlers;

void default_assert_handler(ic::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
    std::cerr.flush();
}
} // namespace

void ic::impl::push_assertion_handler(assertion_handler handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ic::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

ic::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ic::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

IC_COLD_FUNC void ic::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    // topmost handler wins, otherwise report to stderr
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // IC_BREAK_AND_ABORT follows at the call site
}

bool ic::impl::is_debugger_connected() noexcept
{
#ifdef IC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(IC_OS_LINUX)
    // Check /proc/self/status for TracerPid
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                auto const parsed = std::sscanf(buf + 10, "%d", &pid) == 1;
                std::fclose(f);
                return parsed && pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ic::impl::perform_abort() noexcept
{
    std::abort();
}
