/**
 * @file debug_info.cpp
 * @brief Stack trace printing for CALLTRACE_PANIC.
 *
 * Only the POSIX path resolves symbols. It is not async-signal-safe: it allocates
 * and calls `fmt::print`, which is acceptable right before `std::abort()`.
 */
#include "ct_base.hpp"

#if defined(CALLTRACE_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

#include <array>
#include <memory>

namespace calltrace::debug
{

namespace
{
constexpr int kMaxFrames = 64;
} // namespace

void print_stack_trace() noexcept
{
#if defined(CALLTRACE_IS_POSIX)
    try
    {
        std::array<void *, kMaxFrames> frames{};
        const int count = ::backtrace(frames.data(), kMaxFrames);
        fmt::print(stderr, "Stack trace ({} frames):\n", count);

        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < count; ++i)
        {
            Dl_info info{};
            if (::dladdr(frames[static_cast<size_t>(i)], &info) == 0 || info.dli_sname == nullptr)
            {
                fmt::print(stderr, "  #{:<2} {}\n", i, frames[static_cast<size_t>(i)]);
                continue;
            }

            int status = 0;
            std::unique_ptr<char, decltype(&std::free)> demangled(
                abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status), &std::free);
            const char *symbol = (status == 0 && demangled) ? demangled.get() : info.dli_sname;
            fmt::print(stderr, "  #{:<2} {} in {}\n", i, symbol,
                       format_tools::filename_only(info.dli_fname ? info.dli_fname : "?"));
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "Stack trace unavailable: %s\n", e.what());
    }
#else
    std::fprintf(stderr, "Stack trace unavailable on this platform.\n");
#endif
    std::fflush(stderr);
}

} // namespace calltrace::debug
