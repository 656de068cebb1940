/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * The functions in `calltrace::debug` write straight to `stderr` and never go through
 * the Logger, so they stay usable while the Logger itself is being built or is failing.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace calltrace::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX systems use `backtrace` and `dladdr` with demangled symbol names. Other
 * platforms print a single notice line.
 */
CALLTRACE_EXPORT void print_stack_trace() noexcept;

inline std::string srcloc_to_str(std::source_location loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * Intended for broken invariants only. Formatting failures are reported rather
 * than thrown, then `std::abort()` is called.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", srcloc_to_str(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL ERROR WHILE FORMATTING PANIC MESSAGE: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace calltrace::debug

/**
 * @brief Calls `calltrace::debug::panic` with the current source location.
 */
#ifndef CALLTRACE_PANIC
#define CALLTRACE_PANIC(fmt_str, ...)                                                                  \
    ::calltrace::debug::panic(std::source_location::current(),                                     \
                              FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a library diagnostic to `stderr`. Compiled out unless
 *        CALLTRACE_ENABLE_DEBUG_MESSAGES is defined.
 */
#ifndef CALLTRACE_DEBUG
#if defined(CALLTRACE_ENABLE_DEBUG_MESSAGES)
#define CALLTRACE_DEBUG(fmt_str, ...)                                                                  \
    ::calltrace::debug::debug_msg(FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)
#else
#define CALLTRACE_DEBUG(fmt_str, ...)                                                                  \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
