// Tools for formatting strings
#pragma once
#include "ct_platform.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace calltrace::format_tools
{

/**
 * @brief Formats a time point as a local "MM/DD HH:MM:SS" stamp, the log line timestamp.
 */
CALLTRACE_EXPORT std::string log_timestamp(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a time point as a local "YYYY-MM-DD" date, used to name the daily log files.
 */
CALLTRACE_EXPORT std::string date_stamp(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Reduces a `std::source_location::function_name()` string to the bare function name.
 *
 * "void app::Calculator::add(int, int)" becomes "add", "virtual void Suite_Case_Test::TestBody()"
 * becomes "TestBody". For a lambda the enclosing function is returned. The result is a view
 * into @p pretty_name.
 */
CALLTRACE_EXPORT std::string_view bare_function_name(std::string_view pretty_name) noexcept;

/**
 * @brief Extracts the last octet of the first dotted IPv4 address found in @p host_ip.
 * @return The last octet ("7" for "10.0.0.7"), or std::nullopt when there is no address.
 */
CALLTRACE_EXPORT std::optional<std::string> extract_ip_suffix(std::string_view host_ip);

/**
 * @brief Removes leading and trailing ASCII whitespace.
 */
CALLTRACE_EXPORT std::string_view trim(std::string_view text) noexcept;

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 * @throws fmt::format_error when the format string does not match the arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    if (pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(pos + 1);
}

} // namespace calltrace::format_tools
