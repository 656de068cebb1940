#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide logging facade.
 *
 * All entry points are static. The first record of the process builds the
 * SinkConfig from `TraceConfig::current()` (exactly once, even when several threads
 * log at the same time); every record after that is written synchronously.
 *
 * `info`, `debug` and `error` prefix the message with `[<caller>]: `, where the
 * caller is the bare name of the function that made the call. `debug` is emitted
 * at INFO when the caller's own caller is a test function, i.e. its name starts
 * with one of TraceConfig::test_function_prefixes. The caller's caller is taken
 * from the thread's CallFrameGuard stack; without a frame the record stays DEBUG.
 *
 * @code
 *   Logger::info("connected");                  // "[open_session]: connected"
 *   CALLTRACE_LOG_DEBUG("retry {} of {}", n, max);
 *   try { ... } catch (const std::exception &) { Logger::exception("upload failed"); }
 * @endcode
 */
#include "ct_base.hpp"

#include <source_location>
#include <string>
#include <string_view>
#include <vector>

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef CALLTRACE_LOG_BUFFER_RESERVE
#define CALLTRACE_LOG_BUFFER_RESERVE (256u)
#endif

namespace calltrace::utils
{

class SinkConfig;

class CALLTRACE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_DEBUG = 10,
        L_INFO = 20,
        L_WARNING = 30,
        L_ERROR = 40,
        L_CRITICAL = 50,
    };

    Logger() = delete;

    static void info(std::string_view message, bool auto_prefix = true,
                     std::source_location loc = std::source_location::current());
    static void debug(std::string_view message, bool auto_prefix = true,
                      std::source_location loc = std::source_location::current());
    static void error(std::string_view message, bool auto_prefix = true,
                      std::source_location loc = std::source_location::current());
    static void warning(std::string_view message);

    /**
     * @brief Logs @p message at ERROR. Inside a `catch` block the active exception's
     *        type and `what()` are appended on a new line.
     */
    static void exception(std::string_view message);

    /** @brief Builds the sinks now instead of on the first record. */
    static void ensure_configured();

    static void flush() noexcept;

    /** @brief One line per sink, e.g. "File: /tmp/logs/2024-01-31_debug.log". */
    static std::vector<std::string> sink_descriptions();

    static const char *level_name(Level lvl) noexcept;

    /**
     * @brief Parses "DEBUG", "info", "Warning", ... or a numeric level such as "20".
     * @throws std::invalid_argument for anything else.
     */
    static Level parse_level(std::string_view text);

    /** @brief `[<caller>]: <message>` for the function at @p loc. */
    static std::string prefix_with_caller(std::string_view message, std::source_location loc);

    /**
     * @brief The severity `debug` would use when called from @p caller on this thread.
     */
    static Level debug_severity_for(std::string_view caller);

    template <Level lvl, typename... Args>
    static void log_fmt(std::source_location loc, fmt::format_string<Args...> fmt_str,
                        Args &&...args);
    static void log_fmt_runtime(Level lvl, std::source_location loc, fmt::string_view fmt_str,
                                fmt::format_args args);

    /** @brief Writes @p body at @p lvl with no prefix and no promotion. */
    static void emit(Level lvl, std::string_view body);

  private:
    static void emit_prefixed(Level lvl, std::string_view body, std::source_location loc);
};

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(std::source_location loc, fmt::format_string<Args...> fmt_str,
                     Args &&...args)
{
    fmt::memory_buffer mb;
    try
    {
        mb.reserve(CALLTRACE_LOG_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    }
    catch (const fmt::format_error &ex)
    {
        emit(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        return;
    }
    emit_prefixed(lvl, std::string_view(mb.data(), mb.size()), loc);
}

} // namespace calltrace::utils

#define CALLTRACE_LOG_DEBUG(fmt_str, ...)                                                              \
    ::calltrace::utils::Logger::log_fmt<::calltrace::utils::Logger::Level::L_DEBUG>(               \
        std::source_location::current(), FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)
#define CALLTRACE_LOG_INFO(fmt_str, ...)                                                               \
    ::calltrace::utils::Logger::log_fmt<::calltrace::utils::Logger::Level::L_INFO>(                \
        std::source_location::current(), FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)
#define CALLTRACE_LOG_WARN(fmt_str, ...)                                                               \
    ::calltrace::utils::Logger::log_fmt<::calltrace::utils::Logger::Level::L_WARNING>(             \
        std::source_location::current(), FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)
#define CALLTRACE_LOG_ERROR(fmt_str, ...)                                                              \
    ::calltrace::utils::Logger::log_fmt<::calltrace::utils::Logger::Level::L_ERROR>(               \
        std::source_location::current(), FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)

#define CALLTRACE_LOG_INFO_RT(fmt_str, ...)                                                            \
    ::calltrace::utils::Logger::log_fmt_runtime(::calltrace::utils::Logger::Level::L_INFO,         \
                                                std::source_location::current(), fmt_str,            \
                                                fmt::make_format_args(__VA_ARGS__))
