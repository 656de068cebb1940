/**
 * @file logger.cpp
 * @brief Logger facade: lazy sink construction, caller prefixes and debug promotion.
 */
#include "ct_base.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/sink_config.hpp"
#include "utils/trace_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <typeinfo>

#if defined(CALLTRACE_IS_POSIX)
#include <cxxabi.h>
#endif

namespace calltrace::utils
{

namespace
{

std::mutex g_sink_mu;
// The one strong reference to the cached SinkConfig; never reset.
std::shared_ptr<SinkConfig> g_sinks;

/// Returns the process's SinkConfig, building it on first use.
std::shared_ptr<SinkConfig> acquire_sinks()
{
    std::lock_guard<std::mutex> lock(g_sink_mu);
    if (!g_sinks)
    {
        const auto cfg = TraceConfig::current();
        g_sinks = InstanceCache<SinkConfig>::instance().get_or_create(
            InstanceCache<SinkConfig>::make_key({cfg->log_level}),
            [&]() { return std::make_shared<SinkConfig>(*cfg); });
    }
    return g_sinks;
}

bool is_test_function(std::string_view name, const std::vector<std::string> &prefixes) noexcept
{
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](const std::string &p) { return !p.empty() && name.starts_with(p); });
}

std::string demangled_type_name(const std::type_info &ti)
{
#if defined(CALLTRACE_IS_POSIX)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> name(
        abi::__cxa_demangle(ti.name(), nullptr, nullptr, &status), &std::free);
    if (status == 0 && name)
        return name.get();
#endif
    return ti.name();
}

} // namespace

void Logger::emit(Level lvl, std::string_view body)
{
    auto sinks = acquire_sinks();
    sinks->dispatch(static_cast<int>(lvl), body);
}

std::string Logger::prefix_with_caller(std::string_view message, std::source_location loc)
{
    return fmt::format("[{}]: {}", format_tools::bare_function_name(loc.function_name()),
                       message);
}

Logger::Level Logger::debug_severity_for(std::string_view caller)
{
    const auto grandcaller = basics::CallFrameGuard::caller_of(caller);
    if (!grandcaller)
        return Level::L_DEBUG;
    const auto cfg = TraceConfig::current();
    return is_test_function(*grandcaller, cfg->test_function_prefixes) ? Level::L_INFO
                                                                        : Level::L_DEBUG;
}

void Logger::emit_prefixed(Level lvl, std::string_view body, std::source_location loc)
{
    switch (lvl)
    {
    case Level::L_DEBUG:
        emit(debug_severity_for(format_tools::bare_function_name(loc.function_name())),
             prefix_with_caller(body, loc));
        break;
    case Level::L_INFO:
    case Level::L_ERROR:
        emit(lvl, prefix_with_caller(body, loc));
        break;
    default:
        emit(lvl, body);
        break;
    }
}

void Logger::info(std::string_view message, bool auto_prefix, std::source_location loc)
{
    if (auto_prefix)
        emit(Level::L_INFO, prefix_with_caller(message, loc));
    else
        emit(Level::L_INFO, message);
}

void Logger::debug(std::string_view message, bool auto_prefix, std::source_location loc)
{
    const auto lvl = debug_severity_for(format_tools::bare_function_name(loc.function_name()));
    if (auto_prefix)
        emit(lvl, prefix_with_caller(message, loc));
    else
        emit(lvl, message);
}

void Logger::error(std::string_view message, bool auto_prefix, std::source_location loc)
{
    if (auto_prefix)
        emit(Level::L_ERROR, prefix_with_caller(message, loc));
    else
        emit(Level::L_ERROR, message);
}

void Logger::warning(std::string_view message)
{
    emit(Level::L_WARNING, message);
}

void Logger::exception(std::string_view message)
{
    std::string body(message);
    if (auto eptr = std::current_exception())
    {
        try
        {
            std::rethrow_exception(eptr);
        }
        catch (const std::exception &e)
        {
            body += fmt::format("\n{}: {}", demangled_type_name(typeid(e)), e.what());
        }
        catch (...)
        {
            body += "\nunknown exception";
        }
    }
    emit(Level::L_ERROR, body);
}

void Logger::log_fmt_runtime(Level lvl, std::source_location loc, fmt::string_view fmt_str,
                             fmt::format_args args)
{
    std::string body;
    try
    {
        body = fmt::vformat(fmt_str, args);
    }
    catch (const fmt::format_error &ex)
    {
        emit(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        return;
    }
    emit_prefixed(lvl, body, loc);
}

void Logger::ensure_configured()
{
    (void)acquire_sinks();
}

void Logger::flush() noexcept
{
    std::shared_ptr<SinkConfig> sinks;
    {
        std::lock_guard<std::mutex> lock(g_sink_mu);
        sinks = g_sinks;
    }
    if (sinks)
        sinks->flush();
}

std::vector<std::string> Logger::sink_descriptions()
{
    return acquire_sinks()->descriptions();
}

const char *Logger::level_name(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_DEBUG:
        return "DEBUG";
    case Level::L_INFO:
        return "INFO";
    case Level::L_WARNING:
        return "WARNING";
    case Level::L_ERROR:
        return "ERROR";
    case Level::L_CRITICAL:
        return "CRITICAL";
    }
    return "UNK";
}

Logger::Level Logger::parse_level(std::string_view text)
{
    std::string upper(format_tools::trim(text));
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (auto lvl : {Level::L_DEBUG, Level::L_INFO, Level::L_WARNING, Level::L_ERROR,
                     Level::L_CRITICAL})
    {
        if (upper == level_name(lvl))
            return lvl;
    }
    if (upper == "WARN")
        return Level::L_WARNING;

    int numeric = 0;
    const auto *first = upper.data();
    const auto *last = upper.data() + upper.size();
    if (auto [ptr, ec] = std::from_chars(first, last, numeric); ec == std::errc{} && ptr == last)
    {
        for (auto lvl : {Level::L_DEBUG, Level::L_INFO, Level::L_WARNING, Level::L_ERROR,
                         Level::L_CRITICAL})
        {
            if (numeric == static_cast<int>(lvl))
                return lvl;
        }
    }
    throw std::invalid_argument(fmt::format("unknown log level '{}'", text));
}

} // namespace calltrace::utils
