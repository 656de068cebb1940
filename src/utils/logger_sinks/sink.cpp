#include "ct_base.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace calltrace::utils
{

// Returns the display name for a given log level.
const char *Sink::level_to_string_internal(int lvl)
{
    // Plain ints mirror Logger::Level without including logger.hpp.
    constexpr int kDebugLevel = 10;
    constexpr int kInfoLevel = 20;
    constexpr int kWarnLevel = 30;
    constexpr int kErrorLevel = 40;
    constexpr int kCriticalLevel = 50;
    switch (lvl)
    {
    case kDebugLevel:
        return "DEBUG";
    case kInfoLevel:
        return "INFO";
    case kWarnLevel:
        return "WARNING";
    case kErrorLevel:
        return "ERROR";
    case kCriticalLevel:
        return "CRITICAL";
    default:
        return "UNK";
    }
}

std::string Sink::format_logmsg(const LogMessage &msg)
{
    return fmt::format("{}: {} | {} | {}\n", msg.host_label,
                       format_tools::log_timestamp(msg.timestamp),
                       level_to_string_internal(msg.level),
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace calltrace::utils
