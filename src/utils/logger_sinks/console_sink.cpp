#include "ct_base.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"

#include <cctype>
#include <optional>

#include <fmt/color.h>

namespace calltrace::utils
{

namespace
{

// Length of a leading "[name]" tag made of letters and underscores, or 0.
size_t name_tag_length(std::string_view body) noexcept
{
    if (body.empty() || body.front() != '[')
        return 0;
    for (size_t i = 1; i < body.size(); ++i)
    {
        const auto c = static_cast<unsigned char>(body[i]);
        if (c == ']')
            return i + 1;
        if (!std::isalpha(c) && c != '_')
            return 0;
    }
    return 0;
}

std::optional<fmt::text_style> level_style(int lvl) noexcept
{
    using Level = Logger::Level;
    switch (lvl)
    {
    case static_cast<int>(Level::L_INFO):
        return fmt::emphasis::bold | fmt::fg(fmt::terminal_color::bright_white);
    case static_cast<int>(Level::L_ERROR):
        return fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red);
    case static_cast<int>(Level::L_DEBUG):
        return fmt::emphasis::bold | fmt::fg(fmt::terminal_color::bright_blue);
    default:
        return std::nullopt;
    }
}

} // namespace

ConsoleSink::ConsoleSink(bool use_color, std::FILE *stream) : use_color_(use_color), stream_(stream)
{
}

std::string ConsoleSink::format_colored(const LogMessage &msg)
{
    const std::string_view body(msg.body.data(), msg.body.size());
    const auto head = fmt::format(
        "{}: {} | ", fmt::format(fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red), "{}",
                                 msg.host_label),
        fmt::format(fmt::fg(fmt::terminal_color::bright_yellow), "{}",
                    format_tools::log_timestamp(msg.timestamp)));

    const auto style = level_style(msg.level);
    if (!style)
    {
        return fmt::format("{}{} | {}\n", head, level_to_string_internal(msg.level), body);
    }

    // Only the first line takes the message color.
    const auto tag_len = name_tag_length(body);
    std::string_view tag = body.substr(0, tag_len);
    std::string_view rest = body.substr(tag_len);
    std::string_view tail;
    if (const auto nl = rest.find('\n'); nl != std::string_view::npos)
    {
        tail = rest.substr(nl);
        rest = rest.substr(0, nl);
    }

    return fmt::format(
        "{}{} | {}{}{}\n", head, fmt::format(*style, "{:<5}", level_to_string_internal(msg.level)),
        tag.empty() ? std::string{}
                    : fmt::format(fmt::emphasis::bold | fmt::fg(fmt::terminal_color::green), "{}",
                                  tag),
        rest.empty() ? std::string{} : fmt::format(*style, "{}", rest), tail);
}

void ConsoleSink::write(const LogMessage &msg)
{
    const auto line = use_color_ ? format_colored(msg) : format_logmsg(msg);
    std::lock_guard<std::mutex> lock(mutex_);
    fmt::print(stream_, "{}", line);
}

void ConsoleSink::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stream_);
}

} // namespace calltrace::utils
