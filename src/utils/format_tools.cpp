// format_tools.cpp
#include "ct_base.hpp"

#include <ctime>
#include <regex>

namespace calltrace::format_tools
{

std::string log_timestamp(std::chrono::system_clock::time_point timestamp)
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(timestamp);
    return fmt::format("{:%m/%d %H:%M:%S}", fmt::localtime(tt));
}

std::string date_stamp(std::chrono::system_clock::time_point timestamp)
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(timestamp);
    return fmt::format("{:%Y-%m-%d}", fmt::localtime(tt));
}

std::string_view bare_function_name(std::string_view pretty_name) noexcept
{
    // Cut the parameter list. For "f(int)::<lambda()>" this keeps the enclosing "f".
    // Clang spells anonymous namespaces "(anonymous namespace)"; that is not it.
    constexpr std::string_view kAnonNs = "(anonymous namespace)";
    size_t paren = pretty_name.find('(');
    while (paren != std::string_view::npos && pretty_name.substr(paren).starts_with(kAnonNs))
        paren = pretty_name.find('(', paren + kAnonNs.size());
    std::string_view name = pretty_name.substr(0, paren);

    // Drop trailing template arguments: "g<int>" -> "g".
    if (!name.empty() && name.back() == '>')
    {
        int depth = 0;
        for (size_t i = name.size(); i-- > 0;)
        {
            if (name[i] == '>')
                ++depth;
            else if (name[i] == '<' && --depth == 0)
            {
                name = name.substr(0, i);
                break;
            }
        }
    }

    const auto scope = name.rfind("::");
    if (scope != std::string_view::npos)
        name = name.substr(scope + 2);
    const auto space = name.find_last_of(" *&");
    if (space != std::string_view::npos)
        name = name.substr(space + 1);
    return name;
}

std::optional<std::string> extract_ip_suffix(std::string_view host_ip)
{
    static const std::regex kIpv4(R"(\d+\.\d+\.\d+\.(\d+))");
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(host_ip.begin(), host_ip.end(), m, kIpv4))
    {
        return m[1].str();
    }
    return std::nullopt;
}

std::string_view trim(std::string_view text) noexcept
{
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

} // namespace calltrace::format_tools
