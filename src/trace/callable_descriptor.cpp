#include "ct_base.hpp"
#include "trace/callable_descriptor.hpp"

#include <algorithm>

namespace calltrace::trace
{

size_t CallableDescriptor::positional_count() const noexcept
{
    return static_cast<size_t>(
        std::count_if(params.begin(), params.end(), [](const ParamSpec &p) { return p.is_positional(); }));
}

std::string CallableDescriptor::signature() const
{
    fmt::memory_buffer mb;
    fmt::format_to(std::back_inserter(mb), "{}(", name);
    bool star_written = false;
    for (size_t i = 0; i < params.size(); ++i)
    {
        const auto &p = params[i];
        if (i > 0)
            fmt::format_to(std::back_inserter(mb), ", ");
        if (!p.is_positional() && !star_written)
        {
            fmt::format_to(std::back_inserter(mb), "*, ");
            star_written = true;
        }
        if (p.has_default())
            fmt::format_to(std::back_inserter(mb), "{}={}", p.name, p.default_value->text());
        else
            fmt::format_to(std::back_inserter(mb), "{}", p.name);
    }
    fmt::format_to(std::back_inserter(mb), ")");
    return fmt::to_string(mb);
}

} // namespace calltrace::trace
