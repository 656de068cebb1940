#include "ct_service.hpp"
#include "trace/instrumentor.hpp"

#include <algorithm>

namespace calltrace::trace
{

bool MatchPolicy::matches(std::string_view type_name) const noexcept
{
    const auto any_of = [&](const std::vector<std::string> &list, auto &&pred)
    { return std::any_of(list.begin(), list.end(), pred); };

    return any_of(starts_with, [&](const std::string &p) { return type_name.starts_with(p); }) ||
           any_of(ends_with, [&](const std::string &s) { return type_name.ends_with(s); }) ||
           any_of(contains, [&](const std::string &c)
                  { return type_name.find(c) != std::string_view::npos; });
}

MatchPolicy MatchPolicy::from_config(const TraceConfig &cfg)
{
    return MatchPolicy{cfg.class_name_startswith, cfg.class_name_endswith, cfg.class_name_contain};
}

ClassSpec &instrument(ClassSpec &cls, const MatchPolicy &policy)
{
    size_t wrapped = 0;
    for (Member &m : cls.members())
    {
        const CallableDescriptor &desc = m.descriptor;
        if (m.instrumented || desc.is_private() || desc.is_constructor)
            continue;

        const std::string &owner = desc.owner.empty() ? cls.name() : desc.owner;
        if (!policy.matches(owner))
            continue;

        m.handler = std::make_shared<const Handler>(trace(desc, *m.handler));
        m.instrumented = true;
        ++wrapped;
    }
    CALLTRACE_LOG_DEBUG("instrumented {} member(s) of {}", wrapped, cls.name());
    return cls;
}

ClassSpec &instrument(ClassSpec &cls)
{
    return instrument(cls, MatchPolicy::from_config(*TraceConfig::current()));
}

} // namespace calltrace::trace
