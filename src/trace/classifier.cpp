#include "ct_base.hpp"
#include "trace/classifier.hpp"

#include <algorithm>

namespace calltrace::trace
{

CallableRole classify(const CallableDescriptor &desc) noexcept
{
    try
    {
        const auto first = std::find_if(desc.params.begin(), desc.params.end(),
                                        [](const ParamSpec &p) { return p.is_positional(); });
        if (first == desc.params.end())
            return CallableRole::STATIC_METHOD;
        if (first->name == kSelfParam)
            return CallableRole::INSTANCE_METHOD;
        if (!desc.owner.empty())
        {
            return first->name == kClsParam ? CallableRole::CLASS_METHOD
                                            : CallableRole::STATIC_METHOD;
        }
        return CallableRole::FUNCTION;
    }
    catch (const std::exception &e)
    {
        CALLTRACE_DEBUG("classify('{}') failed: {}", desc.name, e.what());
        return CallableRole::FUNCTION;
    }
}

const char *role_name(CallableRole role) noexcept
{
    switch (role)
    {
    case CallableRole::FUNCTION:
        return "FUNCTION";
    case CallableRole::INSTANCE_METHOD:
        return "INSTANCE_METHOD";
    case CallableRole::STATIC_METHOD:
        return "STATIC_METHOD";
    case CallableRole::CLASS_METHOD:
        return "CLASS_METHOD";
    }
    return "UNKNOWN";
}

} // namespace calltrace::trace
