#include "ct_service.hpp"
#include "trace/call_tracer.hpp"
#include "trace/step_reporter.hpp"

#include <memory>
#include <stdexcept>

namespace calltrace::trace
{

using utils::Logger;

ResolvedCall resolve_call(const CallableDescriptor &desc, const ArgList &args,
                          const KwArgs &kwargs)
{
    ResolvedCall rc;
    rc.role = classify(desc);

    bool receiver_dropped = false;
    for (const auto &p : desc.params)
    {
        if (!receiver_dropped && has_receiver_param(rc.role) && p.is_positional())
        {
            receiver_dropped = true;
            continue;
        }
        rc.declared.push_back(p);
    }

    auto first = args.begin();
    if (rc.role == CallableRole::INSTANCE_METHOD && !desc.is_constructor && !args.empty() &&
        args.front().is_object())
    {
        ++first;
    }
    rc.args.assign(first, args.end());

    rc.bound = bind_parameters(rc.declared, rc.args, kwargs);
    rc.title = render_title(desc.name, desc.doc, rc.declared, rc.bound);
    return rc;
}

Handler trace(CallableDescriptor desc, Handler inner)
{
    if (!inner)
        throw std::invalid_argument(fmt::format("trace('{}'): empty handler", desc.name));

    auto shared_desc = std::make_shared<const CallableDescriptor>(std::move(desc));
    return [desc = std::move(shared_desc), inner = std::move(inner)](const ArgList &args,
                                                                      const KwArgs &kwargs) -> Value
    {
        if (desc->is_private())
            return inner(args, kwargs);

        ResolvedCall rc;
        try
        {
            rc = resolve_call(*desc, args, kwargs);
        }
        catch (const std::exception &e)
        {
            Logger::warning(fmt::format("[{}]: call not traced: {}", desc->name, e.what()));
            return inner(args, kwargs);
        }

        Logger::info(fmt::format("[{}]: {}", desc->name, rc.title), false);

        basics::CallFrameGuard frame(desc->name);
        std::unique_ptr<StepContext> step;
        if (!desc->is_constructor)
        {
            auto reporter = current_step_reporter();
            if (reporter->enabled())
                step = reporter->open_step(rc.title, binding_texts(rc.declared, rc.bound));
        }
        return inner(args, kwargs);
    };
}

} // namespace calltrace::trace
