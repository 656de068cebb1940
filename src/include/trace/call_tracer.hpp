#pragma once
/**
 * @file call_tracer.hpp
 * @brief Wraps a callable so that each invocation logs one `[name]: <title>` line.
 *
 * The wrapper classifies the callable, drops the receiver of an instance method
 * from the arguments used for the title, renders the title and logs it at INFO
 * without the caller prefix. While the wrapped call runs, its name is on the
 * thread's call frame stack and, when a StepReporter is installed, a step is open.
 * The original arguments are passed through unchanged, and the result or
 * exception of the wrapped callable comes back unchanged.
 *
 * Callables whose name starts with '_' are called straight through. If the title
 * cannot be produced, a warning is logged and the call proceeds untraced.
 */
#include "trace/callable_descriptor.hpp"
#include "trace/classifier.hpp"
#include "trace/title_template.hpp"

#include <functional>
#include <string>
#include <vector>

namespace calltrace::trace
{

using Handler = std::function<Value(const ArgList &, const KwArgs &)>;

/** @brief Everything derived from one call before the wrapped callable runs. */
struct ResolvedCall
{
    CallableRole role = CallableRole::FUNCTION;
    /// Declared parameters without the receiver.
    std::vector<ParamSpec> declared;
    /// Call-site positional arguments without the receiver.
    ArgList args;
    BindingMap bound;
    std::string title;
};

/**
 * @brief Classifies, strips the receiver, binds and renders the title for one call.
 *
 * The leading argument is treated as the receiver only for an instance method
 * that is not a constructor, and only when it is an object reference.
 */
CALLTRACE_EXPORT ResolvedCall resolve_call(const CallableDescriptor &desc, const ArgList &args,
                                           const KwArgs &kwargs);

/**
 * @brief Returns a handler that traces each call and then invokes @p inner.
 * @throws std::invalid_argument if @p inner is empty.
 */
CALLTRACE_EXPORT Handler trace(CallableDescriptor desc, Handler inner);

} // namespace calltrace::trace
