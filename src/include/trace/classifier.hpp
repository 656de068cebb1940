#pragma once

#include "trace/callable_descriptor.hpp"

namespace calltrace::trace
{

enum class CallableRole
{
    FUNCTION,
    INSTANCE_METHOD,
    STATIC_METHOD,
    CLASS_METHOD,
};

/**
 * @brief Determines how a callable is invoked from its declared parameters alone.
 *
 * - no positional parameter: STATIC_METHOD (there is no receiver to strip)
 * - first positional parameter named `self`: INSTANCE_METHOD
 * - bound to a type (non-empty owner), first positional named `cls`: CLASS_METHOD
 * - bound to a type otherwise: STATIC_METHOD
 * - anything else: FUNCTION
 *
 * Never throws; an internal failure classifies as FUNCTION.
 */
CALLTRACE_EXPORT CallableRole classify(const CallableDescriptor &desc) noexcept;

CALLTRACE_EXPORT const char *role_name(CallableRole role) noexcept;

/** @brief True when the role's first declared parameter is a receiver (`self` or `cls`). */
constexpr bool has_receiver_param(CallableRole role) noexcept
{
    return role == CallableRole::INSTANCE_METHOD || role == CallableRole::CLASS_METHOD;
}

} // namespace calltrace::trace
