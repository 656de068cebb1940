#pragma once
/**
 * @file instrumentor.hpp
 * @brief Selects the members of a ClassSpec by declaring type name and wraps them with trace().
 */
#include "trace/class_spec.hpp"
#include "utils/trace_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace calltrace::trace
{

struct CALLTRACE_EXPORT MatchPolicy
{
    std::vector<std::string> starts_with;
    std::vector<std::string> ends_with;
    std::vector<std::string> contains;

    /** @brief True if @p type_name matches any prefix, suffix or substring. */
    [[nodiscard]] bool matches(std::string_view type_name) const noexcept;

    static MatchPolicy from_config(const TraceConfig &cfg);
};

/**
 * @brief Wraps every eligible member of @p cls with the call tracer.
 *
 * A member is eligible when its name does not start with '_', it is not a
 * constructor, it is not already instrumented, and its declaring type name
 * (the class name when the member has none) satisfies @p policy. Applying this
 * twice leaves the handlers from the first pass in place.
 *
 * Handlers are replaced without locking; no other thread may invoke members of
 * @p cls while this runs.
 *
 * @return @p cls
 */
CALLTRACE_EXPORT ClassSpec &instrument(ClassSpec &cls, const MatchPolicy &policy);

/** @brief instrument() with the policy from TraceConfig::current(). */
CALLTRACE_EXPORT ClassSpec &instrument(ClassSpec &cls);

} // namespace calltrace::trace
