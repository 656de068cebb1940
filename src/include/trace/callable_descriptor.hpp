#pragma once
/**
 * @file callable_descriptor.hpp
 * @brief Registration-time description of a traceable callable.
 *
 * A CallableDescriptor is captured once, when a function or member is registered,
 * and never changes afterwards. It carries everything the tracer needs: the name,
 * the declaring type, the declared parameters with their defaults, and the doc
 * string holding the title template.
 *
 * @code
 *   CallableDescriptor d{.name = "add",
 *                        .params = {param("a"), param("b", 1)},
 *                        .doc = "Adds {{a}} and {{b}}\n:param a: left operand"};
 * @endcode
 */
#include "trace/value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace calltrace::trace
{

enum class ParamKind
{
    PositionalOrKeyword,
    KeywordOnly,
};

struct ParamSpec
{
    std::string name;
    std::optional<Value> default_value;
    ParamKind kind = ParamKind::PositionalOrKeyword;

    [[nodiscard]] bool has_default() const noexcept { return default_value.has_value(); }
    [[nodiscard]] bool is_positional() const noexcept
    {
        return kind == ParamKind::PositionalOrKeyword;
    }
};

inline ParamSpec param(std::string name)
{
    return ParamSpec{std::move(name), std::nullopt, ParamKind::PositionalOrKeyword};
}

inline ParamSpec param(std::string name, Value default_value)
{
    return ParamSpec{std::move(name), std::move(default_value), ParamKind::PositionalOrKeyword};
}

inline ParamSpec kw_only(std::string name)
{
    return ParamSpec{std::move(name), std::nullopt, ParamKind::KeywordOnly};
}

inline ParamSpec kw_only(std::string name, Value default_value)
{
    return ParamSpec{std::move(name), std::move(default_value), ParamKind::KeywordOnly};
}

/// Conventional name of the receiver parameter of an instance method.
inline constexpr std::string_view kSelfParam = "self";
/// Conventional name of the receiver parameter of a class method.
inline constexpr std::string_view kClsParam = "cls";

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct CALLTRACE_EXPORT CallableDescriptor
{
    std::string name;
    /// Name of the declaring type; empty for free functions.
    std::string owner;
    std::optional<std::type_index> owner_type;
    /// Declared parameters in order, including a leading `self` / `cls` receiver.
    std::vector<ParamSpec> params;
    std::string doc;
    bool is_constructor = false;

    /** @brief Names beginning with '_' are private: never traced or instrumented. */
    [[nodiscard]] bool is_private() const noexcept { return !name.empty() && name.front() == '_'; }

    [[nodiscard]] size_t positional_count() const noexcept;

    /** @brief "add(a, b=1)" style signature, used in binding error messages. */
    [[nodiscard]] std::string signature() const;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace calltrace::trace
