#pragma once
/**
 * @file title_template.hpp
 * @brief Turns a callable's doc string into the human-readable title of a call.
 *
 * The title is the part of the doc string before the first `:param`, `@param`,
 * `:return` or `@return` marker, with every line trimmed and the lines joined
 * with no separator. Each `{{name}}` placeholder of a declared parameter is then
 * replaced with the text of the value that parameter received.
 */
#include "trace/callable_descriptor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace calltrace::trace
{

/// Parameter name to the value it received; std::nullopt when unresolved.
using BindingMap = std::unordered_map<std::string, std::optional<Value>>;

/** @brief The title portion of @p doc. */
CALLTRACE_EXPORT std::string extract_title(std::string_view doc);

/**
 * @brief Binds every declared parameter to its call-site value.
 *
 * Priority: the positional argument at the parameter's position, then a keyword
 * argument with its name, then its declared default. Extra arguments are ignored.
 * @p declared and @p args must both exclude the receiver.
 */
CALLTRACE_EXPORT BindingMap bind_parameters(const std::vector<ParamSpec> &declared,
                                            const ArgList &args, const KwArgs &kwargs);

/**
 * @brief The text substituted for one binding.
 *
 * Unresolved or empty values give "". Strings lose their surrounding quote characters.
 * Anything that cannot be rendered gives "".
 */
CALLTRACE_EXPORT std::string binding_text(const std::optional<Value> &value) noexcept;

/**
 * @brief Replaces `{{name}}` for each parameter of @p declared, in declaration order.
 *
 * Text inserted for one parameter is seen by the parameters after it.
 */
CALLTRACE_EXPORT std::string substitute(std::string title, const std::vector<ParamSpec> &declared,
                                        const BindingMap &bound);

/**
 * @brief Full title rendering: @p name when @p doc is empty, otherwise the extracted
 *        title with placeholders substituted.
 */
CALLTRACE_EXPORT std::string render_title(std::string_view name, std::string_view doc,
                                          const std::vector<ParamSpec> &declared,
                                          const BindingMap &bound);

/** @brief Bindings as (name, text) pairs in declaration order. */
CALLTRACE_EXPORT std::vector<std::pair<std::string, std::string>>
binding_texts(const std::vector<ParamSpec> &declared, const BindingMap &bound);

} // namespace calltrace::trace
