#include "ct_base.hpp"
#include "trace/title_template.hpp"

#include <array>

namespace calltrace::trace
{

namespace
{
constexpr std::array<std::string_view, 4> kDocMarkers{":param", "@param", "@return", ":return"};
constexpr std::string_view kQuoteChars = "'";
} // namespace

std::string extract_title(std::string_view doc)
{
    size_t cut = doc.size();
    for (auto marker : kDocMarkers)
    {
        if (auto pos = doc.find(marker); pos != std::string_view::npos && pos < cut)
            cut = pos;
    }
    const std::string_view head = doc.substr(0, cut);

    std::string title;
    size_t start = 0;
    while (start <= head.size())
    {
        const auto end = head.find('\n', start);
        const auto line = head.substr(start, end == std::string_view::npos ? end : end - start);
        title += format_tools::trim(line);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return title;
}

BindingMap bind_parameters(const std::vector<ParamSpec> &declared, const ArgList &args,
                           const KwArgs &kwargs)
{
    BindingMap bound;
    size_t position = 0;
    for (const auto &p : declared)
    {
        std::optional<Value> value;
        if (p.is_positional())
        {
            if (position < args.size())
                value = args[position];
            ++position;
        }
        if (!value)
        {
            if (const auto *kw = find_keyword(kwargs, p.name))
                value = *kw;
        }
        if (!value && p.has_default())
            value = p.default_value;
        bound[p.name] = std::move(value);
    }
    return bound;
}

std::string binding_text(const std::optional<Value> &value) noexcept
{
    try
    {
        if (!value || value->is_empty())
            return {};
        if (!value->is_object() && value->json().is_string())
        {
            const auto &s = value->json().get_ref<const std::string &>();
            const auto first = s.find_first_not_of(kQuoteChars);
            if (first == std::string::npos)
                return {};
            const auto last = s.find_last_not_of(kQuoteChars);
            return s.substr(first, last - first + 1);
        }
        return value->text();
    }
    catch (const std::exception &e)
    {
        CALLTRACE_DEBUG("binding_text failed: {}", e.what());
        return {};
    }
}

std::string substitute(std::string title, const std::vector<ParamSpec> &declared,
                       const BindingMap &bound)
{
    for (const auto &p : declared)
    {
        const std::string placeholder = "{{" + p.name + "}}";
        auto pos = title.find(placeholder);
        if (pos == std::string::npos)
            continue;
        const auto it = bound.find(p.name);
        const std::string text = it == bound.end() ? std::string{} : binding_text(it->second);
        while (pos != std::string::npos)
        {
            title.replace(pos, placeholder.size(), text);
            pos = title.find(placeholder, pos + text.size());
        }
    }
    return title;
}

std::string render_title(std::string_view name, std::string_view doc,
                         const std::vector<ParamSpec> &declared, const BindingMap &bound)
{
    if (doc.empty())
        return std::string(name);
    return substitute(extract_title(doc), declared, bound);
}

std::vector<std::pair<std::string, std::string>>
binding_texts(const std::vector<ParamSpec> &declared, const BindingMap &bound)
{
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(declared.size());
    for (const auto &p : declared)
    {
        auto it = bound.find(p.name);
        out.emplace_back(p.name, it == bound.end() ? std::string{} : binding_text(it->second));
    }
    return out;
}

} // namespace calltrace::trace
