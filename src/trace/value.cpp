#include "ct_base.hpp"
#include "trace/value.hpp"

#include <stdexcept>

namespace calltrace::trace
{

bool Value::is_null() const noexcept
{
    const auto *j = std::get_if<nlohmann::json>(&data_);
    return j != nullptr && j->is_null();
}

bool Value::is_empty() const noexcept
{
    const auto *j = std::get_if<nlohmann::json>(&data_);
    if (j == nullptr)
        return false;
    if (j->is_string())
        return j->get_ref<const std::string &>().empty();
    return j->is_null() || ((j->is_array() || j->is_object()) && j->empty());
}

const nlohmann::json &Value::json() const
{
    const auto *j = std::get_if<nlohmann::json>(&data_);
    if (j == nullptr)
    {
        throw std::invalid_argument(
            fmt::format("expected a data value, got a {} object", std::get<ObjectRef>(data_).type_name));
    }
    return *j;
}

std::string Value::text() const
{
    if (const auto *ref = std::get_if<ObjectRef>(&data_))
        return fmt::format("<{} object at {}>", ref->type_name, ref->ptr);

    const auto &j = std::get<nlohmann::json>(data_);
    if (j.is_string())
        return j.get<std::string>();
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const Value *find_keyword(const KwArgs &kwargs, std::string_view name) noexcept
{
    for (const auto &[key, value] : kwargs)
    {
        if (key == name)
            return &value;
    }
    return nullptr;
}

std::string instance_key(const ArgList &args, const KwArgs &kwargs)
{
    std::string key;
    for (const auto &a : args)
        key += a.text();
    for (const auto &kv : kwargs)
        key += kv.first;
    return key;
}

} // namespace calltrace::trace
