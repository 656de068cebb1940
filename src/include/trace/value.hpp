#pragma once
/**
 * @file value.hpp
 * @brief Dynamic call-site values passed through traced handlers.
 *
 * A Value holds either plain data (`nlohmann::json`) or a reference to a C++
 * object together with its type identity. Object references are how receivers
 * travel through `ArgList`: `Value::borrow(obj, "Calculator")` for an object
 * owned elsewhere, `Value::own(ptr, "Calculator")` to share ownership.
 */
#include "ct_base.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace calltrace::trace
{

struct ObjectRef
{
    std::shared_ptr<void> owner; ///< Empty for borrowed objects.
    void *ptr = nullptr;
    std::type_index type = typeid(void);
    std::string type_name;
};

class Value;

template <typename T>
concept JsonConvertible = !std::is_same_v<std::remove_cvref_t<T>, Value> &&
                          !std::is_same_v<std::remove_cvref_t<T>, ObjectRef> &&
                          std::is_constructible_v<nlohmann::json, T>;

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

class CALLTRACE_EXPORT Value
{
  public:
    /** @brief A null value. */
    Value() = default;

    template <JsonConvertible T> Value(T &&v) : data_(nlohmann::json(std::forward<T>(v))) {}

    explicit Value(ObjectRef ref) : data_(std::move(ref)) {}

    /** @brief References @p object without taking ownership. */
    template <typename T> static Value borrow(T &object, std::string type_name)
    {
        ObjectRef ref;
        ref.ptr = const_cast<void *>(static_cast<const void *>(std::addressof(object)));
        ref.type = typeid(T);
        ref.type_name = std::move(type_name);
        return Value(std::move(ref));
    }

    /** @brief References @p object and shares its ownership. */
    template <typename T> static Value own(std::shared_ptr<T> object, std::string type_name)
    {
        ObjectRef ref;
        ref.ptr = const_cast<void *>(static_cast<const void *>(object.get()));
        ref.type = typeid(T);
        ref.type_name = std::move(type_name);
        ref.owner = std::const_pointer_cast<void>(std::static_pointer_cast<const void>(object));
        return Value(std::move(ref));
    }

    [[nodiscard]] bool is_object() const noexcept
    {
        return std::holds_alternative<ObjectRef>(data_);
    }
    [[nodiscard]] bool is_null() const noexcept;

    /** @brief True for null, "", [] and {}. Numbers and booleans are never empty. */
    [[nodiscard]] bool is_empty() const noexcept;

    /**
     * @brief The JSON payload.
     * @throws std::invalid_argument when this Value is an object reference.
     */
    [[nodiscard]] const nlohmann::json &json() const;

    /** @brief `json().get<T>()`. Throws like nlohmann::json on a type mismatch. */
    template <typename T> [[nodiscard]] T get() const { return json().template get<T>(); }

    /** @brief The referenced object when it is exactly a `T`, else nullptr. */
    template <typename T> [[nodiscard]] T *as_object() const noexcept
    {
        const auto *ref = std::get_if<ObjectRef>(&data_);
        if (ref == nullptr || ref->type != std::type_index(typeid(T)))
            return nullptr;
        return static_cast<T *>(ref->ptr);
    }

    /** @brief The object reference, or nullptr for data values. */
    [[nodiscard]] const ObjectRef *object() const noexcept { return std::get_if<ObjectRef>(&data_); }

    /**
     * @brief Textual form: strings verbatim, other data as compact JSON,
     *        objects as "<Type object at 0x...>".
     */
    [[nodiscard]] std::string text() const;

  private:
    std::variant<nlohmann::json, ObjectRef> data_;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

/** @brief Positional call-site arguments, receiver included for instance methods. */
using ArgList = std::vector<Value>;

/** @brief Keyword call-site arguments in the order they were given. */
using KwArgs = std::vector<std::pair<std::string, Value>>;

/** @brief The keyword argument named @p name, or nullptr. */
CALLTRACE_EXPORT const Value *find_keyword(const KwArgs &kwargs, std::string_view name) noexcept;

/**
 * @brief The InstanceCache key for a call: each positional argument's text followed
 *        by each keyword argument's name, with no separator.
 */
CALLTRACE_EXPORT std::string instance_key(const ArgList &args, const KwArgs &kwargs = {});

} // namespace calltrace::trace

template <> struct fmt::formatter<calltrace::trace::Value> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const calltrace::trace::Value &v, FormatContext &ctx) const
    {
        const auto s = v.text();
        return fmt::formatter<std::string_view>::format(std::string_view(s), ctx);
    }
};
