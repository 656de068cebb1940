#pragma once
/**
 * @file class_builder.hpp
 * @brief Registers the members of a C++ class into a ClassSpec.
 *
 * @code
 *   ClassSpec calc = ClassBuilder<Calculator>("Calculator")
 *                        .constructor<int>({param("base", 0)})
 *                        .method("add", &Calculator::add, {param("a"), param("b")},
 *                                "Adds {{a}} and {{b}}")
 *                        .static_method("version", &Calculator::version)
 *                        .build();
 * @endcode
 *
 * Instance methods get a leading `self` parameter and expect the receiver as the
 * first positional argument (`Value::borrow(obj, "Calculator")`). Class methods get
 * a leading `cls` parameter that never appears in the call arguments. Arguments
 * are matched strictly (bind_call) and converted with `nlohmann::json::get<A>()`;
 * a parameter of type `Value` receives the argument as is.
 */
#include "trace/class_spec.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace calltrace::trace
{

namespace detail
{

template <typename A> std::decay_t<A> convert_arg(const Value &v, const ParamSpec &p)
{
    using D = std::decay_t<A>;
    if constexpr (std::is_same_v<D, Value>)
    {
        return v;
    }
    else
    {
        if (v.is_object())
            throw std::invalid_argument(
                fmt::format("argument '{}': expected data, got {}", p.name, v.text()));
        try
        {
            return v.get<D>();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument(fmt::format("argument '{}': {}", p.name, e.what()));
        }
    }
}

/** @brief Calls @p f with the bound values converted to the parameter types @p A... */
template <typename... A, typename F, std::size_t... I>
decltype(auto) apply_bound(F &&f, const std::vector<Value> &bound,
                           const std::vector<const ParamSpec *> &params,
                           std::index_sequence<I...>)
{
    return std::forward<F>(f)(convert_arg<A>(bound[I], *params[I])...);
}

template <typename R, typename Call> Value to_value(Call &&call)
{
    if constexpr (std::is_void_v<R>)
    {
        std::forward<Call>(call)();
        return Value{};
    }
    else if constexpr (std::is_same_v<std::decay_t<R>, Value>)
    {
        return std::forward<Call>(call)();
    }
    else
    {
        return Value(nlohmann::json(std::forward<Call>(call)()));
    }
}

/** @brief The parameters bind_call fills, in order (receiver excluded). */
inline std::vector<const ParamSpec *> call_params(const CallableDescriptor &desc)
{
    const CallableRole role = classify(desc);
    std::vector<const ParamSpec *> out;
    bool skipped = false;
    for (const auto &p : desc.params)
    {
        if (!skipped && has_receiver_param(role) && p.is_positional())
        {
            skipped = true;
            continue;
        }
        out.push_back(&p);
    }
    return out;
}

} // namespace detail

template <typename T> class ClassBuilder
{
  public:
    explicit ClassBuilder(std::string class_name) : spec_(std::move(class_name), typeid(T)) {}

    template <typename R, typename... A>
    ClassBuilder &method(std::string name, R (T::*fn)(A...), std::vector<ParamSpec> params = {},
                         std::string doc = {})
    {
        return add_instance_method<R, A...>(
            std::move(name), std::move(params), std::move(doc),
            [fn](T &self, auto &&...a) -> R { return (self.*fn)(std::forward<decltype(a)>(a)...); });
    }

    template <typename R, typename... A>
    ClassBuilder &method(std::string name, R (T::*fn)(A...) const,
                         std::vector<ParamSpec> params = {}, std::string doc = {})
    {
        return add_instance_method<R, A...>(
            std::move(name), std::move(params), std::move(doc),
            [fn](T &self, auto &&...a) -> R { return (self.*fn)(std::forward<decltype(a)>(a)...); });
    }

    template <typename R, typename... A>
    ClassBuilder &static_method(std::string name, R (*fn)(A...),
                                std::vector<ParamSpec> params = {}, std::string doc = {})
    {
        CallableDescriptor desc = make_descriptor<A...>(std::move(name), std::move(params),
                                                        std::move(doc), std::nullopt);
        return add_free<R, A...>(std::move(desc), fn);
    }

    template <typename R, typename... A>
    ClassBuilder &class_method(std::string name, R (*fn)(A...),
                               std::vector<ParamSpec> params = {}, std::string doc = {})
    {
        CallableDescriptor desc = make_descriptor<A...>(std::move(name), std::move(params),
                                                        std::move(doc), kClsParam);
        return add_free<R, A...>(std::move(desc), fn);
    }

    /** @brief Registers `T(A...)` as a member named after the class. */
    template <typename... A>
    ClassBuilder &constructor(std::vector<ParamSpec> params = {}, std::string doc = {})
    {
        CallableDescriptor desc = make_descriptor<A...>(spec_.name(), std::move(params),
                                                        std::move(doc), std::nullopt);
        desc.is_constructor = true;
        auto shared_desc = std::make_shared<const CallableDescriptor>(desc);
        Handler h = [shared_desc, class_name = spec_.name()](const ArgList &args,
                                                            const KwArgs &kwargs) -> Value
        {
            const auto bound = bind_call(*shared_desc, args, kwargs);
            const auto params = detail::call_params(*shared_desc);
            auto obj = detail::apply_bound<A...>(
                [](auto &&...a) { return std::make_shared<T>(std::forward<decltype(a)>(a)...); },
                bound, params, std::index_sequence_for<A...>{});
            return Value::own(std::move(obj), class_name);
        };
        put(std::move(desc), std::move(h));
        return *this;
    }

    /**
     * @brief Copies the members of @p base, constructors excluded.
     *
     * Inherited members keep their declaring type name and their current handler,
     * traced or not. Instance methods accept a `T` receiver and forward it as a
     * `Base`. A member registered later under the same name overrides the
     * inherited one.
     */
    template <typename Base> ClassBuilder &inherit(const ClassSpec &base)
    {
        static_assert(std::is_base_of_v<Base, T>, "inherit<Base>: T must derive from Base");
        if (base.type() != std::type_index(typeid(Base)))
        {
            throw std::invalid_argument(
                fmt::format("{}: inherit<{}> given a spec of another type", spec_.name(),
                            base.name()));
        }
        for (const Member &m : base.members())
        {
            if (m.descriptor.is_constructor || spec_.find(m.descriptor.name) != nullptr)
                continue;

            Member copy = m;
            if (classify(m.descriptor) == CallableRole::INSTANCE_METHOD)
            {
                copy.handler = std::make_shared<const Handler>(
                    [inner = m.handler, base_name = base.name(),
                     member = m.descriptor.name](const ArgList &args, const KwArgs &kwargs) -> Value
                    {
                        T *self = args.empty() ? nullptr : args.front().template as_object<T>();
                        if (self == nullptr)
                            return (*inner)(args, kwargs);
                        ArgList forwarded = args;
                        forwarded.front() = Value::borrow(static_cast<Base &>(*self), base_name);
                        return (*inner)(forwarded, kwargs);
                    });
            }
            inherited_.insert(copy.descriptor.name);
            spec_.add(std::move(copy));
        }
        return *this;
    }

    [[nodiscard]] ClassSpec build() { return std::move(spec_); }

  private:
    template <typename... A>
    CallableDescriptor make_descriptor(std::string name, std::vector<ParamSpec> params,
                                       std::string doc, std::optional<std::string_view> receiver)
    {
        if (params.size() != sizeof...(A))
        {
            throw std::invalid_argument(fmt::format("{}.{}: {} parameter names for {} arguments",
                                                    spec_.name(), name, params.size(),
                                                    sizeof...(A)));
        }
        CallableDescriptor desc;
        desc.name = std::move(name);
        desc.owner = spec_.name();
        desc.owner_type = spec_.type();
        desc.doc = std::move(doc);
        if (receiver)
            desc.params.push_back(param(std::string(*receiver)));
        for (auto &p : params)
            desc.params.push_back(std::move(p));
        return desc;
    }

    template <typename R, typename... A, typename Invoke>
    ClassBuilder &add_instance_method(std::string name, std::vector<ParamSpec> params,
                                      std::string doc, Invoke invoke)
    {
        CallableDescriptor desc = make_descriptor<A...>(std::move(name), std::move(params),
                                                        std::move(doc), kSelfParam);
        auto shared_desc = std::make_shared<const CallableDescriptor>(desc);
        Handler h = [shared_desc, invoke, class_name = spec_.name()](const ArgList &args,
                                                                     const KwArgs &kwargs) -> Value
        {
            T *self = args.empty() ? nullptr : args.front().template as_object<T>();
            if (self == nullptr)
            {
                throw std::invalid_argument(fmt::format("{}.{}() requires a {} receiver",
                                                        class_name, shared_desc->name, class_name));
            }
            const ArgList rest(args.begin() + 1, args.end());
            const auto bound = bind_call(*shared_desc, rest, kwargs);
            const auto params = detail::call_params(*shared_desc);
            return detail::to_value<R>(
                [&]() -> R
                {
                    return detail::apply_bound<A...>(
                        [&](auto &&...a) -> R { return invoke(*self, std::forward<decltype(a)>(a)...); },
                        bound, params, std::index_sequence_for<A...>{});
                });
        };
        put(std::move(desc), std::move(h));
        return *this;
    }

    template <typename R, typename... A>
    ClassBuilder &add_free(CallableDescriptor desc, R (*fn)(A...))
    {
        auto shared_desc = std::make_shared<const CallableDescriptor>(desc);
        Handler h = [shared_desc, fn](const ArgList &args, const KwArgs &kwargs) -> Value
        {
            const auto bound = bind_call(*shared_desc, args, kwargs);
            const auto params = detail::call_params(*shared_desc);
            return detail::to_value<R>(
                [&]() -> R
                {
                    return detail::apply_bound<A...>(fn, bound, params,
                                                     std::index_sequence_for<A...>{});
                });
        };
        put(std::move(desc), std::move(h));
        return *this;
    }

    void put(CallableDescriptor desc, Handler h)
    {
        Member m{std::move(desc), std::make_shared<const Handler>(std::move(h)), false};
        if (Member *existing = spec_.find(m.descriptor.name);
            existing != nullptr && inherited_.erase(m.descriptor.name) > 0)
        {
            *existing = std::move(m);
            return;
        }
        spec_.add(std::move(m));
    }

    ClassSpec spec_;
    std::unordered_set<std::string> inherited_;
};

} // namespace calltrace::trace
