#pragma once
#include "llmtools/exceptions.hpp"
#include "llmtools/types.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace llmtools::tools
{

/// One declared parameter of a callable.
struct Param
{
    std::string name;
    Json schema = Json::object(); ///< May be a {"$ref": "#/$defs/..."} into Signature::definitions
    std::optional<std::string> description;
    std::optional<Json> default_value; ///< Presence makes the parameter optional
    bool variadic{false};              ///< Unbounded argument list; rejected at registration
};

/// Explicit stand-in for runtime reflection: what a callable accepts.
struct Signature
{
    std::string name;
    std::optional<std::string> doc;
    std::vector<Param> params;
    Json definitions = Json::object(); ///< Named sub-schemas referenced by params
};

/// A tool implementation plus the signature it is introspected from.
///
/// Usage:
/// @code
/// auto add = llmtools::tools::make_callable("add", [](int a, int b) { return a + b; })
///                .doc("Add two integers.")
///                .param("a", "First addend")
///                .param("b", "Second addend");
/// @endcode
class Callable
{
  public:
    using Fn = std::function<Json(const Json&)>;
    using AsyncFn = std::function<std::future<Json>(const Json&)>;
    using Invoker = std::function<Json(const Signature&, const Json&)>;
    using AsyncInvoker = std::function<std::future<Json>(const Signature&, const Json&)>;

    Callable() = default;

    /// Untyped callable receiving the whole argument object.
    Callable(std::string name, Fn fn)
    {
        signature_.name = std::move(name);
        if (fn)
            invoker_ = [fn = std::make_shared<Fn>(std::move(fn))](const Signature&, const Json& args)
            { return (*fn)(args); };
    }

    Callable(Signature signature, Invoker invoker)
        : signature_(std::move(signature)), invoker_(std::move(invoker))
    {
    }

    Callable(Signature signature, AsyncInvoker invoker)
        : signature_(std::move(signature)), async_invoker_(std::move(invoker))
    {
    }

    static Callable from_async(std::string name, AsyncFn fn)
    {
        Signature sig;
        sig.name = std::move(name);
        if (!fn)
            return Callable(std::move(sig), AsyncInvoker{});
        return Callable(std::move(sig),
                        AsyncInvoker{[fn = std::make_shared<AsyncFn>(std::move(fn))](
                                         const Signature&, const Json& args) { return (*fn)(args); }});
    }

    const Signature& signature() const
    {
        return signature_;
    }
    const std::string& name() const
    {
        return signature_.name;
    }
    bool is_async() const
    {
        return static_cast<bool>(async_invoker_);
    }
    explicit operator bool() const
    {
        return static_cast<bool>(invoker_) || static_cast<bool>(async_invoker_);
    }

    /// Runs the implementation to completion on the calling thread.
    Json invoke(const Json& args) const
    {
        if (async_invoker_)
            return async_invoker_(signature_, args).get();
        if (invoker_)
            return invoker_(signature_, args);
        throw Error("Callable '" + signature_.name + "' has no implementation");
    }

    // Builder setters

    Callable& doc(std::string text)
    {
        signature_.doc = std::move(text);
        return *this;
    }

    /// Describes the parameter called @p name. If none exists yet, names the next
    /// unnamed positional slot, or appends an unconstrained parameter.
    Callable& param(const std::string& name, std::string description)
    {
        if (auto* p = find_param(name))
        {
            p->description = std::move(description);
            return *this;
        }
        for (auto& p : signature_.params)
        {
            if (p.name.empty() && !p.variadic)
            {
                p.name = name;
                p.description = std::move(description);
                return *this;
            }
        }
        Param p;
        p.name = name;
        p.description = std::move(description);
        signature_.params.push_back(std::move(p));
        return *this;
    }

    Callable& param(const std::string& name, Json schema,
                    std::optional<std::string> description)
    {
        if (auto* p = find_param(name))
        {
            p->schema = std::move(schema);
            p->description = std::move(description);
            return *this;
        }
        Param p;
        p.name = name;
        p.schema = std::move(schema);
        p.description = std::move(description);
        signature_.params.push_back(std::move(p));
        return *this;
    }

    Callable& param_default(const std::string& name, Json value)
    {
        require_param(name).default_value = std::move(value);
        return *this;
    }

    Callable& param_schema(const std::string& name, Json schema)
    {
        require_param(name).schema = std::move(schema);
        return *this;
    }

    Callable& define(const std::string& name, Json schema)
    {
        signature_.definitions[name] = std::move(schema);
        return *this;
    }

    /// Declares an unbounded trailing argument list.
    Callable& variadic(const std::string& name)
    {
        Param p;
        p.name = name;
        p.variadic = true;
        signature_.params.push_back(std::move(p));
        return *this;
    }

    Callable& rename(std::string name)
    {
        signature_.name = std::move(name);
        return *this;
    }

  private:
    Param* find_param(const std::string& name)
    {
        for (auto& p : signature_.params)
            if (!p.name.empty() && p.name == name)
                return &p;
        return nullptr;
    }

    Param& require_param(const std::string& name)
    {
        if (auto* p = find_param(name))
            return *p;
        throw ValidationError("Unknown parameter '" + name + "' on callable '" +
                              signature_.name + "'");
    }

    Signature signature_;
    Invoker invoker_;
    AsyncInvoker async_invoker_;
};

namespace detail
{

template <typename T>
struct is_optional : std::false_type
{
};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type
{
};

template <typename T>
struct is_vector : std::false_type
{
};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type
{
};

template <typename T>
struct is_future : std::false_type
{
};
template <typename T>
struct is_future<std::future<T>> : std::true_type
{
};

template <typename T>
Json schema_for()
{
    using U = std::decay_t<T>;
    if constexpr (is_optional<U>::value)
        return Json{{"anyOf", Json::array({schema_for<typename U::value_type>(),
                                           Json{{"type", "null"}}})}};
    else if constexpr (std::is_same_v<U, bool>)
        return Json{{"type", "boolean"}};
    else if constexpr (std::is_integral_v<U>)
        return Json{{"type", "integer"}};
    else if constexpr (std::is_floating_point_v<U>)
        return Json{{"type", "number"}};
    else if constexpr (std::is_same_v<U, std::string>)
        return Json{{"type", "string"}};
    else if constexpr (is_vector<U>::value)
        return Json{{"type", "array"}, {"items", schema_for<typename U::value_type>()}};
    else
        // Json and user types with from_json: caller supplies a schema via param_schema()
        return Json::object();
}

/// True when @p value is a number representable as U. Non-numbers pass so
/// that get<U>() reports the type mismatch.
template <typename U>
bool fits_integer(const Json& value)
{
    using limits = std::numeric_limits<U>;
    if (value.is_number_unsigned())
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(limits::max());
    if (value.is_number_integer())
    {
        auto v = value.get<std::int64_t>();
        if constexpr (std::is_signed_v<U>)
            return v >= static_cast<std::int64_t>(limits::min()) &&
                   v <= static_cast<std::int64_t>(limits::max());
        else
            return v >= 0 && static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(limits::max());
    }
    if (value.is_number_float())
    {
        double d = value.get<double>();
        return std::isfinite(d) && d >= static_cast<double>(limits::min()) &&
               d < static_cast<double>(limits::max()) + 1.0;
    }
    return true;
}

/// get<U>() that refuses to narrow integers, including vector elements.
template <typename U>
U checked_get(const std::string& name, const Json& value)
{
    if constexpr (std::is_integral_v<U> && !std::is_same_v<U, bool>)
    {
        if (!fits_integer<U>(value))
            throw ValidationError("Argument '" + name + "' value " + value.dump() +
                                  " is out of range for its parameter type");
        return value.template get<U>();
    }
    else if constexpr (is_vector<U>::value)
    {
        if (!value.is_array())
            return value.template get<U>();
        U out;
        out.reserve(value.size());
        for (const auto& item : value)
            out.push_back(checked_get<typename U::value_type>(name, item));
        return out;
    }
    else
    {
        return value.template get<U>();
    }
}

template <typename T>
std::decay_t<T> arg_from_json(const Param& p, const Json& args)
{
    using U = std::decay_t<T>;
    auto it = args.find(p.name);
    if constexpr (is_optional<U>::value)
    {
        using V = typename U::value_type;
        if (it != args.end() && !it->is_null())
            return U(checked_get<V>(p.name, *it));
        if (p.default_value && !p.default_value->is_null())
            return U(checked_get<V>(p.name, *p.default_value));
        return U{};
    }
    else
    {
        if (it != args.end())
            return checked_get<U>(p.name, *it);
        if (p.default_value)
            return checked_get<U>(p.name, *p.default_value);
        throw ValidationError("Missing required argument '" + p.name + "'");
    }
}

template <typename T>
struct function_traits : function_traits<decltype(&T::operator())>
{
};
template <typename R, typename... A>
struct function_traits<R (*)(A...)>
{
    using result = R;
    using args = std::tuple<A...>;
};
template <typename R, typename... A>
struct function_traits<R(A...)> : function_traits<R (*)(A...)>
{
};
template <typename C, typename R, typename... A>
struct function_traits<R (C::*)(A...)> : function_traits<R (*)(A...)>
{
};
template <typename C, typename R, typename... A>
struct function_traits<R (C::*)(A...) const> : function_traits<R (*)(A...)>
{
};

template <typename R>
Json result_to_json(std::future<R>& fut)
{
    if constexpr (std::is_void_v<R>)
    {
        fut.get();
        return Json();
    }
    else
    {
        return Json(fut.get());
    }
}

template <typename F, typename Tuple>
struct Binder;

template <typename F, typename... A>
struct Binder<F, std::tuple<A...>>
{
    static std::vector<Param> params()
    {
        std::vector<Param> out;
        (out.push_back(make_slot<A>()), ...);
        return out;
    }

    static Json call(F& f, const Signature& sig, const Json& args)
    {
        return call_impl(f, sig, args, std::index_sequence_for<A...>{});
    }

    static std::future<Json> call_async(F& f, const Signature& sig, const Json& args)
    {
        return call_async_impl(f, sig, args, std::index_sequence_for<A...>{});
    }

  private:
    template <typename T>
    static Param make_slot()
    {
        Param p;
        p.schema = schema_for<T>();
        if constexpr (is_optional<std::decay_t<T>>::value)
            p.default_value = Json();
        return p;
    }

    static void check_arity(const Signature& sig)
    {
        if (sig.params.size() < sizeof...(A))
            throw Error("Callable '" + sig.name + "' declares fewer parameters than it accepts");
    }

    template <std::size_t... I>
    static Json call_impl(F& f, const Signature& sig, const Json& args, std::index_sequence<I...>)
    {
        check_arity(sig);
        using R = std::invoke_result_t<F&, A...>;
        if constexpr (std::is_void_v<R>)
        {
            f(arg_from_json<A>(sig.params[I], args)...);
            return Json();
        }
        else
        {
            return Json(f(arg_from_json<A>(sig.params[I], args)...));
        }
    }

    template <std::size_t... I>
    static std::future<Json> call_async_impl(F& f, const Signature& sig, const Json& args,
                                             std::index_sequence<I...>)
    {
        check_arity(sig);
        auto fut = f(arg_from_json<A>(sig.params[I], args)...);
        std::promise<Json> promise;
        auto out = promise.get_future();
        // The tool's own future is consumed when the caller waits on ours.
        std::thread(
            [promise = std::move(promise), fut = std::move(fut)]() mutable
            {
                try
                {
                    promise.set_value(result_to_json(fut));
                }
                catch (...)
                {
                    promise.set_exception(std::current_exception());
                }
            })
            .detach();
        return out;
    }
};

} // namespace detail

/// Wraps a function object whose parameter types drive the generated schema.
/// Parameters are positional; name and describe them with Callable::param().
///
/// Copies of the returned Callable share one instance of @p f, so state kept
/// by a mutable lambda persists across calls. The loop may invoke a tool from
/// several threads at once; stateful tools must synchronize themselves.
template <typename F>
Callable make_callable(std::string name, F f)
{
    using traits = detail::function_traits<std::decay_t<F>>;
    using binder = detail::Binder<std::decay_t<F>, typename traits::args>;
    static_assert(!detail::is_future<typename traits::result>::value,
                  "use make_async_callable for functions returning std::future");

    Signature sig;
    sig.name = std::move(name);
    sig.params = binder::params();
    auto shared = std::make_shared<std::decay_t<F>>(std::move(f));
    return Callable(std::move(sig),
                    Callable::Invoker{[shared](const Signature& s, const Json& args)
                                      { return binder::call(*shared, s, args); }});
}

/// Member function bound to @p obj; the receiver never appears in the signature.
template <typename C, typename R, typename... A>
Callable make_callable(std::string name, R (C::*method)(A...), C* obj)
{
    return make_callable(std::move(name),
                         [obj, method](A... a) -> R { return (obj->*method)(std::forward<A>(a)...); });
}

template <typename C, typename R, typename... A>
Callable make_callable(std::string name, R (C::*method)(A...) const, const C* obj)
{
    return make_callable(std::move(name),
                         [obj, method](A... a) -> R { return (obj->*method)(std::forward<A>(a)...); });
}

/// Wraps a function object returning std::future<R>.
template <typename F>
Callable make_async_callable(std::string name, F f)
{
    using traits = detail::function_traits<std::decay_t<F>>;
    using binder = detail::Binder<std::decay_t<F>, typename traits::args>;
    static_assert(detail::is_future<typename traits::result>::value,
                  "make_async_callable expects a function returning std::future");

    Signature sig;
    sig.name = std::move(name);
    sig.params = binder::params();
    auto shared = std::make_shared<std::decay_t<F>>(std::move(f));
    return Callable(std::move(sig), Callable::AsyncInvoker{
                                        [shared](const Signature& s, const Json& args)
                                        { return binder::call_async(*shared, s, args); }});
}

} // namespace llmtools::tools
