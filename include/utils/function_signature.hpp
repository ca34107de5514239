#ifndef SPARKBRIDGE_FUNCTION_SIGNATURE_HPP
#define SPARKBRIDGE_FUNCTION_SIGNATURE_HPP

#include <cstddef>
#include <functional>
#include <tuple>
#include <type_traits>

/// Signature of a non-generic callable: result type and argument types.
/// Generic lambdas have no single `operator()` and are not supported.
template <typename T>
struct function_traits;

template <typename R, typename... Args>
struct function_traits<R(Args...)> {
    static constexpr std::size_t args_size = sizeof...(Args);
    using result_type = R;

    template <std::size_t I>
    struct args {
        using type = std::tuple_element_t<I, std::tuple<Args...>>;
    };
};

template <typename R, typename... Args>
struct function_traits<R(*)(Args...)> : function_traits<R(Args...)> {};

template <typename R, typename C, typename... Args>
struct function_traits<R(C::*)(Args...)> : function_traits<R(Args...)> {};

template <typename R, typename C, typename... Args>
struct function_traits<R(C::*)(Args...) const> : function_traits<R(Args...)> {};

template <typename R, typename... Args>
struct function_traits<std::function<R(Args...)>> : function_traits<R(Args...)> {};

// lambda / functor
template <typename F>
struct function_traits : function_traits<decltype(&std::decay_t<F>::operator())> {};

#endif //SPARKBRIDGE_FUNCTION_SIGNATURE_HPP
