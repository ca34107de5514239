#ifndef SPARKBRIDGE_MATCH_HPP
#define SPARKBRIDGE_MATCH_HPP

#include <utility>
#include <cstdint>
#include <functional>
#include <type_traits>
#include "utils/function_signature.hpp"
#include <boost/variant.hpp>

template <typename ...Args>
struct TypeList {};

template <typename T, typename ST>
struct TypeIndex {
    constexpr static const int value = -1;
};

template <typename ...Args, typename ST>
struct TypeIndex<TypeList<ST, Args...>, ST> {
    constexpr static const int value = 0;
};

template <typename H, typename ...T, typename ST>
struct TypeIndex<TypeList<H, T...>, ST> {
    constexpr static const int value = (TypeIndex<TypeList<T...>, ST>::value == -1) ? -1 : 1 + (TypeIndex<TypeList<T...>, ST>::value);
};

template <typename V, typename F>
struct GetIndex;

template <typename ...Args, typename F>
struct GetIndex<boost::variant<Args...>, F> {
    using arg_t = std::decay_t<typename function_traits<F>::template args<0>::type>;
    constexpr static const int value = TypeIndex<TypeList<Args...>, arg_t>::value;
    static_assert(value != -1, "handler argument is not an alternative of the variant");
};

template <typename VT, typename F, typename R = typename function_traits<F>::result_type>
R match(VT& v, F&& f) {
    using T = typename GetIndex<std::remove_const_t<VT>, std::decay_t<F>>::arg_t;
    return std::invoke(std::forward<F>(f), boost::get<T>(v));
}

/// Dispatch on the active alternative, first handler whose argument type
/// matches wins. The last handler is taken unchecked (`boost::bad_get` if
/// no handler matches).
template <typename VT, typename F, typename ...Fs, typename R = typename function_traits<F>::result_type>
R match(VT& v, F&& f, Fs&&... fs) {
    using GI = GetIndex<std::remove_const_t<VT>, std::decay_t<F>>;
    using T = typename GI::arg_t;
    if (v.which() == GI::value) {
        return std::invoke(std::forward<F>(f), boost::get<T>(v));
    }
    return match(v, std::forward<Fs>(fs)...);
}

#endif //SPARKBRIDGE_MATCH_HPP
