#ifndef SPARKBRIDGE_TRAITS_HPP
#define SPARKBRIDGE_TRAITS_HPP

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

template <typename T>
struct is_pair : std::false_type {};

template <typename K, typename V>
struct is_pair<std::pair<K, V>> : std::true_type {};

template <typename T>
constexpr bool is_pair_v = is_pair<T>::value;

template <typename T>
constexpr bool is_string_v = std::is_same_v<std::decay_t<T>, std::string>;

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
constexpr bool is_vector_v = is_vector<std::decay_t<T>>::value;

/// Element type of whatever `std::begin` yields on a const `R`.
template <typename R>
using range_value_t = std::decay_t<decltype(*std::begin(std::declval<const R&>()))>;

#endif //SPARKBRIDGE_TRAITS_HPP
