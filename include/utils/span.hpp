#ifndef SPARKBRIDGE_SPAN_HPP
#define SPARKBRIDGE_SPAN_HPP

#include <vector>
#include <iterator>

template <typename T>
std::vector<T> flatten(std::vector<std::vector<T>> v) {
    std::size_t total_size = 0;
    for (const auto& sub : v)
        total_size += sub.size();
    std::vector<T> result;
    result.reserve(total_size);
    for (auto& sub : v)
        result.insert(result.end(),
                      std::make_move_iterator(sub.begin()),
                      std::make_move_iterator(sub.end()));
    return result;
}

#endif //SPARKBRIDGE_SPAN_HPP
