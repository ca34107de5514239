#ifndef SPARKBRIDGE_BROADCAST_HPP
#define SPARKBRIDGE_BROADCAST_HPP

#include "common.hpp"

/// Read-only value registered with the engine under `id()`. The driver keeps
/// its own copy.
template <typename T>
struct Broadcast {
    size_t bid;
    T data;

    Broadcast(size_t id_, T value) : bid{id_}, data{move(value)} {}

    size_t id() const {
        return bid;
    }
    const T& value() const {
        return data;
    }
};

#endif //SPARKBRIDGE_BROADCAST_HPP
