#ifndef SPARKBRIDGE_ITERATOR_HPP
#define SPARKBRIDGE_ITERATOR_HPP

#include "common.hpp"

struct IterBase {
    virtual ~IterBase() = default;
};

/// Pull-based stream of partition elements. `next` yields `boost::none` once
/// exhausted.
template <typename T>
struct Iterator : IterBase {
    virtual optional<T> next() = 0;
    virtual bool hasNext() = 0;
    vector<T> collect() {
        vector<T> res;
        for (auto v = next(); v.is_initialized(); v = next()) {
            res.push_back(move(v.value()));
        }
        return res;
    }
};

/// Owns its elements, hands them out by move.
template <typename T>
struct OwnIterator : Iterator<T> {
    vector<T> data;
    size_t pos = 0;
    OwnIterator(vector<T> data_) : data{move(data_)} {}
    optional<T> next() override {
        if (pos == data.size()) {
            return {};
        }
        return move(data[pos++]);
    }
    bool hasNext() override {
        return pos != data.size();
    }
};

template <typename T, typename U, typename F>
struct MapIterator : Iterator<U> {
    unique_ptr<Iterator<T>> prev;
    F func;
    MapIterator(unique_ptr<Iterator<T>> prev, F func)
        : prev{move(prev)}, func{move(func)} {}
    optional<U> next() override {
        auto s = prev->next();
        if (!s.is_initialized()) {
            return {};
        }
        return static_cast<U>(invoke(func, move(s.value())));
    }
    bool hasNext() override {
        return prev->hasNext();
    }
};

// F: T -> vector<U>
template <typename T, typename U, typename F>
struct FlatMapIterator : Iterator<U> {
    unique_ptr<Iterator<T>> prev;
    F func;
    vector<U> current;
    size_t pos = 0;
    FlatMapIterator(unique_ptr<Iterator<T>> prev, F func)
            : prev{move(prev)}, func{move(func)} {}
    // refill `current` until it has an unread element or `prev` runs dry
    bool fill() {
        while (pos == current.size()) {
            auto s = prev->next();
            if (!s.is_initialized()) {
                return false;
            }
            current = invoke(func, move(s.value()));
            pos = 0;
        }
        return true;
    }
    optional<U> next() override {
        if (!fill()) {
            return {};
        }
        return move(current[pos++]);
    }
    bool hasNext() override {
        return fill();
    }
};

template <typename T, typename F>
struct FilterIterator : Iterator<T> {
    unique_ptr<Iterator<T>> prev;
    F func;
    optional<T> temp;
    FilterIterator(unique_ptr<Iterator<T>> prev, F func)
            : prev{move(prev)}, func{move(func)} {}
    bool fill() {
        while (!temp.is_initialized()) {
            auto s = prev->next();
            if (!s.is_initialized()) {
                return false;
            }
            if (invoke(func, static_cast<const T&>(s.value()))) {
                temp = move(s);
            }
        }
        return true;
    }
    optional<T> next() override {
        if (!fill()) {
            return {};
        }
        optional<T> u{move(temp)};
        temp = boost::none;
        return u;
    }
    bool hasNext() override {
        return fill();
    }
};

#endif //SPARKBRIDGE_ITERATOR_HPP
