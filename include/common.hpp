#ifndef SPARKBRIDGE_COMMON_HPP
#define SPARKBRIDGE_COMMON_HPP

#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstddef>

#include <atomic>

using std::atomic;

#include <vector>
#include <array>
#include <utility>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <tuple>

using std::array;
using std::pair;
using std::vector;
using std::string;
using std::map;
using std::unordered_map;
using std::set;
using std::unordered_set;
using std::tuple;

using std::make_pair;
using std::make_tuple;

#include <mutex>
#include <shared_mutex>
#include <thread>

using std::mutex;
using std::shared_mutex;
using std::lock_guard;
using std::shared_lock;
using std::unique_lock;
using std::thread;

#include <memory>

using std::forward;
using std::move;
using std::unique_ptr;
using std::shared_ptr;
using std::make_unique;
using std::make_shared;

#include <functional>

using std::invoke;

#include <filesystem>

namespace fs = std::filesystem;

#include <iostream>
#include <algorithm>
#include <numeric>
#include <type_traits>

using std::decay_t;

#include <chrono>

using namespace std::chrono_literals;


#include "utils/utils.hpp"


#include "concurrentqueue/blockingconcurrentqueue.h"

using moodycamel::BlockingConcurrentQueue;

#include "parallel_hashmap/phmap.h"

using phmap::parallel_flat_hash_map;

/// `parallel_flat_hash_map` whose submaps carry their own mutex,
/// safe for concurrent access from several threads.
template <typename K, typename V>
using concurrent_hash_map = phmap::parallel_flat_hash_map<
        K, V,
        phmap::priv::hash_default_hash<K>,
        phmap::priv::hash_default_eq<K>,
        phmap::priv::Allocator<phmap::priv::Pair<const K, V>>,
        4, std::mutex>;

#include <boost/variant.hpp>
#include <boost/optional.hpp>

using boost::optional;
using boost::variant;

#include <fmt/format.h>

#include "errors.hpp"



#endif //SPARKBRIDGE_COMMON_HPP
