#ifndef SPARKBRIDGE_COMMAND_REGISTRY_HPP
#define SPARKBRIDGE_COMMAND_REGISTRY_HPP

#include <typeinfo>

#include "common.hpp"
#include "command.hpp"
#include "iterator.hpp"
#include "serializer.hpp"

/// Engine-side half of a stage: knows the element types the stage was
/// built for, so it can decode its input, run the function and encode its
/// output without the driver's closure.
struct StageRunnerBase {
    virtual ~StageRunnerBase() = default;
    virtual unique_ptr<IterBase> decode(const SerializerDesc& desc, const vector<char>& bytes) const = 0;
    virtual unique_ptr<IterBase> apply(unique_ptr<IterBase> input, const vector<char>& args) const = 0;
    virtual vector<char> encode(const SerializerDesc& desc, unique_ptr<IterBase> output) const = 0;
};

template <StageKind K, typename T, typename F, typename... Args>
struct StageOutput;

template <typename T, typename F, typename... Args>
struct StageOutput<StageKind::Map, T, F, Args...> {
    using type = decay_t<std::invoke_result_t<F, T, const Args&...>>;
};

template <typename T, typename F, typename... Args>
struct StageOutput<StageKind::FlatMap, T, F, Args...> {
    using type = typename decay_t<std::invoke_result_t<F, T, const Args&...>>::value_type;
};

template <typename T, typename F, typename... Args>
struct StageOutput<StageKind::Filter, T, F, Args...> {
    static_assert(std::is_convertible_v<std::invoke_result_t<F, const T&, const Args&...>, bool>,
                  "filter functions must return bool");
    using type = T;
};

template <typename T, typename F, typename... Args>
struct StageOutput<StageKind::MapPartitions, T, F, Args...> {
    using type = typename decay_t<std::invoke_result_t<F, unique_ptr<Iterator<T>>, const Args&...>>::value_type;
};

template <StageKind K, typename T, typename F, typename... Args>
using stage_output_t = typename StageOutput<K, T, F, Args...>::type;

/// `F` is capture-free, so the engine side rebuilds it with `F{}`;
/// captured state travels in `Args`.
template <StageKind K, typename T, typename U, typename F, typename... Args>
struct StageRunner : StageRunnerBase {
    using ArgTuple = tuple<Args...>;

    unique_ptr<IterBase> decode(const SerializerDesc& desc, const vector<char>& bytes) const override {
        return make_unique<OwnIterator<T>>(makeSerializer<T>(desc)->load(bytes));
    }

    unique_ptr<IterBase> apply(unique_ptr<IterBase> input, const vector<char>& args) const override {
        auto iter = dynamic_unique_ptr_cast<Iterator<T>>(move(input));
        if (!iter) {
            throw EngineError{fmt::format("{} stage received input of the wrong element type, expected {}",
                                          stageKindName(K), typeid(T).name())};
        }
        ArgTuple captured;
        if constexpr (sizeof...(Args) > 0) {
            try {
                deserialize(captured, args.data(), args.size());
            } catch (const std::exception& e) {
                throw EngineError{fmt::format("could not decode stage arguments: {}", e.what())};
            }
        }
        auto bound = [captured = move(captured)](auto&& x) {
            return std::apply([&](const Args&... as) {
                return invoke(F{}, forward<decltype(x)>(x), as...);
            }, captured);
        };
        if constexpr (K == StageKind::Map) {
            return make_unique<MapIterator<T, U, decltype(bound)>>(move(iter), move(bound));
        } else if constexpr (K == StageKind::FlatMap) {
            return make_unique<FlatMapIterator<T, U, decltype(bound)>>(move(iter), move(bound));
        } else if constexpr (K == StageKind::Filter) {
            return make_unique<FilterIterator<T, decltype(bound)>>(move(iter), move(bound));
        } else {
            return make_unique<OwnIterator<U>>(bound(move(iter)));
        }
    }

    vector<char> encode(const SerializerDesc& desc, unique_ptr<IterBase> output) const override {
        auto iter = dynamic_unique_ptr_cast<Iterator<U>>(move(output));
        if (!iter) {
            throw EngineError{fmt::format("{} stage produced output of an unexpected element type", stageKindName(K))};
        }
        vector<char> bytes;
        FrameBuffer sink{bytes};
        makeSerializer<U>(desc)->dump(iter->collect(), sink);
        return bytes;
    }
};

/// Process-wide table of stage runners keyed by function id. Stages
/// register themselves when the driver builds them; the engine looks them
/// up when it runs a command.
struct CommandRegistry {
    mutable shared_mutex lck;
    unordered_map<string, shared_ptr<const StageRunnerBase>> runners;

    static CommandRegistry& instance();

    void add(const string& id, shared_ptr<const StageRunnerBase> runner);
    /// Throws `EngineError` for an unknown id.
    shared_ptr<const StageRunnerBase> get(const string& id) const;
    bool contains(const string& id) const;
};

/// Wraps `f` and its captured `args` into a stage reading elements of type
/// `T`, registering the engine-side runner on the way.
template <StageKind K, typename T, typename F, typename... Args>
CommandStage makeStage(F, Args&&... args) {
    static_assert(std::is_empty_v<F> && std::is_default_constructible_v<F>,
                  "stage functions must not capture state, pass it as stage arguments instead");
    using U = stage_output_t<K, T, F, decay_t<Args>...>;
    using Runner = StageRunner<K, T, U, F, decay_t<Args>...>;
    CommandStage stage;
    stage.kind = K;
    stage.function = typeid(Runner).name();
    CommandRegistry::instance().add(stage.function, make_shared<const Runner>());
    if constexpr (sizeof...(Args) > 0) {
        tuple<decay_t<Args>...> captured{forward<Args>(args)...};
        serialize(captured, stage.args);
    }
    return stage;
}

/// Runs a decoded command over one partition's frames and returns the
/// encoded output frames. An empty command returns the input unchanged.
vector<char> runCommand(const Command& command, const vector<char>& input);

#endif //SPARKBRIDGE_COMMAND_REGISTRY_HPP
