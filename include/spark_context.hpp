#ifndef SPARKBRIDGE_SPARK_CONTEXT_HPP
#define SPARKBRIDGE_SPARK_CONTEXT_HPP

#include "common.hpp"
#include "broadcast.hpp"
#include "engine.hpp"
#include "serializer.hpp"
#include "spark_config.hpp"
#include "stager.hpp"
#include "rdd/rdd.hpp"
#include "scheduler/job_dispatcher.hpp"
#include "utils/logging.hpp"

/// Per-call overrides for data sources. Unset fields fall back to the
/// context configuration.
struct SourceOptions {
    optional<string> serializer;
    optional<size_t> batchSize;
    /// Nested serializers, for `pair`.
    vector<SerializerDesc> children;
    optional<StageStrategy> strategy;
};

/// Releases an engine dataset when the scope that created it ends.
struct ScopedDataset {
    Engine& engine;
    DatasetRef ref;

    ScopedDataset(Engine& e, DatasetRef r) : engine{e}, ref{r} {}
    ScopedDataset(const ScopedDataset&) = delete;
    ScopedDataset& operator=(const ScopedDataset&) = delete;
    ~ScopedDataset() {
        engine.release(ref);
    }
};

constexpr const char* callSiteKey = "externalCallSite";

/// Local properties of every thread that set one, keyed by a token unique
/// to the thread's lifetime. A thread's entries are erased when it exits.
using PropertyStore = concurrent_hash_map<uint64_t, LocalProperties>;

/// Driver side of a session with an engine. Owns the engine connection, the
/// frozen configuration, a private temp directory for staging and the
/// local-property store.
struct SparkContext {
    const SparkConfig conf;
    shared_ptr<Engine> engine;
    fs::path tempDir;
    atomic<bool> stopped{false};
    atomic<size_t> nextStageFile{0};
    LocalProperties defaultProperties;
    shared_ptr<PropertyStore> threadProperties = make_shared<PropertyStore>();
    JobDispatcher dispatcher;

    SparkContext(SparkConfig config, shared_ptr<Engine> e);
    SparkContext(const SparkContext&) = delete;
    SparkContext& operator=(const SparkContext&) = delete;
    ~SparkContext();

    /// Stops the engine and removes the temp directory. A second call throws
    /// `ContextError`.
    void stop();
    bool isStopped() const {
        return stopped.load();
    }
    /// Throws `ContextError` once the context is stopped.
    void ensureActive(const char* operation) const;

    const SparkConfig& config() const {
        return conf;
    }
    size_t defaultParallelism() const;

    /// Resolves a serializer by name, falling back to the configured default
    /// name and batch size.
    SerializerDesc getSerializer(const optional<string>& name = boost::none,
                                 const optional<size_t>& batchSize = boost::none,
                                 vector<SerializerDesc> children = {}) const;

    // local properties, per calling thread
    void setLocalProperty(const string& key, string value);
    optional<string> getLocalProperty(const string& key) const;
    /// Drops the calling thread's value, the context-wide default (if any)
    /// shows through again.
    void clearLocalProperty(const string& key);
    void setCallSite(string site) {
        setLocalProperty(callSiteKey, move(site));
    }
    optional<string> getCallSite() const {
        return getLocalProperty(callSiteKey);
    }
    /// Defaults overlaid with the calling thread's values.
    LocalProperties localProperties() const;

    /// Stages `data` into `numSlices` partitions (default
    /// `defaultParallelism()`). Element order is kept across partitions.
    template <typename T>
    RDD<T> parallelize(vector<T> data, optional<size_t> numSlices = boost::none,
                       const SourceOptions& options = {});

    /// Materializes any range in iteration order, then stages it.
    template <typename R, typename T = range_value_t<R>,
              typename = std::enable_if_t<!is_vector_v<R>>>
    RDD<T> parallelize(const R& range, optional<size_t> numSlices = boost::none,
                       const SourceOptions& options = {}) {
        vector<T> data(std::begin(range), std::end(range));
        return parallelize<T>(move(data), numSlices, options);
    }

    /// One string per line of the file, or of every file in a directory.
    /// `minPartitions` defaults to `defaultParallelism()`.
    RDD<string> textFile(const fs::path& path, optional<size_t> minPartitions = boost::none,
                         const SourceOptions& options = {});
    /// One (path, content) pair per file of a directory.
    RDD<pair<string, string>> wholeTextFiles(const fs::path& path, optional<size_t> minPartitions = boost::none,
                                             const SourceOptions& options = {});

    /// Applies `f` to every element of the selected partitions and returns
    /// one vector per selected partition, in the order requested.
    template <typename T, typename F>
    auto runJob(const RDD<T>& rdd, F f, const PartitionList& partitions = boost::none, bool allowLocal = false)
        -> vector<vector<stage_output_t<StageKind::Map, T, F>>>;

    /// As `runJob`, with the stage kind chosen by the caller and `args`
    /// handed to `f` after the element (or partition iterator).
    template <StageKind K, typename T, typename F, typename... Args>
    auto runJobWithCommand(const RDD<T>& rdd, const PartitionList& partitions, bool allowLocal,
                           F f, Args&&... args)
        -> vector<vector<stage_output_t<K, T, F, decay_t<Args>...>>>;

    template <typename T>
    vector<T> collect(const RDD<T>& rdd);

    template <typename T>
    Broadcast<T> broadcast(T value, optional<size_t> id = boost::none) {
        ensureActive("broadcast");
        vector<char> bytes;
        serialize(value, bytes);
        size_t assigned = engine->broadcast(move(bytes), id);
        SPARKBRIDGE_LOG_DEBUG("registered broadcast {}", assigned);
        return Broadcast<T>{assigned, move(value)};
    }

    template <typename... Paths>
    void addFile(const Paths&... paths) {
        ensureActive("addFile");
        (engine->addFile(fs::path{paths}), ...);
    }

    /// Wraps an engine dataset produced by a pipeline.
    template <typename U>
    RDD<U> pipelined(DatasetRef source, Command command);
};

/// Validates `config` (`ConfigError`, nothing created) and opens a context
/// on `engine`.
unique_ptr<SparkContext> createContext(SparkConfig config, shared_ptr<Engine> engine);
/// As above, on a `LocalEngine` built from `config`.
unique_ptr<SparkContext> createContext(SparkConfig config);


// HACK: weird solution for circular import dependency
template <typename T>
template <StageKind K, typename F, typename... Args>
auto RDD<T>::newRddFromCommand(F f, Args&&... args) const -> RDD<stage_output_t<K, T, F, decay_t<Args>...>> {
    using U = stage_output_t<K, T, F, decay_t<Args>...>;
    auto stage = makeStage<K, T>(f, forward<Args>(args)...);
    auto base = command.is_initialized() ? command.value() : Command{deserializer, serializer};
    auto fused = base.then(move(stage));
    fused.serializer = carrierFor<U>(serializer);
    return sc.template pipelined<U>(source, move(fused));
}

template <typename T>
vector<T> RDD<T>::collect() const {
    return sc.collect(*this);
}

template <typename U>
RDD<U> SparkContext::pipelined(DatasetRef source, Command command) {
    ensureActive("pipeline");
    auto ref = engine->pipeline(source, command.encode());
    size_t n = engine->numPartitions(ref);
    auto output = command.serializer;
    return RDD<U>{*this, ref, output, output, move(command), source, n};
}

template <typename T>
RDD<T> SparkContext::parallelize(vector<T> data, optional<size_t> numSlices, const SourceOptions& options) {
    ensureActive("parallelize");
    size_t slices = numSlices.value_or(defaultParallelism());
    if (slices == 0) {
        throw ContextError{"number of slices must be at least 1"};
    }
    auto desc = getSerializer(options.serializer, options.batchSize, options.children);
    // slicing is per frame, keep batches small enough that every slice gets one
    desc.batchSize = std::max<size_t>(1, std::min(desc.batchSize, data.size() / slices));
    // fails here, before anything is staged, when `desc` cannot carry `T`
    auto codec = makeSerializer<T>(desc);
    auto stager = makeStager(options.strategy.value_or(conf.stageStrategy()), *engine, tempDir, nextStageFile);
    auto ref = stager->stage([&](FrameSink& sink) {
        codec->dump(data, sink);
    }, slices);
    SPARKBRIDGE_LOG_DEBUG("parallelized {} elements into dataset {} with {}", data.size(), ref.id, desc.toString());
    return RDD<T>{*this, ref, desc, desc, boost::none, ref, engine->numPartitions(ref)};
}

template <typename T, typename F>
auto SparkContext::runJob(const RDD<T>& rdd, F f, const PartitionList& partitions, bool allowLocal)
    -> vector<vector<stage_output_t<StageKind::Map, T, F>>> {
    return runJobWithCommand<StageKind::Map>(rdd, partitions, allowLocal, f);
}

template <StageKind K, typename T, typename F, typename... Args>
auto SparkContext::runJobWithCommand(const RDD<T>& rdd, const PartitionList& partitions, bool allowLocal,
                                     F f, Args&&... args)
    -> vector<vector<stage_output_t<K, T, F, decay_t<Args>...>>> {
    using U = stage_output_t<K, T, F, decay_t<Args>...>;
    ensureActive("runJob");
    auto valid = resolvePartitions(partitions, rdd.partitionsSize());
    if (valid.empty()) {
        SPARKBRIDGE_LOG_DEBUG("no valid partitions requested on dataset {}, nothing to run", rdd.id());
        return {};
    }
    auto piped = rdd.template newRddFromCommand<K>(f, forward<Args>(args)...);
    ScopedDataset jobDataset{*engine, piped.ref};
    return dispatcher.submit<U>(piped.ref, valid, allowLocal, *piped.decoder, localProperties());
}

template <typename T>
vector<T> SparkContext::collect(const RDD<T>& rdd) {
    ensureActive("collect");
    auto all = resolvePartitions(boost::none, rdd.partitionsSize());
    if (all.empty()) {
        return {};
    }
    return flatten(dispatcher.submit<T>(rdd.ref, all, false, *rdd.decoder, localProperties()));
}

#endif //SPARKBRIDGE_SPARK_CONTEXT_HPP
