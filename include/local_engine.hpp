#ifndef SPARKBRIDGE_LOCAL_ENGINE_HPP
#define SPARKBRIDGE_LOCAL_ENGINE_HPP

#include "common.hpp"
#include "command.hpp"
#include "engine.hpp"
#include "spark_config.hpp"
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <deque>

struct LocalEngineOptions {
    size_t threads = 1;
    size_t parallelism = 1;
    fs::path localDir;
    /// Most recent jobs kept for `jobs()`.
    size_t jobHistory = 64;

    /// Reads `spark.master` (`local`, `local[N]`, `local[*]`),
    /// `spark.default.parallelism` and `spark.local.dir`.
    /// Throws `ConfigError` for a master this engine cannot run.
    static LocalEngineOptions fromConfig(const SparkConfig& config);
};

/// Partitions as concatenated length-prefixed frames.
struct SourceDataset {
    vector<vector<char>> partitions;
};

struct PipelinedDataset {
    DatasetRef parent;
    Command command;
    size_t numPartitions;
};

using Dataset = variant<SourceDataset, PipelinedDataset>;

struct TaskEndReason {
    struct Success {};
    struct Error {
        string reason;
    };
    variant<Success, Error> vmember;
    auto& get() {
        return vmember;
    }
    const auto& get() const {
        return vmember;
    }
};

struct CompletionEvent {
    size_t partition = 0;
    TaskEndReason reason;
    vector<char> result;
};

/// Drains `total` completion events of one job, in completion order.
/// A failed task surfaces as `EngineError`.
struct JobResultIterator : Iterator<PartitionResult> {
    shared_ptr<BlockingConcurrentQueue<CompletionEvent>> events;
    size_t remaining;

    JobResultIterator(shared_ptr<BlockingConcurrentQueue<CompletionEvent>> q, size_t total)
        : events{move(q)}, remaining{total} {}

    optional<PartitionResult> next() override;
    bool hasNext() override {
        return remaining != 0;
    }
};

struct JobRecord {
    size_t jobId;
    DatasetRef dataset;
    vector<size_t> partitions;
    bool allowLocal;
    LocalProperties properties;
};

/// Slice `i` of `n` holds frames `[i * len / n, (i + 1) * len / n)`.
vector<vector<char>> sliceFrames(const vector<vector<char>>& frames, size_t slices);

/// In-process engine: datasets live in memory, tasks run on a thread pool.
struct LocalEngine : Engine {
    LocalEngineOptions options;
    atomic<size_t> nextDatasetId{0};
    atomic<size_t> nextJobId{0};
    atomic<size_t> nextBroadcastId{0};
    atomic<bool> stopped{false};
    concurrent_hash_map<size_t, shared_ptr<const Dataset>> datasets;
    concurrent_hash_map<size_t, vector<char>> broadcasts;
    mutable mutex jobsLock;
    std::deque<JobRecord> jobLog;
    boost::asio::thread_pool pool;

    explicit LocalEngine(LocalEngineOptions opts);
    ~LocalEngine() override;

    size_t defaultParallelism() const override {
        return options.parallelism;
    }
    fs::path localDir() const override {
        return options.localDir;
    }

    DatasetRef readRDDFromFile(const fs::path& path, size_t slices) override;
    DatasetRef parallelizeFrames(vector<vector<char>> frames, size_t slices) override;
    DatasetRef textFile(const fs::path& path, size_t minPartitions) override;
    DatasetRef wholeTextFiles(const fs::path& path, size_t minPartitions) override;
    DatasetRef pipeline(DatasetRef parent, const vector<char>& command) override;
    size_t numPartitions(DatasetRef dataset) const override;
    void release(DatasetRef dataset) override;

    unique_ptr<Iterator<PartitionResult>> runJob(
            DatasetRef dataset, const vector<size_t>& partitions,
            bool allowLocal, const LocalProperties& properties) override;

    size_t broadcast(vector<char> bytes, optional<size_t> id) override;
    void addFile(const fs::path& path) override;
    void stop() override;

    /// Bytes registered under a broadcast id.
    vector<char> broadcastValue(size_t id) const;
    /// Where `addFile` put a file of that name.
    fs::path sparkFile(const string& name) const;
    /// The last `options.jobHistory` jobs, oldest first.
    vector<JobRecord> jobs() const;

    shared_ptr<const Dataset> find(DatasetRef dataset) const;
    DatasetRef store(Dataset dataset);
    /// Encoded frames of one partition, running pipelines recursively.
    vector<char> compute(const Dataset& dataset, size_t partition) const;
    void ensureRunning(const char* operation) const;
};

#endif //SPARKBRIDGE_LOCAL_ENGINE_HPP
