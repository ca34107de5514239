#ifndef SPARKBRIDGE_JOB_DISPATCHER_HPP
#define SPARKBRIDGE_JOB_DISPATCHER_HPP

#include "common.hpp"
#include "engine.hpp"
#include "serializer.hpp"
#include "utils/logging.hpp"

/// `boost::none` selects every partition.
using PartitionList = optional<vector<int64_t>>;

/// Checks a requested partition list against a handle with `numPartitions`
/// partitions. Negative indices throw `ContextError`; indices past the end
/// are dropped. Order and repeats are kept.
vector<size_t> resolvePartitions(const PartitionList& requested, size_t numPartitions);

/// Submits jobs to the engine and drains their results.
struct JobDispatcher {
    Engine& engine;
    atomic<size_t> submitted{0};

    explicit JobDispatcher(Engine& e) : engine{e} {}

    /// Runs `dataset` on `partitions` and decodes each result with
    /// `decoder`. Entry `i` of the result belongs to `partitions[i]`,
    /// whatever order the engine finishes in. A partition requested more
    /// than once is computed once and copied to each of its positions.
    template <typename U>
    vector<vector<U>> submit(DatasetRef dataset, const vector<size_t>& partitions, bool allowLocal,
                             const Serializer<U>& decoder, const LocalProperties& properties) {
        vector<size_t> distinct;
        unordered_map<size_t, vector<size_t>> outputIds;
        for (size_t i = 0; i < partitions.size(); ++i) {
            auto& ids = outputIds[partitions[i]];
            if (ids.empty()) {
                distinct.push_back(partitions[i]);
            }
            ids.push_back(i);
        }
        size_t numOutputParts = distinct.size();
        submitted.fetch_add(1);
        SPARKBRIDGE_LOG_DEBUG("submitting job on dataset {} for {} partitions", dataset.id, numOutputParts);
        auto iter = engine.runJob(dataset, distinct, allowLocal, properties);

        vector<vector<U>> results(partitions.size());
        unordered_set<size_t> finished;
        while (finished.size() != numOutputParts) {
            auto result = iter->next();
            if (!result.is_initialized()) {
                throw EngineError{fmt::format("job on dataset {} ended after {} of {} partitions",
                                              dataset.id, finished.size(), numOutputParts)};
            }
            auto it = outputIds.find(result->partition);
            if (it == outputIds.end() || !finished.insert(result->partition).second) {
                throw EngineError{fmt::format("engine returned unexpected partition {}", result->partition)};
            }
            auto decoded = decoder.load(result->bytes);
            const auto& ids = it->second;
            for (size_t k = 0; k + 1 < ids.size(); ++k) {
                results[ids[k]] = decoded;
            }
            results[ids.back()] = move(decoded);
        }
        return results;
    }
};

#endif //SPARKBRIDGE_JOB_DISPATCHER_HPP
