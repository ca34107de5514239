#include "scheduler/job_dispatcher.hpp"

vector<size_t> resolvePartitions(const PartitionList& requested, size_t numPartitions) {
    vector<size_t> valid;
    if (!requested.is_initialized()) {
        valid.resize(numPartitions);
        std::iota(valid.begin(), valid.end(), 0);
        return valid;
    }
    for (auto p : requested.value()) {
        if (p < 0) {
            throw ContextError{fmt::format("partition index {} is negative", p)};
        }
    }
    for (auto p : requested.value()) {
        if (static_cast<size_t>(p) < numPartitions) {
            valid.push_back(static_cast<size_t>(p));
        } else {
            SPARKBRIDGE_LOG_DEBUG("dropping partition {}, handle has {}", p, numPartitions);
        }
    }
    return valid;
}
