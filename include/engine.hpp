#ifndef SPARKBRIDGE_ENGINE_HPP
#define SPARKBRIDGE_ENGINE_HPP

#include "common.hpp"
#include "iterator.hpp"
#include "serializer.hpp"

/// Opaque reference to a dataset living in the engine.
struct DatasetRef {
    size_t id = 0;

    bool operator==(const DatasetRef& rhs) const {
        return id == rhs.id;
    }
};

/// Serialized frames of one computed partition.
struct PartitionResult {
    size_t partition = 0;
    vector<char> bytes;
};

using LocalProperties = map<string, string>;

/// Codec of the records `Engine::textFile` produces.
inline SerializerDesc textFileDesc() {
    return SerializerDesc{SerializerKind::Utf8, 1, {}};
}

/// Codec of the (path, content) records `Engine::wholeTextFiles` produces.
inline SerializerDesc wholeTextFilesDesc() {
    return SerializerDesc{SerializerKind::Pair, 1, {textFileDesc(), textFileDesc()}};
}

/// Everything the driver needs from the execution engine. Every failure is
/// reported as `EngineError`.
struct Engine {
    virtual ~Engine() = default;

    virtual size_t defaultParallelism() const = 0;
    /// Scratch directory the driver may create its temp dir in.
    virtual fs::path localDir() const = 0;

    /// Ingests a file of length-prefixed frames, cut into `slices`
    /// contiguous partitions at frame granularity.
    virtual DatasetRef readRDDFromFile(const fs::path& path, size_t slices) = 0;
    virtual DatasetRef parallelizeFrames(vector<vector<char>> frames, size_t slices) = 0;
    /// One utf8 record per line.
    virtual DatasetRef textFile(const fs::path& path, size_t minPartitions) = 0;
    /// One pair(utf8, utf8) record (path, content) per file.
    virtual DatasetRef wholeTextFiles(const fs::path& path, size_t minPartitions) = 0;
    /// Lazily describes `parent` with an encoded `Command` applied to each
    /// partition.
    virtual DatasetRef pipeline(DatasetRef parent, const vector<char>& command) = 0;
    virtual size_t numPartitions(DatasetRef dataset) const = 0;
    /// Forgets a dataset the driver no longer references. Unknown ids are
    /// ignored; never throws.
    virtual void release(DatasetRef dataset) = 0;

    /// Results are yielded in completion order, not partition order.
    virtual unique_ptr<Iterator<PartitionResult>> runJob(
            DatasetRef dataset, const vector<size_t>& partitions,
            bool allowLocal, const LocalProperties& properties) = 0;

    /// Registers a serialized value, returns its id.
    virtual size_t broadcast(vector<char> bytes, optional<size_t> id) = 0;
    virtual void addFile(const fs::path& path) = 0;
    virtual void stop() = 0;
};

#endif //SPARKBRIDGE_ENGINE_HPP
