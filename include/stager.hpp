#ifndef SPARKBRIDGE_STAGER_HPP
#define SPARKBRIDGE_STAGER_HPP

#include "common.hpp"
#include "engine.hpp"
#include "serializer.hpp"
#include "spark_config.hpp"

/// Writes every frame of a staged collection into the sink it is given.
using FrameWriter = std::function<void(FrameSink&)>;

/// Hands a locally encoded collection to the engine as a partitioned dataset.
struct PartitionStager {
    Engine& engine;

    explicit PartitionStager(Engine& e) : engine{e} {}
    virtual ~PartitionStager() = default;

    virtual DatasetRef stage(const FrameWriter& write, size_t slices) = 0;
};

/// Encodes into a uniquely named file under `dir`, hands the path to the
/// engine and removes the file once the engine call returns or throws.
struct FileStager : PartitionStager {
    fs::path dir;
    atomic<size_t>& counter;

    FileStager(Engine& e, fs::path d, atomic<size_t>& c)
        : PartitionStager{e}, dir{move(d)}, counter{c} {}

    DatasetRef stage(const FrameWriter& write, size_t slices) override;
};

/// Encodes into memory, no file involved.
struct DirectStager : PartitionStager {
    using PartitionStager::PartitionStager;

    DatasetRef stage(const FrameWriter& write, size_t slices) override;
};

unique_ptr<PartitionStager> makeStager(StageStrategy strategy, Engine& engine,
                                       const fs::path& tempDir, atomic<size_t>& counter);

#endif //SPARKBRIDGE_STAGER_HPP
