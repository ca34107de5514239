#include "stager.hpp"
#include "utils/temp_file.hpp"

#include <fstream>

DatasetRef FileStager::stage(const FrameWriter& write, size_t slices) {
    TempFile staged{dir / fmt::format("to_parallelize.{}", counter.fetch_add(1))};
    {
        std::ofstream out{staged.path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw ContextError{fmt::format("cannot create staging file {}", staged.path.string())};
        }
        StreamFrameSink sink{out};
        write(sink);
        out.close();
        if (!out) {
            throw ContextError{fmt::format("cannot close staging file {}", staged.path.string())};
        }
    }
    SPARKBRIDGE_LOG_DEBUG("staged frames in {}", staged.path.string());
    return engine.readRDDFromFile(staged.path, slices);
}

DatasetRef DirectStager::stage(const FrameWriter& write, size_t slices) {
    FrameList frames;
    write(frames);
    SPARKBRIDGE_LOG_DEBUG("staged {} frames in memory", frames.frames.size());
    return engine.parallelizeFrames(move(frames.frames), slices);
}

unique_ptr<PartitionStager> makeStager(StageStrategy strategy, Engine& engine,
                                       const fs::path& tempDir, atomic<size_t>& counter) {
    switch (strategy) {
        case StageStrategy::File:
            return make_unique<FileStager>(engine, tempDir, counter);
        case StageStrategy::Direct:
            return make_unique<DirectStager>(engine);
    }
    throw ContextError{"unknown staging strategy"};
}
