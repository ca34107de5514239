#include "local_engine.hpp"
#include "command_registry.hpp"

#include <fstream>
#include <iterator>

namespace {

/// Runs `f`, reporting anything it throws as `EngineError`.
template <typename F>
auto engineCall(const char* operation, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const EngineError&) {
        throw;
    } catch (const std::exception& e) {
        throw EngineError{fmt::format("{} failed: {}", operation, e.what())};
    }
}

string readWholeFile(const fs::path& path) {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw EngineError{fmt::format("cannot open {}", path.string())};
    }
    string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw EngineError{fmt::format("error while reading {}", path.string())};
    }
    return content;
}

// hadoop-style: `_SUCCESS`, `.crc` and friends are not data
bool isHidden(const fs::path& path) {
    auto name = path.filename().string();
    return name.empty() || name[0] == '.' || name[0] == '_';
}

/// `path` itself when it is a file, else the visible regular files
/// directly inside it, in path order.
vector<fs::path> listInputFiles(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw EngineError{fmt::format("input path {} does not exist", path.string())};
    }
    if (fs::is_regular_file(status)) {
        return {path};
    }
    if (!fs::is_directory(status)) {
        throw EngineError{fmt::format("input path {} is neither a file nor a directory", path.string())};
    }
    vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator{path}) {
        if (entry.is_regular_file() && !isHidden(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

void splitLines(const string& content, vector<string>& lines) {
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == string::npos) {
            end = content.size();
        }
        size_t stop = end;
        if (stop > start && content[stop - 1] == '\r') {
            --stop;
        }
        lines.emplace_back(content, start, stop - start);
        start = end + 1;
    }
}

}

LocalEngineOptions LocalEngineOptions::fromConfig(const SparkConfig& config) {
    LocalEngineOptions opts;
    auto master = config.master();
    if (master == "local") {
        opts.threads = 1;
    } else if (master.size() > 7 && master.compare(0, 6, "local[") == 0 && master.back() == ']') {
        auto inner = master.substr(6, master.size() - 7);
        if (inner == "*") {
            opts.threads = std::max<size_t>(1, thread::hardware_concurrency());
        } else if (auto n = parsePositive(inner)) {
            opts.threads = n.value();
        } else {
            throw ConfigError{fmt::format("{}: bad thread count in '{}'", config_keys::master, master)};
        }
    } else {
        throw ConfigError{fmt::format("{}: local engine cannot run master '{}'", config_keys::master, master)};
    }
    opts.parallelism = config.defaultParallelism().value_or(opts.threads);
    if (auto dir = config.localDir()) {
        opts.localDir = dir.value();
    } else {
        opts.localDir = fs::temp_directory_path() / "sparkbridge";
    }
    return opts;
}

optional<PartitionResult> JobResultIterator::next() {
    if (remaining == 0) {
        return boost::none;
    }
    CompletionEvent event;
    events->wait_dequeue(event);
    --remaining;
    return match(event.reason.get(),
        [&](const TaskEndReason::Success&) -> optional<PartitionResult> {
            return PartitionResult{event.partition, move(event.result)};
        },
        [&](const TaskEndReason::Error& e) -> optional<PartitionResult> {
            throw EngineError{fmt::format("task for partition {} failed: {}", event.partition, e.reason)};
        });
}

vector<vector<char>> sliceFrames(const vector<vector<char>>& frames, size_t slices) {
    if (slices == 0) {
        throw EngineError{"number of slices must be at least 1"};
    }
    vector<vector<char>> partitions(slices);
    size_t len = frames.size();
    for (size_t i = 0; i < slices; ++i) {
        size_t start = i * len / slices;
        size_t end = (i + 1) * len / slices;
        for (size_t f = start; f < end; ++f) {
            appendFrame(partitions[i], frames[f].data(), frames[f].size());
        }
    }
    return partitions;
}

LocalEngine::LocalEngine(LocalEngineOptions opts)
    : options{move(opts)}, pool{options.threads} {
    std::error_code ec;
    fs::create_directories(options.localDir, ec);
    if (ec) {
        throw EngineError{fmt::format("cannot create local dir {}: {}", options.localDir.string(), ec.message())};
    }
    SPARKBRIDGE_LOG_DEBUG("local engine started with {} threads, parallelism {}, local dir {}",
                          options.threads, options.parallelism, options.localDir.string());
}

LocalEngine::~LocalEngine() {
    pool.join();
}

void LocalEngine::ensureRunning(const char* operation) const {
    if (stopped.load()) {
        throw EngineError{fmt::format("{} called on a stopped engine", operation)};
    }
}

shared_ptr<const Dataset> LocalEngine::find(DatasetRef dataset) const {
    shared_ptr<const Dataset> result;
    datasets.if_contains(dataset.id, [&](const auto& entry) {
        result = entry.second;
    });
    if (!result) {
        throw EngineError{fmt::format("unknown dataset {}", dataset.id)};
    }
    return result;
}

DatasetRef LocalEngine::store(Dataset dataset) {
    DatasetRef ref{nextDatasetId.fetch_add(1)};
    datasets.emplace(ref.id, make_shared<const Dataset>(move(dataset)));
    return ref;
}

DatasetRef LocalEngine::readRDDFromFile(const fs::path& path, size_t slices) {
    ensureRunning("readRDDFromFile");
    return engineCall("readRDDFromFile", [&] {
        auto bytes = readWholeFile(path);
        auto frames = readFrames(bytes.data(), bytes.size());
        auto ref = store(SourceDataset{sliceFrames(frames, slices)});
        SPARKBRIDGE_LOG_DEBUG("dataset {}: {} frames from {} in {} partitions",
                              ref.id, frames.size(), path.string(), slices);
        return ref;
    });
}

DatasetRef LocalEngine::parallelizeFrames(vector<vector<char>> frames, size_t slices) {
    ensureRunning("parallelizeFrames");
    return engineCall("parallelizeFrames", [&] {
        auto ref = store(SourceDataset{sliceFrames(frames, slices)});
        SPARKBRIDGE_LOG_DEBUG("dataset {}: {} in-memory frames in {} partitions", ref.id, frames.size(), slices);
        return ref;
    });
}

DatasetRef LocalEngine::textFile(const fs::path& path, size_t minPartitions) {
    ensureRunning("textFile");
    return engineCall("textFile", [&] {
        vector<string> lines;
        for (const auto& file : listInputFiles(path)) {
            splitLines(readWholeFile(file), lines);
        }
        FrameList frames;
        Utf8Serializer{textFileDesc()}.dump(lines, frames);
        auto ref = store(SourceDataset{sliceFrames(frames.frames, std::max<size_t>(minPartitions, 1))});
        SPARKBRIDGE_LOG_DEBUG("dataset {}: {} lines from {}", ref.id, lines.size(), path.string());
        return ref;
    });
}

DatasetRef LocalEngine::wholeTextFiles(const fs::path& path, size_t minPartitions) {
    ensureRunning("wholeTextFiles");
    return engineCall("wholeTextFiles", [&] {
        vector<pair<string, string>> records;
        for (const auto& file : listInputFiles(path)) {
            records.emplace_back(file.string(), readWholeFile(file));
        }
        FrameList frames;
        makeSerializer<pair<string, string>>(wholeTextFilesDesc())->dump(records, frames);
        auto ref = store(SourceDataset{sliceFrames(frames.frames, std::max<size_t>(minPartitions, 1))});
        SPARKBRIDGE_LOG_DEBUG("dataset {}: {} files from {}", ref.id, records.size(), path.string());
        return ref;
    });
}

DatasetRef LocalEngine::pipeline(DatasetRef parent, const vector<char>& command) {
    ensureRunning("pipeline");
    auto decoded = Command::decode(command.data(), command.size());
    for (const auto& stage : decoded.stages()) {
        if (!CommandRegistry::instance().contains(stage.function)) {
            throw EngineError{fmt::format("{} stage refers to unregistered function '{}'",
                                          stageKindName(stage.kind), stage.function)};
        }
    }
    size_t n = numPartitions(parent);
    auto ref = store(PipelinedDataset{parent, move(decoded), n});
    SPARKBRIDGE_LOG_DEBUG("dataset {}: pipeline over dataset {}", ref.id, parent.id);
    return ref;
}

size_t LocalEngine::numPartitions(DatasetRef dataset) const {
    ensureRunning("numPartitions");
    auto ds = find(dataset);
    return match(*ds,
        [](const SourceDataset& source) -> size_t {
            return source.partitions.size();
        },
        [](const PipelinedDataset& piped) -> size_t {
            return piped.numPartitions;
        });
}

void LocalEngine::release(DatasetRef dataset) {
    if (datasets.erase(dataset.id) != 0) {
        SPARKBRIDGE_LOG_TRACE("released dataset {}", dataset.id);
    }
}

vector<char> LocalEngine::compute(const Dataset& dataset, size_t partition) const {
    return match(dataset,
        [&](const SourceDataset& source) -> vector<char> {
            return source.partitions.at(partition);
        },
        [&](const PipelinedDataset& piped) -> vector<char> {
            auto parent = find(piped.parent);
            return runCommand(piped.command, compute(*parent, partition));
        });
}

unique_ptr<Iterator<PartitionResult>> LocalEngine::runJob(
        DatasetRef dataset, const vector<size_t>& partitions,
        bool allowLocal, const LocalProperties& properties) {
    ensureRunning("runJob");
    auto ds = find(dataset);
    size_t n = numPartitions(dataset);
    for (auto p : partitions) {
        if (p >= n) {
            throw EngineError{fmt::format("partition {} out of range for dataset {} with {} partitions",
                                          p, dataset.id, n)};
        }
    }
    size_t jobId = nextJobId.fetch_add(1);
    {
        lock_guard lk{jobsLock};
        jobLog.push_back(JobRecord{jobId, dataset, partitions, allowLocal, properties});
        while (jobLog.size() > options.jobHistory) {
            jobLog.pop_front();
        }
    }
    SPARKBRIDGE_LOG_DEBUG("job {}: dataset {}, {} partitions, allowLocal={}",
                          jobId, dataset.id, partitions.size(), allowLocal);

    if (allowLocal && partitions.size() == 1) {
        auto bytes = engineCall("local task", [&] {
            return compute(*ds, partitions.front());
        });
        vector<PartitionResult> results;
        results.push_back(PartitionResult{partitions.front(), move(bytes)});
        return make_unique<OwnIterator<PartitionResult>>(move(results));
    }

    auto events = make_shared<BlockingConcurrentQueue<CompletionEvent>>();
    for (auto p : partitions) {
        boost::asio::post(pool, [this, ds, p, events]() {
            CompletionEvent event;
            event.partition = p;
            try {
                event.result = compute(*ds, p);
                event.reason = TaskEndReason{TaskEndReason::Success{}};
            } catch (const std::exception& e) {
                event.reason = TaskEndReason{TaskEndReason::Error{e.what()}};
            }
            events->enqueue(move(event));
        });
    }
    return make_unique<JobResultIterator>(move(events), partitions.size());
}

size_t LocalEngine::broadcast(vector<char> bytes, optional<size_t> id) {
    ensureRunning("broadcast");
    if (id.is_initialized()) {
        if (!broadcasts.try_emplace(id.value(), move(bytes)).second) {
            throw EngineError{fmt::format("broadcast id {} is already registered", id.value())};
        }
        return id.value();
    }
    while (true) {
        size_t candidate = nextBroadcastId.fetch_add(1);
        if (broadcasts.try_emplace(candidate, bytes).second) {
            return candidate;
        }
    }
}

vector<char> LocalEngine::broadcastValue(size_t id) const {
    optional<vector<char>> value;
    broadcasts.if_contains(id, [&](const auto& entry) {
        value = entry.second;
    });
    if (!value.is_initialized()) {
        throw EngineError{fmt::format("unknown broadcast id {}", id)};
    }
    return move(value.value());
}

void LocalEngine::addFile(const fs::path& path) {
    ensureRunning("addFile");
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw EngineError{fmt::format("cannot add {}: no such file", path.string())};
    }
    auto dir = options.localDir / "files";
    fs::create_directories(dir, ec);
    if (ec) {
        throw EngineError{fmt::format("cannot create {}: {}", dir.string(), ec.message())};
    }
    fs::copy_file(path, dir / path.filename(), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw EngineError{fmt::format("cannot add {}: {}", path.string(), ec.message())};
    }
    SPARKBRIDGE_LOG_DEBUG("added file {}", path.string());
}

fs::path LocalEngine::sparkFile(const string& name) const {
    return options.localDir / "files" / name;
}

vector<JobRecord> LocalEngine::jobs() const {
    lock_guard lk{jobsLock};
    return vector<JobRecord>(jobLog.begin(), jobLog.end());
}

void LocalEngine::stop() {
    if (stopped.exchange(true)) {
        throw EngineError{"engine already stopped"};
    }
    pool.join();
    datasets.clear();
    broadcasts.clear();
    SPARKBRIDGE_LOG_DEBUG("local engine stopped");
}
