#include "spark_context.hpp"
#include "local_engine.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace {

fs::path makeTempDir(const fs::path& localDir) {
    auto dir = localDir / fmt::format("spark-{}", boost::uuids::to_string(boost::uuids::random_generator()()));
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ContextError{fmt::format("cannot create temp dir {}: {}", dir.string(), ec.message())};
    }
    return dir;
}

atomic<uint64_t> nextThreadToken{1};

/// Identifies the calling thread in every context's property store and
/// erases its entries when the thread exits.
struct ThreadPropertyOwner {
    uint64_t token = nextThreadToken.fetch_add(1);
    vector<std::weak_ptr<PropertyStore>> stores;

    void track(const shared_ptr<PropertyStore>& store) {
        stores.erase(std::remove_if(stores.begin(), stores.end(), [](const auto& s) {
            return s.expired();
        }), stores.end());
        stores.push_back(store);
    }

    ~ThreadPropertyOwner() {
        for (auto& weak : stores) {
            if (auto store = weak.lock()) {
                store->erase(token);
            }
        }
    }
};

thread_local ThreadPropertyOwner propertyOwner;

void removeTempDir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        SPARKBRIDGE_LOG_WARN("could not remove temp dir {}: {}", dir.string(), ec.message());
    }
}

}

SparkContext::SparkContext(SparkConfig config, shared_ptr<Engine> e)
    : conf{move(config)}, engine{move(e)}, tempDir{makeTempDir(engine->localDir())}, dispatcher{*engine} {
    defaultProperties[callSiteKey] = "sparkbridge";
    SPARKBRIDGE_LOG_INFO("context '{}' started on {} (parallelism {}, temp dir {})",
                         conf.appName(), conf.master(), engine->defaultParallelism(), tempDir.string());
}

SparkContext::~SparkContext() {
    if (!stopped.load()) {
        removeTempDir(tempDir);
    }
}

void SparkContext::ensureActive(const char* operation) const {
    if (stopped.load()) {
        throw ContextError{fmt::format("{} called on a stopped context", operation)};
    }
}

void SparkContext::stop() {
    if (stopped.exchange(true)) {
        throw ContextError{"context is already stopped"};
    }
    removeTempDir(tempDir);
    engine->stop();
    SPARKBRIDGE_LOG_INFO("context '{}' stopped after {} jobs", conf.appName(), dispatcher.submitted.load());
}

size_t SparkContext::defaultParallelism() const {
    ensureActive("defaultParallelism");
    return engine->defaultParallelism();
}

SerializerDesc SparkContext::getSerializer(const optional<string>& name, const optional<size_t>& batchSize,
                                           vector<SerializerDesc> children) const {
    ensureActive("getSerializer");
    return makeSerializerDesc(name.value_or(conf.serializer()), batchSize.value_or(conf.batchSize()),
                              move(children));
}

void SparkContext::setLocalProperty(const string& key, string value) {
    ensureActive("setLocalProperty");
    bool inserted = threadProperties->try_emplace_l(propertyOwner.token, [&](auto& entry) {
        entry.second[key] = value;
    }, LocalProperties{{key, value}});
    if (inserted) {
        propertyOwner.track(threadProperties);
    }
}

optional<string> SparkContext::getLocalProperty(const string& key) const {
    ensureActive("getLocalProperty");
    optional<string> value;
    threadProperties->if_contains(propertyOwner.token, [&](const auto& entry) {
        auto it = entry.second.find(key);
        if (it != entry.second.end()) {
            value = it->second;
        }
    });
    if (value.is_initialized()) {
        return value;
    }
    auto it = defaultProperties.find(key);
    if (it != defaultProperties.end()) {
        return it->second;
    }
    return boost::none;
}

void SparkContext::clearLocalProperty(const string& key) {
    ensureActive("clearLocalProperty");
    threadProperties->modify_if(propertyOwner.token, [&](auto& entry) {
        entry.second.erase(key);
    });
}

LocalProperties SparkContext::localProperties() const {
    LocalProperties merged = defaultProperties;
    threadProperties->if_contains(propertyOwner.token, [&](const auto& entry) {
        for (const auto& [k, v] : entry.second) {
            merged[k] = v;
        }
    });
    return merged;
}

RDD<string> SparkContext::textFile(const fs::path& path, optional<size_t> minPartitions,
                                   const SourceOptions& options) {
    ensureActive("textFile");
    auto output = getSerializer(options.serializer, options.batchSize, options.children);
    auto ref = engine->textFile(path, minPartitions.value_or(defaultParallelism()));
    return RDD<string>{*this, ref, output, textFileDesc(), boost::none, ref, engine->numPartitions(ref)};
}

RDD<pair<string, string>> SparkContext::wholeTextFiles(const fs::path& path, optional<size_t> minPartitions,
                                                       const SourceOptions& options) {
    ensureActive("wholeTextFiles");
    auto output = getSerializer(options.serializer, options.batchSize, options.children);
    auto ref = engine->wholeTextFiles(path, minPartitions.value_or(defaultParallelism()));
    return RDD<pair<string, string>>{*this, ref, output, wholeTextFilesDesc(), boost::none, ref,
                                     engine->numPartitions(ref)};
}

unique_ptr<SparkContext> createContext(SparkConfig config, shared_ptr<Engine> engine) {
    config.validate();
    if (!engine) {
        throw ContextError{"cannot create a context without an engine"};
    }
    Logger::instance().setLevel(config.logLevel());
    return make_unique<SparkContext>(move(config), move(engine));
}

unique_ptr<SparkContext> createContext(SparkConfig config) {
    config.validate();
    auto engine = make_shared<LocalEngine>(LocalEngineOptions::fromConfig(config));
    return createContext(move(config), move(engine));
}
