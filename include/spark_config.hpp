#ifndef SPARKBRIDGE_SPARK_CONFIG_HPP
#define SPARKBRIDGE_SPARK_CONFIG_HPP

#include "common.hpp"
#include "utils/logging.hpp"

enum class StageStrategy {
    File,
    Direct
};

optional<StageStrategy> parseStageStrategy(const string& name);

namespace config_keys {
    constexpr const char* appName = "spark.app.name";
    constexpr const char* master = "spark.master";
    constexpr const char* serializer = "spark.bridge.serializer";
    constexpr const char* batchSize = "spark.bridge.batch_size";
    constexpr const char* stageStrategy = "spark.bridge.stage_strategy";
    constexpr const char* logLevel = "spark.bridge.log_level";
    constexpr const char* defaultParallelism = "spark.default.parallelism";
    constexpr const char* localDir = "spark.local.dir";
}

/// String settings with defaults. A context copies the config it is created
/// with and never changes it afterwards.
struct SparkConfig {
    map<string, string> settings;

    SparkConfig();

    SparkConfig& set(const string& key, string value) {
        settings[key] = move(value);
        return *this;
    }
    SparkConfig& remove(const string& key) {
        settings.erase(key);
        return *this;
    }
    optional<string> get(const string& key) const;
    string getOr(const string& key, const string& fallback) const;
    bool contains(const string& key) const {
        return settings.count(key) != 0;
    }

    /// Throws `ConfigError` listing every invalid setting.
    void validate() const;

    // typed views, only meaningful on a validated config
    string appName() const;
    string master() const;
    string serializer() const;
    size_t batchSize() const;
    StageStrategy stageStrategy() const;
    LogLevel logLevel() const;
    optional<size_t> defaultParallelism() const;
    optional<string> localDir() const;
};

/// Strict positive integer parse, `boost::none` for anything else.
optional<size_t> parsePositive(const string& value);

#endif //SPARKBRIDGE_SPARK_CONFIG_HPP
