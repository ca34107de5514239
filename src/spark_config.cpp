#include "spark_config.hpp"
#include "serializer.hpp"

#include <fmt/ranges.h>

optional<StageStrategy> parseStageStrategy(const string& name) {
    if (name == "file") return StageStrategy::File;
    if (name == "direct") return StageStrategy::Direct;
    return boost::none;
}

optional<size_t> parsePositive(const string& value) {
    if (value.empty() || value.size() > 18) {
        return boost::none;
    }
    size_t result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return boost::none;
        }
        result = result * 10 + static_cast<size_t>(c - '0');
    }
    if (result == 0) {
        return boost::none;
    }
    return result;
}

SparkConfig::SparkConfig() {
    settings[config_keys::appName] = "sparkbridge";
    settings[config_keys::master] = "local[*]";
    settings[config_keys::serializer] = "plain";
    settings[config_keys::batchSize] = "1024";
    settings[config_keys::stageStrategy] = "file";
    settings[config_keys::logLevel] = "info";
}

optional<string> SparkConfig::get(const string& key) const {
    auto it = settings.find(key);
    if (it == settings.end()) {
        return boost::none;
    }
    return it->second;
}

string SparkConfig::getOr(const string& key, const string& fallback) const {
    auto it = settings.find(key);
    return it == settings.end() ? fallback : it->second;
}

void SparkConfig::validate() const {
    vector<string> errors;
    if (getOr(config_keys::appName, "").empty()) {
        errors.push_back(fmt::format("{} must not be empty", config_keys::appName));
    }
    if (getOr(config_keys::master, "").empty()) {
        errors.push_back(fmt::format("{} must not be empty", config_keys::master));
    }
    auto name = getOr(config_keys::serializer, "");
    auto kind = findSerializerKind(name);
    if (!kind.is_initialized()) {
        errors.push_back(fmt::format("{}: unknown serializer '{}'", config_keys::serializer, name));
    } else if (kind.value() == SerializerKind::Pair) {
        errors.push_back(fmt::format("{}: 'pair' needs nested serializers and cannot be the default",
                                     config_keys::serializer));
    }
    auto batch = getOr(config_keys::batchSize, "");
    if (!parsePositive(batch).is_initialized()) {
        errors.push_back(fmt::format("{}: '{}' is not a positive integer", config_keys::batchSize, batch));
    }
    auto strategy = getOr(config_keys::stageStrategy, "");
    if (!parseStageStrategy(strategy).is_initialized()) {
        errors.push_back(fmt::format("{}: '{}' is neither 'file' nor 'direct'", config_keys::stageStrategy, strategy));
    }
    auto level = getOr(config_keys::logLevel, "");
    if (!parseLogLevel(level).is_initialized()) {
        errors.push_back(fmt::format("{}: unknown log level '{}'", config_keys::logLevel, level));
    }
    if (auto parallelism = get(config_keys::defaultParallelism)) {
        if (!parsePositive(parallelism.value()).is_initialized()) {
            errors.push_back(fmt::format("{}: '{}' is not a positive integer",
                                         config_keys::defaultParallelism, parallelism.value()));
        }
    }
    if (auto dir = get(config_keys::localDir)) {
        if (dir->empty()) {
            errors.push_back(fmt::format("{} must not be empty when set", config_keys::localDir));
        }
    }
    if (!errors.empty()) {
        throw ConfigError{fmt::format("invalid configuration: {}", fmt::join(errors, "; "))};
    }
}

string SparkConfig::appName() const {
    return getOr(config_keys::appName, "sparkbridge");
}

string SparkConfig::master() const {
    return getOr(config_keys::master, "local[*]");
}

string SparkConfig::serializer() const {
    return getOr(config_keys::serializer, "plain");
}

size_t SparkConfig::batchSize() const {
    return parsePositive(getOr(config_keys::batchSize, "")).value_or(1024);
}

StageStrategy SparkConfig::stageStrategy() const {
    return parseStageStrategy(getOr(config_keys::stageStrategy, "")).value_or(StageStrategy::File);
}

LogLevel SparkConfig::logLevel() const {
    return parseLogLevel(getOr(config_keys::logLevel, "")).value_or(LogLevel::Info);
}

optional<size_t> SparkConfig::defaultParallelism() const {
    auto value = get(config_keys::defaultParallelism);
    if (!value.is_initialized()) {
        return boost::none;
    }
    return parsePositive(value.value());
}

optional<string> SparkConfig::localDir() const {
    return get(config_keys::localDir);
}
