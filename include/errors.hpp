#ifndef SPARKBRIDGE_ERRORS_HPP
#define SPARKBRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>

/// Base of everything the bridge throws.
struct SparkError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Invalid configuration at context creation. No context is produced.
struct ConfigError : SparkError {
    using SparkError::SparkError;
};

/// Unknown serializer, serializer that cannot carry the element type,
/// or bytes that do not decode with the bound serializer.
struct SerializerError : SparkError {
    using SparkError::SparkError;
};

/// Malformed call against a context (bad partition list, use after stop),
/// or driver-side I/O on the temp dir or a staging file.
struct ContextError : SparkError {
    using SparkError::SparkError;
};

/// Failure raised by the execution engine. Never retried by the driver.
struct EngineError : SparkError {
    using SparkError::SparkError;
};

#endif //SPARKBRIDGE_ERRORS_HPP
