#ifndef SPARKBRIDGE_COMMAND_HPP
#define SPARKBRIDGE_COMMAND_HPP

#include "common.hpp"
#include "serializer.hpp"

enum class StageKind : uint8_t {
    Map,            // T -> U, per element
    FlatMap,        // T -> vector<U>, per element
    Filter,         // const T& -> bool, per element
    MapPartitions   // unique_ptr<Iterator<T>> -> vector<U>, per partition
};

const char* stageKindName(StageKind kind);

/// Pure data: which registered function to run, how, and with which
/// captured arguments (a Boost archive of the argument tuple).
struct CommandStage {
    StageKind kind = StageKind::Map;
    string function;
    vector<char> args;

    bool operator==(const CommandStage& rhs) const {
        return kind == rhs.kind && function == rhs.function && args == rhs.args;
    }
};

struct CommandNode {
    CommandStage stage;
    shared_ptr<const CommandNode> prev;
    size_t depth;
};

/// Linear pipeline of stages applied per partition, in chain order.
/// The chain is immutable: `then` shares the existing links and returns a
/// new command.
struct Command {
    /// Reads the source partition.
    SerializerDesc deserializer;
    /// Writes the pipeline output.
    SerializerDesc serializer;
    shared_ptr<const CommandNode> tail;

    Command(SerializerDesc deser, SerializerDesc ser)
        : deserializer{move(deser)}, serializer{move(ser)} {}

    Command then(CommandStage stage) const;

    vector<CommandStage> stages() const;
    size_t size() const {
        return tail ? tail->depth : 0;
    }
    bool empty() const {
        return !tail;
    }

    /// Cap'n Proto flat-array message, see schema/command.capnp.
    vector<char> encode() const;
    /// Throws `EngineError` on a malformed message.
    static Command decode(const char* bytes, size_t size);
};

#endif //SPARKBRIDGE_COMMAND_HPP
