#include "command.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/exception.h>
#include "command.capnp.h"

namespace {

wire::SerializerSpec::Kind toWire(SerializerKind kind) {
    switch (kind) {
        case SerializerKind::Plain: return wire::SerializerSpec::Kind::PLAIN;
        case SerializerKind::Utf8: return wire::SerializerSpec::Kind::UTF8;
        case SerializerKind::Pair: return wire::SerializerSpec::Kind::PAIR;
    }
    throw SerializerError{"unknown serializer kind"};
}

SerializerKind fromWire(wire::SerializerSpec::Kind kind) {
    switch (kind) {
        case wire::SerializerSpec::Kind::PLAIN: return SerializerKind::Plain;
        case wire::SerializerSpec::Kind::UTF8: return SerializerKind::Utf8;
        case wire::SerializerSpec::Kind::PAIR: return SerializerKind::Pair;
    }
    throw EngineError{"command names an unknown serializer kind"};
}

wire::Stage::Kind toWire(StageKind kind) {
    switch (kind) {
        case StageKind::Map: return wire::Stage::Kind::MAP;
        case StageKind::FlatMap: return wire::Stage::Kind::FLAT_MAP;
        case StageKind::Filter: return wire::Stage::Kind::FILTER;
        case StageKind::MapPartitions: return wire::Stage::Kind::MAP_PARTITIONS;
    }
    throw EngineError{"unknown stage kind"};
}

StageKind fromWire(wire::Stage::Kind kind) {
    switch (kind) {
        case wire::Stage::Kind::MAP: return StageKind::Map;
        case wire::Stage::Kind::FLAT_MAP: return StageKind::FlatMap;
        case wire::Stage::Kind::FILTER: return StageKind::Filter;
        case wire::Stage::Kind::MAP_PARTITIONS: return StageKind::MapPartitions;
    }
    throw EngineError{"command names an unknown stage kind"};
}

void writeSpec(wire::SerializerSpec::Builder builder, const SerializerDesc& desc) {
    builder.setKind(toWire(desc.kind));
    builder.setBatchSize(desc.batchSize);
    auto children = builder.initChildren(static_cast<unsigned int>(desc.children.size()));
    for (size_t i = 0; i < desc.children.size(); ++i) {
        writeSpec(children[static_cast<unsigned int>(i)], desc.children[i]);
    }
}

SerializerDesc readSpec(wire::SerializerSpec::Reader reader) {
    SerializerDesc desc;
    desc.kind = fromWire(reader.getKind());
    desc.batchSize = reader.getBatchSize();
    for (auto child : reader.getChildren()) {
        desc.children.push_back(readSpec(child));
    }
    return desc;
}

}

const char* stageKindName(StageKind kind) {
    switch (kind) {
        case StageKind::Map: return "map";
        case StageKind::FlatMap: return "flat_map";
        case StageKind::Filter: return "filter";
        case StageKind::MapPartitions: return "map_partitions";
    }
    return "unknown";
}

Command Command::then(CommandStage stage) const {
    Command next{deserializer, serializer};
    next.tail = make_shared<const CommandNode>(CommandNode{move(stage), tail, size() + 1});
    return next;
}

vector<CommandStage> Command::stages() const {
    vector<CommandStage> result;
    result.reserve(size());
    for (auto node = tail; node; node = node->prev) {
        result.push_back(node->stage);
    }
    std::reverse(result.begin(), result.end());
    return result;
}

vector<char> Command::encode() const {
    ::capnp::MallocMessageBuilder builder;
    auto command = builder.initRoot<wire::Command>();
    writeSpec(command.initDeserializer(), deserializer);
    writeSpec(command.initSerializer(), serializer);
    auto all = stages();
    auto list = command.initStages(static_cast<unsigned int>(all.size()));
    for (size_t i = 0; i < all.size(); ++i) {
        auto stage = list[static_cast<unsigned int>(i)];
        stage.setKind(toWire(all[i].kind));
        stage.setFunction(all[i].function.c_str());
        stage.setArgs(kj::arrayPtr(reinterpret_cast<const kj::byte*>(all[i].args.data()), all[i].args.size()));
    }
    auto words = ::capnp::messageToFlatArray(builder);
    auto bytes = words.asBytes();
    return {reinterpret_cast<const char*>(bytes.begin()), reinterpret_cast<const char*>(bytes.end())};
}

Command Command::decode(const char* bytes, size_t size) {
    if (size == 0 || size % sizeof(::capnp::word) != 0) {
        throw EngineError{fmt::format("malformed command: {} bytes is not a whole number of words", size)};
    }
    // the reader needs word alignment
    auto words = kj::heapArray<::capnp::word>(size / sizeof(::capnp::word));
    std::memcpy(words.begin(), bytes, size);
    try {
        ::capnp::FlatArrayMessageReader message{words};
        auto reader = message.getRoot<wire::Command>();
        Command command{readSpec(reader.getDeserializer()), readSpec(reader.getSerializer())};
        for (auto stage : reader.getStages()) {
            auto args = stage.getArgs();
            command = command.then(CommandStage{
                    fromWire(stage.getKind()),
                    stage.getFunction().cStr(),
                    {reinterpret_cast<const char*>(args.begin()), reinterpret_cast<const char*>(args.end())}
            });
        }
        return command;
    } catch (const kj::Exception& e) {
        throw EngineError{fmt::format("malformed command: {}", e.getDescription().cStr())};
    }
}
