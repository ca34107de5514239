#ifndef SPARKBRIDGE_RDD_HPP
#define SPARKBRIDGE_RDD_HPP

#include "common.hpp"
#include "command.hpp"
#include "command_registry.hpp"
#include "engine.hpp"
#include "serializer.hpp"

struct SparkContext;

/// Handle to an engine dataset whose elements decode to `T`.
///
/// `deserializer` is how the dataset's own elements are encoded, `decoder`
/// is the typed codec built from it. `serializer` is what pipelines built on
/// top of this handle write their output with. A handle produced by a
/// pipeline keeps the fused `command` and the `source` dataset it reads, so
/// stacking another stage replaces the whole chain instead of nesting it.
// HACK: bodies that need `SparkContext` live at the bottom of spark_context.hpp
template <typename T>
struct RDD {
    SparkContext& sc;
    DatasetRef ref;
    SerializerDesc serializer;
    SerializerDesc deserializer;
    shared_ptr<const Serializer<T>> decoder;
    optional<Command> command;
    DatasetRef source;
    size_t numPartitions = 0;

    RDD(SparkContext& sc_, DatasetRef ref_, SerializerDesc ser, SerializerDesc deser,
        optional<Command> cmd, DatasetRef src, size_t n)
        : sc{sc_}, ref{ref_}, serializer{move(ser)}, deserializer{move(deser)},
          decoder{makeSerializer<T>(deserializer)}, command{move(cmd)}, source{src}, numPartitions{n} {}

    size_t id() const {
        return ref.id;
    }

    size_t partitionsSize() const {
        return numPartitions;
    }

    /// New handle describing this one with one more stage of kind `K`
    /// applied per partition. Nothing runs until a job is submitted.
    template <StageKind K, typename F, typename... Args>
    auto newRddFromCommand(F f, Args&&... args) const -> RDD<stage_output_t<K, T, F, decay_t<Args>...>>;

    /// Every element, partition by partition.
    vector<T> collect() const;
};

#endif //SPARKBRIDGE_RDD_HPP
