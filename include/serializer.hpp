#ifndef SPARKBRIDGE_SERIALIZER_HPP
#define SPARKBRIDGE_SERIALIZER_HPP

#include <ostream>
#include <string_view>

#include "common.hpp"

/// Closed set of codecs the bridge knows how to pair on both sides of the
/// engine boundary.
enum class SerializerKind : uint8_t {
    Plain,
    Utf8,
    Pair
};

/// Structural description of a serializer. Two serializers decode each
/// other's output only if their descriptors compare equal.
struct SerializerDesc {
    SerializerKind kind = SerializerKind::Plain;
    size_t batchSize = 1;
    vector<SerializerDesc> children;

    bool operator==(const SerializerDesc& rhs) const {
        return kind == rhs.kind && batchSize == rhs.batchSize && children == rhs.children;
    }
    bool operator!=(const SerializerDesc& rhs) const {
        return !(*this == rhs);
    }
    string toString() const;
};

optional<SerializerKind> findSerializerKind(std::string_view name);
const char* serializerKindName(SerializerKind kind);

/// Registry lookup by (case-insensitive) name. Throws `SerializerError` for an
/// unknown name, a zero batch size, or a child count the kind does not take.
SerializerDesc makeSerializerDesc(std::string_view name, size_t batchSize, vector<SerializerDesc> children = {});

bool isValidUtf8(const char* data, size_t size);

// Frames: 4-byte big-endian length, then payload.

void putUint32(vector<char>& out, uint32_t v);
uint32_t getUint32(const char* p);
void appendFrame(vector<char>& out, const char* data, size_t size);

struct FrameSink {
    virtual ~FrameSink() = default;
    virtual void put(const char* data, size_t size) = 0;
};

/// Appends length-prefixed frames to a byte buffer.
struct FrameBuffer : FrameSink {
    vector<char>& bytes;
    explicit FrameBuffer(vector<char>& b) : bytes{b} {}
    void put(const char* data, size_t size) override {
        appendFrame(bytes, data, size);
    }
};

/// Keeps every frame as its own buffer.
struct FrameList : FrameSink {
    vector<vector<char>> frames;
    void put(const char* data, size_t size) override {
        frames.emplace_back(data, data + size);
    }
};

/// Writes length-prefixed frames to a stream, throws once the stream fails.
struct StreamFrameSink : FrameSink {
    std::ostream& os;
    explicit StreamFrameSink(std::ostream& s) : os{s} {}
    void put(const char* data, size_t size) override;
};

struct FrameReader {
    const char* ptr;
    const char* end;
    FrameReader(const char* p, size_t size) : ptr{p}, end{p + size} {}
    bool done() const {
        return ptr == end;
    }
    /// Next frame payload, `boost::none` at end of input.
    /// A truncated frame throws `SerializerError`.
    optional<pair<const char*, size_t>> next();
};

vector<vector<char>> readFrames(const char* bytes, size_t size);

template <typename T>
struct Serializer {
    using const_iter = typename vector<T>::const_iterator;
    SerializerDesc desc;

    explicit Serializer(SerializerDesc d) : desc{move(d)} {}
    virtual ~Serializer() = default;

    virtual void dumpBatch(const_iter first, const_iter last, vector<char>& payload) const = 0;
    virtual void loadBatch(const char* payload, size_t size, vector<T>& out) const = 0;

    /// Encodes `items` in order, one frame per batch of `desc.batchSize`.
    void dump(const vector<T>& items, FrameSink& sink) const {
        vector<char> payload;
        for (size_t i = 0; i < items.size(); i += desc.batchSize) {
            size_t n = std::min(desc.batchSize, items.size() - i);
            payload.clear();
            dumpBatch(items.cbegin() + i, items.cbegin() + i + n, payload);
            sink.put(payload.data(), payload.size());
        }
    }

    vector<T> load(const char* bytes, size_t size) const {
        vector<T> result;
        FrameReader reader{bytes, size};
        for (auto frame = reader.next(); frame.is_initialized(); frame = reader.next()) {
            loadBatch(frame->first, frame->second, result);
        }
        return result;
    }

    vector<T> load(const vector<char>& bytes) const {
        return load(bytes.data(), bytes.size());
    }
};

/// Boost binary archive of each batch.
template <typename T>
struct PlainSerializer : Serializer<T> {
    using typename Serializer<T>::const_iter;
    using Serializer<T>::Serializer;

    void dumpBatch(const_iter first, const_iter last, vector<char>& payload) const override {
        vector<T> batch(first, last);
        try {
            serialize(batch, payload);
        } catch (const std::exception& e) {
            throw SerializerError{fmt::format("plain serializer could not encode batch: {}", e.what())};
        }
    }

    void loadBatch(const char* payload, size_t size, vector<T>& out) const override {
        vector<T> batch;
        try {
            deserialize(batch, payload, size);
        } catch (const std::exception& e) {
            throw SerializerError{fmt::format("plain serializer could not decode batch: {}", e.what())};
        }
        out.insert(out.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
    }
};

/// Count, then length-prefixed UTF-8 strings.
struct Utf8Serializer : Serializer<string> {
    using Serializer<string>::Serializer;
    void dumpBatch(const_iter first, const_iter last, vector<char>& payload) const override;
    void loadBatch(const char* payload, size_t size, vector<string>& out) const override;
};

/// Key batch and value batch as two nested frames.
template <typename K, typename V>
struct PairSerializer : Serializer<pair<K, V>> {
    using typename Serializer<pair<K, V>>::const_iter;
    shared_ptr<const Serializer<K>> keys;
    shared_ptr<const Serializer<V>> values;

    PairSerializer(SerializerDesc d, shared_ptr<const Serializer<K>> k, shared_ptr<const Serializer<V>> v)
        : Serializer<pair<K, V>>{move(d)}, keys{move(k)}, values{move(v)} {}

    void dumpBatch(const_iter first, const_iter last, vector<char>& payload) const override {
        vector<K> ks;
        vector<V> vs;
        for (auto it = first; it != last; ++it) {
            ks.push_back(it->first);
            vs.push_back(it->second);
        }
        vector<char> kp, vp;
        keys->dumpBatch(ks.cbegin(), ks.cend(), kp);
        values->dumpBatch(vs.cbegin(), vs.cend(), vp);
        appendFrame(payload, kp.data(), kp.size());
        appendFrame(payload, vp.data(), vp.size());
    }

    void loadBatch(const char* payload, size_t size, vector<pair<K, V>>& out) const override {
        FrameReader reader{payload, size};
        auto kf = reader.next();
        auto vf = reader.next();
        if (!kf.is_initialized() || !vf.is_initialized() || !reader.done()) {
            throw SerializerError{"pair batch must hold exactly one key frame and one value frame"};
        }
        vector<K> ks;
        vector<V> vs;
        keys->loadBatch(kf->first, kf->second, ks);
        values->loadBatch(vf->first, vf->second, vs);
        if (ks.size() != vs.size()) {
            throw SerializerError{fmt::format("pair batch has {} keys but {} values", ks.size(), vs.size())};
        }
        for (size_t i = 0; i < ks.size(); ++i) {
            out.emplace_back(move(ks[i]), move(vs[i]));
        }
    }
};

/// Builds the codec a descriptor names for element type `T`.
/// Throws `SerializerError` when the kind cannot carry `T`.
template <typename T>
shared_ptr<const Serializer<T>> makeSerializer(const SerializerDesc& desc) {
    switch (desc.kind) {
        case SerializerKind::Plain:
            return make_shared<PlainSerializer<T>>(desc);
        case SerializerKind::Utf8:
            if constexpr (is_string_v<T>) {
                return make_shared<Utf8Serializer>(desc);
            } else {
                throw SerializerError{"utf8 serializer can only carry std::string elements"};
            }
        case SerializerKind::Pair:
            if constexpr (is_pair_v<T>) {
                using K = typename T::first_type;
                using V = typename T::second_type;
                if (desc.children.size() != 2) {
                    throw SerializerError{"pair serializer needs a key and a value serializer"};
                }
                return make_shared<PairSerializer<K, V>>(
                        desc, makeSerializer<K>(desc.children[0]), makeSerializer<V>(desc.children[1]));
            } else {
                throw SerializerError{"pair serializer can only carry std::pair elements"};
            }
    }
    throw SerializerError{"unknown serializer kind"};
}

/// Whether `makeSerializer<T>(desc)` would succeed.
template <typename T>
bool canCarry(const SerializerDesc& desc) {
    switch (desc.kind) {
        case SerializerKind::Plain:
            return true;
        case SerializerKind::Utf8:
            return is_string_v<T>;
        case SerializerKind::Pair:
            if constexpr (is_pair_v<T>) {
                return desc.children.size() == 2
                       && canCarry<typename T::first_type>(desc.children[0])
                       && canCarry<typename T::second_type>(desc.children[1]);
            } else {
                return false;
            }
    }
    return false;
}

/// `preferred` when it can carry `T`, otherwise a plain serializer with the
/// same batch size. Picks the output codec of a pipeline whose element type
/// differs from its input.
template <typename T>
SerializerDesc carrierFor(const SerializerDesc& preferred) {
    if (canCarry<T>(preferred)) {
        return preferred;
    }
    return SerializerDesc{SerializerKind::Plain, preferred.batchSize, {}};
}

#endif //SPARKBRIDGE_SERIALIZER_HPP
