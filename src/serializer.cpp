#include "serializer.hpp"

#include <cctype>
#include <limits>
#include <boost/endian/conversion.hpp>
#include <fmt/ranges.h>

namespace {

struct RegistryEntry {
    const char* name;
    SerializerKind kind;
};

constexpr RegistryEntry registry[] = {
        {"plain", SerializerKind::Plain},
        {"utf8", SerializerKind::Utf8},
        {"pair", SerializerKind::Pair},
};

}

optional<SerializerKind> findSerializerKind(std::string_view name) {
    string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : registry) {
        if (lower == entry.name) {
            return entry.kind;
        }
    }
    return boost::none;
}

const char* serializerKindName(SerializerKind kind) {
    for (const auto& entry : registry) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

string SerializerDesc::toString() const {
    if (children.empty()) {
        return fmt::format("{}(batch={})", serializerKindName(kind), batchSize);
    }
    vector<string> inner;
    for (const auto& c : children) {
        inner.push_back(c.toString());
    }
    return fmt::format("{}(batch={}, {})", serializerKindName(kind), batchSize, fmt::join(inner, ", "));
}

SerializerDesc makeSerializerDesc(std::string_view name, size_t batchSize, vector<SerializerDesc> children) {
    auto kind = findSerializerKind(name);
    if (!kind.is_initialized()) {
        throw SerializerError{fmt::format("unknown serializer '{}'", name)};
    }
    if (batchSize == 0) {
        throw SerializerError{"serializer batch size must be at least 1"};
    }
    size_t expected = kind.value() == SerializerKind::Pair ? 2 : 0;
    if (children.size() != expected) {
        throw SerializerError{fmt::format("serializer '{}' takes {} nested serializers, got {}",
                                          serializerKindName(kind.value()), expected, children.size())};
    }
    return SerializerDesc{kind.value(), batchSize, move(children)};
}

bool isValidUtf8(const char* data, size_t size) {
    auto bytes = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;
    while (i < size) {
        unsigned char c = bytes[i];
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            i += 1;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > size) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (bytes[i + k] & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)
            || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

void putUint32(vector<char>& out, uint32_t v) {
    uint32_t be = boost::endian::native_to_big(v);
    const char* p = reinterpret_cast<const char*>(&be);
    out.insert(out.end(), p, p + sizeof(be));
}

uint32_t getUint32(const char* p) {
    uint32_t be;
    std::memcpy(&be, p, sizeof(be));
    return boost::endian::big_to_native(be);
}

void appendFrame(vector<char>& out, const char* data, size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw SerializerError{fmt::format("frame of {} bytes exceeds the 4 GiB frame limit", size)};
    }
    putUint32(out, static_cast<uint32_t>(size));
    out.insert(out.end(), data, data + size);
}

void StreamFrameSink::put(const char* data, size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw SerializerError{fmt::format("frame of {} bytes exceeds the 4 GiB frame limit", size)};
    }
    vector<char> header;
    putUint32(header, static_cast<uint32_t>(size));
    os.write(header.data(), static_cast<std::streamsize>(header.size()));
    os.write(data, static_cast<std::streamsize>(size));
    if (!os) {
        throw ContextError{"failed to write staged frame"};
    }
}

optional<pair<const char*, size_t>> FrameReader::next() {
    if (ptr == end) {
        return boost::none;
    }
    if (static_cast<size_t>(end - ptr) < sizeof(uint32_t)) {
        throw SerializerError{"truncated frame header"};
    }
    size_t size = getUint32(ptr);
    ptr += sizeof(uint32_t);
    if (static_cast<size_t>(end - ptr) < size) {
        throw SerializerError{fmt::format("truncated frame: expected {} bytes, {} left", size, end - ptr)};
    }
    const char* payload = ptr;
    ptr += size;
    return make_pair(payload, size);
}

vector<vector<char>> readFrames(const char* bytes, size_t size) {
    vector<vector<char>> frames;
    FrameReader reader{bytes, size};
    for (auto frame = reader.next(); frame.is_initialized(); frame = reader.next()) {
        frames.emplace_back(frame->first, frame->first + frame->second);
    }
    return frames;
}

void Utf8Serializer::dumpBatch(const_iter first, const_iter last, vector<char>& payload) const {
    putUint32(payload, static_cast<uint32_t>(last - first));
    for (auto it = first; it != last; ++it) {
        if (!isValidUtf8(it->data(), it->size())) {
            throw SerializerError{fmt::format("element {} is not valid UTF-8", it - first)};
        }
        appendFrame(payload, it->data(), it->size());
    }
}

void Utf8Serializer::loadBatch(const char* payload, size_t size, vector<string>& out) const {
    if (size < sizeof(uint32_t)) {
        throw SerializerError{"utf8 batch is missing its element count"};
    }
    uint32_t count = getUint32(payload);
    FrameReader reader{payload + sizeof(uint32_t), size - sizeof(uint32_t)};
    for (uint32_t i = 0; i < count; ++i) {
        auto frame = reader.next();
        if (!frame.is_initialized()) {
            throw SerializerError{fmt::format("utf8 batch announced {} strings, found {}", count, i)};
        }
        if (!isValidUtf8(frame->first, frame->second)) {
            throw SerializerError{"decoded string is not valid UTF-8"};
        }
        out.emplace_back(frame->first, frame->second);
    }
    if (!reader.done()) {
        throw SerializerError{"trailing bytes after utf8 batch"};
    }
}
