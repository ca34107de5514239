#include <gtest/gtest.h>
#include "serializer.hpp"
#include <sstream>

namespace {

struct Point {
    int x = 0;
    int y = 0;
    SPARKBRIDGE_SERIALIZE_MEMBERS(x, y);

    bool operator==(const Point& rhs) const {
        return x == rhs.x && y == rhs.y;
    }
};

template <typename T>
vector<char> dumpAll(const Serializer<T>& ser, const vector<T>& items) {
    vector<char> bytes;
    FrameBuffer sink{bytes};
    ser.dump(items, sink);
    return bytes;
}

}

TEST(SerializerTest, RegistryIsCaseInsensitive) {
    EXPECT_EQ(findSerializerKind("PLAIN"), SerializerKind::Plain);
    EXPECT_EQ(findSerializerKind("Utf8"), SerializerKind::Utf8);
    EXPECT_EQ(findSerializerKind("pair"), SerializerKind::Pair);
    EXPECT_FALSE(findSerializerKind("marshal").is_initialized());
}

TEST(SerializerTest, DescriptorValidation) {
    EXPECT_THROW(makeSerializerDesc("nope", 1), SerializerError);
    EXPECT_THROW(makeSerializerDesc("plain", 0), SerializerError);
    EXPECT_THROW(makeSerializerDesc("pair", 1), SerializerError);
    EXPECT_THROW(makeSerializerDesc("plain", 1, {makeSerializerDesc("plain", 1)}), SerializerError);

    auto pairDesc = makeSerializerDesc("pair", 4, {makeSerializerDesc("utf8", 1), makeSerializerDesc("plain", 2)});
    EXPECT_EQ(pairDesc.kind, SerializerKind::Pair);
    EXPECT_EQ(pairDesc.children.size(), 2u);
    EXPECT_EQ(pairDesc.toString(), "pair(batch=4, utf8(batch=1), plain(batch=2))");
}

TEST(SerializerTest, EqualityIsStructural) {
    EXPECT_EQ(makeSerializerDesc("plain", 8), makeSerializerDesc("PLAIN", 8));
    EXPECT_NE(makeSerializerDesc("plain", 8), makeSerializerDesc("plain", 16));
    EXPECT_NE(makeSerializerDesc("plain", 8), makeSerializerDesc("utf8", 8));
}

TEST(SerializerTest, PlainRoundTripKeepsOrder) {
    auto ser = makeSerializer<Point>(makeSerializerDesc("plain", 2));
    vector<Point> points{{1, 2}, {3, 4}, {5, 6}};
    auto bytes = dumpAll(*ser, points);
    EXPECT_EQ(ser->load(bytes), points);
}

TEST(SerializerTest, OneFramePerBatch) {
    auto ser = makeSerializer<int>(makeSerializerDesc("plain", 3));
    vector<int> items(7);
    std::iota(items.begin(), items.end(), 0);
    FrameList frames;
    ser->dump(items, frames);
    ASSERT_EQ(frames.frames.size(), 3u);

    vector<int> last;
    ser->loadBatch(frames.frames[2].data(), frames.frames[2].size(), last);
    EXPECT_EQ(last, vector<int>{6});
}

TEST(SerializerTest, EmptyInputWritesNoFrames) {
    auto ser = makeSerializer<int>(makeSerializerDesc("plain", 3));
    auto bytes = dumpAll(*ser, vector<int>{});
    EXPECT_TRUE(bytes.empty());
    EXPECT_TRUE(ser->load(bytes).empty());
}

TEST(SerializerTest, Utf8RoundTrip) {
    auto ser = makeSerializer<string>(makeSerializerDesc("utf8", 2));
    vector<string> words{"hello", "", "w\xC3\xB6rld", "\xE6\x97\xA5\xE6\x9C\xAC"};
    EXPECT_EQ(ser->load(dumpAll(*ser, words)), words);
}

TEST(SerializerTest, Utf8RejectsInvalidText) {
    auto ser = makeSerializer<string>(makeSerializerDesc("utf8", 1));
    EXPECT_THROW(dumpAll(*ser, vector<string>{"bad \xC3\x28"}), SerializerError);
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80", 3));  // surrogate
    EXPECT_FALSE(isValidUtf8("\xC0\xAF", 2));      // overlong
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80", 4));
}

TEST(SerializerTest, PairRoundTrip) {
    auto desc = makeSerializerDesc("pair", 2, {makeSerializerDesc("utf8", 1), makeSerializerDesc("plain", 1)});
    auto ser = makeSerializer<pair<string, int>>(desc);
    vector<pair<string, int>> items{{"a", 1}, {"b", 2}, {"c", 3}};
    EXPECT_EQ(ser->load(dumpAll(*ser, items)), items);
}

TEST(SerializerTest, IncompatibleKindFailsAtConstruction) {
    EXPECT_THROW(makeSerializer<int>(makeSerializerDesc("utf8", 1)), SerializerError);
    auto desc = makeSerializerDesc("pair", 1, {makeSerializerDesc("plain", 1), makeSerializerDesc("plain", 1)});
    EXPECT_THROW(makeSerializer<int>(desc), SerializerError);
    auto utf8Keys = makeSerializerDesc("pair", 1, {makeSerializerDesc("utf8", 1), makeSerializerDesc("plain", 1)});
    EXPECT_THROW((makeSerializer<pair<int, int>>(utf8Keys)), SerializerError);
}

TEST(SerializerTest, CarrierFallsBackToPlain) {
    auto utf8 = makeSerializerDesc("utf8", 5);
    EXPECT_EQ(carrierFor<string>(utf8), utf8);
    EXPECT_EQ(carrierFor<int>(utf8), makeSerializerDesc("plain", 5));
}

TEST(SerializerTest, TruncatedFrameIsRejected) {
    auto ser = makeSerializer<int>(makeSerializerDesc("plain", 4));
    auto bytes = dumpAll(*ser, vector<int>{1, 2, 3});
    bytes.pop_back();
    EXPECT_THROW(ser->load(bytes), SerializerError);

    vector<char> header{0, 0};
    EXPECT_THROW(readFrames(header.data(), header.size()), SerializerError);
}

TEST(SerializerTest, PairCountMismatchIsRejected) {
    auto keys = makeSerializer<string>(makeSerializerDesc("utf8", 1));
    auto values = makeSerializer<int>(makeSerializerDesc("plain", 1));
    vector<string> ks{"a", "b"};
    vector<int> vs{1};
    vector<char> kp, vp, payload;
    keys->dumpBatch(ks.cbegin(), ks.cend(), kp);
    values->dumpBatch(vs.cbegin(), vs.cend(), vp);
    appendFrame(payload, kp.data(), kp.size());
    appendFrame(payload, vp.data(), vp.size());

    auto desc = makeSerializerDesc("pair", 2, {makeSerializerDesc("utf8", 1), makeSerializerDesc("plain", 1)});
    auto ser = makeSerializer<pair<string, int>>(desc);
    vector<pair<string, int>> out;
    EXPECT_THROW(ser->loadBatch(payload.data(), payload.size(), out), SerializerError);
}

TEST(SerializerTest, FramesAreBigEndianLengthPrefixed) {
    vector<char> out;
    appendFrame(out, "abc", 3);
    ASSERT_EQ(out.size(), 7u);
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[3], 3);
    EXPECT_EQ(getUint32(out.data()), 3u);
}

TEST(ArchiveTest, TupleKeepsElementOrder) {
    auto original = make_tuple(7, string{"seven"}, vector<int>{1, 2}, map<string, int>{{"k", 3}});
    vector<char> bytes;
    serialize(original, bytes);
    decltype(original) decoded;
    deserialize(decoded, bytes.data(), bytes.size());
    EXPECT_EQ(decoded, original);
}

TEST(ArchiveTest, SerializeAppends) {
    vector<char> bytes{'x'};
    serialize(string{"tail"}, bytes);
    ASSERT_GT(bytes.size(), 1u);
    EXPECT_EQ(bytes.front(), 'x');
    string decoded;
    deserialize(decoded, bytes.data() + 1, bytes.size() - 1);
    EXPECT_EQ(decoded, "tail");
}

TEST(StreamFrameSinkTest, WriteFailureIsContextError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamFrameSink sink{out};
    EXPECT_THROW(sink.put("x", 1), ContextError);
}
