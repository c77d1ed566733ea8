#include <gtest/gtest.h>

#include <deque>
#include <list>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "csb/codec/collection_serializer.hpp"

using csb::codec::CollectionSerializer;
using csb::collections::SparseMap;
using csb::foundation::CodecOptions;
using csb::foundation::ErrorCode;

TEST(CollectionSerializerTest, BinaryDocumentRoundTrip) {
    CollectionSerializer s;
    std::map<int, std::string> original{{1, "a"}, {2, "b"}, {3, "c"}};

    auto bin = s.serializeBinary(original);
    ASSERT_TRUE(bin.hasValue());
    ASSERT_GE(bin.value().size(), 8u);
    EXPECT_EQ(bin.value()[0], 'C');
    EXPECT_EQ(bin.value()[3], 'F');

    auto back = s.deserializeBinary<std::map<int, std::string>>(bin.value());
    ASSERT_TRUE(back.hasValue());
    EXPECT_EQ(back.value(), original);
}

TEST(CollectionSerializerTest, JsonDocumentRoundTrip) {
    CollectionSerializer s;
    SparseMap<std::deque<std::string>> original;
    original.Insert(5, {"x"});
    original.Insert(100, {"y", "z"});

    auto json = s.serializeJson(original);
    ASSERT_TRUE(json.hasValue());
    EXPECT_EQ(json.value(), R"({"5":["x"],"100":["y","z"]})");

    auto back = s.deserializeJson<SparseMap<std::deque<std::string>>>(json.value());
    ASSERT_TRUE(back.hasValue());
    EXPECT_EQ(back.value(), original);
}

TEST(CollectionSerializerTest, EmptyContainers) {
    CollectionSerializer s;
    auto bin = s.serializeBinary(std::unordered_map<std::string, int>{});
    ASSERT_TRUE(bin.hasValue());
    EXPECT_EQ(bin.value().size(), 12u);  // header + zero length

    auto back = s.deserializeBinary<std::unordered_map<std::string, int>>(bin.value());
    ASSERT_TRUE(back.hasValue());
    EXPECT_TRUE(back.value().empty());

    auto json = s.serializeJson(std::list<int>{});
    ASSERT_TRUE(json.hasValue());
    EXPECT_EQ(json.value(), "[]");
}

TEST(CollectionSerializerTest, BinaryRejectsMissingHeader) {
    CollectionSerializer s;
    std::vector<uint8_t> raw{0, 0, 0, 0};
    auto r = s.deserializeBinary<std::list<int>>(raw);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidBinaryData);
}

TEST(CollectionSerializerTest, BinaryRejectsTrailingBytes) {
    CollectionSerializer s;
    auto bin = s.serializeBinary(std::set<int>{1});
    ASSERT_TRUE(bin.hasValue());
    auto bytes = bin.value();
    bytes.push_back(0);

    auto r = s.deserializeBinary<std::set<int>>(bytes);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::TrailingData);
}

TEST(CollectionSerializerTest, BinaryRejectsTruncation) {
    CollectionSerializer s;
    auto bin = s.serializeBinary(std::vector<std::string>{"hello", "world"});
    ASSERT_TRUE(bin.hasValue());
    auto bytes = bin.value();
    bytes.pop_back();

    auto r = s.deserializeBinary<std::vector<std::string>>(bytes);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::UnexpectedEnd);
}

TEST(CollectionSerializerTest, JsonRejectsTrailingText) {
    CollectionSerializer s;
    auto r = s.deserializeJson<std::vector<int>>("[1] x");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::TrailingData);
}

TEST(CollectionSerializerTest, EncodeErrorSurfaces) {
    CollectionSerializer s;
    auto r = s.serializeJson(std::map<std::set<int>, int>{{{1}, 1}});
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::UnsupportedMapKey);
}

TEST(CollectionSerializerTest, OptionsApplyToBothBackends) {
    CodecOptions options;
    options.maxDepth = 1;
    CollectionSerializer s(options);
    EXPECT_EQ(s.options().maxDepth, 1u);

    auto nested = std::vector<std::vector<int>>{{1}};
    auto bin = s.serializeBinary(nested);
    ASSERT_TRUE(bin.hasError());
    EXPECT_EQ(bin.error().code(), ErrorCode::DepthLimitExceeded);

    auto json = s.deserializeJson<std::vector<std::vector<int>>>("[[1]]");
    ASSERT_TRUE(json.hasError());
    EXPECT_EQ(json.error().code(), ErrorCode::DepthLimitExceeded);

    s.setOptions(CodecOptions{});
    EXPECT_TRUE(s.serializeBinary(nested).hasValue());
}

TEST(CollectionSerializerTest, MoveKeepsOptions) {
    CodecOptions options;
    options.maxFrameLength = 7;
    CollectionSerializer a(options);
    CollectionSerializer b(std::move(a));
    EXPECT_EQ(b.options().maxFrameLength, 7u);
}
