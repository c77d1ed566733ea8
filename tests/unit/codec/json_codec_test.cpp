#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <deque>
#include <limits>
#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "csb/codec/collections.hpp"
#include "csb/codec/json_codec.hpp"

using namespace csb::codec;
using csb::collections::SparseMap;
using csb::foundation::CodecOptions;
using csb::foundation::ErrorCode;

// ---------------------------------------------------------------------------
// Encoder output
// ---------------------------------------------------------------------------

TEST(JsonEncoderTest, ArraysAndObjects) {
    std::map<std::string, std::list<int>> m{{"a", {1, 2}}, {"b", {}}};
    JsonEncoder enc;
    ASSERT_TRUE(encode(m, enc).hasValue());
    EXPECT_EQ(enc.str(), R"({"a":[1,2],"b":[]})");
}

TEST(JsonEncoderTest, ScalarKeysAreQuoted) {
    std::map<bool, double> m{{false, 0.5}, {true, -2.0}};
    JsonEncoder enc;
    ASSERT_TRUE(encode(m, enc).hasValue());
    EXPECT_EQ(enc.str(), R"({"false":0.5,"true":-2})");
}

TEST(JsonEncoderTest, StringEscaping) {
    std::vector<std::string> v{"q\"b\\n\n", std::string(1, '\x01')};
    JsonEncoder enc;
    ASSERT_TRUE(encode(v, enc).hasValue());
    EXPECT_EQ(enc.str(), R"(["q\"b\\n\n","\u0001"])");
}

TEST(JsonEncoderTest, NonFiniteRejected) {
    JsonEncoder enc;
    auto r = encode(std::vector<double>{1.0, std::numeric_limits<double>::infinity()}, enc);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::NonFiniteNumber);
}

TEST(JsonEncoderTest, ContainerKeyRejected) {
    std::map<std::set<int>, int> m{{{1, 2}, 3}};
    JsonEncoder enc;
    auto r = encode(m, enc);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::UnsupportedMapKey);
}

TEST(JsonEncoderTest, DepthLimit) {
    CodecOptions options;
    options.maxDepth = 1;
    JsonEncoder enc(options);
    auto r = encode(std::list<std::list<int>>{{1}}, enc);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::DepthLimitExceeded);
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

TEST(JsonDecoderTest, WhitespaceTolerated) {
    JsonDecoder dec(" { \"1\" : [ true , false ] ,\n\"2\":[] } ");
    auto r = decode<std::map<int, std::deque<bool>>>(dec);
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value().at(1), (std::deque<bool>{true, false}));
    EXPECT_TRUE(r.value().at(2).empty());
    EXPECT_TRUE(dec.finish().hasValue());
}

TEST(JsonDecoderTest, CommasInsideStringsDoNotCount) {
    JsonDecoder dec(R"(["a,b", "[c]", "{"])");
    auto r = decode<std::vector<std::string>>(dec);
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value(), (std::vector<std::string>{"a,b", "[c]", "{"}));
}

TEST(JsonDecoderTest, UnicodeEscapes) {
    JsonDecoder dec(R"(["\u00e9", "\ud83d\ude00", "\u0001"])");
    auto r = decode<std::list<std::string>>(dec);
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value(), (std::list<std::string>{"\xC3\xA9", "\xF0\x9F\x98\x80", "\x01"}));
}

TEST(JsonDecoderTest, LoneSurrogateRejected) {
    JsonDecoder dec(R"(["\udc00"])");
    auto r = decode<std::list<std::string>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidJsonData);
}

TEST(JsonDecoderTest, WrongBracket) {
    JsonDecoder dec("[1, 2}");
    auto r = decode<std::vector<int>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidJsonData);
}

TEST(JsonDecoderTest, ObjectWhereArrayExpected) {
    JsonDecoder dec(R"({"a":1})");
    auto r = decode<std::vector<int>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidJsonData);
}

TEST(JsonDecoderTest, Unterminated) {
    JsonDecoder dec("[1, 2");
    auto r = decode<std::vector<int>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::UnexpectedEnd);
}

TEST(JsonDecoderTest, TrailingCommaIsMalformed) {
    JsonDecoder dec("[1,]");
    auto r = decode<std::vector<int>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidJsonData);
}

TEST(JsonDecoderTest, FractionForIntegerRejected) {
    JsonDecoder dec("[1.5]");
    auto r = decode<std::vector<int>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidJsonData);
}

TEST(JsonDecoderTest, IntegerOverflow) {
    JsonDecoder dec("[99999999999999999999]");
    auto r = decode<std::vector<int64_t>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ValueOutOfRange);
}

TEST(JsonDecoderTest, NegativeZeroIsUnsignedZero) {
    JsonDecoder dec("[-0, 0]");
    auto r = decode<std::vector<uint32_t>>(dec);
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value(), (std::vector<uint32_t>{0, 0}));
}

TEST(JsonDecoderTest, NegativeForUnsignedRejected) {
    JsonDecoder dec("[-1]");
    auto r = decode<std::vector<uint32_t>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ValueOutOfRange);
}

TEST(JsonDecoderTest, NarrowingOverflow) {
    JsonDecoder dec("[128]");
    auto r = decode<std::vector<int8_t>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ValueOutOfRange);
}

TEST(JsonDecoderTest, NonNumericKey) {
    JsonDecoder dec(R"({"one":"x"})");
    auto r = decode<SparseMap<std::string>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidJsonData);
}

TEST(JsonDecoderTest, FrameLengthLimit) {
    CodecOptions options;
    options.maxFrameLength = 2;
    JsonDecoder dec("[1,2,3]", options);
    auto r = decode<std::vector<int>>(dec);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::LengthLimitExceeded);
}

TEST(JsonDecoderTest, TrailingData) {
    JsonDecoder dec("[] []");
    ASSERT_TRUE(decode<std::vector<int>>(dec).hasValue());
    auto end = dec.finish();
    ASSERT_TRUE(end.hasError());
    EXPECT_EQ(end.error().code(), ErrorCode::TrailingData);
}

TEST(JsonDecoderTest, DoubleRoundTripIsExact) {
    std::vector<double> original{0.1, 1.0 / 3.0, -1e-300, 123456789.125};
    JsonEncoder enc;
    ASSERT_TRUE(encode(original, enc).hasValue());

    JsonDecoder dec(enc.str());
    auto r = decode<std::vector<double>>(dec);
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value(), original);
}
