#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "codec/round_trip.hpp"
#include "codec/trace_codec.hpp"

using csb::collections::SparseMap;
using csb::test::binaryRoundTrip;
using csb::test::jsonRoundTrip;

TEST(SparseAdapterTest, KeysAndValuesSurviveBinary) {
    SparseMap<std::string> original;
    original.Insert(5, "x");
    original.Insert(100, "y");

    auto result = binaryRoundTrip(original);
    ASSERT_TRUE(result.hasValue());
    const auto& decoded = result.value();
    EXPECT_EQ(decoded, original);
    EXPECT_EQ(decoded.Size(), 2u);
    EXPECT_FALSE(decoded.Has(6));
    EXPECT_FALSE(decoded.Has(0));
}

TEST(SparseAdapterTest, JsonUsesDecimalKeys) {
    SparseMap<int> original;
    original.Insert(7, -1);
    original.Insert(2, 40);

    csb::codec::JsonEncoder enc;
    ASSERT_TRUE(csb::codec::encode(original, enc).hasValue());
    EXPECT_EQ(enc.str(), R"({"2":40,"7":-1})");

    auto result = jsonRoundTrip(original);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), original);
}

TEST(SparseAdapterTest, RemovedKeysStayAbsent) {
    SparseMap<int> original;
    original.Insert(1, 1);
    original.Insert(2, 2);
    original.Insert(3, 3);
    original.Remove(2);

    auto result = binaryRoundTrip(original);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().Size(), 2u);
    EXPECT_FALSE(result.value().Has(2));
}

TEST(SparseAdapterTest, Empty) {
    auto result = jsonRoundTrip(SparseMap<std::string>{});
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().Empty());
}

TEST(SparseAdapterTest, ValuesCanBeContainers) {
    SparseMap<std::vector<std::string>> original;
    original.Insert(0, {"a", "b"});
    original.Insert(9, {});

    auto result = binaryRoundTrip(original);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), original);
}

TEST(SparseAdapterTest, NegativeKeyRejected) {
    csb::codec::JsonDecoder dec(R"({"-3":"x"})");
    auto result = csb::codec::decode<SparseMap<std::string>>(dec);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), csb::foundation::ErrorCode::ValueOutOfRange);
}

TEST(SparseAdapterTest, DuplicateKeyKeepsLastValue) {
    csb::codec::JsonDecoder dec(R"({"4":"old","4":"new"})");
    auto result = csb::codec::decode<SparseMap<std::string>>(dec);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().Size(), 1u);
    ASSERT_NE(result.value().Get(4), nullptr);
    EXPECT_EQ(*result.value().Get(4), "new");
}

TEST(SparseAdapterTest, HugeKeyFailsBeforeAllocating) {
    // map(1) { 2^62: "x" } in the binary layout.
    std::vector<uint8_t> bytes{1, 0, 0, 0,
                               0, 0, 0, 0, 0, 0, 0, 0x40,
                               1, 0, 0, 0, 'x'};
    csb::codec::BinaryDecoder dec(bytes);
    auto result = csb::codec::decode<SparseMap<std::string>>(dec);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), csb::foundation::ErrorCode::ValueOutOfRange);
}

TEST(SparseAdapterTest, KeyLimitFollowsOptions) {
    csb::foundation::CodecOptions options;
    options.maxSparseKey = 10;

    csb::codec::JsonDecoder atLimit(R"({"10":"x"})", options);
    auto ok = csb::codec::decode<SparseMap<std::string>>(atLimit);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_TRUE(ok.value().Has(10));

    csb::codec::JsonDecoder above(R"({"1":"a","11":"x"})", options);
    auto rejected = csb::codec::decode<SparseMap<std::string>>(above);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), csb::foundation::ErrorCode::ValueOutOfRange);
}

TEST(SparseAdapterTest, KeyLimitAppliesToAnyDecoder) {
    csb::test::TraceDecoder dec({"map(1)", "key(0)", "uint:4611686018427387904", "val(0)",
                                 "str:x", "end"});
    auto result = csb::codec::decode<SparseMap<std::string>>(dec);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().what.rfind("range: sparse key ", 0), 0u);
}
