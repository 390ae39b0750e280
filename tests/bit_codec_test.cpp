/**
 * @file    bit_codec_test.cpp
 * @brief   Zero-width marker codec tests
 * @license MIT
 */

#include "core/bit_codec.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <string>

namespace dmt {
namespace {

const std::string Z(BitCodec::kZero);
const std::string O(BitCodec::kOne);

Payload bytes_of(std::string_view s) {
    return Payload(s.begin(), s.end());
}

TEST(BitCodecTest, EncodesMostSignificantBitFirst) {
    BitCodec codec;
    // 'A' = 0x41 = 0100 0001
    EXPECT_EQ(codec.encode(bytes_of("A")), Z + O + Z + Z + Z + Z + Z + O);
}

TEST(BitCodecTest, EncodedTextContainsOnlyMarkers) {
    BitCodec codec;
    const Payload payload = bytes_of("Hello, world!");
    const std::string encoded = codec.encode(payload);

    EXPECT_EQ(encoded.size(), payload.size() * 8 * BitCodec::kZero.size());
    EXPECT_EQ(codec.marker_count(encoded), payload.size() * 8);
}

TEST(BitCodecTest, EmptyPayloadEncodesToEmptyText) {
    BitCodec codec;
    EXPECT_TRUE(codec.encode(Payload{}).empty());
    EXPECT_TRUE(codec.decode("").empty());
}

TEST(BitCodecTest, DecodeIgnoresVisibleText) {
    BitCodec codec;
    const std::string run = codec.encode(bytes_of("ok"));

    // Scatter the markers through ordinary (and multi-byte) text
    std::string mixed = "<p>caf\xC3\xA9 ";
    for (std::size_t i = 0; i < run.size(); i += BitCodec::kZero.size()) {
        mixed += run.substr(i, BitCodec::kZero.size());
        mixed += (i % 2 == 0) ? "x" : "\xE2\x82\xAC";
    }
    mixed += "</p>";

    EXPECT_EQ(codec.decode(mixed), bytes_of("ok"));
}

TEST(BitCodecTest, DecodeDropsTrailingPartialGroup) {
    BitCodec codec;
    const std::string text = codec.encode(bytes_of("Z")) + O + Z + O;
    EXPECT_EQ(codec.decode(text), bytes_of("Z"));
}

TEST(BitCodecTest, AllByteValuesSurvive) {
    BitCodec codec;
    Payload all;
    for (int b = 0; b < 256; ++b) all.push_back(static_cast<std::uint8_t>(b));
    EXPECT_EQ(codec.decode(codec.encode(all)), all);
}

TEST(BitCodecTest, BitsArePackedMsbFirst) {
    const BitVector bits = payload_to_bits(Payload{0x80, 0x01});
    ASSERT_EQ(bits.size(), 16u);
    EXPECT_EQ(bits[0], 1);
    EXPECT_EQ(bits[7], 0);
    EXPECT_EQ(bits[15], 1);

    EXPECT_EQ(bits_to_payload(bits), (Payload{0x80, 0x01}));
}

TEST(BitCodecTest, BitsToPayloadDropsTrailingPartialGroup) {
    BitVector bits = payload_to_bits(Payload{0xA5});
    bits.push_back(1);
    bits.push_back(1);
    EXPECT_EQ(bits_to_payload(bits), Payload{0xA5});
}

TEST(PayloadTextTest, LatinOneMapsToSingleBytes) {
    EXPECT_EQ(payload_from_text("abc"), bytes_of("abc"));
    EXPECT_EQ(payload_from_text("\xC3\xA9"), Payload{0xE9});  // U+00E9
    EXPECT_EQ(text_from_payload(Payload{0xE9, 'x'}), "\xC3\xA9x");
}

TEST(PayloadTextTest, RejectsCodePointsAboveLatinOne) {
    EXPECT_THROW(payload_from_text("price: \xE2\x82\xAC"), ValidationError);  // U+20AC
    EXPECT_THROW(payload_from_text("\xF0\x9F\x98\x80"), ValidationError);     // U+1F600
}

TEST(PayloadTextTest, RejectsMalformedUtf8) {
    EXPECT_THROW(payload_from_text("\xC3"), ValidationError);
    EXPECT_THROW(payload_from_text("\x80"), ValidationError);
    EXPECT_THROW(payload_from_text("\xC3(x"), ValidationError);
}

TEST(PlausibilityTest, PrintableTextScoresHigh) {
    EXPECT_DOUBLE_EQ(plausibility_ratio(bytes_of("hello world")), 1.0);
    EXPECT_DOUBLE_EQ(plausibility_ratio(Payload{0x00, 0x01, 'a', 'b'}), 0.5);
    EXPECT_DOUBLE_EQ(plausibility_ratio(Payload{}), 0.0);
}

}  // namespace
}  // namespace dmt
