/**
 * @file    dct_transform_test.cpp
 * @brief   Block DCT / QIM transform tests
 * @license MIT
 */

#include "core/dct_transform.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace dmt {
namespace {

using test::noise_image;

BitVector bits_of(std::string_view s) {
    return payload_to_bits(Payload(s.begin(), s.end()));
}

TEST(DctTransformTest, RoundTripColour) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(256, 256);
    const BitVector bits = bits_of("watermark");

    const cv::Mat marked = transform.embed(image, bits, 3, 7, OperationContext{});
    ASSERT_EQ(marked.size(), image.size());
    ASSERT_EQ(marked.type(), image.type());

    EXPECT_EQ(transform.extract(marked, static_cast<int>(bits.size()), 3, 7, OperationContext{}),
              bits);
}

TEST(DctTransformTest, RoundTripGrey) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(128, 96, 1);
    const BitVector bits = bits_of("grey");

    const cv::Mat marked = transform.embed(image, bits, 1, 1, OperationContext{});
    EXPECT_EQ(transform.extract(marked, static_cast<int>(bits.size()), 1, 1, OperationContext{}),
              bits);
}

TEST(DctTransformTest, AlphaChannelIsPreserved) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(64, 64, 4);
    const cv::Mat marked = transform.embed(image, bits_of("a"), 1, 1, OperationContext{});

    ASSERT_EQ(marked.channels(), 4);
    cv::Mat alpha_in, alpha_out;
    cv::extractChannel(image, alpha_in, 3);
    cv::extractChannel(marked, alpha_out, 3);
    EXPECT_EQ(cv::norm(alpha_in, alpha_out, cv::NORM_INF), 0.0);
}

TEST(DctTransformTest, MarkIsImperceptible) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(128, 128);
    const cv::Mat marked = transform.embed(image, bits_of("quiet"), 5, 9, OperationContext{});

    // Mean absolute pixel change stays within a few grey levels
    cv::Mat diff_image;
    cv::absdiff(image, marked, diff_image);
    const cv::Scalar diff = cv::mean(diff_image);
    for (int c = 0; c < 3; ++c) {
        EXPECT_LT(diff[c], 4.0);
    }
}

TEST(DctTransformTest, WrongWatermarkKeyScramblesBits) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(256, 256);
    const BitVector bits = bits_of("watermark");

    const cv::Mat marked = transform.embed(image, bits, 3, 7, OperationContext{});
    EXPECT_NE(transform.extract(marked, static_cast<int>(bits.size()), 3, 8, OperationContext{}),
              bits);
}

TEST(DctTransformTest, KeysZeroAndMinusOneAreDistinct) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(256, 256);
    const BitVector bits = bits_of("zero!");

    const cv::Mat marked = transform.embed(image, bits, 0, 0, OperationContext{});
    const int length = static_cast<int>(bits.size());
    EXPECT_EQ(transform.extract(marked, length, 0, 0, OperationContext{}), bits);
    EXPECT_NE(transform.extract(marked, length, -1, 0, OperationContext{}), bits);
    EXPECT_NE(transform.extract(marked, length, 0, -1, OperationContext{}), bits);
}

TEST(DctTransformTest, WrongBitLengthIsNotDetected) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(256, 256);
    const BitVector bits = bits_of("abcd");

    const cv::Mat marked = transform.embed(image, bits, 1, 1, OperationContext{});

    // Any positive length "works": the result has the requested size
    EXPECT_EQ(transform.extract(marked, 24, 1, 1, OperationContext{}).size(), 24u);
    EXPECT_EQ(transform.extract(marked, 40, 1, 1, OperationContext{}).size(), 40u);
}

TEST(DctTransformTest, CapacityIsOneBitPerBlock) {
    DctQimTransform transform;
    EXPECT_EQ(transform.capacity_bits(cv::Mat(64, 80, CV_8UC3)), 80u);
    EXPECT_EQ(transform.capacity_bits(cv::Mat(7, 100, CV_8UC3)), 0u);
}

TEST(DctTransformTest, PayloadLargerThanCapacityIsRejected) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(16, 16);  // 4 blocks
    EXPECT_THROW(transform.embed(image, bits_of("x"), 1, 1, OperationContext{}),
                 CapabilityError);
}

TEST(DctTransformTest, InvalidInputsAreRejected) {
    DctQimTransform transform;
    const cv::Mat image = noise_image(64, 64);

    EXPECT_THROW(transform.embed(image, BitVector{}, 1, 1, OperationContext{}), CapabilityError);
    EXPECT_THROW(transform.embed(cv::Mat(), bits_of("x"), 1, 1, OperationContext{}),
                 CapabilityError);
    EXPECT_THROW(transform.embed(cv::Mat(64, 64, CV_16UC3, cv::Scalar::all(0)), bits_of("x"),
                                 1, 1, OperationContext{}),
                 CapabilityError);
    EXPECT_THROW(transform.extract(image, 0, 1, 1, OperationContext{}), CapabilityError);
}

TEST(DctTransformTest, InvalidOptionsAreRejected) {
    EXPECT_THROW(DctQimTransform(DctQimOptions{.step = 0.0f}), ValidationError);
    EXPECT_THROW(DctQimTransform(DctQimOptions{.coef_row = 0, .coef_col = 0}), ValidationError);
    EXPECT_THROW(DctQimTransform(DctQimOptions{.coef_row = 8}), ValidationError);
}

TEST(DctTransformTest, CancelledContextStopsEmbedding) {
    DctQimTransform transform;
    std::atomic<bool> cancel{true};
    const OperationContext ctx(std::nullopt, &cancel);

    EXPECT_THROW(transform.embed(noise_image(64, 64), bits_of("x"), 1, 1, ctx), CancelledError);
}

TEST(DctTransformTest, CancelledContextStopsLongKeystream) {
    DctQimTransform transform;
    std::atomic<bool> cancel{true};
    const OperationContext ctx(std::nullopt, &cancel);

    // No full block: only the keystream and vote loops see the context
    EXPECT_THROW(transform.extract(noise_image(4, 4), 1 << 20, 1, 1, ctx), CancelledError);
}

TEST(DctTransformTest, ExpiredDeadlineStopsExtraction) {
    DctQimTransform transform;
    const OperationContext ctx(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_THROW(transform.extract(noise_image(64, 64), 8, 1, 1, ctx), TimeoutError);
}

}  // namespace
}  // namespace dmt
