/**
 * @file    dct_transform.hpp
 * @brief   Reference keyed transform: block DCT with QIM
 * @license MIT
 *
 * @details
 * Carries one bit per 8x8 luma block in a mid-frequency DCT coefficient
 * using quantization index modulation (QIM): the coefficient magnitude is
 * snapped to a multiple of `step` whose parity encodes the bit.
 *
 *   key_image      shuffles the block visiting order (cv::RNG + randShuffle)
 *   key_watermark  XOR keystream over the payload bits
 *
 * Bits are repeated cyclically across all blocks (block k carries bit
 * k mod L) and extraction takes a majority vote per bit. Blocks whose
 * pixels are all equal cast no vote, so the constant fill around a
 * recovered crop does not drag bits toward zero.
 */

#pragma once

#include "core/transform_capability.hpp"

namespace dmt {

struct DctQimOptions {
    float step = 24.0f;     // QIM quantization step on the DCT coefficient
    int coef_row = 2;       // Coefficient position inside the 8x8 block
    int coef_col = 3;
};

class DctQimTransform : public TransformCapability {
public:
    static constexpr int kBlockSize = 8;

    explicit DctQimTransform(DctQimOptions options = DctQimOptions{});

    cv::Mat embed(const cv::Mat& image, const BitVector& bits,
                  int key_image, int key_watermark,
                  const OperationContext& ctx) const override;

    BitVector extract(const cv::Mat& image, int bit_length,
                      int key_image, int key_watermark,
                      const OperationContext& ctx) const override;

    std::size_t capacity_bits(const cv::Mat& image) const override;

    const DctQimOptions& options() const noexcept { return options_; }

private:
    DctQimOptions options_;
};

}  // namespace dmt
