/**
 * @file    transform_capability.hpp
 * @brief   Keyed frequency-domain transform interface
 * @license MIT
 *
 * @details
 * The orchestrator only talks to this interface. Implementations perturb
 * image content to carry a bit vector under two integer keys and read it
 * back given the bit count. They never store the bit count anywhere.
 */

#pragma once

#include "core/bit_codec.hpp"
#include "core/operation_context.hpp"

#include <opencv2/core.hpp>
#include <cstddef>

namespace dmt {

class TransformCapability {
public:
    virtual ~TransformCapability() = default;

    /**
     * Embed bits into a copy of image
     *
     * @param image          BGR/BGRA/grey 8-bit image (not modified)
     * @param bits           Bits to carry
     * @param key_image      Key controlling where bits land in the image
     * @param key_watermark  Key scrambling the bits themselves
     * @param ctx            Deadline/cancellation, polled during the work
     * @return               Watermarked image, same size and type as input
     */
    virtual cv::Mat embed(const cv::Mat& image, const BitVector& bits,
                          int key_image, int key_watermark,
                          const OperationContext& ctx) const = 0;

    /**
     * Read bit_length bits back from image
     *
     * The result always has bit_length entries. Nothing checks that
     * bit_length matches the embedded length.
     */
    virtual BitVector extract(const cv::Mat& image, int bit_length,
                              int key_image, int key_watermark,
                              const OperationContext& ctx) const = 0;

    /**
     * Maximum number of distinct bits the image can carry
     */
    virtual std::size_t capacity_bits(const cv::Mat& image) const = 0;
};

}  // namespace dmt
