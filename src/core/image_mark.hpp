/**
 * @file    image_mark.hpp
 * @brief   Invisible image mark orchestration
 * @license MIT
 *
 * @details
 * Thin, stateless front for an injected TransformCapability and
 * AttackSimulator. Its real job is bookkeeping:
 *
 *   - keys go to the capability unchanged
 *   - the bit length is surfaced at embed time; the carrier has no length
 *     field, so the caller now owns the only copy
 *   - attack requests are validated before dispatch
 *
 * Extraction with the wrong bit length is NOT detected. It returns a
 * payload of the requested size with meaningless content.
 */

#pragma once

#include "core/attack_simulator.hpp"
#include "core/bit_codec.hpp"
#include "core/operation_context.hpp"
#include "core/transform_capability.hpp"

#include <opencv2/core.hpp>
#include <memory>

namespace dmt {

/**
 * Result of embedding: the marked image and the bit length needed to read it
 */
struct EmbeddedMark {
    cv::Mat image;
    int bit_length = 0;
};

class InvisibleImageMarkOrchestrator {
public:
    /**
     * @throws ValidationError if either capability is missing
     */
    InvisibleImageMarkOrchestrator(std::shared_ptr<const TransformCapability> transform,
                                   std::shared_ptr<const AttackSimulator> attacks);

    /**
     * Embed payload into a copy of image
     *
     * @throws ValidationError  empty image or empty payload
     * @throws CapabilityError  transform fault (format, capacity...)
     * @throws TimeoutError / CancelledError
     */
    EmbeddedMark embed(const cv::Mat& image, const Payload& payload,
                       int key_image, int key_watermark,
                       const OperationContext& ctx = {}) const;

    /**
     * Extract bit_length bits and pack them into bytes
     *
     * @throws ValidationError  empty image or bit_length <= 0
     * @throws CapabilityError  transform fault
     */
    Payload extract(const cv::Mat& image, int bit_length,
                    int key_image, int key_watermark,
                    const OperationContext& ctx = {}) const;

    /**
     * Validate then dispatch an attack to the simulator
     *
     * @throws ValidationError  empty image, missing/invalid params, cut box
     *                          outside the image
     */
    cv::Mat attack(const cv::Mat& image, AttackType type,
                   const AttackParams& params,
                   const OperationContext& ctx = {}) const;

private:
    std::shared_ptr<const TransformCapability> transform_;
    std::shared_ptr<const AttackSimulator> attacks_;
};

}  // namespace dmt
