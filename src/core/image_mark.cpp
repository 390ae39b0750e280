/**
 * @file    image_mark.cpp
 * @brief   Invisible image mark orchestration implementation
 * @license MIT
 */

#include "core/image_mark.hpp"
#include "core/capability_call.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>
#include <chrono>
#include <utility>

namespace dmt {

InvisibleImageMarkOrchestrator::InvisibleImageMarkOrchestrator(
    std::shared_ptr<const TransformCapability> transform,
    std::shared_ptr<const AttackSimulator> attacks)
    : transform_(std::move(transform)), attacks_(std::move(attacks)) {
    if (!transform_) {
        throw ValidationError("image mark: transform capability is required");
    }
    if (!attacks_) {
        throw ValidationError("image mark: attack simulator is required");
    }
}

EmbeddedMark InvisibleImageMarkOrchestrator::embed(
    const cv::Mat& image, const Payload& payload,
    int key_image, int key_watermark,
    const OperationContext& ctx) const {
    if (image.empty()) {
        throw ValidationError("image mark: empty image");
    }
    if (payload.empty()) {
        throw ValidationError("image mark: empty payload");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const BitVector bits = payload_to_bits(payload);

    EmbeddedMark mark;
    mark.image = run_capability("embed", ctx, [&] {
        return transform_->embed(image, bits, key_image, key_watermark, ctx);
    });
    mark.bit_length = static_cast<int>(bits.size());

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("Embedded {}-bit mark into {}x{} image in {} ms",
                 mark.bit_length, image.cols, image.rows, elapsed);

    return mark;
}

Payload InvisibleImageMarkOrchestrator::extract(
    const cv::Mat& image, int bit_length,
    int key_image, int key_watermark,
    const OperationContext& ctx) const {
    if (image.empty()) {
        throw ValidationError("image mark: empty image");
    }
    if (bit_length <= 0) {
        throw ValidationError("image mark: bit length must be positive");
    }

    const BitVector bits = run_capability("extract", ctx, [&] {
        return transform_->extract(image, bit_length, key_image, key_watermark, ctx);
    });

    if (bit_length % 8 != 0) {
        spdlog::warn("Bit length {} is not a whole number of bytes; "
                     "trailing {} bit(s) dropped", bit_length, bit_length % 8);
    }

    Payload payload = bits_to_payload(bits);
    spdlog::info("Extracted {} bytes ({} bits) from {}x{} image",
                 payload.size(), bit_length, image.cols, image.rows);
    return payload;
}

cv::Mat InvisibleImageMarkOrchestrator::attack(
    const cv::Mat& image, AttackType type, const AttackParams& params,
    const OperationContext& ctx) const {
    if (image.empty()) {
        throw ValidationError("attack: empty image");
    }
    validate_attack_params(type, params);
    if (type == AttackType::Cut) {
        resolve_cut_box(params, shape_of(image));
    }

    cv::Mat attacked = run_capability("attack", ctx, [&] {
        return attacks_->apply(image, type, params, ctx);
    });

    spdlog::info("Applied '{}' attack: {}x{} -> {}x{}", to_string(type),
                 image.cols, image.rows, attacked.cols, attacked.rows);
    return attacked;
}

}  // namespace dmt
