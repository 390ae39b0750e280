/**
 * @file    attack_simulator.hpp
 * @brief   Robustness attacks on watermarked images
 * @license MIT
 *
 * @details
 * The orchestrator validates the attack type and the parameters each type
 * requires, then hands off to an AttackSimulator. OpenCvAttackSimulator is
 * the reference implementation:
 *
 *   cut          crop to a box (absolute or relative), optional rescale
 *   resize       resize to width x height
 *   bright       multiply intensities by ratio
 *   shelter      n white rectangles of ratio x image size
 *   salt_pepper  ratio of pixels forced to black or white
 *   rot          rotate by angle degrees about the centre
 */

#pragma once

#include "core/geometry.hpp"
#include "core/operation_context.hpp"

#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dmt {

enum class AttackType {
    Cut,
    Resize,
    Bright,
    Shelter,
    SaltPepper,
    Rotate,
};

inline constexpr std::array<AttackType, 6> kAllAttackTypes = {
    AttackType::Cut, AttackType::Resize, AttackType::Bright,
    AttackType::Shelter, AttackType::SaltPepper, AttackType::Rotate,
};

std::string_view to_string(AttackType type) noexcept;

/**
 * Parse the wire name of an attack ("cut", "resize", "bright", "shelter",
 * "salt_pepper", "rot")
 *
 * @throws ValidationError for an unrecognized name
 */
AttackType parse_attack_type(std::string_view name);

/**
 * Union of all attack parameters; each attack reads the fields it needs
 */
struct AttackParams {
    std::optional<CropBox> box;             // cut: absolute box
    std::optional<cv::Rect2d> relative_box; // cut: box as fractions of width/height
    std::optional<double> scale;            // cut: rescale factor after cropping
    std::optional<int> width;               // resize
    std::optional<int> height;              // resize
    std::optional<double> ratio;            // bright, shelter, salt_pepper
    std::optional<int> count;               // shelter: number of rectangles
    std::optional<double> angle;            // rot: degrees, counter-clockwise
    std::uint64_t seed = 0;                 // shelter, salt_pepper
};

/**
 * Check that params carry everything `type` needs with sane values
 *
 * @throws ValidationError naming the first missing/invalid field
 */
void validate_attack_params(AttackType type, const AttackParams& params);

/**
 * Resolve the cut box of params against an image of the given shape
 *
 * @throws ValidationError if the box does not fit the image
 */
CropBox resolve_cut_box(const AttackParams& params, const CanvasShape& shape);

class AttackSimulator {
public:
    virtual ~AttackSimulator() = default;

    /**
     * Apply one attack to a copy of image
     *
     * Params have already been validated by the caller.
     */
    virtual cv::Mat apply(const cv::Mat& image, AttackType type,
                          const AttackParams& params,
                          const OperationContext& ctx) const = 0;
};

class OpenCvAttackSimulator : public AttackSimulator {
public:
    cv::Mat apply(const cv::Mat& image, AttackType type,
                  const AttackParams& params,
                  const OperationContext& ctx) const override;
};

}  // namespace dmt
