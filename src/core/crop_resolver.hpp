/**
 * @file    crop_resolver.hpp
 * @brief   Crop geometry estimation and canvas recovery
 * @license MIT
 *
 * @details
 * After a crop attack the marked fragment has lost its position in the
 * original frame, and a block-based transform can no longer find its bits.
 * The resolver:
 *
 *   1. estimate_crop(): finds where the fragment sits in the original using
 *      an injected TemplateMatcher
 *   2. recover_crop():  pastes the fragment back at that box on a canvas of
 *      the original size, everything else set to a constant neutral fill
 *
 * Recovery never resizes. A box whose size differs from the fragment is
 * rejected, since resampling would destroy the frequency-domain mark.
 */

#pragma once

#include "core/geometry.hpp"
#include "core/operation_context.hpp"
#include "core/template_matcher.hpp"

#include <opencv2/core.hpp>
#include <memory>

namespace dmt {

struct CropEstimate {
    CropBox box;            // Where the template sits in the original
    CanvasShape shape;      // Size of the original
    double score = 0.0;     // Matcher score of the winning location
    double scale = 1.0;     // Template scale relative to the original
};

class CropGeometryResolver {
public:
    /**
     * @param matcher       Template matching capability (required)
     * @param neutral_fill  Value written outside the crop box on recovery
     * @throws ValidationError if matcher is null
     */
    explicit CropGeometryResolver(std::shared_ptr<const TemplateMatcher> matcher,
                                  cv::Scalar neutral_fill = cv::Scalar::all(0));

    /**
     * Estimate where templ was cut from original
     *
     * @throws ValidationError  empty input or template larger than original
     * @throws NoMatchError     best score below the matcher's confidence floor
     * @throws CapabilityError  matcher fault
     */
    CropEstimate estimate_crop(const cv::Mat& original, const cv::Mat& templ,
                               const OperationContext& ctx = {}) const;

    /**
     * Rebuild a canvas of target_shape with templ placed exactly at box
     *
     * @throws ValidationError  box outside target_shape, or box size !=
     *                          template size
     */
    cv::Mat recover_crop(const cv::Mat& templ, const CropBox& box,
                         const CanvasShape& target_shape) const;

    const cv::Scalar& neutral_fill() const noexcept { return neutral_fill_; }

private:
    std::shared_ptr<const TemplateMatcher> matcher_;
    cv::Scalar neutral_fill_;
};

}  // namespace dmt
