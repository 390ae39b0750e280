/**
 * @file    template_matcher.hpp
 * @brief   Template matching capability for crop geometry estimation
 * @license MIT
 */

#pragma once

#include "core/operation_context.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace dmt {

/**
 * Best placement of a template inside a larger image
 */
struct MatchResult {
    cv::Point location;     // Top-left corner in the image frame
    cv::Size size;          // Matched region size (template size / scale)
    double score = 0.0;     // Similarity, higher is better
    double scale = 1.0;     // Template scale relative to the image
};

class TemplateMatcher {
public:
    virtual ~TemplateMatcher() = default;

    /**
     * Locate templ inside image
     *
     * Among locations scoring within tolerance() of the best score, the
     * first in raster order (top-left to bottom-right) wins.
     */
    virtual MatchResult best_match(const cv::Mat& image, const cv::Mat& templ,
                                   const OperationContext& ctx) const = 0;

    /**
     * Scores below this are not a usable match
     */
    virtual double confidence_floor() const noexcept = 0;

    /**
     * Scores this close to the best are treated as ties
     */
    virtual double tolerance() const noexcept = 0;
};

struct NccMatcherOptions {
    double confidence_floor = 0.5;
    double tolerance = 1e-4;
    // Candidate template scales (template size / region size). The template
    // is resized by 1/scale before matching.
    std::vector<double> scales{1.0};
};

/**
 * Normalized cross-correlation (cv::TM_CCOEFF_NORMED) on grey float images
 */
class NccTemplateMatcher : public TemplateMatcher {
public:
    explicit NccTemplateMatcher(NccMatcherOptions options = NccMatcherOptions{});

    MatchResult best_match(const cv::Mat& image, const cv::Mat& templ,
                           const OperationContext& ctx) const override;

    double confidence_floor() const noexcept override { return options_.confidence_floor; }
    double tolerance() const noexcept override { return options_.tolerance; }

private:
    NccMatcherOptions options_;
};

}  // namespace dmt
