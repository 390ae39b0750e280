/**
 * @file    crop_resolver.cpp
 * @brief   Crop geometry estimation and canvas recovery implementation
 * @license MIT
 */

#include "core/crop_resolver.hpp"
#include "core/capability_call.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <utility>

namespace dmt {

CropGeometryResolver::CropGeometryResolver(std::shared_ptr<const TemplateMatcher> matcher,
                                           cv::Scalar neutral_fill)
    : matcher_(std::move(matcher)), neutral_fill_(neutral_fill) {
    if (!matcher_) {
        throw ValidationError("crop resolver: template matcher is required");
    }
}

CropEstimate CropGeometryResolver::estimate_crop(const cv::Mat& original,
                                                 const cv::Mat& templ,
                                                 const OperationContext& ctx) const {
    if (original.empty() || templ.empty()) {
        throw ValidationError("estimate crop: original and template are both required");
    }
    if (templ.cols > original.cols || templ.rows > original.rows) {
        throw ValidationError(fmt::format(
            "estimate crop: template {}x{} is larger than original {}x{}",
            templ.cols, templ.rows, original.cols, original.rows));
    }

    const MatchResult match = run_capability("template match", ctx, [&] {
        return matcher_->best_match(original, templ, ctx);
    });

    if (match.score < matcher_->confidence_floor()) {
        throw NoMatchError(fmt::format(
            "estimate crop: best score {:.4f} below confidence floor {:.4f}",
            match.score, matcher_->confidence_floor()), match.score);
    }

    CropEstimate estimate;
    estimate.box = CropBox::from_rect(cv::Rect(match.location, match.size));
    estimate.shape = shape_of(original);
    estimate.score = match.score;
    estimate.scale = match.scale;

    spdlog::info("Estimated crop ({},{})-({},{}) in {}x{} original, score={:.4f} scale={:.3f}",
                 estimate.box.x1, estimate.box.y1, estimate.box.x2, estimate.box.y2,
                 estimate.shape.width, estimate.shape.height,
                 estimate.score, estimate.scale);
    return estimate;
}

cv::Mat CropGeometryResolver::recover_crop(const cv::Mat& templ, const CropBox& box,
                                           const CanvasShape& target_shape) const {
    if (templ.empty()) {
        throw ValidationError("recover crop: empty template");
    }
    if (!target_shape.valid()) {
        throw ValidationError(fmt::format("recover crop: invalid canvas shape {}x{}",
                                          target_shape.width, target_shape.height));
    }
    if (!box.fits(target_shape)) {
        throw ValidationError(fmt::format(
            "recover crop: box ({},{})-({},{}) does not fit a {}x{} canvas",
            box.x1, box.y1, box.x2, box.y2, target_shape.width, target_shape.height));
    }
    if (box.width() != templ.cols || box.height() != templ.rows) {
        throw ValidationError(fmt::format(
            "recover crop: box is {}x{} but template is {}x{}",
            box.width(), box.height(), templ.cols, templ.rows));
    }

    cv::Mat canvas(target_shape.height, target_shape.width, templ.type(), neutral_fill_);
    templ.copyTo(canvas(box.to_rect()));

    spdlog::debug("Recovered {}x{} canvas with template at ({},{})",
                  target_shape.width, target_shape.height, box.x1, box.y1);
    return canvas;
}

}  // namespace dmt
