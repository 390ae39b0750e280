/**
 * @file    template_matcher.cpp
 * @brief   NCC template matcher implementation
 * @license MIT
 *
 * @details
 * One matchTemplate pass per candidate scale. A scale only replaces the
 * current best when it beats it by more than the tie tolerance, so earlier
 * entries in the scale list win ties.
 */

#include "core/template_matcher.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <utility>

namespace dmt {

namespace {

cv::Mat to_gray_float(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    cv::Mat gray_f;
    gray.convertTo(gray_f, CV_32F, 1.0 / 255.0);
    return gray_f;
}

// First location in raster order whose score is within tolerance of the peak
cv::Point first_peak(const cv::Mat& scores, double peak, double tolerance) {
    const float threshold = static_cast<float>(peak - tolerance);
    for (int y = 0; y < scores.rows; ++y) {
        const float* row = scores.ptr<float>(y);
        for (int x = 0; x < scores.cols; ++x) {
            if (row[x] >= threshold) return cv::Point(x, y);
        }
    }
    return cv::Point(0, 0);
}

}  // namespace

NccTemplateMatcher::NccTemplateMatcher(NccMatcherOptions options)
    : options_(std::move(options)) {
    if (options_.scales.empty()) {
        throw ValidationError("template matcher: at least one scale is required");
    }
    for (double s : options_.scales) {
        if (!(s > 0.0)) {
            throw ValidationError("template matcher: scales must be positive");
        }
    }
    if (options_.tolerance < 0.0) {
        throw ValidationError("template matcher: tolerance must not be negative");
    }
}

MatchResult NccTemplateMatcher::best_match(const cv::Mat& image, const cv::Mat& templ,
                                           const OperationContext& ctx) const {
    auto start_time = std::chrono::high_resolution_clock::now();

    const cv::Mat image_f = to_gray_float(image);
    const cv::Mat templ_f = to_gray_float(templ);

    MatchResult best;
    best.score = -2.0;  // Below the NCC range [-1, 1]
    bool any_scale = false;

    for (double scale : options_.scales) {
        ctx.throw_if_stopped("template match");

        const cv::Size region(
            static_cast<int>(std::lround(templ_f.cols / scale)),
            static_cast<int>(std::lround(templ_f.rows / scale)));

        if (region.width < 1 || region.height < 1 ||
            region.width > image_f.cols || region.height > image_f.rows) {
            spdlog::debug("  scale {:.3f}: region {}x{} does not fit, skipped",
                          scale, region.width, region.height);
            continue;
        }

        cv::Mat tmpl = templ_f;
        if (region != templ_f.size()) {
            cv::resize(templ_f, tmpl, region, 0, 0,
                       scale < 1.0 ? cv::INTER_LINEAR : cv::INTER_AREA);
        }

        cv::Mat match_result;
        cv::matchTemplate(image_f, tmpl, match_result, cv::TM_CCOEFF_NORMED);
        cv::patchNaNs(match_result, -1.0);  // Flat template/window gives 0/0

        double min_val, max_val;
        cv::minMaxLoc(match_result, &min_val, &max_val);
        any_scale = true;

        spdlog::debug("  scale {:.3f}: ncc={:.4f}", scale, max_val);

        if (max_val > best.score + options_.tolerance) {
            best.location = first_peak(match_result, max_val, options_.tolerance);
            best.size = region;
            best.score = max_val;
            best.scale = scale;
        }
    }

    if (!any_scale) {
        throw ValidationError("template matcher: template does not fit the image at any scale");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("Template match in {} us: pos=({},{}) size={}x{} score={:.4f} scale={:.3f}",
                  elapsed, best.location.x, best.location.y,
                  best.size.width, best.size.height, best.score, best.scale);

    return best;
}

}  // namespace dmt
