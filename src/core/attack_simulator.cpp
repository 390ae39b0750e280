/**
 * @file    attack_simulator.cpp
 * @brief   Robustness attack implementation
 * @license MIT
 */

#include "core/attack_simulator.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <string>

namespace dmt {

namespace {

cv::Mat cut_attack(const cv::Mat& image, const AttackParams& params) {
    const CropBox box = resolve_cut_box(params, shape_of(image));
    cv::Mat cropped = image(box.to_rect()).clone();

    if (params.scale && *params.scale != 1.0) {
        const double sw = cropped.cols * *params.scale;
        const double sh = cropped.rows * *params.scale;
        if (sw > kMaxCanvasSide || sh > kMaxCanvasSide) {
            throw ValidationError(fmt::format(
                "attack 'cut': scale {} gives a {:.0f}x{:.0f} image, limit is {} per side",
                *params.scale, sw, sh, kMaxCanvasSide));
        }
        const int w = std::max(1, static_cast<int>(sw));
        const int h = std::max(1, static_cast<int>(sh));
        cv::Mat scaled;
        cv::resize(cropped, scaled, cv::Size(w, h), 0, 0,
                   *params.scale > 1.0 ? cv::INTER_LINEAR : cv::INTER_AREA);
        return scaled;
    }
    return cropped;
}

cv::Mat resize_attack(const cv::Mat& image, const AttackParams& params) {
    cv::Mat out;
    cv::resize(image, out, cv::Size(*params.width, *params.height));
    return out;
}

cv::Mat bright_attack(const cv::Mat& image, const AttackParams& params) {
    cv::Mat out;
    image.convertTo(out, -1, *params.ratio, 0.0);  // saturate_cast clips to 255
    return out;
}

cv::Mat shelter_attack(const cv::Mat& image, const AttackParams& params,
                       const OperationContext& ctx) {
    cv::Mat out = image.clone();
    cv::RNG rng(params.seed);
    const double ratio = *params.ratio;

    for (int i = 0; i < *params.count; ++i) {
        ctx.throw_if_stopped("shelter attack");

        // Keep the rectangle inside the image: start in [0, 1 - ratio)
        const double ty = rng.uniform(0.0, 1.0) * (1.0 - ratio);
        const double tx = rng.uniform(0.0, 1.0) * (1.0 - ratio);
        const int y1 = static_cast<int>(ty * out.rows);
        const int y2 = static_cast<int>((ty + ratio) * out.rows);
        const int x1 = static_cast<int>(tx * out.cols);
        const int x2 = static_cast<int>((tx + ratio) * out.cols);
        if (x2 > x1 && y2 > y1) {
            out(cv::Rect(x1, y1, x2 - x1, y2 - y1)).setTo(cv::Scalar::all(255));
        }
    }
    return out;
}

cv::Mat salt_pepper_attack(const cv::Mat& image, const AttackParams& params,
                           const OperationContext& ctx) {
    cv::Mat out = image.clone();
    cv::RNG rng(params.seed);
    const double ratio = *params.ratio;
    const int channels = out.channels();

    for (int y = 0; y < out.rows; ++y) {
        if (y % 64 == 0) ctx.throw_if_stopped("salt_pepper attack");

        auto* row = out.ptr<uchar>(y);
        for (int x = 0; x < out.cols; ++x) {
            if (rng.uniform(0.0, 1.0) >= ratio) continue;
            const uchar value = rng.uniform(0, 2) ? 255 : 0;
            for (int c = 0; c < channels; ++c) {
                row[x * channels + c] = value;
            }
        }
    }
    return out;
}

cv::Mat rotate_attack(const cv::Mat& image, const AttackParams& params) {
    const cv::Point2f centre(image.cols / 2.0f, image.rows / 2.0f);
    const cv::Mat m = cv::getRotationMatrix2D(centre, *params.angle, 1.0);
    cv::Mat out;
    cv::warpAffine(image, out, m, image.size());
    return out;
}

}  // namespace

std::string_view to_string(AttackType type) noexcept {
    switch (type) {
        case AttackType::Cut:        return "cut";
        case AttackType::Resize:     return "resize";
        case AttackType::Bright:     return "bright";
        case AttackType::Shelter:    return "shelter";
        case AttackType::SaltPepper: return "salt_pepper";
        case AttackType::Rotate:     return "rot";
    }
    return "unknown";
}

AttackType parse_attack_type(std::string_view name) {
    for (AttackType type : kAllAttackTypes) {
        if (to_string(type) == name) return type;
    }
    throw ValidationError(fmt::format("unsupported attack type: '{}'", name));
}

void validate_attack_params(AttackType type, const AttackParams& params) {
    const auto require = [type](bool ok, std::string_view what) {
        if (!ok) {
            throw ValidationError(fmt::format("attack '{}': {}", to_string(type), what));
        }
    };

    switch (type) {
        case AttackType::Cut:
            require(params.box.has_value() || params.relative_box.has_value(),
                    "requires a box (x1,y1,x2,y2) or a relative box");
            if (params.relative_box) {
                const cv::Rect2d& r = *params.relative_box;
                require(r.x >= 0.0 && r.y >= 0.0 && r.width > 0.0 && r.height > 0.0 &&
                        r.x + r.width <= 1.0 && r.y + r.height <= 1.0,
                        "relative box must lie inside [0,1]x[0,1]");
            }
            require(!params.scale || (*params.scale > 0.0 && *params.scale <= kMaxCanvasSide),
                    fmt::format("scale must be in (0, {}]", kMaxCanvasSide));
            break;
        case AttackType::Resize:
            require(params.width.has_value() && params.height.has_value(),
                    "requires width and height");
            require(CanvasShape{*params.width, *params.height}.valid(),
                    fmt::format("width and height must be in [1, {}]", kMaxCanvasSide));
            break;
        case AttackType::Bright:
            require(params.ratio.has_value(), "requires ratio");
            require(*params.ratio > 0.0, "ratio must be positive");
            break;
        case AttackType::Shelter:
            require(params.ratio.has_value() && params.count.has_value(),
                    "requires ratio and n");
            require(*params.ratio > 0.0 && *params.ratio <= 1.0, "ratio must be in (0, 1]");
            require(*params.count > 0, "n must be positive");
            break;
        case AttackType::SaltPepper:
            require(params.ratio.has_value(), "requires ratio");
            require(*params.ratio >= 0.0 && *params.ratio <= 1.0, "ratio must be in [0, 1]");
            break;
        case AttackType::Rotate:
            require(params.angle.has_value(), "requires angle");
            break;
    }
}

CropBox resolve_cut_box(const AttackParams& params, const CanvasShape& shape) {
    CropBox box;
    if (params.box) {
        box = *params.box;
    } else if (params.relative_box) {
        const cv::Rect2d& r = *params.relative_box;
        box = CropBox{
            static_cast<int>(shape.width * r.x),
            static_cast<int>(shape.height * r.y),
            static_cast<int>(shape.width * (r.x + r.width)),
            static_cast<int>(shape.height * (r.y + r.height)),
        };
    } else {
        throw ValidationError("attack 'cut': requires a box or a relative box");
    }

    if (!box.fits(shape)) {
        throw ValidationError(fmt::format(
            "attack 'cut': box ({},{})-({},{}) does not fit a {}x{} image",
            box.x1, box.y1, box.x2, box.y2, shape.width, shape.height));
    }
    return box;
}

cv::Mat OpenCvAttackSimulator::apply(const cv::Mat& image, AttackType type,
                                     const AttackParams& params,
                                     const OperationContext& ctx) const {
    ctx.throw_if_stopped("attack");

    spdlog::debug("Applying '{}' attack to {}x{} image", to_string(type),
                  image.cols, image.rows);

    switch (type) {
        case AttackType::Cut:        return cut_attack(image, params);
        case AttackType::Resize:     return resize_attack(image, params);
        case AttackType::Bright:     return bright_attack(image, params);
        case AttackType::Shelter:    return shelter_attack(image, params, ctx);
        case AttackType::SaltPepper: return salt_pepper_attack(image, params, ctx);
        case AttackType::Rotate:     return rotate_attack(image, params);
    }
    throw ValidationError("unsupported attack type");
}

}  // namespace dmt
