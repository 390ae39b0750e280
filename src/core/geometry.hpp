/**
 * @file    geometry.hpp
 * @brief   Crop box and canvas shape in the original image frame
 * @license MIT
 *
 * @details
 * Coordinates: origin top-left, x = column, y = row.
 * A CropBox is half-open: columns [x1, x2), rows [y1, y2).
 */

#pragma once

#include <opencv2/core.hpp>

namespace dmt {

// Largest width or height accepted for an image produced by an operation
inline constexpr int kMaxCanvasSide = 32768;

struct CanvasShape {
    int width = 0;
    int height = 0;

    // 0 < width, height <= kMaxCanvasSide
    bool valid() const {
        return width > 0 && height > 0 &&
               width <= kMaxCanvasSide && height <= kMaxCanvasSide;
    }

    bool operator==(const CanvasShape&) const = default;
};

struct CropBox {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }

    // 0 <= x1 < x2 <= width, 0 <= y1 < y2 <= height
    bool fits(const CanvasShape& shape) const {
        return x1 >= 0 && y1 >= 0 && x1 < x2 && y1 < y2 &&
               x2 <= shape.width && y2 <= shape.height;
    }

    cv::Rect to_rect() const { return cv::Rect(x1, y1, width(), height()); }

    static CropBox from_rect(const cv::Rect& r) {
        return CropBox{r.x, r.y, r.x + r.width, r.y + r.height};
    }

    bool operator==(const CropBox&) const = default;
};

inline CanvasShape shape_of(const cv::Mat& image) {
    return CanvasShape{image.cols, image.rows};
}

}  // namespace dmt
