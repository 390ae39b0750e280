/**
 * @file    dct_transform.cpp
 * @brief   Block DCT / QIM keyed transform implementation
 * @license MIT
 */

#include "core/dct_transform.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <vector>

namespace dmt {

namespace {

constexpr int kPollInterval = 256;  // Blocks between deadline checks

/**
 * Image split into a float luma plane plus whatever is needed to put it back
 */
struct LumaPlanes {
    cv::Mat luma;                   // CV_32FC1
    std::vector<cv::Mat> ycrcb;     // 8-bit planes (colour input only)
    cv::Mat alpha;                  // Alpha plane (BGRA input only)
    int channels = 0;
};

LumaPlanes split_luma(const cv::Mat& image) {
    if (image.empty()) {
        throw CapabilityError("dct transform: empty image");
    }
    if (image.depth() != CV_8U) {
        throw CapabilityError("dct transform: unsupported image depth (8-bit required)");
    }

    LumaPlanes planes;
    planes.channels = image.channels();

    if (planes.channels == 1) {
        image.convertTo(planes.luma, CV_32F);
        return planes;
    }

    cv::Mat bgr;
    if (planes.channels == 4) {
        std::vector<cv::Mat> ch;
        cv::split(image, ch);
        planes.alpha = ch[3];
        cv::merge(std::vector<cv::Mat>{ch[0], ch[1], ch[2]}, bgr);
    } else if (planes.channels == 3) {
        bgr = image;
    } else {
        throw CapabilityError(fmt::format(
            "dct transform: unsupported channel count {}", planes.channels));
    }

    cv::Mat ycrcb;
    cv::cvtColor(bgr, ycrcb, cv::COLOR_BGR2YCrCb);
    cv::split(ycrcb, planes.ycrcb);
    planes.ycrcb[0].convertTo(planes.luma, CV_32F);
    return planes;
}

cv::Mat merge_luma(const LumaPlanes& planes) {
    cv::Mat luma8;
    planes.luma.convertTo(luma8, CV_8U);  // rounds and saturates

    if (planes.channels == 1) {
        return luma8;
    }

    std::vector<cv::Mat> ycrcb = planes.ycrcb;
    ycrcb[0] = luma8;
    cv::Mat merged, bgr;
    cv::merge(ycrcb, merged);
    cv::cvtColor(merged, bgr, cv::COLOR_YCrCb2BGR);

    if (planes.channels == 4) {
        std::vector<cv::Mat> ch;
        cv::split(bgr, ch);
        ch.push_back(planes.alpha);
        cv::Mat bgra;
        cv::merge(ch, bgra);
        return bgra;
    }
    return bgr;
}

constexpr std::size_t kKeystreamPollInterval = 1 << 16;

// cv::RNG replaces a zero state with ~0u, which would make keys 0 and -1 equivalent
std::uint64_t key_seed(int key) {
    return static_cast<std::uint64_t>(static_cast<std::uint32_t>(key)) ^ 0x9E3779B97F4A7C15ull;
}

std::vector<int> block_order(int block_count, int key_image) {
    std::vector<int> order(static_cast<std::size_t>(block_count));
    std::iota(order.begin(), order.end(), 0);
    if (block_count > 1) {
        cv::RNG rng(key_seed(key_image));
        cv::randShuffle(order, 1.0, &rng);
    }
    return order;
}

BitVector keystream(std::size_t length, int key_watermark, const OperationContext& ctx) {
    cv::RNG rng(key_seed(key_watermark));
    BitVector ks(length);
    for (std::size_t i = 0; i < length; ++i) {
        if (i % kKeystreamPollInterval == 0) ctx.throw_if_stopped("dct keystream");
        ks[i] = static_cast<std::uint8_t>(rng.uniform(0, 2));
    }
    return ks;
}

// Snap |coeff| to the nearest multiple of step whose index parity == bit
void quantize(float& coeff, int bit, float step) {
    const float sign = (coeff >= 0.0f) ? 1.0f : -1.0f;
    const float scaled = std::abs(coeff) / step;
    int q = static_cast<int>(std::lround(scaled));

    if ((q & 1) != bit) {
        if (q == 0 || scaled > static_cast<float>(q)) {
            q += 1;
        } else {
            q -= 1;
        }
    }
    coeff = sign * static_cast<float>(q) * step;
}

int read_parity(float coeff, float step) {
    return static_cast<int>(std::lround(std::abs(coeff) / step)) & 1;
}

}  // namespace

DctQimTransform::DctQimTransform(DctQimOptions options)
    : options_(options) {
    if (!(options_.step > 0.0f)) {
        throw ValidationError("dct transform: quantization step must be positive");
    }
    if (options_.coef_row < 0 || options_.coef_row >= kBlockSize ||
        options_.coef_col < 0 || options_.coef_col >= kBlockSize ||
        (options_.coef_row == 0 && options_.coef_col == 0)) {
        throw ValidationError("dct transform: coefficient must be an AC term inside the block");
    }
}

std::size_t DctQimTransform::capacity_bits(const cv::Mat& image) const {
    return static_cast<std::size_t>(image.cols / kBlockSize) *
           static_cast<std::size_t>(image.rows / kBlockSize);
}

cv::Mat DctQimTransform::embed(const cv::Mat& image, const BitVector& bits,
                               int key_image, int key_watermark,
                               const OperationContext& ctx) const {
    if (bits.empty()) {
        throw CapabilityError("dct transform: nothing to embed");
    }

    LumaPlanes planes = split_luma(image);

    const int blocks_x = image.cols / kBlockSize;
    const int blocks_y = image.rows / kBlockSize;
    const int block_count = blocks_x * blocks_y;

    if (bits.size() > static_cast<std::size_t>(block_count)) {
        throw CapabilityError(fmt::format(
            "dct transform: payload of {} bits exceeds image capacity of {} bits ({}x{})",
            bits.size(), block_count, image.cols, image.rows));
    }

    const auto order = block_order(block_count, key_image);
    const auto ks = keystream(bits.size(), key_watermark, ctx);

    cv::Mat coeffs, restored;
    for (int k = 0; k < block_count; ++k) {
        if (k % kPollInterval == 0) ctx.throw_if_stopped("dct embed");

        const std::size_t bit_index = static_cast<std::size_t>(k) % bits.size();
        const int bit = (bits[bit_index] ^ ks[bit_index]) & 1;

        const int idx = order[static_cast<std::size_t>(k)];
        const cv::Rect roi((idx % blocks_x) * kBlockSize, (idx / blocks_x) * kBlockSize,
                           kBlockSize, kBlockSize);
        cv::Mat block = planes.luma(roi);

        cv::dct(block, coeffs);
        quantize(coeffs.at<float>(options_.coef_row, options_.coef_col), bit, options_.step);
        cv::idct(coeffs, restored);
        restored.copyTo(block);
    }

    spdlog::debug("DCT embed: {} bits over {} blocks ({}x{}), step={:.1f}",
                  bits.size(), block_count, blocks_x, blocks_y, options_.step);

    return merge_luma(planes);
}

BitVector DctQimTransform::extract(const cv::Mat& image, int bit_length,
                                   int key_image, int key_watermark,
                                   const OperationContext& ctx) const {
    if (bit_length <= 0) {
        throw CapabilityError("dct transform: bit length must be positive");
    }

    LumaPlanes planes = split_luma(image);

    const int blocks_x = image.cols / kBlockSize;
    const int blocks_y = image.rows / kBlockSize;
    const int block_count = blocks_x * blocks_y;
    const auto length = static_cast<std::size_t>(bit_length);

    const auto order = block_order(block_count, key_image);
    const auto ks = keystream(length, key_watermark, ctx);

    std::vector<int> ones(length, 0);
    std::vector<int> votes(length, 0);
    int skipped = 0;

    cv::Mat coeffs;
    for (int k = 0; k < block_count; ++k) {
        if (k % kPollInterval == 0) ctx.throw_if_stopped("dct extract");

        const int idx = order[static_cast<std::size_t>(k)];
        const cv::Rect roi((idx % blocks_x) * kBlockSize, (idx / blocks_x) * kBlockSize,
                           kBlockSize, kBlockSize);
        const cv::Mat block = planes.luma(roi);

        double min_val, max_val;
        cv::minMaxLoc(block, &min_val, &max_val);
        if (max_val - min_val < 0.5) {
            ++skipped;  // Constant block: fill, not content
            continue;
        }

        cv::dct(block, coeffs);
        const std::size_t bit_index = static_cast<std::size_t>(k) % length;
        ones[bit_index] += read_parity(coeffs.at<float>(options_.coef_row, options_.coef_col),
                                       options_.step);
        votes[bit_index] += 1;
    }

    BitVector bits(length, 0);
    for (std::size_t i = 0; i < length; ++i) {
        if (i % kKeystreamPollInterval == 0) ctx.throw_if_stopped("dct extract");
        const int raw = (2 * ones[i] > votes[i]) ? 1 : 0;
        bits[i] = static_cast<std::uint8_t>((raw ^ ks[i]) & 1);
    }

    spdlog::debug("DCT extract: {} bits from {} blocks ({} constant blocks skipped)",
                  length, block_count, skipped);
    return bits;
}

}  // namespace dmt
