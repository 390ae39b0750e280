/**
 * @file    artifact_store.cpp
 * @brief   Image decoding and per-call output artifacts implementation
 * @license MIT
 */

#include "service/artifact_store.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <ctime>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>
#include <utility>

namespace dmt {

namespace {

std::vector<int> encode_params(std::string_view ext) {
    if (ext == "jpg" || ext == "jpeg") {
        // JPEG: 100 = minimal loss (still lossy, the mark may not survive)
        return {cv::IMWRITE_JPEG_QUALITY, 100};
    }
    if (ext == "png") {
        // PNG: lossless, compression level only affects file size/speed
        return {cv::IMWRITE_PNG_COMPRESSION, 6};
    }
    if (ext == "webp") {
        // WebP: 101+ = lossless mode
        return {cv::IMWRITE_WEBP_QUALITY, 101};
    }
    return {};
}

std::uint32_t random_instance_tag() {
    std::random_device rd;
    return static_cast<std::uint32_t>(rd());
}

}  // namespace

ArtifactStore::ArtifactStore(std::filesystem::path output_dir,
                             std::size_t max_content_length,
                             std::set<std::string> allowed_extensions)
    : output_dir_(std::move(output_dir)),
      max_content_length_(max_content_length),
      allowed_extensions_(std::move(allowed_extensions)),
      instance_tag_(random_instance_tag()) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw IoError(fmt::format("cannot create output directory {}: {}",
                                  output_dir_, ec.message()));
    }
}

bool ArtifactStore::allowed_file(const std::filesystem::path& filename) const {
    const std::string ext = extension_lower(filename);
    return !ext.empty() && allowed_extensions_.count(ext) > 0;
}

cv::Mat ArtifactStore::decode_image(std::span<const std::uint8_t> bytes,
                                    std::string_view what) const {
    if (bytes.empty()) {
        throw ValidationError(fmt::format("{}: no image data", what));
    }
    if (bytes.size() > max_content_length_) {
        throw ValidationError(fmt::format("{}: {} bytes exceeds the {} byte limit",
                                          what, bytes.size(), max_content_length_));
    }

    std::vector<std::uint8_t> buf(bytes.begin(), bytes.end());
    cv::Mat image;
    try {
        image = cv::imdecode(buf, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw ValidationError(fmt::format("{}: cannot decode image ({})", what, e.what()));
    }
    if (image.empty()) {
        throw ValidationError(fmt::format("{}: unsupported or corrupt image data", what));
    }
    return image;
}

std::string ArtifactStore::next_id(std::string_view prefix) {
    const std::uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed);
    return fmt::format("{}_{:%Y%m%d_%H%M%S}_{:08x}_{}",
                       prefix, fmt::localtime(std::time(nullptr)), instance_tag_, seq);
}

ArtifactRef ArtifactStore::save_image(const cv::Mat& image, std::string_view prefix,
                                      std::string_view ext) {
    if (image.empty()) {
        throw IoError("cannot store an empty image");
    }

    std::vector<std::uint8_t> encoded;
    bool ok = false;
    try {
        ok = cv::imencode(fmt::format(".{}", ext), image, encoded, encode_params(ext));
    } catch (const cv::Exception& e) {
        throw IoError(fmt::format("cannot encode image as {}: {}", ext, e.what()));
    }
    if (!ok) {
        throw IoError(fmt::format("cannot encode image as {}", ext));
    }

    ArtifactRef ref;
    ref.id = fmt::format("{}.{}", next_id(prefix), ext);
    ref.path = output_dir_ / ref.id;

    write_file_atomic(ref.path, encoded);

    spdlog::info("Saved: {} ({} bytes)", ref.path.filename(), encoded.size());
    return ref;
}

std::size_t ArtifactStore::cleanup_older_than(std::chrono::hours max_age) const {
    std::size_t removed = 0;
    std::error_code ec;
    const auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;

    for (const auto& entry : std::filesystem::directory_iterator(output_dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;

        const auto mtime = entry.last_write_time(ec);
        if (ec || mtime >= cutoff) continue;

        if (std::filesystem::remove(entry.path(), ec)) {
            ++removed;
        } else if (ec) {
            spdlog::warn("Cannot remove old artifact {}: {}", entry.path(), ec.message());
        }
    }
    if (ec) {
        spdlog::warn("Cleanup of {} stopped early: {}", output_dir_, ec.message());
    }

    spdlog::debug("Cleanup removed {} artifact(s) older than {}h", removed, max_age.count());
    return removed;
}

std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError(fmt::format("cannot open {}", path));
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IoError(fmt::format("cannot read {}", path));
    }
    return bytes;
}

void write_file_atomic(const std::filesystem::path& path, std::span<const std::uint8_t> bytes) {
    std::filesystem::path tmp = path;
    tmp += ".part";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
            out.close();
        }
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw IoError(fmt::format("cannot write {}", tmp));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw IoError(fmt::format("cannot move {} into place: {}", path, ec.message()));
    }
}

}  // namespace dmt
