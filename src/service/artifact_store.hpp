/**
 * @file    artifact_store.hpp
 * @brief   Image decoding and per-call output artifacts
 * @license MIT
 *
 * @details
 * Every output gets a fresh identifier:
 *   <prefix>_<YYYYmmdd_HHMMSS>_<instance>_<sequence>
 * where <instance> is random per store and <sequence> is an atomic counter,
 * so concurrent calls (and concurrent processes) never share a name and one
 * call's cleanup cannot remove another call's file.
 *
 * Writes go to "<name>.part" first and are renamed into place, so a file
 * under the final name is always complete.
 */

#pragma once

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dmt {

/**
 * Opaque handle to a stored binary artifact
 */
struct ArtifactRef {
    std::string id;                 // File name, unique per call
    std::filesystem::path path;     // Full path on disk
};

class ArtifactStore {
public:
    /**
     * @throws IoError if output_dir cannot be created
     */
    ArtifactStore(std::filesystem::path output_dir,
                  std::size_t max_content_length,
                  std::set<std::string> allowed_extensions);

    /**
     * Check a client-supplied file name against the allowed extensions
     */
    bool allowed_file(const std::filesystem::path& filename) const;

    /**
     * Decode image bytes (any format OpenCV reads) to 8-bit BGR
     *
     * @param what  Field name for error messages ("image", "template"...)
     * @throws ValidationError  empty, oversize, or undecodable input
     */
    cv::Mat decode_image(std::span<const std::uint8_t> bytes, std::string_view what) const;

    /**
     * Encode and store an image under a fresh identifier
     *
     * @param prefix  Leading part of the identifier ("blind", "attacked_cut"...)
     * @param ext     Output format extension ("png", "jpg", "webp", "bmp")
     * @throws IoError on encode or write failure (no file is left behind)
     */
    ArtifactRef save_image(const cv::Mat& image, std::string_view prefix,
                           std::string_view ext = "png");

    /**
     * Remove regular files in the output directory older than max_age
     *
     * @return  Number of files removed
     */
    std::size_t cleanup_older_than(std::chrono::hours max_age) const;

    /**
     * Generate a unique identifier (without extension)
     */
    std::string next_id(std::string_view prefix);

    const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

private:
    std::filesystem::path output_dir_;
    std::size_t max_content_length_;
    std::set<std::string> allowed_extensions_;
    std::uint32_t instance_tag_;
    std::atomic<std::uint64_t> sequence_{0};
};

/**
 * Read a whole file into memory
 * @throws IoError
 */
std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path);

/**
 * Write bytes to path through a temporary file and rename
 * @throws IoError (the temporary is removed)
 */
void write_file_atomic(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);

}  // namespace dmt
