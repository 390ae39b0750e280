/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 path helpers and fmt formatter for std::filesystem::path
 * @license MIT
 *
 * @details
 * Artifact paths show up in log lines, the CSV operation log and the CLI's
 * JSON output, all of which are UTF-8. path.string() is not guaranteed to
 * be UTF-8 on every platform; u8string() is.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved: {}", artifact.path);
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace dmt {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * C++20 u8string() returns std::u8string (char8_t), hence the cast.
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Lower-case extension without the leading dot ("photo.PNG" -> "png")
 */
inline std::string extension_lower(const std::filesystem::path& path) {
    std::string ext = to_utf8(path.extension());
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace dmt

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
