/**
 * @file    config.hpp
 * @brief   Service configuration (defaults, JSON file, environment)
 * @license MIT
 *
 * @details
 * Precedence, lowest first:
 *   1. built-in defaults
 *   2. JSON config file (unknown keys are ignored)
 *   3. DUALMARK_* environment variables
 *
 * Example file:
 *   {
 *     "output_dir": "output",
 *     "log_dir": "logs",
 *     "default_key_image": 1,
 *     "qim_step": 24.0,
 *     "match_scales": [1.0, 0.5]
 *   }
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dmt {

struct ServiceConfig {
    std::filesystem::path output_dir = "output";
    std::filesystem::path log_dir = "logs";             // empty = no operation log
    std::size_t max_content_length = 16 * 1024 * 1024;  // Per input image
    std::set<std::string> allowed_extensions{"png", "jpg", "jpeg", "bmp", "gif"};
    std::string output_extension = "png";               // Lossless keeps the mark intact

    int default_key_image = 1;
    int default_key_watermark = 1;

    float qim_step = 24.0f;
    double match_confidence_floor = 0.5;
    double match_tolerance = 1e-4;
    std::vector<double> match_scales{1.0};
    int neutral_fill = 0;                               // Grey level outside a recovered crop

    std::string closing_tag = "</body>";
    int timeout_ms = 0;                                 // 0 = no deadline
    std::string log_level = "info";

    /**
     * Overlay keys present in j
     * @throws ValidationError on a type mismatch or invalid value
     */
    void apply_json(const nlohmann::json& j);

    /**
     * Overlay DUALMARK_* variables found through lookup
     * @throws ValidationError on an unparsable value
     */
    void apply_env(const std::function<std::optional<std::string>(const char*)>& lookup);

    /**
     * @throws ValidationError if any field is out of range
     */
    void validate() const;

    nlohmann::json to_json() const;

    /**
     * Defaults, then the file (if given), then the process environment
     * @throws ValidationError / IoError
     */
    static ServiceConfig load(const std::optional<std::filesystem::path>& file);
};

/**
 * Environment lookup backed by std::getenv
 */
std::optional<std::string> process_env(const char* name);

}  // namespace dmt
