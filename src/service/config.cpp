/**
 * @file    config.cpp
 * @brief   Service configuration implementation
 * @license MIT
 */

#include "service/config.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace dmt {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& field) {
    if (!j.contains(key)) return;
    try {
        field = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(fmt::format("config: '{}' has the wrong type ({})", key, e.what()));
    }
}

void read_path(const nlohmann::json& j, const char* key, std::filesystem::path& field) {
    std::string value = to_utf8(field);
    read_field(j, key, value);
    field = std::filesystem::path(value);
}

int parse_int(const char* name, const std::string& value) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception&) {
        throw ValidationError(fmt::format("config: {}='{}' is not an integer", name, value));
    }
}

double parse_double(const char* name, const std::string& value) {
    try {
        std::size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception&) {
        throw ValidationError(fmt::format("config: {}='{}' is not a number", name, value));
    }
}

}  // namespace

void ServiceConfig::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("config: top-level JSON value must be an object");
    }

    read_path(j, "output_dir", output_dir);
    read_path(j, "log_dir", log_dir);
    read_field(j, "max_content_length", max_content_length);
    read_field(j, "output_extension", output_extension);
    read_field(j, "default_key_image", default_key_image);
    read_field(j, "default_key_watermark", default_key_watermark);
    read_field(j, "qim_step", qim_step);
    read_field(j, "match_confidence_floor", match_confidence_floor);
    read_field(j, "match_tolerance", match_tolerance);
    read_field(j, "match_scales", match_scales);
    read_field(j, "neutral_fill", neutral_fill);
    read_field(j, "closing_tag", closing_tag);
    read_field(j, "timeout_ms", timeout_ms);
    read_field(j, "log_level", log_level);

    if (j.contains("allowed_extensions")) {
        std::vector<std::string> exts;
        read_field(j, "allowed_extensions", exts);
        allowed_extensions = std::set<std::string>(exts.begin(), exts.end());
    }
}

void ServiceConfig::apply_env(
    const std::function<std::optional<std::string>(const char*)>& lookup) {
    if (auto v = lookup("DUALMARK_OUTPUT_DIR")) output_dir = *v;
    if (auto v = lookup("DUALMARK_LOG_DIR")) log_dir = *v;
    if (auto v = lookup("DUALMARK_MAX_CONTENT_LENGTH")) {
        int parsed = parse_int("DUALMARK_MAX_CONTENT_LENGTH", *v);
        if (parsed <= 0) {
            throw ValidationError("config: DUALMARK_MAX_CONTENT_LENGTH must be positive");
        }
        max_content_length = static_cast<std::size_t>(parsed);
    }
    if (auto v = lookup("DUALMARK_KEY_IMAGE")) {
        default_key_image = parse_int("DUALMARK_KEY_IMAGE", *v);
    }
    if (auto v = lookup("DUALMARK_KEY_WATERMARK")) {
        default_key_watermark = parse_int("DUALMARK_KEY_WATERMARK", *v);
    }
    if (auto v = lookup("DUALMARK_QIM_STEP")) {
        qim_step = static_cast<float>(parse_double("DUALMARK_QIM_STEP", *v));
    }
    if (auto v = lookup("DUALMARK_MATCH_FLOOR")) {
        match_confidence_floor = parse_double("DUALMARK_MATCH_FLOOR", *v);
    }
    if (auto v = lookup("DUALMARK_NEUTRAL_FILL")) {
        neutral_fill = parse_int("DUALMARK_NEUTRAL_FILL", *v);
    }
    if (auto v = lookup("DUALMARK_TIMEOUT_MS")) {
        timeout_ms = parse_int("DUALMARK_TIMEOUT_MS", *v);
    }
    if (auto v = lookup("DUALMARK_LOG_LEVEL")) log_level = *v;
}

void ServiceConfig::validate() const {
    if (output_dir.empty()) {
        throw ValidationError("config: output_dir must not be empty");
    }
    if (max_content_length == 0) {
        throw ValidationError("config: max_content_length must be positive");
    }
    if (allowed_extensions.empty()) {
        throw ValidationError("config: allowed_extensions must not be empty");
    }
    if (output_extension != "png" && output_extension != "bmp") {
        throw ValidationError("config: output_extension must be a lossless format (png, bmp)");
    }
    if (!(qim_step > 0.0f)) {
        throw ValidationError("config: qim_step must be positive");
    }
    if (match_confidence_floor < -1.0 || match_confidence_floor > 1.0) {
        throw ValidationError("config: match_confidence_floor must be within [-1, 1]");
    }
    if (match_tolerance < 0.0) {
        throw ValidationError("config: match_tolerance must not be negative");
    }
    if (match_scales.empty()) {
        throw ValidationError("config: match_scales must not be empty");
    }
    for (double s : match_scales) {
        if (!(s > 0.0)) throw ValidationError("config: match_scales must be positive");
    }
    if (neutral_fill < 0 || neutral_fill > 255) {
        throw ValidationError("config: neutral_fill must be within [0, 255]");
    }
    if (closing_tag.empty()) {
        throw ValidationError("config: closing_tag must not be empty");
    }
    if (timeout_ms < 0) {
        throw ValidationError("config: timeout_ms must not be negative");
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw ValidationError(fmt::format("config: unknown log_level '{}'", log_level));
    }
}

nlohmann::json ServiceConfig::to_json() const {
    return nlohmann::json{
        {"output_dir", to_utf8(output_dir)},
        {"log_dir", to_utf8(log_dir)},
        {"max_content_length", max_content_length},
        {"allowed_extensions", allowed_extensions},
        {"output_extension", output_extension},
        {"default_key_image", default_key_image},
        {"default_key_watermark", default_key_watermark},
        {"qim_step", qim_step},
        {"match_confidence_floor", match_confidence_floor},
        {"match_tolerance", match_tolerance},
        {"match_scales", match_scales},
        {"neutral_fill", neutral_fill},
        {"closing_tag", closing_tag},
        {"timeout_ms", timeout_ms},
        {"log_level", log_level},
    };
}

ServiceConfig ServiceConfig::load(const std::optional<std::filesystem::path>& file) {
    ServiceConfig config;

    if (file) {
        std::ifstream in(*file);
        if (!in) {
            throw IoError(fmt::format("config: cannot open {}", *file));
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ValidationError(fmt::format("config: {} is not valid JSON ({})", *file, e.what()));
        }
        config.apply_json(j);
        spdlog::debug("Loaded config file {}", *file);
    }

    config.apply_env(process_env);
    config.validate();
    return config;
}

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

}  // namespace dmt
