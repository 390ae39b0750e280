/**
 * @file    config_test.cpp
 * @brief   Service configuration tests
 * @license MIT
 */

#include "core/errors.hpp"
#include "service/config.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <string>

namespace dmt {
namespace {

auto env_from(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(ServiceConfigTest, DefaultsAreValid) {
    const ServiceConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.default_key_image, 1);
    EXPECT_EQ(config.default_key_watermark, 1);
    EXPECT_EQ(config.max_content_length, 16u * 1024u * 1024u);
    EXPECT_EQ(config.allowed_extensions.count("gif"), 1u);
    EXPECT_EQ(config.closing_tag, "</body>");
}

TEST(ServiceConfigTest, JsonOverridesDefaults) {
    ServiceConfig config;
    config.apply_json(nlohmann::json{
        {"output_dir", "/tmp/marks"},
        {"default_key_image", 17},
        {"match_scales", {1.0, 0.5}},
        {"allowed_extensions", {"png"}},
        {"unknown_key", true},
    });

    EXPECT_EQ(config.output_dir, std::filesystem::path("/tmp/marks"));
    EXPECT_EQ(config.default_key_image, 17);
    EXPECT_EQ(config.default_key_watermark, 1);
    EXPECT_EQ(config.match_scales, (std::vector<double>{1.0, 0.5}));
    EXPECT_EQ(config.allowed_extensions, (std::set<std::string>{"png"}));
}

TEST(ServiceConfigTest, EnvironmentOverridesJson) {
    ServiceConfig config;
    config.apply_json(nlohmann::json{{"default_key_image", 17}, {"timeout_ms", 500}});
    config.apply_env(env_from({{"DUALMARK_KEY_IMAGE", "99"}, {"DUALMARK_LOG_LEVEL", "debug"}}));

    EXPECT_EQ(config.default_key_image, 99);
    EXPECT_EQ(config.timeout_ms, 500);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ServiceConfigTest, WrongTypesAndBadValuesAreRejected) {
    ServiceConfig config;
    EXPECT_THROW(config.apply_json(nlohmann::json{{"qim_step", "big"}}), ValidationError);
    EXPECT_THROW(config.apply_json(nlohmann::json::array()), ValidationError);
    EXPECT_THROW(config.apply_env(env_from({{"DUALMARK_KEY_IMAGE", "12abc"}})), ValidationError);
    EXPECT_THROW(config.apply_env(env_from({{"DUALMARK_MAX_CONTENT_LENGTH", "0"}})),
                 ValidationError);
}

TEST(ServiceConfigTest, ValidateChecksRanges) {
    {
        ServiceConfig c;
        c.output_extension = "jpg";  // lossy output would damage the mark
        EXPECT_THROW(c.validate(), ValidationError);
    }
    {
        ServiceConfig c;
        c.neutral_fill = 300;
        EXPECT_THROW(c.validate(), ValidationError);
    }
    {
        ServiceConfig c;
        c.match_scales.clear();
        EXPECT_THROW(c.validate(), ValidationError);
    }
    {
        ServiceConfig c;
        c.log_level = "chatty";
        EXPECT_THROW(c.validate(), ValidationError);
    }
    {
        ServiceConfig c;
        c.timeout_ms = -1;
        EXPECT_THROW(c.validate(), ValidationError);
    }
}

TEST(ServiceConfigTest, LoadReadsFile) {
    test::TempDir dir;
    const auto file = dir.path() / "dualmark.json";
    {
        std::ofstream out(file);
        out << R"({"default_key_watermark": 5, "neutral_fill": 128})";
    }

    const ServiceConfig config = ServiceConfig::load(file);
    EXPECT_EQ(config.default_key_watermark, 5);
    EXPECT_EQ(config.neutral_fill, 128);
}

TEST(ServiceConfigTest, LoadReportsMissingAndMalformedFiles) {
    test::TempDir dir;
    EXPECT_THROW(ServiceConfig::load(dir.path() / "missing.json"), IoError);

    const auto file = dir.path() / "broken.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    EXPECT_THROW(ServiceConfig::load(file), ValidationError);
}

TEST(ServiceConfigTest, JsonViewRoundTrips) {
    ServiceConfig config;
    config.default_key_image = 3;
    config.match_scales = {1.0, 0.75};

    ServiceConfig copy;
    copy.apply_json(config.to_json());
    EXPECT_EQ(copy.default_key_image, 3);
    EXPECT_EQ(copy.match_scales, config.match_scales);
    EXPECT_EQ(copy.output_dir, config.output_dir);
}

}  // namespace
}  // namespace dmt
