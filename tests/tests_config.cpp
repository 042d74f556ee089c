/*!
 * @file
 * @brief Configuration validation, presets and file loading.
 */

#include "gestify/Config.hpp"

#include "catch2/catch.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace gestify;

namespace {

std::string writeTemp(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

} // namespace

TEST_CASE("PipelineConfig: defaults and presets validate")
{
    CHECK_NOTHROW(PipelineConfig{}.validate());
    CHECK_NOTHROW(PipelineConfig::fastMode().validate());
    CHECK_NOTHROW(PipelineConfig::accurateMode().validate());
    CHECK_NOTHROW(PipelineConfig::twoHandMode().validate());
    CHECK_NOTHROW(ServiceConfig{}.validate());

    CHECK(PipelineConfig::fastMode().selection.maxHands == 1);
    CHECK(PipelineConfig::twoHandMode().twoHand.enabled);
}

TEST_CASE("PipelineConfig: out-of-range values are rejected")
{
    PipelineConfig config;

    SECTION("release must sit above grab")
    {
        config.pinch.releaseThreshold = 50.0f;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SECTION("negative cooldown")
    {
        config.gate.cooldownSeconds = -1.0;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SECTION("more hands than roles")
    {
        config.selection.maxHands = 3;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SECTION("screen size set on one axis only")
    {
        config.output.screenWidth = 1920;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SECTION("messages name the key")
    {
        config.smoothing.window = 0;
        CHECK_THROWS_WITH(config.validate(), Catch::Contains("smoothing.window"));
    }
}

TEST_CASE("loadConfig")
{
    SECTION("keys override defaults, missing keys keep them")
    {
        const std::string path = writeTemp("gestify_config_test.yml",
                                           "%YAML:1.0\n"
                                           "---\n"
                                           "pinch:\n"
                                           "   grab_threshold: 50\n"
                                           "   release_threshold: 80\n"
                                           "gate:\n"
                                           "   cooldown_seconds: 0.5\n"
                                           "   attention_enabled: false\n"
                                           "selection:\n"
                                           "   max_hands: 1\n"
                                           "service:\n"
                                           "   osc_target_host: \"10.0.0.2\"\n"
                                           "   osc_target_port: 7000\n"
                                           "   log_level: debug\n");

        AppConfig config = loadConfig(path);
        CHECK(config.pipeline.pinch.grabThreshold == Approx(50.0f));
        CHECK(config.pipeline.pinch.releaseThreshold == Approx(80.0f));
        CHECK(config.pipeline.gate.cooldownSeconds == Approx(0.5));
        CHECK_FALSE(config.pipeline.gate.attentionEnabled);
        CHECK(config.pipeline.selection.maxHands == 1);
        CHECK(config.pipeline.smoothing.window == PipelineConfig{}.smoothing.window);
        CHECK(config.service.oscTargetHost == "10.0.0.2");
        CHECK(config.service.oscTargetPort == "7000");
        CHECK(config.service.logLevel == "debug");
        CHECK(config.service.oscListenPort == ServiceConfig{}.oscListenPort);

        std::remove(path.c_str());
    }

    SECTION("invalid values in the file")
    {
        const std::string path = writeTemp("gestify_config_invalid.yml",
                                           "%YAML:1.0\n"
                                           "---\n"
                                           "pinch:\n"
                                           "   grab_threshold: 90\n"
                                           "   release_threshold: 60\n");
        CHECK_THROWS_AS(loadConfig(path), ConfigError);
        std::remove(path.c_str());
    }

    SECTION("missing file")
    {
        const auto path = std::filesystem::temp_directory_path() / "gestify_does_not_exist.yml";
        CHECK_THROWS_AS(loadConfig(path.string()), ConfigError);
    }
}
