/*
 * Stagecraft Stage Config Tests
 *
 * TOML overlays onto Stagecraft_StageConfig.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "stagecraft/stage.h"
#include "stagecraft/error.h"
#include <cstdio>
#include <string>

using Catch::Approx;

TEST_CASE("Stage config from TOML", "[config][toml]") {
    Stagecraft_StageConfig config = STAGECRAFT_STAGE_DEFAULT;

    SECTION("Every table") {
        const char *toml =
            "[stage]\n"
            "title = \"Platformer\"\n"
            "width = 640\n"
            "height = 480\n"
            "background = \"white\"\n"
            "fps = 30\n"
            "cap_frame_rate = false\n"
            "headless = true\n"
            "\n"
            "[physics]\n"
            "substeps = 8\n"
            "gravity = [0, -900.5]\n"
            "sleep_time_threshold = -1\n"
            "\n"
            "[text]\n"
            "font = \"assets/ui.ttf\"\n"
            "size = 32\n";

        REQUIRE(stagecraft_stage_config_parse_toml(toml, &config));
        REQUIRE(std::string(config.title) == "Platformer");
        REQUIRE(config.width == 640);
        REQUIRE(config.height == 480);
        REQUIRE(stagecraft_color_equal(config.background, STAGECRAFT_COLOR_WHITE));
        REQUIRE(config.fps == 30);
        REQUIRE_FALSE(config.cap_frame_rate);
        REQUIRE(config.headless);
        REQUIRE(config.substeps == 8);
        REQUIRE(config.gravity_x == 0.0f);
        REQUIRE(config.gravity_y == Approx(-900.5f));
        REQUIRE(config.sleep_time_threshold == -1.0f);
        REQUIRE(std::string(config.font_path) == "assets/ui.ttf");
        REQUIRE(config.font_size == 32);
    }

    SECTION("Absent keys keep their values") {
        REQUIRE(stagecraft_stage_config_parse_toml("[stage]\nwidth = 800\n", &config));
        REQUIRE(config.width == 800);
        REQUIRE(config.height == 720);
        REQUIRE(std::string(config.title) == "Stagecraft");
        REQUIRE(config.substeps == 4);
    }

    SECTION("Hex background") {
        REQUIRE(stagecraft_stage_config_parse_toml("[stage]\nbackground = \"#102030\"\n", &config));
        REQUIRE(config.background.r == 0x10);
        REQUIRE(config.background.g == 0x20);
        REQUIRE(config.background.b == 0x30);
    }

    SECTION("Unknown keys are ignored") {
        REQUIRE(stagecraft_stage_config_parse_toml("[stage]\nvsync = true\n[extra]\nx = 1\n", &config));
    }
}

TEST_CASE("Stage config errors", "[config][error]") {
    Stagecraft_StageConfig config = STAGECRAFT_STAGE_DEFAULT;
    stagecraft_clear_error();

    SECTION("Syntax error") {
        REQUIRE_FALSE(stagecraft_stage_config_parse_toml("[stage\nwidth = ", &config));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
    }

    SECTION("Unknown color") {
        REQUIRE_FALSE(stagecraft_stage_config_parse_toml("[stage]\nbackground = \"blurple\"\n", &config));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
    }

    SECTION("Bad size") {
        REQUIRE_FALSE(stagecraft_stage_config_parse_toml("[stage]\nwidth = -1\n", &config));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
    }

    SECTION("Gravity needs two numbers") {
        REQUIRE_FALSE(stagecraft_stage_config_parse_toml("[physics]\ngravity = [1]\n", &config));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
    }

    SECTION("Zero substeps") {
        REQUIRE_FALSE(stagecraft_stage_config_parse_toml("[physics]\nsubsteps = 0\n", &config));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(stagecraft_stage_config_load_toml("no_such_stage.toml", &config));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
    }

    stagecraft_clear_error();
}

TEST_CASE("Stage config file", "[config][file]") {
    const char *path = "stagecraft_config_test.toml";
    FILE *fp = std::fopen(path, "w");
    REQUIRE(fp != nullptr);
    std::fputs("[stage]\ntitle = \"From file\"\n[physics]\ngravity = [0.0, -500.0]\n", fp);
    std::fclose(fp);

    Stagecraft_StageConfig config = STAGECRAFT_STAGE_DEFAULT;
    REQUIRE(stagecraft_stage_config_load_toml(path, &config));
    REQUIRE(std::string(config.title) == "From file");
    REQUIRE(config.gravity_y == Approx(-500.0f));

    std::remove(path);
}
