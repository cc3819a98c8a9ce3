/*
 * Stagecraft Stage Tests
 *
 * Lifecycle, screen helpers, walls, removal, background and stage text.
 * Every stage is headless.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "stagecraft/stage.h"
#include "stagecraft/canvas.h"
#include "stagecraft/error.h"
#include "../test_support.h"
#include <SDL3/SDL.h>
#include <cstdio>
#include <string>

using Catch::Approx;

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

TEST_CASE("Stage lifecycle", "[stage][lifecycle]") {
    SECTION("Headless stage") {
        Stagecraft_StageConfig config = test_stage_config();
        Stagecraft_Stage *stage = stagecraft_stage_create(&config);
        REQUIRE(stage != nullptr);
        REQUIRE(stagecraft_stage_is_running(stage));
        REQUIRE(stagecraft_stage_get_window(stage) == nullptr);
        REQUIRE(stagecraft_stage_get_space(stage) != nullptr);
        REQUIRE(stagecraft_stage_get_camera(stage) != nullptr);
        REQUIRE(stagecraft_stage_get_assets(stage) != nullptr);

        SDL_Surface *canvas = stagecraft_stage_get_canvas(stage);
        REQUIRE(canvas->w == 400);
        REQUIRE(canvas->h == 300);
        REQUIRE(stagecraft_stage_get_frame_count(stage) == 0);
        stagecraft_stage_destroy(stage);
    }

    SECTION("Invalid size") {
        stagecraft_clear_error();
        Stagecraft_StageConfig config = test_stage_config();
        config.width = 0;
        REQUIRE(stagecraft_stage_create(&config) == nullptr);
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
        stagecraft_clear_error();
    }

    SECTION("End is terminal") {
        Stagecraft_StageConfig config = test_stage_config();
        Stagecraft_Stage *stage = stagecraft_stage_create(&config);
        stagecraft_stage_end(stage);
        REQUIRE(stagecraft_stage_get_state(stage) == STAGECRAFT_STAGE_STOPPED);
        stagecraft_stage_end(stage);
        REQUIRE_FALSE(stagecraft_stage_is_running(stage));
        stagecraft_stage_destroy(stage);
    }

    SECTION("Destroy tolerates NULL") {
        stagecraft_stage_destroy(nullptr);
    }
}

/* ============================================================================
 * Screen
 * ============================================================================ */

TEST_CASE("Stage screen helpers", "[stage][screen]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);

    SECTION("Edges and center") {
        REQUIRE(stagecraft_stage_width(stage) == 400);
        REQUIRE(stagecraft_stage_height(stage) == 300);
        REQUIRE(stagecraft_stage_top(stage) == 300.0f);
        REQUIRE(stagecraft_stage_bottom(stage) == 0.0f);
        REQUIRE(stagecraft_stage_left(stage) == 0.0f);
        REQUIRE(stagecraft_stage_right(stage) == 400.0f);

        Stagecraft_Vec2 c = stagecraft_stage_center(stage);
        REQUIRE(c.x == 200.0f);
        REQUIRE(c.y == 150.0f);

        int w = 0, h = 0;
        stagecraft_stage_size(stage, &w, &h);
        REQUIRE(w == 400);
        REQUIRE(h == 300);
    }

    SECTION("Resize recreates the canvas") {
        REQUIRE(stagecraft_stage_set_size(stage, 200, 100));
        REQUIRE(stagecraft_stage_get_canvas(stage)->w == 200);
        REQUIRE(stagecraft_stage_get_canvas(stage)->h == 100);
        REQUIRE(stagecraft_stage_top(stage) == 100.0f);

        stagecraft_clear_error();
        REQUIRE_FALSE(stagecraft_stage_set_size(stage, -5, 100));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG);
        REQUIRE(stagecraft_stage_width(stage) == 200);
        stagecraft_clear_error();
    }

    SECTION("Settings") {
        stagecraft_stage_set_title(stage, "Demo");
        stagecraft_stage_set_fps(stage, 30);
        stagecraft_stage_set_fps(stage, 0);
        stagecraft_stage_set_color(stage, STAGECRAFT_COLOR_WHITE);
        stagecraft_stage_set_show_mouse_coordinates(stage, true);

        const Stagecraft_StageConfig *cfg = stagecraft_stage_get_config(stage);
        REQUIRE(std::string(cfg->title) == "Demo");
        REQUIRE(cfg->fps == 30);
        REQUIRE(stagecraft_color_equal(cfg->background, STAGECRAFT_COLOR_WHITE));
        REQUIRE(cfg->show_mouse_coordinates);
    }

    stagecraft_stage_destroy(stage);
}

/* ============================================================================
 * Screen Walls
 * ============================================================================ */

TEST_CASE("Screen walls", "[stage][walls]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    Stagecraft_Actor *walls[4];

    SECTION("All four edges") {
        REQUIRE(stagecraft_stage_create_screen_walls(stage, nullptr, walls) == 4);
        REQUIRE(stagecraft_stage_get_actor_count(stage) == 4);

        REQUIRE(stagecraft_actor_left(walls[0]) == Approx(0.0f).margin(1e-4));
        REQUIRE(stagecraft_actor_width(walls[0]) == Approx(1.0f));
        REQUIRE(stagecraft_actor_height(walls[0]) == Approx(300.0f));

        REQUIRE(stagecraft_actor_left(walls[1]) == Approx(398.0f));
        REQUIRE(stagecraft_actor_bottom(walls[2]) == Approx(298.0f));
        REQUIRE(stagecraft_actor_width(walls[2]) == Approx(400.0f));
        REQUIRE(stagecraft_actor_bottom(walls[3]) == Approx(0.0f).margin(1e-4));

        for (int i = 0; i < 4; i++) {
            REQUIRE(stagecraft_physics_body_get_kind(stagecraft_actor_get_body(walls[i])) == STAGECRAFT_BODY_STATIC);
        }
    }

    SECTION("Selected edges with insets") {
        Stagecraft_ScreenWalls spec = STAGECRAFT_SCREEN_WALLS_DEFAULT;
        spec.top = false;
        spec.right = false;
        spec.left_inset = 10.0f;
        spec.bottom_inset = 5.0f;
        spec.thickness = 4.0f;
        spec.has_elasticity = true;
        spec.elasticity = 0.9f;

        REQUIRE(stagecraft_stage_create_screen_walls(stage, &spec, walls) == 2);
        REQUIRE(walls[1] == nullptr);
        REQUIRE(walls[2] == nullptr);
        REQUIRE(stagecraft_actor_left(walls[0]) == Approx(10.0f));
        REQUIRE(stagecraft_actor_width(walls[0]) == Approx(4.0f));
        REQUIRE(stagecraft_actor_bottom(walls[3]) == Approx(5.0f));
        REQUIRE(stagecraft_actor_get_elasticity(walls[3]) == Approx(0.9f));
    }

    stagecraft_stage_destroy(stage);
}

/* ============================================================================
 * Removal
 * ============================================================================ */

TEST_CASE("Actor removal", "[stage][remove]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);

    Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
    Stagecraft_Actor *b = stagecraft_stage_create_circle(stage, 5.0f, nullptr);
    Stagecraft_Actor *c = stagecraft_stage_create_rect(stage, 5.0f, 5.0f, nullptr);
    REQUIRE(stagecraft_stage_get_actor_count(stage) == 3);
    REQUIRE(stagecraft_physics_space_get_body_count(stagecraft_stage_get_space(stage)) == 3);

    SECTION("Creation order is kept") {
        REQUIRE(stagecraft_stage_get_actor(stage, 0) == a);
        REQUIRE(stagecraft_stage_get_actor(stage, 2) == c);
        REQUIRE(stagecraft_stage_get_actor(stage, 3) == nullptr);
    }

    SECTION("Removing outside a tick is immediate") {
        stagecraft_stage_remove(stage, b);
        REQUIRE(stagecraft_stage_get_actor_count(stage) == 2);
        REQUIRE(stagecraft_stage_get_actor(stage, 1) == c);
        REQUIRE(stagecraft_physics_space_get_body_count(stagecraft_stage_get_space(stage)) == 2);
        REQUIRE(stagecraft_physics_space_get_shape_count(stagecraft_stage_get_space(stage)) == 2);
    }

    SECTION("Actors from another stage are ignored") {
        Stagecraft_StageConfig other_config = test_stage_config();
        Stagecraft_Stage *other = stagecraft_stage_create(&other_config);
        stagecraft_stage_remove(other, a);
        REQUIRE(stagecraft_stage_get_actor_count(stage) == 3);
        stagecraft_stage_destroy(other);
    }

    stagecraft_stage_destroy(stage);
}

/* ============================================================================
 * Background and Text
 * ============================================================================ */

TEST_CASE("Stage background", "[stage][background]") {
    const char *path = "stagecraft_background_test.bmp";
    REQUIRE(write_test_bmp(path, 4, 4, 0, 0, 255));

    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    SECTION("Color fills the canvas") {
        stagecraft_stage_set_color(stage, STAGECRAFT_COLOR_WHITE);
        REQUIRE(stagecraft_stage_update(stage));
        SDL_Surface *canvas = stagecraft_stage_get_canvas(stage);
        REQUIRE(stagecraft_color_equal(stagecraft_canvas_get_pixel(canvas, 10, 10), STAGECRAFT_COLOR_WHITE));
    }

    SECTION("Image is scaled over the color") {
        REQUIRE(stagecraft_stage_set_background_image(stage, path));
        REQUIRE(stagecraft_stage_update(stage));
        SDL_Surface *canvas = stagecraft_stage_get_canvas(stage);
        Stagecraft_Color px = stagecraft_canvas_get_pixel(canvas, 399, 299);
        REQUIRE(px.b == 255);
        REQUIRE(px.r == 0);

        REQUIRE(stagecraft_stage_set_background_image(stage, nullptr));
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(stagecraft_color_equal(stagecraft_canvas_get_pixel(canvas, 10, 10), config.background));
    }

    SECTION("Missing image fails") {
        stagecraft_clear_error();
        REQUIRE_FALSE(stagecraft_stage_set_background_image(stage, "no_such_background.png"));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_RESOURCE);
        stagecraft_clear_error();
    }

    stagecraft_stage_destroy(stage);
    std::remove(path);
}

TEST_CASE("Stage text", "[stage][text]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    SECTION("Centered by default") {
        Stagecraft_TextOverlay *overlay = stagecraft_stage_add_text(stage, "Ready", nullptr, nullptr, 0,
                                                                    STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        REQUIRE(overlay != nullptr);
        REQUIRE(overlay->pos.x == 200.0f);
        REQUIRE(overlay->pos.y == 150.0f);
    }

    SECTION("Without any font the text is skipped") {
        Stagecraft_Vec2 pos = stagecraft_vec2(0.0f, 0.0f);
        stagecraft_stage_add_text(stage, "Score", &pos, nullptr, 0, STAGECRAFT_COLOR_BLACK, nullptr, "score");
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(stagecraft_stage_is_running(stage));
        stagecraft_stage_remove_text(stage, "score");
        stagecraft_stage_remove_text(stage, "score");
    }

    stagecraft_stage_destroy(stage);
}
