/*
 * Stagecraft Text Tests
 *
 * Overlay bookkeeping and font failure paths. Glyph rendering needs a
 * TTF on disk and is exercised by the examples instead.
 */

#include <catch2/catch_test_macros.hpp>
#include "stagecraft/text.h"
#include "stagecraft/assets.h"
#include "stagecraft/canvas.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"
#include <SDL3/SDL.h>
#include <string>

/* ============================================================================
 * Overlay Tests
 * ============================================================================ */

TEST_CASE("Text overlay init", "[text][overlay]") {
    Stagecraft_TextOverlay overlay;

    SECTION("Name defaults to the text") {
        stagecraft_text_overlay_init(&overlay, "Score: 0", stagecraft_vec2(5.0f, 6.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        REQUIRE(std::string(overlay.name) == "Score: 0");
        REQUIRE(overlay.size == STAGECRAFT_TEXT_DEFAULT_SIZE);
        REQUIRE(overlay.font_path[0] == '\0');
        REQUIRE_FALSE(overlay.has_background);
        REQUIRE(overlay.pos.x == 5.0f);
        stagecraft_text_overlay_free(&overlay);
        REQUIRE(overlay.name == nullptr);
    }

    SECTION("Explicit name and background") {
        Stagecraft_Color bg = STAGECRAFT_COLOR_WHITE;
        stagecraft_text_overlay_init(&overlay, "Hello", stagecraft_vec2(0.0f, 0.0f), "ui.ttf", 32,
                                     STAGECRAFT_COLOR_RED, &bg, "greeting");
        REQUIRE(std::string(overlay.name) == "greeting");
        REQUIRE(std::string(overlay.font_path) == "ui.ttf");
        REQUIRE(overlay.size == 32);
        REQUIRE(overlay.has_background);
        REQUIRE(stagecraft_color_equal(overlay.background, STAGECRAFT_COLOR_WHITE));
        stagecraft_text_overlay_free(&overlay);
    }

    SECTION("Long text is kept whole") {
        std::string text(300, 'x');
        text += "end";
        stagecraft_text_overlay_init(&overlay, text.c_str(), stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        REQUIRE(std::string(overlay.text) == text);
        REQUIRE(std::string(overlay.name) == text);
        stagecraft_text_overlay_free(&overlay);
    }
}

TEST_CASE("Text overlay list", "[text][list]") {
    Stagecraft_TextOverlayList list = {};
    Stagecraft_TextOverlay overlay;

    stagecraft_text_overlay_init(&overlay, "one", stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                 STAGECRAFT_COLOR_BLACK, nullptr, "hud");
    REQUIRE(stagecraft_text_list_put(&list, &overlay) != nullptr);

    stagecraft_text_overlay_init(&overlay, "other", stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                 STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
    stagecraft_text_list_put(&list, &overlay);
    REQUIRE(list.count == 2);

    SECTION("Same name replaces in place") {
        stagecraft_text_overlay_init(&overlay, "two", stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, "hud");
        stagecraft_text_list_put(&list, &overlay);
        REQUIRE(list.count == 2);
        REQUIRE(std::string(list.items[0].text) == "two");
    }

    SECTION("Remove by name") {
        REQUIRE(stagecraft_text_list_remove(&list, "hud"));
        REQUIRE(list.count == 1);
        REQUIRE(stagecraft_text_list_find(&list, "hud") == nullptr);
        REQUIRE(stagecraft_text_list_find(&list, "other") != nullptr);
        REQUIRE_FALSE(stagecraft_text_list_remove(&list, "hud"));
    }

    SECTION("Grows past the initial capacity") {
        for (int i = 0; i < 10; i++) {
            std::string name = "line" + std::to_string(i);
            stagecraft_text_overlay_init(&overlay, name.c_str(), stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                         STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
            stagecraft_text_list_put(&list, &overlay);
        }
        REQUIRE(list.count == 12);
        REQUIRE(stagecraft_text_list_find(&list, "line9") != nullptr);
    }

    SECTION("Long unnamed text is removed by the same text") {
        std::string text(100, 'a');
        stagecraft_text_overlay_init(&overlay, text.c_str(), stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        REQUIRE(stagecraft_text_list_put(&list, &overlay) != nullptr);
        REQUIRE(list.count == 3);

        REQUIRE(stagecraft_text_list_remove(&list, text.c_str()));
        REQUIRE(list.count == 2);
        REQUIRE(stagecraft_text_list_find(&list, text.c_str()) == nullptr);
    }

    SECTION("Long texts sharing a prefix stay distinct") {
        std::string prefix(63, 'p');
        std::string first = prefix + "first";
        std::string second = prefix + "second";
        stagecraft_text_overlay_init(&overlay, first.c_str(), stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        stagecraft_text_list_put(&list, &overlay);
        stagecraft_text_overlay_init(&overlay, second.c_str(), stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        stagecraft_text_list_put(&list, &overlay);
        REQUIRE(list.count == 4);

        REQUIRE(stagecraft_text_list_remove(&list, first.c_str()));
        Stagecraft_TextOverlay *kept = stagecraft_text_list_find(&list, second.c_str());
        REQUIRE(kept != nullptr);
        REQUIRE(std::string(kept->text) == second);
    }

    stagecraft_text_list_free(&list);
    REQUIRE(list.count == 0);
}

/* ============================================================================
 * Font Failures
 * ============================================================================ */

TEST_CASE("Font loading failures", "[text][font]") {
    stagecraft_clear_error();

    SECTION("Missing file") {
        REQUIRE(stagecraft_font_load("no_such_font.ttf", 20.0f) == nullptr);
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_RESOURCE);
    }

    SECTION("Garbage bytes") {
        unsigned char junk[64] = {0};
        REQUIRE(stagecraft_font_load_memory(junk, sizeof(junk), 20.0f) == nullptr);
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_RESOURCE);
    }

    stagecraft_clear_error();
}

TEST_CASE("Drawing overlays", "[text][draw]") {
    SDL_Surface *surface = stagecraft_canvas_create(32, 32);
    Stagecraft_Assets *assets = stagecraft_assets_create();
    Stagecraft_TextOverlay overlay;

    SECTION("No font at all is skipped") {
        stagecraft_text_overlay_init(&overlay, "hi", stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        REQUIRE(stagecraft_text_draw_overlays(surface, assets, &overlay, 1, stagecraft_vec2(0.0f, 0.0f), nullptr));
        REQUIRE(stagecraft_canvas_get_pixel(surface, 1, 1).a == 0);
        stagecraft_text_overlay_free(&overlay);
    }

    SECTION("Missing font warns once per overlay") {
        int warnings = 0;
        uint32_t handle = stagecraft_log_add_callback(
            [](Stagecraft_LogLevel level, const char *, const char *, void *userdata) {
                if (level == STAGECRAFT_LOG_LEVEL_WARNING) {
                    (*static_cast<int *>(userdata))++;
                }
            },
            &warnings);
        REQUIRE(handle != 0);

        stagecraft_text_overlay_init(&overlay, "hi", stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        for (int frame = 0; frame < 3; frame++) {
            REQUIRE(stagecraft_text_draw_overlays(surface, assets, &overlay, 1,
                                                  stagecraft_vec2(0.0f, 0.0f), nullptr));
        }
        REQUIRE(warnings == 1);
        REQUIRE(overlay.font_warned);

        stagecraft_log_remove_callback(handle);
        stagecraft_text_overlay_free(&overlay);
    }

    SECTION("Replacing an overlay keeps its warning state") {
        int warnings = 0;
        uint32_t handle = stagecraft_log_add_callback(
            [](Stagecraft_LogLevel level, const char *, const char *, void *userdata) {
                if (level == STAGECRAFT_LOG_LEVEL_WARNING) {
                    (*static_cast<int *>(userdata))++;
                }
            },
            &warnings);
        REQUIRE(handle != 0);

        Stagecraft_TextOverlayList list = {};
        for (int frame = 0; frame < 3; frame++) {
            stagecraft_text_overlay_init(&overlay, "BOOM!!", stagecraft_vec2(0.0f, 0.0f), nullptr, 0,
                                         STAGECRAFT_COLOR_RED, nullptr, "boom");
            REQUIRE(stagecraft_text_list_put(&list, &overlay) != nullptr);
            REQUIRE(stagecraft_text_draw_overlays(surface, assets, list.items, list.count,
                                                  stagecraft_vec2(0.0f, 0.0f), nullptr));
        }
        REQUIRE(list.count == 1);
        REQUIRE(warnings == 1);

        stagecraft_log_remove_callback(handle);
        stagecraft_text_list_free(&list);
    }

    SECTION("Unreadable font fails the draw") {
        stagecraft_clear_error();
        stagecraft_text_overlay_init(&overlay, "hi", stagecraft_vec2(0.0f, 0.0f), "no_such_font.ttf", 0,
                                     STAGECRAFT_COLOR_BLACK, nullptr, nullptr);
        REQUIRE_FALSE(stagecraft_text_draw_overlays(surface, assets, &overlay, 1,
                                                    stagecraft_vec2(0.0f, 0.0f), nullptr));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_RESOURCE);
        REQUIRE(stagecraft_assets_get_font_count(assets) == 0);
        stagecraft_text_overlay_free(&overlay);
        stagecraft_clear_error();
    }

    stagecraft_assets_destroy(assets);
    SDL_DestroySurface(surface);
}
