/*
 * Stagecraft Canvas Tests
 *
 * Software surface helpers: pixels, primitives, compositing, transforms.
 */

#include <catch2/catch_test_macros.hpp>
#include "stagecraft/canvas.h"
#include <SDL3/SDL.h>

static bool same(Stagecraft_Color a, Stagecraft_Color b) {
    return stagecraft_color_equal(a, b);
}

/* ============================================================================
 * Surfaces and Pixels
 * ============================================================================ */

TEST_CASE("Canvas surfaces", "[canvas][surface]") {
    SDL_Surface *s = stagecraft_canvas_create(10, 8);
    REQUIRE(s != nullptr);
    REQUIRE(s->w == 10);
    REQUIRE(s->h == 8);

    SECTION("Starts transparent") {
        REQUIRE(stagecraft_canvas_get_pixel(s, 3, 3).a == 0);
    }

    SECTION("Fill and read back") {
        stagecraft_canvas_fill(s, STAGECRAFT_COLOR_PURPLE);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 9, 7), STAGECRAFT_COLOR_PURPLE));
        REQUIRE(stagecraft_canvas_get_pixel(s, 0, 0).a == 255);
    }

    SECTION("Set pixel") {
        stagecraft_canvas_set_pixel(s, 2, 5, STAGECRAFT_COLOR_GREEN);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 2, 5), STAGECRAFT_COLOR_GREEN));
    }

    SECTION("Out of range reads are transparent") {
        stagecraft_canvas_fill(s, STAGECRAFT_COLOR_WHITE);
        REQUIRE(stagecraft_canvas_get_pixel(s, -1, 0).a == 0);
        REQUIRE(stagecraft_canvas_get_pixel(s, 10, 0).a == 0);
    }

    SECTION("Copy is independent") {
        stagecraft_canvas_fill(s, STAGECRAFT_COLOR_RED);
        SDL_Surface *copy = stagecraft_canvas_copy(s);
        REQUIRE(copy != nullptr);
        stagecraft_canvas_fill(s, STAGECRAFT_COLOR_BLACK);
        REQUIRE(same(stagecraft_canvas_get_pixel(copy, 0, 0), STAGECRAFT_COLOR_RED));
        SDL_DestroySurface(copy);
    }

    SDL_DestroySurface(s);
}

/* ============================================================================
 * Primitives
 * ============================================================================ */

TEST_CASE("Canvas primitives", "[canvas][draw]") {
    SDL_Surface *s = stagecraft_canvas_create(20, 20);

    SECTION("Filled polygon") {
        Stagecraft_Vec2 square[4] = {{4.0f, 4.0f}, {16.0f, 4.0f}, {16.0f, 16.0f}, {4.0f, 16.0f}};
        stagecraft_canvas_draw_polygon(s, square, 4, STAGECRAFT_COLOR_RED, 0);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 10, 10), STAGECRAFT_COLOR_RED));
        REQUIRE(stagecraft_canvas_get_pixel(s, 1, 1).a == 0);
    }

    SECTION("Outlined polygon leaves the middle empty") {
        Stagecraft_Vec2 square[4] = {{2.0f, 2.0f}, {18.0f, 2.0f}, {18.0f, 18.0f}, {2.0f, 18.0f}};
        stagecraft_canvas_draw_polygon(s, square, 4, STAGECRAFT_COLOR_RED, 2);
        REQUIRE(stagecraft_canvas_get_pixel(s, 10, 10).a == 0);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 10, 2), STAGECRAFT_COLOR_RED));
    }

    SECTION("Filled circle") {
        stagecraft_canvas_draw_circle(s, 10.0f, 10.0f, 5.0f, STAGECRAFT_COLOR_GREEN, 0);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 10, 10), STAGECRAFT_COLOR_GREEN));
        REQUIRE(stagecraft_canvas_get_pixel(s, 2, 2).a == 0);
    }

    SECTION("Ring circle") {
        stagecraft_canvas_draw_circle(s, 10.0f, 10.0f, 8.0f, STAGECRAFT_COLOR_GREEN, 2);
        REQUIRE(stagecraft_canvas_get_pixel(s, 10, 10).a == 0);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 10, 3), STAGECRAFT_COLOR_GREEN));
    }

    SECTION("Line") {
        stagecraft_canvas_draw_line(s, stagecraft_vec2(0.0f, 10.0f), stagecraft_vec2(20.0f, 10.0f),
                                    STAGECRAFT_COLOR_BLACK, 2);
        REQUIRE(same(stagecraft_canvas_get_pixel(s, 5, 10), STAGECRAFT_COLOR_BLACK));
        REQUIRE(stagecraft_canvas_get_pixel(s, 5, 2).a == 0);
    }

    SDL_DestroySurface(s);
}

/* ============================================================================
 * Compositing
 * ============================================================================ */

TEST_CASE("Canvas compositing", "[canvas][blit]") {
    SDL_Surface *dst = stagecraft_canvas_create(8, 8);
    SDL_Surface *src = stagecraft_canvas_create(2, 2);
    stagecraft_canvas_fill(src, STAGECRAFT_COLOR_RED);

    SECTION("Blit places the source") {
        REQUIRE(stagecraft_canvas_blit(src, dst, 3, 3));
        REQUIRE(same(stagecraft_canvas_get_pixel(dst, 4, 4), STAGECRAFT_COLOR_RED));
        REQUIRE(stagecraft_canvas_get_pixel(dst, 5, 5).a == 0);
    }

    SECTION("Blit min clips to the mask") {
        stagecraft_canvas_fill(dst, STAGECRAFT_COLOR_WHITE);
        SDL_Surface *mask = stagecraft_canvas_create(8, 8);
        stagecraft_canvas_set_pixel(mask, 1, 1, STAGECRAFT_COLOR_WHITE);
        stagecraft_canvas_blit_min(mask, dst, 0, 0);

        REQUIRE(same(stagecraft_canvas_get_pixel(dst, 1, 1), STAGECRAFT_COLOR_WHITE));
        REQUIRE(stagecraft_canvas_get_pixel(dst, 2, 2).a == 0);
        SDL_DestroySurface(mask);
    }

    SECTION("Tile covers the destination") {
        stagecraft_canvas_tile(src, dst, 0.0f, 0.0f);
        REQUIRE(same(stagecraft_canvas_get_pixel(dst, 0, 0), STAGECRAFT_COLOR_RED));
        REQUIRE(same(stagecraft_canvas_get_pixel(dst, 7, 7), STAGECRAFT_COLOR_RED));
    }

    SECTION("Tile with a negative start still covers") {
        stagecraft_canvas_tile(src, dst, -3.0f, -1.0f);
        REQUIRE(same(stagecraft_canvas_get_pixel(dst, 0, 0), STAGECRAFT_COLOR_RED));
        REQUIRE(same(stagecraft_canvas_get_pixel(dst, 7, 7), STAGECRAFT_COLOR_RED));
    }

    SDL_DestroySurface(src);
    SDL_DestroySurface(dst);
}

/* ============================================================================
 * Transforms and Transparency
 * ============================================================================ */

TEST_CASE("Canvas transforms", "[canvas][transform]") {
    SDL_Surface *src = stagecraft_canvas_create(4, 2);
    stagecraft_canvas_fill(src, STAGECRAFT_COLOR_RED);

    SECTION("Scale") {
        SDL_Surface *scaled = stagecraft_canvas_scale(src, 8, 6);
        REQUIRE(scaled != nullptr);
        REQUIRE(scaled->w == 8);
        REQUIRE(scaled->h == 6);
        REQUIRE(same(stagecraft_canvas_get_pixel(scaled, 7, 5), STAGECRAFT_COLOR_RED));
        SDL_DestroySurface(scaled);
    }

    SECTION("Quarter turn swaps dimensions") {
        SDL_Surface *rotated = stagecraft_canvas_rotate(src, 90.0f);
        REQUIRE(rotated != nullptr);
        REQUIRE(rotated->w == 2);
        REQUIRE(rotated->h == 4);
        SDL_DestroySurface(rotated);
    }

    SECTION("Color key clears matching pixels") {
        stagecraft_canvas_set_pixel(src, 0, 0, STAGECRAFT_COLOR_GREEN);
        stagecraft_canvas_apply_color_key(src, STAGECRAFT_COLOR_RED);
        REQUIRE(stagecraft_canvas_get_pixel(src, 1, 1).a == 0);
        REQUIRE(stagecraft_canvas_get_pixel(src, 0, 0).a == 255);
    }

    SDL_DestroySurface(src);
}
