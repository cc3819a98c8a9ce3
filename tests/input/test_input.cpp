/*
 * Stagecraft Input Tests
 *
 * SDL event translation (y-up positions, lower-case names) and held sets.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "stagecraft/input.h"
#include <SDL3/SDL.h>
#include <cstring>
#include <string>

using Catch::Approx;

/* ============================================================================
 * Translation
 * ============================================================================ */

TEST_CASE("Input translation", "[input][translate]") {
    SDL_Event sdl;
    SDL_zero(sdl);
    Stagecraft_InputEvent event;

    SECTION("Quit") {
        sdl.type = SDL_EVENT_QUIT;
        REQUIRE(stagecraft_input_translate(&sdl, 300, &event));
        REQUIRE(event.kind == STAGECRAFT_EVENT_QUIT);
    }

    SECTION("Keys use lower-case names") {
        sdl.type = SDL_EVENT_KEY_DOWN;
        sdl.key.key = SDLK_A;
        sdl.key.down = true;
        REQUIRE(stagecraft_input_translate(&sdl, 300, &event));
        REQUIRE(event.kind == STAGECRAFT_EVENT_KEY_DOWN);
        REQUIRE(std::string(event.key.name) == "a");
        REQUIRE(event.key.key == (uint32_t)SDLK_A);

        sdl.type = SDL_EVENT_KEY_UP;
        sdl.key.key = SDLK_SPACE;
        sdl.key.down = false;
        REQUIRE(stagecraft_input_translate(&sdl, 300, &event));
        REQUIRE(event.kind == STAGECRAFT_EVENT_KEY_UP);
        REQUIRE(std::string(event.key.name) == "space");
    }

    SECTION("Mouse positions are flipped to y up") {
        sdl.type = SDL_EVENT_MOUSE_BUTTON_DOWN;
        sdl.button.button = SDL_BUTTON_LEFT;
        sdl.button.x = 40.0f;
        sdl.button.y = 100.0f;
        REQUIRE(stagecraft_input_translate(&sdl, 300, &event));
        REQUIRE(event.kind == STAGECRAFT_EVENT_MOUSE_DOWN);
        REQUIRE(std::string(event.button.button) == "left");
        REQUIRE(event.button.pos.x == Approx(40.0f));
        REQUIRE(event.button.pos.y == Approx(200.0f));
    }

    SECTION("Motion flips the relative y") {
        sdl.type = SDL_EVENT_MOUSE_MOTION;
        sdl.motion.x = 10.0f;
        sdl.motion.y = 20.0f;
        sdl.motion.xrel = 1.0f;
        sdl.motion.yrel = 2.0f;
        REQUIRE(stagecraft_input_translate(&sdl, 100, &event));
        REQUIRE(event.kind == STAGECRAFT_EVENT_MOUSE_MOVE);
        REQUIRE(event.motion.pos.y == Approx(80.0f));
        REQUIRE(event.motion.rel.y == Approx(-2.0f));
    }

    SECTION("Wheel") {
        sdl.type = SDL_EVENT_MOUSE_WHEEL;
        sdl.wheel.y = -1.0f;
        sdl.wheel.direction = SDL_MOUSEWHEEL_FLIPPED;
        REQUIRE(stagecraft_input_translate(&sdl, 100, &event));
        REQUIRE(event.kind == STAGECRAFT_EVENT_MOUSE_WHEEL);
        REQUIRE(event.wheel.y == Approx(-1.0f));
        REQUIRE(event.wheel.flipped);
    }

    SECTION("Other events are ignored") {
        sdl.type = SDL_EVENT_WINDOW_SHOWN;
        REQUIRE_FALSE(stagecraft_input_translate(&sdl, 100, &event));
    }
}

TEST_CASE("Button and kind names", "[input][names]") {
    char name[STAGECRAFT_INPUT_NAME_MAX];

    stagecraft_input_button_name(SDL_BUTTON_RIGHT, name, sizeof(name));
    REQUIRE(std::string(name) == "right");
    stagecraft_input_button_name(SDL_BUTTON_MIDDLE, name, sizeof(name));
    REQUIRE(std::string(name) == "middle");
    stagecraft_input_button_name(5, name, sizeof(name));
    REQUIRE(std::string(name) == "5");

    REQUIRE(std::string(stagecraft_event_kind_name(STAGECRAFT_EVENT_KEYS_HELD)) == "keys_held");
    REQUIRE(std::string(stagecraft_event_kind_name(STAGECRAFT_EVENT_QUIT)) == "quit");
}

/* ============================================================================
 * Held Sets
 * ============================================================================ */

TEST_CASE("Held sets", "[input][held]") {
    Stagecraft_HeldSet set = {};

    SECTION("Add ignores duplicates") {
        stagecraft_held_add(&set, "a");
        stagecraft_held_add(&set, "a");
        stagecraft_held_add(&set, "left");
        REQUIRE(set.count == 2);
        REQUIRE(stagecraft_held_contains(&set, "left"));
    }

    SECTION("Remove keeps press order") {
        stagecraft_held_add(&set, "a");
        stagecraft_held_add(&set, "b");
        stagecraft_held_add(&set, "c");
        stagecraft_held_remove(&set, "a");
        REQUIRE(set.count == 2);
        REQUIRE(std::strcmp(set.names[0], "b") == 0);
        REQUIRE(std::strcmp(set.names[1], "c") == 0);
        stagecraft_held_remove(&set, "missing");
        REQUIRE(set.count == 2);
    }

    SECTION("Overflow is dropped") {
        for (int i = 0; i < STAGECRAFT_INPUT_MAX_HELD + 4; i++) {
            std::string name = "k" + std::to_string(i);
            stagecraft_held_add(&set, name.c_str());
        }
        REQUIRE(set.count == STAGECRAFT_INPUT_MAX_HELD);
    }

    SECTION("Clear") {
        stagecraft_held_add(&set, "a");
        stagecraft_held_clear(&set);
        REQUIRE(set.count == 0);
        REQUIRE_FALSE(stagecraft_held_contains(&set, "a"));
    }
}
