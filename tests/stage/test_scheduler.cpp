/*
 * Stagecraft Scheduler Tests
 *
 * Tick ordering, input dispatch, QUIT handling, deferred removal and
 * draw failures. Events are injected with SDL_PushEvent.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "stagecraft/stage.h"
#include "stagecraft/camera.h"
#include "stagecraft/canvas.h"
#include "stagecraft/error.h"
#include "../test_support.h"
#include <SDL3/SDL.h>
#include <string>
#include <vector>

using Catch::Approx;

/* ============================================================================
 * Helpers
 * ============================================================================ */

static void push_key(SDL_EventType type, SDL_Keycode key) {
    SDL_Event event;
    SDL_zero(event);
    event.type = type;
    event.key.key = key;
    event.key.down = type == SDL_EVENT_KEY_DOWN;
    SDL_PushEvent(&event);
}

static void push_quit(void) {
    SDL_Event event;
    SDL_zero(event);
    event.type = SDL_EVENT_QUIT;
    SDL_PushEvent(&event);
}

static void push_button(SDL_EventType type, Uint8 button, float x, float y) {
    SDL_Event event;
    SDL_zero(event);
    event.type = type;
    event.button.button = button;
    event.button.down = type == SDL_EVENT_MOUSE_BUTTON_DOWN;
    event.button.x = x;
    event.button.y = y;
    SDL_PushEvent(&event);
}

/* Records what a handler saw */
struct Recorder {
    int calls = 0;
    bool result = false;
    std::vector<std::string> names;
    std::vector<Stagecraft_EventKind> kinds;
    Stagecraft_Vec2 pos = {0.0f, 0.0f};
    Stagecraft_Stage *remove_from = nullptr;
};

static bool record_event(Stagecraft_Actor *actor, const Stagecraft_InputEvent *event, void *user_data) {
    Recorder *rec = static_cast<Recorder *>(user_data);
    rec->calls++;
    rec->kinds.push_back(event->kind);

    switch (event->kind) {
    case STAGECRAFT_EVENT_KEY_DOWN:
    case STAGECRAFT_EVENT_KEY_UP:
        rec->names.push_back(event->key.name);
        break;
    case STAGECRAFT_EVENT_KEYS_HELD:
    case STAGECRAFT_EVENT_MOUSE_BUTTONS_HELD:
        for (int i = 0; i < event->held.count; i++) rec->names.push_back(event->held.names[i]);
        break;
    case STAGECRAFT_EVENT_MOUSE_DOWN:
    case STAGECRAFT_EVENT_MOUSE_UP:
        rec->names.push_back(event->button.button);
        rec->pos = event->button.pos;
        break;
    default:
        break;
    }

    if (rec->remove_from) {
        stagecraft_stage_remove(rec->remove_from, actor);
    }
    return rec->result;
}

static void count_frame(Stagecraft_Stage *stage, void *user_data) {
    (void)stage;
    (*static_cast<int *>(user_data))++;
}

/* ============================================================================
 * Tick
 * ============================================================================ */

TEST_CASE("Tick basics", "[scheduler][tick]") {
    Stagecraft_StageConfig config = test_stage_config();
    int frames = 0;
    config.on_frame = count_frame;
    config.on_frame_data = &frames;
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    SECTION("Frame hook and counter") {
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(frames == 2);
        REQUIRE(stagecraft_stage_get_frame_count(stage) == 2);
    }

    SECTION("Stopped stages do not tick") {
        stagecraft_stage_end(stage);
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(frames == 0);
        REQUIRE(stagecraft_stage_get_frame_count(stage) == 0);
    }

    SECTION("Actors are drawn y up") {
        Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
        opts.has_bottom_left = true;
        opts.bottom_left = stagecraft_vec2(10.0f, 10.0f);
        opts.color = STAGECRAFT_COLOR_GREEN;
        stagecraft_stage_create_rect(stage, 20.0f, 20.0f, &opts);

        REQUIRE(stagecraft_stage_update(stage));
        SDL_Surface *canvas = stagecraft_stage_get_canvas(stage);
        REQUIRE(stagecraft_color_equal(stagecraft_canvas_get_pixel(canvas, 20, 280), STAGECRAFT_COLOR_GREEN));
        REQUIRE(stagecraft_color_equal(stagecraft_canvas_get_pixel(canvas, 20, 20), config.background));
    }

    SECTION("Camera applies to drawing") {
        Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
        opts.has_center = true;
        opts.center = stagecraft_vec2(100.0f, 100.0f);
        opts.color = STAGECRAFT_COLOR_GREEN;
        stagecraft_stage_create_rect(stage, 10.0f, 10.0f, &opts);

        stagecraft_camera_move_to(stagecraft_stage_get_camera(stage), 50.0f, 0.0f);
        REQUIRE(stagecraft_stage_update(stage));
        SDL_Surface *canvas = stagecraft_stage_get_canvas(stage);
        REQUIRE(stagecraft_color_equal(stagecraft_canvas_get_pixel(canvas, 50, 200), STAGECRAFT_COLOR_GREEN));
        REQUIRE(stagecraft_color_equal(stagecraft_canvas_get_pixel(canvas, 100, 200), config.background));
    }

    stagecraft_stage_destroy(stage);
}

TEST_CASE("Physics steps with the tick", "[scheduler][physics]") {
    Stagecraft_StageConfig config = test_stage_config();
    config.gravity_y = -900.0f;
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    opts.has_center = true;
    opts.center = stagecraft_vec2(200.0f, 200.0f);
    opts.has_mass = true;
    opts.mass = 1.0f;
    Stagecraft_Actor *ball = stagecraft_stage_create_circle(stage, 5.0f, &opts);

    opts.has_mass = false;
    opts.center = stagecraft_vec2(100.0f, 200.0f);
    Stagecraft_Actor *floating = stagecraft_stage_create_circle(stage, 5.0f, &opts);

    for (int i = 0; i < 10; i++) {
        REQUIRE(stagecraft_stage_update(stage));
    }

    REQUIRE(stagecraft_actor_y(ball) < 200.0f);
    REQUIRE(stagecraft_actor_get_velocity(ball).y < 0.0f);
    REQUIRE(stagecraft_actor_y(floating) == Approx(200.0f));

    stagecraft_stage_destroy(stage);
}

/* ============================================================================
 * Input Dispatch
 * ============================================================================ */

TEST_CASE("Key dispatch", "[scheduler][input]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
    Recorder down, held, up;
    REQUIRE(stagecraft_actor_on(a, STAGECRAFT_EVENT_KEY_DOWN, record_event, &down));
    REQUIRE(stagecraft_actor_on(a, STAGECRAFT_EVENT_KEYS_HELD, record_event, &held));
    REQUIRE(stagecraft_actor_on(a, STAGECRAFT_EVENT_KEY_UP, record_event, &up));

    SECTION("Down, held while down, then up") {
        push_key(SDL_EVENT_KEY_DOWN, SDLK_A);
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(down.calls == 1);
        REQUIRE(down.names[0] == "a");
        REQUIRE(held.calls == 1);
        REQUIRE(held.names[0] == "a");
        REQUIRE(stagecraft_held_contains(stagecraft_stage_get_keys_held(stage), "a"));

        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(held.calls == 2);

        push_key(SDL_EVENT_KEY_UP, SDLK_A);
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(up.calls == 1);
        REQUIRE(held.calls == 2);
        REQUIRE(stagecraft_stage_get_keys_held(stage)->count == 0);
    }

    SECTION("Registering again replaces the handler") {
        Recorder other;
        REQUIRE(stagecraft_actor_on(a, STAGECRAFT_EVENT_KEY_DOWN, record_event, &other));
        push_key(SDL_EVENT_KEY_DOWN, SDLK_SPACE);
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(down.calls == 0);
        REQUIRE(other.calls == 1);
        REQUIRE(other.names[0] == "space");
    }

    SECTION("Off stops delivery") {
        stagecraft_actor_off(a, STAGECRAFT_EVENT_KEY_DOWN);
        stagecraft_actor_off(a, STAGECRAFT_EVENT_MOUSE_WHEEL);
        push_key(SDL_EVENT_KEY_DOWN, SDLK_A);
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(down.calls == 0);
        REQUIRE(held.calls == 1);
    }

    stagecraft_stage_destroy(stage);
    test_drain_events();
}

TEST_CASE("Mouse dispatch", "[scheduler][input]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
    Recorder down, held;
    stagecraft_actor_on(a, STAGECRAFT_EVENT_MOUSE_DOWN, record_event, &down);
    stagecraft_actor_on(a, STAGECRAFT_EVENT_MOUSE_BUTTONS_HELD, record_event, &held);

    push_button(SDL_EVENT_MOUSE_BUTTON_DOWN, SDL_BUTTON_RIGHT, 30.0f, 100.0f);
    REQUIRE(stagecraft_stage_update(stage));

    REQUIRE(down.calls == 1);
    REQUIRE(down.names[0] == "right");
    REQUIRE(down.pos.x == Approx(30.0f));
    REQUIRE(down.pos.y == Approx(200.0f));
    REQUIRE(held.calls == 1);
    REQUIRE(stagecraft_held_contains(stagecraft_stage_get_buttons_held(stage), "right"));

    push_button(SDL_EVENT_MOUSE_BUTTON_UP, SDL_BUTTON_RIGHT, 30.0f, 100.0f);
    REQUIRE(stagecraft_stage_update(stage));
    REQUIRE(held.calls == 1);

    stagecraft_stage_destroy(stage);
    test_drain_events();
}

/* ============================================================================
 * Quit
 * ============================================================================ */

TEST_CASE("Quit handling", "[scheduler][quit]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    SECTION("No handlers stops the stage") {
        push_quit();
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(stagecraft_stage_get_state(stage) == STAGECRAFT_STAGE_STOPPED);
    }

    SECTION("A declining handler keeps it running") {
        Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
        Recorder rec;
        rec.result = false;
        stagecraft_actor_on(a, STAGECRAFT_EVENT_QUIT, record_event, &rec);

        push_quit();
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(rec.calls == 1);
        REQUIRE(stagecraft_stage_is_running(stage));
    }

    SECTION("Any accepting handler stops it") {
        Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
        Stagecraft_Actor *b = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
        Recorder no, yes;
        yes.result = true;
        stagecraft_actor_on(a, STAGECRAFT_EVENT_QUIT, record_event, &no);
        stagecraft_actor_on(b, STAGECRAFT_EVENT_QUIT, record_event, &yes);

        push_quit();
        REQUIRE(stagecraft_stage_update(stage));
        REQUIRE(no.calls == 1);
        REQUIRE(yes.calls == 1);
        REQUIRE_FALSE(stagecraft_stage_is_running(stage));
    }

    SECTION("Run returns once quit") {
        push_quit();
        stagecraft_stage_run(stage);
        REQUIRE_FALSE(stagecraft_stage_is_running(stage));
        REQUIRE(stagecraft_stage_get_frame_count(stage) == 1);
    }

    stagecraft_stage_destroy(stage);
    test_drain_events();
}

/* ============================================================================
 * Removal During a Tick
 * ============================================================================ */

TEST_CASE("Removal inside a handler", "[scheduler][remove]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
    Stagecraft_Actor *b = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);

    Recorder first, second;
    first.remove_from = stage;
    stagecraft_actor_on(a, STAGECRAFT_EVENT_KEY_DOWN, record_event, &first);
    stagecraft_actor_on(b, STAGECRAFT_EVENT_KEY_DOWN, record_event, &second);
    stagecraft_actor_on(a, STAGECRAFT_EVENT_KEYS_HELD, record_event, &first);

    push_key(SDL_EVENT_KEY_DOWN, SDLK_A);
    push_key(SDL_EVENT_KEY_DOWN, SDLK_B);
    REQUIRE(stagecraft_stage_update(stage));

    /* The removed actor sees no further events in the same tick */
    REQUIRE(first.calls == 1);
    REQUIRE(second.calls == 2);
    REQUIRE(stagecraft_stage_get_actor_count(stage) == 1);
    REQUIRE(stagecraft_stage_get_actor(stage, 0) == b);
    REQUIRE(stagecraft_physics_space_get_body_count(stagecraft_stage_get_space(stage)) == 1);

    /* Later ticks keep working with the compacted registry */
    push_key(SDL_EVENT_KEY_DOWN, SDLK_C);
    REQUIRE(stagecraft_stage_update(stage));
    REQUIRE(second.calls == 3);

    stagecraft_stage_destroy(stage);
    test_drain_events();
}

/* ============================================================================
 * Draw Failure
 * ============================================================================ */

TEST_CASE("Draw failure stops the stage", "[scheduler][error]") {
    Stagecraft_StageConfig config = test_stage_config();
    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    test_drain_events();

    Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10.0f, 10.0f, nullptr);
    REQUIRE(stagecraft_actor_add_costume_surfaces(a, "empty", nullptr, 0, nullptr, true) != nullptr);

    stagecraft_clear_error();
    REQUIRE_FALSE(stagecraft_stage_update(stage));
    REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_RESOURCE);
    REQUIRE_FALSE(stagecraft_stage_is_running(stage));
    stagecraft_clear_error();

    stagecraft_stage_destroy(stage);
}
