/**
 * Stagecraft - Frame Scheduler
 *
 * One tick: fixed physics sub-steps, input dispatch, frame hook, then an
 * update pass and a draw pass over every live actor, then present and
 * throttle.
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/stage.h"
#include "stagecraft/canvas.h"
#include "stagecraft/input.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"
#include "stage_internal.h"

#include <SDL3/SDL.h>
#include <stdio.h>

#define NS_PER_SECOND 1000000000ull

/* ============================================================================
 * Input Dispatch
 * ============================================================================ */

/* Returns the number of handlers that returned true */
static int dispatch(Stagecraft_Stage *stage, const Stagecraft_InputEvent *event, int *called) {
    Stagecraft_HandlerList *list = &stage->handlers[event->kind];
    int accepted = 0;

    /* Handlers added during dispatch wait for the next event */
    int count = list->count;
    for (int i = 0; i < count; i++) {
        Stagecraft_HandlerEntry entry = list->entries[i];
        if (!entry.handler || entry.actor->pending_removal) continue;

        if (called) (*called)++;
        if (entry.handler(entry.actor, event, entry.user_data)) {
            accepted++;
        }
    }
    return accepted;
}

static void handle_quit(Stagecraft_Stage *stage, const Stagecraft_InputEvent *event) {
    int called = 0;
    int accepted = dispatch(stage, event, &called);

    if (called == 0 || accepted > 0) {
        stagecraft_log_info(STAGECRAFT_LOG_INPUT, "Quit requested");
        stagecraft_stage_end(stage);
    }
}

static void track_held(Stagecraft_Stage *stage, const Stagecraft_InputEvent *event) {
    switch (event->kind) {
    case STAGECRAFT_EVENT_KEY_DOWN:
        stagecraft_held_add(&stage->keys_held, event->key.name);
        break;
    case STAGECRAFT_EVENT_KEY_UP:
        stagecraft_held_remove(&stage->keys_held, event->key.name);
        break;
    case STAGECRAFT_EVENT_MOUSE_DOWN:
        stagecraft_held_add(&stage->buttons_held, event->button.button);
        break;
    case STAGECRAFT_EVENT_MOUSE_UP:
        stagecraft_held_remove(&stage->buttons_held, event->button.button);
        break;
    default:
        break;
    }
}

static void poll_input(Stagecraft_Stage *stage) {
    SDL_Event sdl_event;
    Stagecraft_InputEvent event;

    while (SDL_PollEvent(&sdl_event)) {
        if (!stagecraft_input_translate(&sdl_event, stage->config.height, &event)) continue;

        track_held(stage, &event);

        if (event.kind == STAGECRAFT_EVENT_QUIT) {
            handle_quit(stage, &event);
        } else {
            dispatch(stage, &event, NULL);
        }
    }

    if (stage->keys_held.count > 0) {
        event.kind = STAGECRAFT_EVENT_KEYS_HELD;
        event.held = stage->keys_held;
        dispatch(stage, &event, NULL);
    }
    if (stage->buttons_held.count > 0) {
        event.kind = STAGECRAFT_EVENT_MOUSE_BUTTONS_HELD;
        event.held = stage->buttons_held;
        dispatch(stage, &event, NULL);
    }
}

/* ============================================================================
 * Drawing
 * ============================================================================ */

static const char *default_font(const Stagecraft_Stage *stage) {
    return stage->config.font_path[0] ? stage->config.font_path : NULL;
}

static bool draw_frame(Stagecraft_Stage *stage) {
    stagecraft_canvas_fill(stage->canvas, stage->config.background);
    if (stage->background_scaled) {
        stagecraft_canvas_blit(stage->background_scaled, stage->canvas, 0, 0);
    }

    /* All updates finish before any actor draws */
    for (int i = 0; i < stage->actor_count; i++) {
        Stagecraft_Actor *actor = stage->actors[i];
        if (!actor->pending_removal) stagecraft_actor_update(actor);
    }
    for (int i = 0; i < stage->actor_count; i++) {
        Stagecraft_Actor *actor = stage->actors[i];
        if (actor->pending_removal) continue;
        if (!stagecraft_actor_draw(actor, stage->canvas, stage->camera)) {
            return false;
        }
    }

    if (!stagecraft_text_draw_overlays(stage->canvas, stage->assets, stage->texts.items, stage->texts.count,
                                       stagecraft_vec2(0.0f, 0.0f), default_font(stage))) {
        return false;
    }

    if (stage->config.show_mouse_coordinates && default_font(stage)) {
        Stagecraft_Vec2 mouse = stagecraft_stage_mouse_xy(stage);
        char label[64];
        snprintf(label, sizeof(label), "(%d, %d)", (int)mouse.x, (int)mouse.y);

        Stagecraft_TextOverlay overlay;
        if (!stagecraft_text_overlay_init(&overlay, label, stagecraft_vec2(0.0f, 0.0f), NULL,
                                          stage->config.font_size, STAGECRAFT_COLOR_BLACK, NULL, NULL)) {
            return false;
        }
        bool ok = stagecraft_text_draw_overlays(stage->canvas, stage->assets, &overlay, 1,
                                                stagecraft_vec2(0.0f, 0.0f), default_font(stage));
        stagecraft_text_overlay_free(&overlay);
        if (!ok) return false;
    }
    return true;
}

static void present(Stagecraft_Stage *stage) {
    if (!stage->window) return;

    SDL_Surface *window_surface = SDL_GetWindowSurface(stage->window);
    if (!window_surface) {
        stagecraft_set_error_from_sdl("Stage: No window surface");
        stagecraft_log_and_clear_error();
        return;
    }

    if (!SDL_BlitSurface(stage->canvas, NULL, window_surface, NULL) ||
        !SDL_UpdateWindowSurface(stage->window)) {
        stagecraft_set_error_from_sdl("Stage: Present failed");
        stagecraft_log_and_clear_error();
    }
}

static void throttle(Stagecraft_Stage *stage) {
    uint64_t now = SDL_GetTicksNS();
    if (stage->config.cap_frame_rate && stage->config.fps > 0) {
        uint64_t frame_ns = NS_PER_SECOND / (uint64_t)stage->config.fps;
        uint64_t elapsed = now - stage->last_frame_ns;
        if (elapsed < frame_ns) {
            SDL_DelayNS(frame_ns - elapsed);
            now = SDL_GetTicksNS();
        }
    }
    stage->last_frame_ns = now;
}

/* ============================================================================
 * Tick
 * ============================================================================ */

bool stagecraft_stage_update(Stagecraft_Stage *stage) {
    if (!stage || stage->state == STAGECRAFT_STAGE_STOPPED) return true;

    bool ok = true;
    stage->in_tick = true;

    /* Fixed step regardless of wall-clock frame time */
    int substeps = stage->config.substeps;
    float dt = 1.0f / (float)(stage->config.fps * substeps);
    for (int i = 0; i < substeps; i++) {
        stagecraft_physics_space_step(stage->space, dt);
    }

    poll_input(stage);

    if (stage->state == STAGECRAFT_STAGE_RUNNING && stage->config.on_frame) {
        stage->config.on_frame(stage, stage->config.on_frame_data);
    }

    if (stage->state == STAGECRAFT_STAGE_RUNNING) {
        if (draw_frame(stage)) {
            present(stage);
        } else {
            stagecraft_log_error(STAGECRAFT_LOG_RENDER, "Frame %llu: %s",
                                 (unsigned long long)stage->frame_count, stagecraft_get_last_error());
            stagecraft_stage_end(stage);
            ok = false;
        }
    }

    throttle(stage);
    stage->frame_count++;

    stage->in_tick = false;
    stagecraft_stage_flush_removals(stage);
    return ok;
}

void stagecraft_stage_run(Stagecraft_Stage *stage) {
    if (!stage) return;

    stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Running at %d fps", stage->config.fps);
    while (stage->state == STAGECRAFT_STAGE_RUNNING) {
        stagecraft_stage_update(stage);
    }
}

void stagecraft_stage_end(Stagecraft_Stage *stage) {
    if (!stage || stage->state == STAGECRAFT_STAGE_STOPPED) return;

    stage->state = STAGECRAFT_STAGE_STOPPED;
    stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Stopped after %llu frame(s)",
                        (unsigned long long)stage->frame_count);
}

bool stagecraft_stage_is_running(const Stagecraft_Stage *stage) {
    return stage && stage->state == STAGECRAFT_STAGE_RUNNING;
}

Stagecraft_StageState stagecraft_stage_get_state(const Stagecraft_Stage *stage) {
    return stage ? stage->state : STAGECRAFT_STAGE_STOPPED;
}

uint64_t stagecraft_stage_get_frame_count(const Stagecraft_Stage *stage) {
    return stage ? stage->frame_count : 0;
}

const Stagecraft_HeldSet *stagecraft_stage_get_keys_held(const Stagecraft_Stage *stage) {
    return stage ? &stage->keys_held : NULL;
}

const Stagecraft_HeldSet *stagecraft_stage_get_buttons_held(const Stagecraft_Stage *stage) {
    return stage ? &stage->buttons_held : NULL;
}
