/*
 * Stagecraft Input Implementation
 */

#include "stagecraft/input.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>

/* ============================================================================
 * Names
 * ============================================================================ */

static void copy_lower(char *dst, size_t dst_size, const char *src) {
    size_t i = 0;
    if (src) {
        for (; src[i] && i + 1 < dst_size; i++) {
            dst[i] = (char)SDL_tolower((unsigned char)src[i]);
        }
    }
    dst[i] = '\0';
}

void stagecraft_input_button_name(int button, char *out, size_t out_size) {
    if (!out || out_size == 0) return;

    switch (button) {
    case SDL_BUTTON_LEFT:   SDL_strlcpy(out, "left", out_size); break;
    case SDL_BUTTON_MIDDLE: SDL_strlcpy(out, "middle", out_size); break;
    case SDL_BUTTON_RIGHT:  SDL_strlcpy(out, "right", out_size); break;
    default:
        snprintf(out, out_size, "%d", button);
        break;
    }
}

const char *stagecraft_event_kind_name(Stagecraft_EventKind kind) {
    switch (kind) {
    case STAGECRAFT_EVENT_KEY_DOWN:           return "key_down";
    case STAGECRAFT_EVENT_KEY_UP:             return "key_up";
    case STAGECRAFT_EVENT_KEYS_HELD:          return "keys_held";
    case STAGECRAFT_EVENT_MOUSE_DOWN:         return "mouse_down";
    case STAGECRAFT_EVENT_MOUSE_UP:           return "mouse_up";
    case STAGECRAFT_EVENT_MOUSE_BUTTONS_HELD: return "mouse_buttons_held";
    case STAGECRAFT_EVENT_MOUSE_MOVE:         return "mouse_move";
    case STAGECRAFT_EVENT_MOUSE_WHEEL:        return "mouse_wheel";
    case STAGECRAFT_EVENT_QUIT:               return "quit";
    case STAGECRAFT_EVENT_KIND_COUNT:         break;
    }
    return "unknown";
}

/* ============================================================================
 * Translation
 * ============================================================================ */

bool stagecraft_input_translate(const SDL_Event *sdl_event, int canvas_height, Stagecraft_InputEvent *out) {
    if (!sdl_event || !out) return false;
    memset(out, 0, sizeof(*out));

    float height = (float)canvas_height;

    switch (sdl_event->type) {
    case SDL_EVENT_QUIT:
        out->kind = STAGECRAFT_EVENT_QUIT;
        return true;

    case SDL_EVENT_KEY_DOWN:
    case SDL_EVENT_KEY_UP:
        out->kind = sdl_event->type == SDL_EVENT_KEY_DOWN ? STAGECRAFT_EVENT_KEY_DOWN : STAGECRAFT_EVENT_KEY_UP;
        copy_lower(out->key.name, sizeof(out->key.name), SDL_GetKeyName(sdl_event->key.key));
        out->key.key = (uint32_t)sdl_event->key.key;
        out->key.mod = (uint16_t)sdl_event->key.mod;
        out->key.scancode = (int)sdl_event->key.scancode;
        out->key.window_id = (uint32_t)sdl_event->key.windowID;
        return true;

    case SDL_EVENT_MOUSE_BUTTON_DOWN:
    case SDL_EVENT_MOUSE_BUTTON_UP:
        out->kind = sdl_event->type == SDL_EVENT_MOUSE_BUTTON_DOWN ? STAGECRAFT_EVENT_MOUSE_DOWN
                                                                    : STAGECRAFT_EVENT_MOUSE_UP;
        out->button.pos = stagecraft_vec2(sdl_event->button.x, height - sdl_event->button.y);
        out->button.button_num = (int)sdl_event->button.button;
        stagecraft_input_button_name(out->button.button_num, out->button.button, sizeof(out->button.button));
        out->button.is_touch = sdl_event->button.which == SDL_TOUCH_MOUSEID;
        out->button.window_id = (uint32_t)sdl_event->button.windowID;
        return true;

    case SDL_EVENT_MOUSE_MOTION:
        out->kind = STAGECRAFT_EVENT_MOUSE_MOVE;
        out->motion.pos = stagecraft_vec2(sdl_event->motion.x, height - sdl_event->motion.y);
        out->motion.rel = stagecraft_vec2(sdl_event->motion.xrel, -sdl_event->motion.yrel);
        out->motion.buttons = (uint32_t)sdl_event->motion.state;
        out->motion.is_touch = sdl_event->motion.which == SDL_TOUCH_MOUSEID;
        out->motion.window_id = (uint32_t)sdl_event->motion.windowID;
        return true;

    case SDL_EVENT_MOUSE_WHEEL:
        out->kind = STAGECRAFT_EVENT_MOUSE_WHEEL;
        out->wheel.x = sdl_event->wheel.x;
        out->wheel.y = sdl_event->wheel.y;
        out->wheel.flipped = sdl_event->wheel.direction == SDL_MOUSEWHEEL_FLIPPED;
        out->wheel.is_touch = sdl_event->wheel.which == SDL_TOUCH_MOUSEID;
        out->wheel.window_id = (uint32_t)sdl_event->wheel.windowID;
        return true;

    default:
        break;
    }
    return false;
}

/* ============================================================================
 * Held Sets
 * ============================================================================ */

bool stagecraft_held_contains(const Stagecraft_HeldSet *set, const char *name) {
    if (!set || !name) return false;
    for (int i = 0; i < set->count; i++) {
        if (strcmp(set->names[i], name) == 0) return true;
    }
    return false;
}

void stagecraft_held_add(Stagecraft_HeldSet *set, const char *name) {
    if (!set || !name || !name[0]) return;
    if (stagecraft_held_contains(set, name)) return;
    if (set->count >= STAGECRAFT_INPUT_MAX_HELD) return;

    SDL_strlcpy(set->names[set->count], name, STAGECRAFT_INPUT_NAME_MAX);
    set->count++;
}

void stagecraft_held_remove(Stagecraft_HeldSet *set, const char *name) {
    if (!set || !name) return;
    for (int i = 0; i < set->count; i++) {
        if (strcmp(set->names[i], name) == 0) {
            /* Keep press order for the remaining names */
            for (int j = i + 1; j < set->count; j++) {
                memcpy(set->names[j - 1], set->names[j], STAGECRAFT_INPUT_NAME_MAX);
            }
            set->count--;
            return;
        }
    }
}

void stagecraft_held_clear(Stagecraft_HeldSet *set) {
    if (!set) return;
    set->count = 0;
}
