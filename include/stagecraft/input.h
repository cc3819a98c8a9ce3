/*
 * Stagecraft Input Events
 *
 * SDL events translated into a closed set of typed events in stage
 * coordinates (origin bottom-left, y up). Actors subscribe per kind with
 * stagecraft_actor_on(); the stage drains SDL once per tick and
 * dispatches through its handler registry.
 */

#ifndef STAGECRAFT_INPUT_H
#define STAGECRAFT_INPUT_H

#include "stagecraft/vec2.h"
#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>

typedef union SDL_Event SDL_Event;

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Actor Stagecraft_Actor;

#define STAGECRAFT_INPUT_NAME_MAX 32
#define STAGECRAFT_INPUT_MAX_HELD 16

typedef enum Stagecraft_EventKind {
    STAGECRAFT_EVENT_KEY_DOWN = 0,
    STAGECRAFT_EVENT_KEY_UP,
    STAGECRAFT_EVENT_KEYS_HELD,            /**< Once per tick while any key is down */
    STAGECRAFT_EVENT_MOUSE_DOWN,
    STAGECRAFT_EVENT_MOUSE_UP,
    STAGECRAFT_EVENT_MOUSE_BUTTONS_HELD,   /**< Once per tick while any button is down */
    STAGECRAFT_EVENT_MOUSE_MOVE,
    STAGECRAFT_EVENT_MOUSE_WHEEL,
    STAGECRAFT_EVENT_QUIT,
    STAGECRAFT_EVENT_KIND_COUNT
} Stagecraft_EventKind;

/* Set of held key or button names */
typedef struct Stagecraft_HeldSet {
    int count;
    char names[STAGECRAFT_INPUT_MAX_HELD][STAGECRAFT_INPUT_NAME_MAX];
} Stagecraft_HeldSet;

typedef struct Stagecraft_InputEvent {
    Stagecraft_EventKind kind;
    union {
        struct {
            char name[STAGECRAFT_INPUT_NAME_MAX];   /**< Lower case, e.g. "a", "space" */
            uint32_t key;                           /**< SDL keycode */
            uint16_t mod;
            int scancode;
            uint32_t window_id;
        } key;
        struct {
            Stagecraft_Vec2 pos;
            char button[STAGECRAFT_INPUT_NAME_MAX]; /**< "left", "middle", "right" or the number */
            int button_num;
            bool is_touch;
            uint32_t window_id;
        } button;
        struct {
            Stagecraft_Vec2 pos;
            Stagecraft_Vec2 rel;
            uint32_t buttons;                       /**< SDL button state mask */
            bool is_touch;
            uint32_t window_id;
        } motion;
        struct {
            float x;
            float y;
            bool flipped;
            bool is_touch;
            uint32_t window_id;
        } wheel;
        Stagecraft_HeldSet held;
    };
} Stagecraft_InputEvent;

/**
 * Event handler. The return value only matters for QUIT: returning true
 * lets the stage stop.
 */
typedef bool (*Stagecraft_EventHandler)(Stagecraft_Actor *actor, const Stagecraft_InputEvent *event,
                                        void *user_data);

/**
 * Translate an SDL event. Positions are flipped to y-up using the canvas
 * height.
 *
 * @return false when the SDL event has no counterpart
 */
bool stagecraft_input_translate(const SDL_Event *sdl_event, int canvas_height, Stagecraft_InputEvent *out);

/* "left", "middle", "right", otherwise the decimal button number */
void stagecraft_input_button_name(int button, char *out, size_t out_size);

const char *stagecraft_event_kind_name(Stagecraft_EventKind kind);

/* Held set helpers; add ignores duplicates and overflow */
void stagecraft_held_add(Stagecraft_HeldSet *set, const char *name);
void stagecraft_held_remove(Stagecraft_HeldSet *set, const char *name);
bool stagecraft_held_contains(const Stagecraft_HeldSet *set, const char *name);
void stagecraft_held_clear(Stagecraft_HeldSet *set);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_INPUT_H */
