/**
 * Stagecraft - Stage Internal Types
 *
 * Internal header shared between actor.cpp, stage.cpp, scheduler.cpp and
 * config.cpp.
 */

#ifndef STAGECRAFT_STAGE_INTERNAL_H
#define STAGECRAFT_STAGE_INTERNAL_H

#include "stagecraft/stage.h"
#include "stagecraft/actor.h"
#include "stagecraft/input.h"
#include "stagecraft/text.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Actor
 * ============================================================================ */

struct Stagecraft_Actor {
    Stagecraft_Stage *stage;
    Stagecraft_PhysicsBody *body;
    Stagecraft_PhysicsShape *shape;

    /* Appearance */
    Stagecraft_Color color;
    int border;
    bool visible;
    bool has_draw_options;
    Stagecraft_DrawOptions draw_options;

    /* Costumes, owned */
    Stagecraft_Costume **costumes;
    int costume_count;
    int costume_capacity;
    Stagecraft_Costume *current_costume;

    Stagecraft_TextOverlayList texts;

    bool pending_removal;   /* Removed during a tick, freed at its end */
    void *user_data;
};

/* ============================================================================
 * Handler Registry
 * ============================================================================ */

typedef struct Stagecraft_HandlerEntry {
    Stagecraft_Actor *actor;
    Stagecraft_EventHandler handler;
    void *user_data;
} Stagecraft_HandlerEntry;

typedef struct Stagecraft_HandlerList {
    Stagecraft_HandlerEntry *entries;
    int count;
    int capacity;
} Stagecraft_HandlerList;

/* ============================================================================
 * Stage
 * ============================================================================ */

struct Stagecraft_Stage {
    Stagecraft_StageConfig config;

    SDL_Window *window;                 /* NULL when headless */
    SDL_Surface *canvas;
    SDL_Surface *background_scaled;     /* Background image at canvas size */
    Stagecraft_PhysicsSpace *space;
    Stagecraft_Camera *camera;
    Stagecraft_Assets *assets;

    /* Live actors in creation order */
    Stagecraft_Actor **actors;
    int actor_count;
    int actor_capacity;

    Stagecraft_HandlerList handlers[STAGECRAFT_EVENT_KIND_COUNT];
    Stagecraft_TextOverlayList texts;

    Stagecraft_HeldSet keys_held;
    Stagecraft_HeldSet buttons_held;

    Stagecraft_StageState state;
    bool in_tick;
    int pending_removals;
    uint64_t frame_count;
    uint64_t last_frame_ns;
};

/* ============================================================================
 * Internal Functions
 * ============================================================================ */

/**
 * Wrap an already created body and shape in an actor and add it to the
 * live set. On failure the body is destroyed.
 */
Stagecraft_Actor *stagecraft_actor_create_internal(Stagecraft_Stage *stage, Stagecraft_PhysicsBody *body,
                                                   Stagecraft_PhysicsShape *shape,
                                                   const Stagecraft_ActorOptions *opts);

/* Free the actor, its costumes, texts and body. Does not touch the live set. */
void stagecraft_actor_destroy_internal(Stagecraft_Actor *actor);

/* Handler registry */
bool stagecraft_stage_set_handler(Stagecraft_Stage *stage, Stagecraft_EventKind kind, Stagecraft_Actor *actor,
                                  Stagecraft_EventHandler handler, void *user_data);
void stagecraft_stage_clear_handler(Stagecraft_Stage *stage, Stagecraft_EventKind kind, Stagecraft_Actor *actor);
void stagecraft_stage_clear_actor_handlers(Stagecraft_Stage *stage, Stagecraft_Actor *actor);

/* Free actors flagged during the tick */
void stagecraft_stage_flush_removals(Stagecraft_Stage *stage);

/* Scale the background image to the canvas size */
bool stagecraft_stage_rebuild_background(Stagecraft_Stage *stage);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_STAGE_INTERNAL_H */
