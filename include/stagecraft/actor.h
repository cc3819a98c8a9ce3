/*
 * Stagecraft Actor
 *
 * One physics body with exactly one shape, plus everything needed to draw
 * it: costumes, fill color, border, text overlays, visibility and debug
 * options. Angles are degrees here; the body stores radians.
 *
 * Actors are created by the stage factories (stagecraft_stage_create_rect
 * and friends) and removed with stagecraft_stage_remove(). Using an actor
 * after removal is undefined.
 *
 * Usage:
 *   Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
 *   opts.has_center = true;
 *   opts.center = stagecraft_vec2(100, 100);
 *   Stagecraft_Actor *ball = stagecraft_stage_create_circle(stage, 20, &opts);
 *
 *   // Each frame:
 *   stagecraft_actor_glide_to(ball, 400, 300, 2.0f);
 *   if (stagecraft_actor_touches(ball, &wall, 1)) { ... }
 */

#ifndef STAGECRAFT_ACTOR_H
#define STAGECRAFT_ACTOR_H

#include "stagecraft/vec2.h"
#include "stagecraft/color.h"
#include "stagecraft/physics.h"
#include "stagecraft/costume.h"
#include "stagecraft/render.h"
#include "stagecraft/text.h"
#include "stagecraft/input.h"
#include <stdbool.h>

typedef struct SDL_Surface SDL_Surface;

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Actor Stagecraft_Actor;
typedef struct Stagecraft_Stage Stagecraft_Stage;
typedef struct Stagecraft_Camera Stagecraft_Camera;

/* Support contact below an actor, recomputed on every query */
typedef struct Stagecraft_Grounding {
    Stagecraft_Vec2 normal;      /**< Points from the support toward the actor */
    float penetration;           /**< Overlap depth, positive when overlapping */
    Stagecraft_Vec2 impulse;     /**< Total impulse of the last step */
    Stagecraft_Vec2 position;    /**< Contact point on the support */
    bool has_body;               /**< The support belongs to a body, static ones included */
    float friction;              /**< Slope estimate |n.x / n.y| */
    Stagecraft_Vec2 velocity;    /**< Velocity of the support body */
} Stagecraft_Grounding;

/* Screen-style rectangle: left, top, width, height (y up) */
typedef struct Stagecraft_Rect {
    float left;
    float top;
    float width;
    float height;
} Stagecraft_Rect;

/* ============================================================================
 * Pass-through Properties
 * ============================================================================ */

Stagecraft_Vec2 stagecraft_actor_get_position(const Stagecraft_Actor *actor);
void stagecraft_actor_set_position(Stagecraft_Actor *actor, float x, float y);
Stagecraft_Vec2 stagecraft_actor_get_velocity(const Stagecraft_Actor *actor);
void stagecraft_actor_set_velocity(Stagecraft_Actor *actor, float vx, float vy);

/* Degrees */
float stagecraft_actor_get_angle(const Stagecraft_Actor *actor);
void stagecraft_actor_set_angle(Stagecraft_Actor *actor, float degrees);

/* Degrees per second */
float stagecraft_actor_get_angular_velocity(const Stagecraft_Actor *actor);
void stagecraft_actor_set_angular_velocity(Stagecraft_Actor *actor, float degrees_per_second);

float stagecraft_actor_get_mass(const Stagecraft_Actor *actor);
bool stagecraft_actor_set_mass(Stagecraft_Actor *actor, float mass);
float stagecraft_actor_get_moment(const Stagecraft_Actor *actor);
bool stagecraft_actor_set_moment(Stagecraft_Actor *actor, float moment);

float stagecraft_actor_get_friction(const Stagecraft_Actor *actor);
void stagecraft_actor_set_friction(Stagecraft_Actor *actor, float friction);
float stagecraft_actor_get_elasticity(const Stagecraft_Actor *actor);
void stagecraft_actor_set_elasticity(Stagecraft_Actor *actor, float elasticity);

Stagecraft_CollisionType stagecraft_actor_get_collision_type(const Stagecraft_Actor *actor);
void stagecraft_actor_set_collision_type(Stagecraft_Actor *actor, Stagecraft_CollisionType type);

/* Shapes sharing a non-zero group never collide */
Stagecraft_CollisionGroup stagecraft_actor_get_group(const Stagecraft_Actor *actor);
void stagecraft_actor_set_group(Stagecraft_Actor *actor, Stagecraft_CollisionGroup group);

Stagecraft_Vec2 stagecraft_actor_get_surface_velocity(const Stagecraft_Actor *actor);
void stagecraft_actor_set_surface_velocity(Stagecraft_Actor *actor, float vx, float vy);

/* ============================================================================
 * Motion (instantaneous)
 * ============================================================================ */

void stagecraft_actor_move_by(Stagecraft_Actor *actor, float dx, float dy);
void stagecraft_actor_move_to(Stagecraft_Actor *actor, float x, float y);
void stagecraft_actor_turn_by(Stagecraft_Actor *actor, float degrees);
void stagecraft_actor_turn_to(Stagecraft_Actor *actor, float degrees);

/* Face the point: angle = atan2 of the direction */
void stagecraft_actor_turn_towards(Stagecraft_Actor *actor, float x, float y);

/**
 * Step toward (x, y) by speed units. speed is a distance per call, not a
 * rate. The step is clamped to the remaining distance, so the actor lands
 * exactly on the target; at the target the call is a no-op.
 */
void stagecraft_actor_glide_to(Stagecraft_Actor *actor, float x, float y, float speed);

/* ============================================================================
 * Forces
 * ============================================================================ */

/* At the center of gravity, world-space vector */
void stagecraft_actor_apply_force(Stagecraft_Actor *actor, Stagecraft_Vec2 force);
void stagecraft_actor_apply_impulse(Stagecraft_Actor *actor, Stagecraft_Vec2 impulse);
void stagecraft_actor_apply_torque(Stagecraft_Actor *actor, float torque);

/* Body-local vector applied at a body-local point */
void stagecraft_actor_apply_local_force(Stagecraft_Actor *actor, Stagecraft_Vec2 force, Stagecraft_Vec2 local_point);
void stagecraft_actor_apply_local_impulse(Stagecraft_Actor *actor, Stagecraft_Vec2 impulse, Stagecraft_Vec2 local_point);

/**
 * Add impulse / moment to the angular velocity. No-op when the moment is
 * zero or undefined.
 */
void stagecraft_actor_apply_impulse_torque(Stagecraft_Actor *actor, float impulse);

/* ============================================================================
 * Queries
 * ============================================================================ */

/* True when the point is on or inside the shape */
bool stagecraft_actor_touches_at(const Stagecraft_Actor *actor, float x, float y);

/**
 * Overlap test against the physics space. With count == 0, true when any
 * other shape overlaps; otherwise true when one of the given actors does.
 */
bool stagecraft_actor_touches(Stagecraft_Actor *actor, Stagecraft_Actor *const *others, int count);

float stagecraft_actor_distance_to(const Stagecraft_Actor *actor, float x, float y);

/* True when another body supports this actor from below */
bool stagecraft_actor_is_grounded(Stagecraft_Actor *actor);

/**
 * Strongest upward contact among the body's arbiters, or a zeroed result
 * when there is none.
 */
Stagecraft_Grounding stagecraft_actor_get_grounding(Stagecraft_Actor *actor);

/* ============================================================================
 * Geometry (world bounding box, recomputed per call)
 * ============================================================================ */

float stagecraft_actor_width(const Stagecraft_Actor *actor);
float stagecraft_actor_height(const Stagecraft_Actor *actor);
float stagecraft_actor_top(const Stagecraft_Actor *actor);
float stagecraft_actor_bottom(const Stagecraft_Actor *actor);
float stagecraft_actor_left(const Stagecraft_Actor *actor);
float stagecraft_actor_right(const Stagecraft_Actor *actor);
Stagecraft_Vec2 stagecraft_actor_topleft(const Stagecraft_Actor *actor);
Stagecraft_Vec2 stagecraft_actor_topright(const Stagecraft_Actor *actor);
Stagecraft_Vec2 stagecraft_actor_bottomleft(const Stagecraft_Actor *actor);
Stagecraft_Vec2 stagecraft_actor_bottomright(const Stagecraft_Actor *actor);
Stagecraft_Rect stagecraft_actor_rect(const Stagecraft_Actor *actor);

/* Body position */
Stagecraft_Vec2 stagecraft_actor_center(const Stagecraft_Actor *actor);
float stagecraft_actor_x(const Stagecraft_Actor *actor);
float stagecraft_actor_y(const Stagecraft_Actor *actor);

/* ============================================================================
 * Costumes
 * ============================================================================ */

/**
 * Create a costume from image files, replacing any costume of that name.
 *
 * @param config NULL for STAGECRAFT_COSTUME_DEFAULT
 * @return The costume, or NULL with STAGECRAFT_ERROR_RESOURCE
 */
Stagecraft_Costume *stagecraft_actor_add_costume(Stagecraft_Actor *actor, const char *name,
                                                 const char *const *paths, int count,
                                                 const Stagecraft_CostumeConfig *config,
                                                 bool make_current);

/* Same, from in-memory surfaces (copied) */
Stagecraft_Costume *stagecraft_actor_add_costume_surfaces(Stagecraft_Actor *actor, const char *name,
                                                          SDL_Surface *const *surfaces, int count,
                                                          const Stagecraft_CostumeConfig *config,
                                                          bool make_current);

/* NULL clears the current costume; unknown names fail */
bool stagecraft_actor_set_costume(Stagecraft_Actor *actor, const char *name);

/* Missing names are ignored */
void stagecraft_actor_remove_costume(Stagecraft_Actor *actor, const char *name);

Stagecraft_Costume *stagecraft_actor_get_costume(const Stagecraft_Actor *actor);
Stagecraft_Costume *stagecraft_actor_find_costume(const Stagecraft_Actor *actor, const char *name);
int stagecraft_actor_get_costume_count(const Stagecraft_Actor *actor);

void stagecraft_actor_start_animation(Stagecraft_Actor *actor, bool loop, int from_index, double frame_time_s);
void stagecraft_actor_stop_animation(Stagecraft_Actor *actor);

/**
 * Resize the shape to the current costume's first image.
 *
 * @return false with STAGECRAFT_ERROR_UNSUPPORTED_SHAPE for unknown kinds
 */
bool stagecraft_actor_fit_to_image(Stagecraft_Actor *actor);

/* Scale the current costume to the actor's bounding box */
bool stagecraft_actor_fit_image(Stagecraft_Actor *actor);

/* ============================================================================
 * Text Overlays
 * ============================================================================ */

/**
 * Add or replace a text overlay. pos is relative to the actor's drawn
 * bounds (top-left, y down). A NULL name keys it by its text.
 *
 * @return The overlay, valid until the actor's overlays next change
 */
Stagecraft_TextOverlay *stagecraft_actor_add_text(Stagecraft_Actor *actor, const char *text,
                                                  Stagecraft_Vec2 pos, const char *font_path, int size,
                                                  Stagecraft_Color color, const Stagecraft_Color *background,
                                                  const char *name);

/* Missing names are ignored */
void stagecraft_actor_remove_text(Stagecraft_Actor *actor, const char *name_or_text);
int stagecraft_actor_get_text_count(const Stagecraft_Actor *actor);

/* ============================================================================
 * Appearance
 * ============================================================================ */

void stagecraft_actor_show(Stagecraft_Actor *actor);
void stagecraft_actor_hide(Stagecraft_Actor *actor);
bool stagecraft_actor_is_hidden(const Stagecraft_Actor *actor);

void stagecraft_actor_set_color(Stagecraft_Actor *actor, Stagecraft_Color color);
Stagecraft_Color stagecraft_actor_get_color(const Stagecraft_Actor *actor);
void stagecraft_actor_set_border(Stagecraft_Actor *actor, int border);
int stagecraft_actor_get_border(const Stagecraft_Actor *actor);

/* NULL disables debug annotations */
void stagecraft_actor_set_draw_options(Stagecraft_Actor *actor, const Stagecraft_DrawOptions *options);

/* ============================================================================
 * Frame
 * ============================================================================ */

/* Advance the current costume's animation */
void stagecraft_actor_update(Stagecraft_Actor *actor);

/**
 * Render through the pipeline. No-op when hidden.
 *
 * @param camera NULL for identity
 */
bool stagecraft_actor_draw(Stagecraft_Actor *actor, SDL_Surface *canvas, const Stagecraft_Camera *camera);

/* ============================================================================
 * Events
 * ============================================================================ */

/* Register a handler for one event kind, replacing any previous one */
bool stagecraft_actor_on(Stagecraft_Actor *actor, Stagecraft_EventKind kind,
                         Stagecraft_EventHandler handler, void *user_data);

/* Missing handlers are ignored */
void stagecraft_actor_off(Stagecraft_Actor *actor, Stagecraft_EventKind kind);

/* ============================================================================
 * Access
 * ============================================================================ */

Stagecraft_PhysicsBody *stagecraft_actor_get_body(const Stagecraft_Actor *actor);
Stagecraft_PhysicsShape *stagecraft_actor_get_shape(const Stagecraft_Actor *actor);
Stagecraft_Stage *stagecraft_actor_get_stage(const Stagecraft_Actor *actor);
Stagecraft_ShapeKind stagecraft_actor_get_shape_kind(const Stagecraft_Actor *actor);

void stagecraft_actor_set_user_data(Stagecraft_Actor *actor, void *data);
void *stagecraft_actor_get_user_data(const Stagecraft_Actor *actor);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_ACTOR_H */
