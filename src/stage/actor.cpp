/*
 * Stagecraft Actor Implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/actor.h"
#include "stagecraft/shape.h"
#include "stagecraft/camera.h"
#include "stagecraft/assets.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"
#include "stage_internal.h"

#include <SDL3/SDL.h>
#include <math.h>
#include <string.h>

#define INITIAL_COSTUME_CAPACITY 2
#define DEFAULT_COSTUME_NAME "default"

/* Support normals at or below this are walls or ceilings */
#define GROUNDED_NORMAL_EPSILON 1e-3f

/* ============================================================================
 * Lifecycle (internal)
 * ============================================================================ */

static Stagecraft_CostumeConfig costume_config_from_options(const Stagecraft_ActorOptions *opts) {
    Stagecraft_CostumeConfig config = STAGECRAFT_COSTUME_DEFAULT;
    config.scale_x = opts->scale_x;
    config.scale_y = opts->scale_y;
    config.has_transparent_color = opts->has_transparent_color;
    config.transparent_color = opts->transparent_color;
    config.transparency_enabled = opts->transparency_enabled;
    config.paint_mode = opts->paint_mode;
    return config;
}

Stagecraft_Actor *stagecraft_actor_create_internal(Stagecraft_Stage *stage, Stagecraft_PhysicsBody *body,
                                                   Stagecraft_PhysicsShape *shape,
                                                   const Stagecraft_ActorOptions *opts) {
    if (!stage || !body || !shape || !opts) {
        stagecraft_physics_body_destroy(body);
        return NULL;
    }

    Stagecraft_Actor *actor = STAGECRAFT_ALLOC(Stagecraft_Actor);
    if (!actor) {
        stagecraft_set_error("Actor: Failed to allocate actor");
        stagecraft_physics_body_destroy(body);
        return NULL;
    }

    actor->stage = stage;
    actor->body = body;
    actor->shape = shape;
    actor->color = opts->color;
    actor->border = opts->border;
    actor->visible = opts->visible;
    if (opts->draw_options) {
        actor->has_draw_options = true;
        actor->draw_options = *opts->draw_options;
    }

    stagecraft_physics_body_set_user_data(body, actor);

    if (opts->image_count > 0) {
        Stagecraft_CostumeConfig config = costume_config_from_options(opts);
        if (!stagecraft_actor_add_costume(actor, DEFAULT_COSTUME_NAME, opts->image_paths,
                                          opts->image_count, &config, true)) {
            stagecraft_actor_destroy_internal(actor);
            return NULL;
        }
    }

    if (stage->actor_count >= stage->actor_capacity) {
        int capacity = stage->actor_capacity > 0 ? stage->actor_capacity * 2 : 16;
        Stagecraft_Actor **actors = STAGECRAFT_REALLOC(stage->actors, Stagecraft_Actor *, capacity);
        if (!actors) {
            stagecraft_set_error("Actor: Failed to grow actor list");
            stagecraft_actor_destroy_internal(actor);
            return NULL;
        }
        stage->actors = actors;
        stage->actor_capacity = capacity;
    }
    stage->actors[stage->actor_count++] = actor;

    return actor;
}

void stagecraft_actor_destroy_internal(Stagecraft_Actor *actor) {
    if (!actor) return;

    for (int i = 0; i < actor->costume_count; i++) {
        stagecraft_costume_destroy(actor->costumes[i]);
    }
    free(actor->costumes);
    stagecraft_text_list_free(&actor->texts);

    /* Frees the shape as well */
    stagecraft_physics_body_destroy(actor->body);
    free(actor);
}

/* ============================================================================
 * Pass-through Properties
 * ============================================================================ */

Stagecraft_Vec2 stagecraft_actor_get_position(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_position(actor->body);
}

void stagecraft_actor_set_position(Stagecraft_Actor *actor, float x, float y) {
    stagecraft_physics_body_set_position(actor->body, x, y);
}

Stagecraft_Vec2 stagecraft_actor_get_velocity(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_velocity(actor->body);
}

void stagecraft_actor_set_velocity(Stagecraft_Actor *actor, float vx, float vy) {
    stagecraft_physics_body_set_velocity(actor->body, vx, vy);
}

float stagecraft_actor_get_angle(const Stagecraft_Actor *actor) {
    return STAGECRAFT_RAD_TO_DEG(stagecraft_physics_body_get_angle(actor->body));
}

void stagecraft_actor_set_angle(Stagecraft_Actor *actor, float degrees) {
    stagecraft_physics_body_set_angle(actor->body, STAGECRAFT_DEG_TO_RAD(degrees));
}

float stagecraft_actor_get_angular_velocity(const Stagecraft_Actor *actor) {
    return STAGECRAFT_RAD_TO_DEG(stagecraft_physics_body_get_angular_velocity(actor->body));
}

void stagecraft_actor_set_angular_velocity(Stagecraft_Actor *actor, float degrees_per_second) {
    stagecraft_physics_body_set_angular_velocity(actor->body, STAGECRAFT_DEG_TO_RAD(degrees_per_second));
}

float stagecraft_actor_get_mass(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_mass(actor->body);
}

bool stagecraft_actor_set_mass(Stagecraft_Actor *actor, float mass) {
    return stagecraft_physics_body_set_mass(actor->body, mass);
}

float stagecraft_actor_get_moment(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_moment(actor->body);
}

bool stagecraft_actor_set_moment(Stagecraft_Actor *actor, float moment) {
    return stagecraft_physics_body_set_moment(actor->body, moment);
}

float stagecraft_actor_get_friction(const Stagecraft_Actor *actor) {
    return stagecraft_physics_shape_get_friction(actor->shape);
}

void stagecraft_actor_set_friction(Stagecraft_Actor *actor, float friction) {
    stagecraft_physics_shape_set_friction(actor->shape, friction);
}

float stagecraft_actor_get_elasticity(const Stagecraft_Actor *actor) {
    return stagecraft_physics_shape_get_elasticity(actor->shape);
}

void stagecraft_actor_set_elasticity(Stagecraft_Actor *actor, float elasticity) {
    stagecraft_physics_shape_set_elasticity(actor->shape, elasticity);
}

Stagecraft_CollisionType stagecraft_actor_get_collision_type(const Stagecraft_Actor *actor) {
    return stagecraft_physics_shape_get_collision_type(actor->shape);
}

void stagecraft_actor_set_collision_type(Stagecraft_Actor *actor, Stagecraft_CollisionType type) {
    stagecraft_physics_shape_set_collision_type(actor->shape, type);
}

Stagecraft_CollisionGroup stagecraft_actor_get_group(const Stagecraft_Actor *actor) {
    return stagecraft_physics_shape_get_filter_group(actor->shape);
}

void stagecraft_actor_set_group(Stagecraft_Actor *actor, Stagecraft_CollisionGroup group) {
    stagecraft_physics_shape_set_filter(actor->shape, group,
                                        stagecraft_physics_shape_get_filter_categories(actor->shape),
                                        stagecraft_physics_shape_get_filter_mask(actor->shape));
}

Stagecraft_Vec2 stagecraft_actor_get_surface_velocity(const Stagecraft_Actor *actor) {
    return stagecraft_physics_shape_get_surface_velocity(actor->shape);
}

void stagecraft_actor_set_surface_velocity(Stagecraft_Actor *actor, float vx, float vy) {
    stagecraft_physics_shape_set_surface_velocity(actor->shape, vx, vy);
}

/* ============================================================================
 * Motion
 * ============================================================================ */

void stagecraft_actor_move_by(Stagecraft_Actor *actor, float dx, float dy) {
    Stagecraft_Vec2 pos = stagecraft_physics_body_get_position(actor->body);
    stagecraft_physics_body_set_position(actor->body, pos.x + dx, pos.y + dy);
}

void stagecraft_actor_move_to(Stagecraft_Actor *actor, float x, float y) {
    stagecraft_physics_body_set_position(actor->body, x, y);
}

void stagecraft_actor_turn_by(Stagecraft_Actor *actor, float degrees) {
    float angle = stagecraft_physics_body_get_angle(actor->body);
    stagecraft_physics_body_set_angle(actor->body, angle + STAGECRAFT_DEG_TO_RAD(degrees));
}

void stagecraft_actor_turn_to(Stagecraft_Actor *actor, float degrees) {
    stagecraft_physics_body_set_angle(actor->body, STAGECRAFT_DEG_TO_RAD(degrees));
}

void stagecraft_actor_turn_towards(Stagecraft_Actor *actor, float x, float y) {
    Stagecraft_Vec2 pos = stagecraft_physics_body_get_position(actor->body);
    Stagecraft_Vec2 dir = stagecraft_vec2(x - pos.x, y - pos.y);
    if (dir.x == 0.0f && dir.y == 0.0f) return;
    stagecraft_physics_body_set_angle(actor->body, stagecraft_vec2_angle(dir));
}

void stagecraft_actor_glide_to(Stagecraft_Actor *actor, float x, float y, float speed) {
    Stagecraft_Vec2 pos = stagecraft_physics_body_get_position(actor->body);
    Stagecraft_Vec2 target = stagecraft_vec2(x, y);
    Stagecraft_Vec2 delta = stagecraft_vec2_sub(target, pos);

    float distance = stagecraft_vec2_length(delta);
    if (distance <= 0.0f) return;

    if (speed >= distance) {
        stagecraft_physics_body_set_position(actor->body, x, y);
        return;
    }

    Stagecraft_Vec2 step = stagecraft_vec2_scale(stagecraft_vec2_normalize(delta), speed);
    stagecraft_physics_body_set_position(actor->body, pos.x + step.x, pos.y + step.y);
}

/* ============================================================================
 * Forces
 * ============================================================================ */

void stagecraft_actor_apply_force(Stagecraft_Actor *actor, Stagecraft_Vec2 force) {
    Stagecraft_Vec2 pos = stagecraft_physics_body_get_position(actor->body);
    stagecraft_physics_body_apply_force_at_world(actor->body, force.x, force.y, pos.x, pos.y);
}

void stagecraft_actor_apply_impulse(Stagecraft_Actor *actor, Stagecraft_Vec2 impulse) {
    Stagecraft_Vec2 pos = stagecraft_physics_body_get_position(actor->body);
    stagecraft_physics_body_apply_impulse_at_world(actor->body, impulse.x, impulse.y, pos.x, pos.y);
}

void stagecraft_actor_apply_torque(Stagecraft_Actor *actor, float torque) {
    stagecraft_physics_body_apply_torque(actor->body, torque);
}

void stagecraft_actor_apply_local_force(Stagecraft_Actor *actor, Stagecraft_Vec2 force, Stagecraft_Vec2 local_point) {
    stagecraft_physics_body_apply_force_at_local(actor->body, force.x, force.y, local_point.x, local_point.y);
}

void stagecraft_actor_apply_local_impulse(Stagecraft_Actor *actor, Stagecraft_Vec2 impulse,
                                          Stagecraft_Vec2 local_point) {
    stagecraft_physics_body_apply_impulse_at_local(actor->body, impulse.x, impulse.y,
                                                   local_point.x, local_point.y);
}

void stagecraft_actor_apply_impulse_torque(Stagecraft_Actor *actor, float impulse) {
    float moment = stagecraft_physics_body_get_moment(actor->body);
    if (moment == 0.0f || isnan(moment)) return;

    float w = stagecraft_physics_body_get_angular_velocity(actor->body);
    stagecraft_physics_body_set_angular_velocity(actor->body, w + impulse / moment);
}

/* ============================================================================
 * Queries
 * ============================================================================ */

bool stagecraft_actor_touches_at(const Stagecraft_Actor *actor, float x, float y) {
    return stagecraft_physics_shape_point_query(actor->shape, x, y) <= 0.0f;
}

typedef struct TouchQuery {
    Stagecraft_Actor *const *others;
    int count;
    bool found;
} TouchQuery;

static bool touch_query_callback(const Stagecraft_Contact *contact, void *user_data) {
    TouchQuery *query = (TouchQuery *)user_data;
    for (int i = 0; i < query->count; i++) {
        if (query->others[i] && query->others[i]->shape == contact->other) {
            query->found = true;
            return false;
        }
    }
    return true;
}

bool stagecraft_actor_touches(Stagecraft_Actor *actor, Stagecraft_Actor *const *others, int count) {
    Stagecraft_PhysicsSpace *space = stagecraft_physics_body_get_space(actor->body);
    if (!space) return false;

    if (!others || count <= 0) {
        return stagecraft_physics_space_shape_query(space, actor->shape, NULL, NULL) > 0;
    }

    TouchQuery query = {others, count, false};
    stagecraft_physics_space_shape_query(space, actor->shape, touch_query_callback, &query);
    return query.found;
}

float stagecraft_actor_distance_to(const Stagecraft_Actor *actor, float x, float y) {
    Stagecraft_Vec2 pos = stagecraft_physics_body_get_position(actor->body);
    return stagecraft_vec2_distance(pos, stagecraft_vec2(x, y));
}

/* Contact normals point from this actor toward the other shape; supports are below it */
static bool grounded_callback(const Stagecraft_Contact *contact, void *user_data) {
    bool *grounded = (bool *)user_data;
    if (-contact->normal.y > GROUNDED_NORMAL_EPSILON) {
        *grounded = true;
        return false;
    }
    return true;
}

bool stagecraft_actor_is_grounded(Stagecraft_Actor *actor) {
    Stagecraft_PhysicsSpace *space = stagecraft_physics_body_get_space(actor->body);
    if (!space) return false;

    bool grounded = false;
    stagecraft_physics_space_shape_query(space, actor->shape, grounded_callback, &grounded);
    return grounded;
}

static bool grounding_callback(const Stagecraft_Contact *contact, void *user_data) {
    Stagecraft_Grounding *grounding = (Stagecraft_Grounding *)user_data;
    Stagecraft_Vec2 n = stagecraft_vec2(-contact->normal.x, -contact->normal.y);

    if (n.y > grounding->normal.y) {
        grounding->normal = n;
        if (contact->count > 0) {
            grounding->penetration = -contact->points[0].distance;
            grounding->position = contact->points[0].point_b;
        }
        grounding->impulse = contact->total_impulse;
        grounding->has_body = contact->other_body != NULL;
        if (grounding->has_body) {
            grounding->friction = fabsf(n.x / n.y);
            grounding->velocity = stagecraft_physics_body_get_velocity(contact->other_body);
        }
    }
    return true;
}

Stagecraft_Grounding stagecraft_actor_get_grounding(Stagecraft_Actor *actor) {
    Stagecraft_Grounding grounding = {};
    stagecraft_physics_body_each_contact(actor->body, grounding_callback, &grounding);
    return grounding;
}

/* ============================================================================
 * Geometry
 * ============================================================================ */

static void actor_bb(const Stagecraft_Actor *actor, float *l, float *b, float *r, float *t) {
    stagecraft_physics_shape_get_bb(actor->shape, l, b, r, t);
}

float stagecraft_actor_width(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return r - l;
}

float stagecraft_actor_height(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return t - b;
}

float stagecraft_actor_top(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return t;
}

float stagecraft_actor_bottom(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return b;
}

float stagecraft_actor_left(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return l;
}

float stagecraft_actor_right(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return r;
}

Stagecraft_Vec2 stagecraft_actor_topleft(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return stagecraft_vec2(l, t);
}

Stagecraft_Vec2 stagecraft_actor_topright(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return stagecraft_vec2(r, t);
}

Stagecraft_Vec2 stagecraft_actor_bottomleft(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return stagecraft_vec2(l, b);
}

Stagecraft_Vec2 stagecraft_actor_bottomright(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    return stagecraft_vec2(r, b);
}

Stagecraft_Rect stagecraft_actor_rect(const Stagecraft_Actor *actor) {
    float l, b, r, t;
    actor_bb(actor, &l, &b, &r, &t);
    Stagecraft_Rect rect = {l, t, r - l, t - b};
    return rect;
}

Stagecraft_Vec2 stagecraft_actor_center(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_position(actor->body);
}

float stagecraft_actor_x(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_position(actor->body).x;
}

float stagecraft_actor_y(const Stagecraft_Actor *actor) {
    return stagecraft_physics_body_get_position(actor->body).y;
}

/* ============================================================================
 * Costumes
 * ============================================================================ */

static int find_costume_index(const Stagecraft_Actor *actor, const char *name) {
    if (!name) return -1;
    for (int i = 0; i < actor->costume_count; i++) {
        if (strcmp(stagecraft_costume_get_name(actor->costumes[i]), name) == 0) {
            return i;
        }
    }
    return -1;
}

/* Takes ownership of costume; replaces any costume with the same name */
static Stagecraft_Costume *insert_costume(Stagecraft_Actor *actor, Stagecraft_Costume *costume, bool make_current) {
    int existing = find_costume_index(actor, stagecraft_costume_get_name(costume));
    if (existing >= 0) {
        Stagecraft_Costume *old = actor->costumes[existing];
        if (actor->current_costume == old) {
            actor->current_costume = costume;
        }
        stagecraft_costume_destroy(old);
        actor->costumes[existing] = costume;
    } else {
        if (actor->costume_count >= actor->costume_capacity) {
            int capacity = actor->costume_capacity > 0 ? actor->costume_capacity * 2 : INITIAL_COSTUME_CAPACITY;
            Stagecraft_Costume **costumes = STAGECRAFT_REALLOC(actor->costumes, Stagecraft_Costume *, capacity);
            if (!costumes) {
                stagecraft_set_error("Actor: Failed to grow costume list");
                stagecraft_costume_destroy(costume);
                return NULL;
            }
            actor->costumes = costumes;
            actor->costume_capacity = capacity;
        }
        actor->costumes[actor->costume_count++] = costume;
    }

    if (make_current) {
        actor->current_costume = costume;
    }
    return costume;
}

Stagecraft_Costume *stagecraft_actor_add_costume(Stagecraft_Actor *actor, const char *name,
                                                 const char *const *paths, int count,
                                                 const Stagecraft_CostumeConfig *config,
                                                 bool make_current) {
    if (!actor || !name) return NULL;

    Stagecraft_Costume *costume = stagecraft_costume_create(name, config);
    if (!costume) return NULL;

    if (!stagecraft_costume_add_images(costume, actor->stage->assets, paths, count)) {
        stagecraft_costume_destroy(costume);
        return NULL;
    }
    return insert_costume(actor, costume, make_current);
}

Stagecraft_Costume *stagecraft_actor_add_costume_surfaces(Stagecraft_Actor *actor, const char *name,
                                                          SDL_Surface *const *surfaces, int count,
                                                          const Stagecraft_CostumeConfig *config,
                                                          bool make_current) {
    if (!actor || !name) return NULL;

    Stagecraft_Costume *costume = stagecraft_costume_create(name, config);
    if (!costume) return NULL;

    for (int i = 0; i < count; i++) {
        if (!stagecraft_costume_add_surface(costume, surfaces[i])) {
            stagecraft_costume_destroy(costume);
            return NULL;
        }
    }
    return insert_costume(actor, costume, make_current);
}

bool stagecraft_actor_set_costume(Stagecraft_Actor *actor, const char *name) {
    if (!name) {
        actor->current_costume = NULL;
        return true;
    }

    int index = find_costume_index(actor, name);
    if (index < 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Actor: No costume named '%s'", name);
        return false;
    }
    actor->current_costume = actor->costumes[index];
    return true;
}

void stagecraft_actor_remove_costume(Stagecraft_Actor *actor, const char *name) {
    int index = find_costume_index(actor, name);
    if (index < 0) return;

    Stagecraft_Costume *costume = actor->costumes[index];
    if (actor->current_costume == costume) {
        actor->current_costume = NULL;
    }
    stagecraft_costume_destroy(costume);

    for (int i = index + 1; i < actor->costume_count; i++) {
        actor->costumes[i - 1] = actor->costumes[i];
    }
    actor->costume_count--;
}

Stagecraft_Costume *stagecraft_actor_get_costume(const Stagecraft_Actor *actor) {
    return actor->current_costume;
}

Stagecraft_Costume *stagecraft_actor_find_costume(const Stagecraft_Actor *actor, const char *name) {
    int index = find_costume_index(actor, name);
    return index >= 0 ? actor->costumes[index] : NULL;
}

int stagecraft_actor_get_costume_count(const Stagecraft_Actor *actor) {
    return actor->costume_count;
}

void stagecraft_actor_start_animation(Stagecraft_Actor *actor, bool loop, int from_index, double frame_time_s) {
    if (!actor->current_costume) return;
    stagecraft_animation_start(stagecraft_costume_get_animation(actor->current_costume),
                               loop, from_index, frame_time_s);
}

void stagecraft_actor_stop_animation(Stagecraft_Actor *actor) {
    if (!actor->current_costume) return;
    stagecraft_animation_stop(stagecraft_costume_get_animation(actor->current_costume));
}

bool stagecraft_actor_fit_to_image(Stagecraft_Actor *actor) {
    SDL_Surface *image = stagecraft_costume_get_original(actor->current_costume, 0);
    if (!image) return true;

    Stagecraft_ShapeGeometry geometry;
    if (!stagecraft_shape_read(actor->shape, &geometry)) return false;
    if (!stagecraft_shape_rescale(&geometry, (float)image->w, (float)image->h)) return false;
    return stagecraft_shape_write(actor->shape, &geometry);
}

bool stagecraft_actor_fit_image(Stagecraft_Actor *actor) {
    Stagecraft_Costume *costume = actor->current_costume;
    if (!costume || stagecraft_costume_get_image_count(costume) == 0) return true;

    Stagecraft_ShapeGeometry geometry;
    if (!stagecraft_shape_read(actor->shape, &geometry)) return false;

    Stagecraft_Animation *anim = stagecraft_costume_get_animation(costume);
    SDL_Surface *image = stagecraft_costume_get_original(costume, anim->image_index);
    if (!image) image = stagecraft_costume_get_original(costume, 0);
    if (image->w <= 0 || image->h <= 0) return true;

    float width = stagecraft_actor_width(actor);
    float height = stagecraft_actor_height(actor);
    return stagecraft_costume_set_scale(costume, width / (float)image->w, height / (float)image->h);
}

/* ============================================================================
 * Text Overlays
 * ============================================================================ */

Stagecraft_TextOverlay *stagecraft_actor_add_text(Stagecraft_Actor *actor, const char *text,
                                                  Stagecraft_Vec2 pos, const char *font_path, int size,
                                                  Stagecraft_Color color, const Stagecraft_Color *background,
                                                  const char *name) {
    Stagecraft_TextOverlay overlay;
    if (!stagecraft_text_overlay_init(&overlay, text, pos, font_path, size, color, background, name)) {
        return NULL;
    }
    return stagecraft_text_list_put(&actor->texts, &overlay);
}

void stagecraft_actor_remove_text(Stagecraft_Actor *actor, const char *name_or_text) {
    stagecraft_text_list_remove(&actor->texts, name_or_text);
}

int stagecraft_actor_get_text_count(const Stagecraft_Actor *actor) {
    return actor->texts.count;
}

/* ============================================================================
 * Appearance
 * ============================================================================ */

void stagecraft_actor_show(Stagecraft_Actor *actor) {
    actor->visible = true;
}

void stagecraft_actor_hide(Stagecraft_Actor *actor) {
    actor->visible = false;
}

bool stagecraft_actor_is_hidden(const Stagecraft_Actor *actor) {
    return !actor->visible;
}

void stagecraft_actor_set_color(Stagecraft_Actor *actor, Stagecraft_Color color) {
    actor->color = color;
}

Stagecraft_Color stagecraft_actor_get_color(const Stagecraft_Actor *actor) {
    return actor->color;
}

void stagecraft_actor_set_border(Stagecraft_Actor *actor, int border) {
    actor->border = border;
}

int stagecraft_actor_get_border(const Stagecraft_Actor *actor) {
    return actor->border;
}

void stagecraft_actor_set_draw_options(Stagecraft_Actor *actor, const Stagecraft_DrawOptions *options) {
    if (options) {
        actor->draw_options = *options;
        actor->has_draw_options = true;
    } else {
        actor->has_draw_options = false;
    }
}

/* ============================================================================
 * Frame
 * ============================================================================ */

void stagecraft_actor_update(Stagecraft_Actor *actor) {
    if (actor->current_costume) {
        stagecraft_costume_update(actor->current_costume);
    }
}

bool stagecraft_actor_draw(Stagecraft_Actor *actor, SDL_Surface *canvas, const Stagecraft_Camera *camera) {
    if (!actor->visible) return true;

    Stagecraft_ShapeGeometry geometry;
    if (!stagecraft_shape_read(actor->shape, &geometry)) return false;

    Stagecraft_RenderInput input = STAGECRAFT_RENDER_INPUT_DEFAULT;
    input.geometry = &geometry;
    input.position = stagecraft_physics_body_get_position(actor->body);
    input.angle = stagecraft_physics_body_get_angle(actor->body);
    input.color = actor->color;
    input.border = actor->border;
    input.draw_options = actor->has_draw_options ? &actor->draw_options : NULL;
    input.camera = camera;
    input.costume = actor->current_costume;
    input.texts = actor->texts.items;
    input.text_count = actor->texts.count;
    input.assets = actor->stage->assets;
    input.default_font_path = actor->stage->config.font_path[0] ? actor->stage->config.font_path : NULL;

    return stagecraft_render_shape(canvas, &input);
}

/* ============================================================================
 * Events
 * ============================================================================ */

bool stagecraft_actor_on(Stagecraft_Actor *actor, Stagecraft_EventKind kind,
                         Stagecraft_EventHandler handler, void *user_data) {
    return stagecraft_stage_set_handler(actor->stage, kind, actor, handler, user_data);
}

void stagecraft_actor_off(Stagecraft_Actor *actor, Stagecraft_EventKind kind) {
    stagecraft_stage_clear_handler(actor->stage, kind, actor);
}

/* ============================================================================
 * Access
 * ============================================================================ */

Stagecraft_PhysicsBody *stagecraft_actor_get_body(const Stagecraft_Actor *actor) {
    return actor->body;
}

Stagecraft_PhysicsShape *stagecraft_actor_get_shape(const Stagecraft_Actor *actor) {
    return actor->shape;
}

Stagecraft_Stage *stagecraft_actor_get_stage(const Stagecraft_Actor *actor) {
    return actor->stage;
}

Stagecraft_ShapeKind stagecraft_actor_get_shape_kind(const Stagecraft_Actor *actor) {
    return stagecraft_physics_shape_get_kind(actor->shape);
}

void stagecraft_actor_set_user_data(Stagecraft_Actor *actor, void *data) {
    actor->user_data = data;
}

void *stagecraft_actor_get_user_data(const Stagecraft_Actor *actor) {
    return actor->user_data;
}
