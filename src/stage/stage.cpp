/**
 * Stagecraft - Stage Implementation
 *
 * Session lifecycle, actor factories, removal, screen helpers, stage text
 * and the per-event-kind handler registry. The tick itself lives in
 * scheduler.cpp.
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/stage.h"
#include "stagecraft/shape.h"
#include "stagecraft/camera.h"
#include "stagecraft/canvas.h"
#include "stagecraft/assets.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"
#include "stage_internal.h"

#include <SDL3/SDL.h>
#include <math.h>
#include <string.h>

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

static SDL_InitFlags init_flags(const Stagecraft_StageConfig *config) {
    return config->headless ? SDL_INIT_EVENTS : SDL_INIT_VIDEO;
}

Stagecraft_Stage *stagecraft_stage_create(const Stagecraft_StageConfig *config) {
    Stagecraft_StageConfig default_config = STAGECRAFT_STAGE_DEFAULT;
    if (!config) {
        config = &default_config;
    }

    if (config->width <= 0 || config->height <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Stage: Invalid size %dx%d",
                                  config->width, config->height);
        return NULL;
    }

    if (!SDL_InitSubSystem(init_flags(config))) {
        stagecraft_set_error_from_sdl("Stage: Failed to initialize SDL");
        return NULL;
    }

    Stagecraft_Stage *stage = STAGECRAFT_ALLOC(Stagecraft_Stage);
    if (!stage) {
        stagecraft_set_error("Stage: Failed to allocate stage");
        SDL_QuitSubSystem(init_flags(config));
        return NULL;
    }
    stage->config = *config;
    if (stage->config.fps <= 0) stage->config.fps = 60;
    if (stage->config.substeps <= 0) stage->config.substeps = 1;

    if (!stage->config.headless) {
        stage->window = SDL_CreateWindow(stage->config.title, stage->config.width, stage->config.height, 0);
        if (!stage->window) {
            stagecraft_set_error_from_sdl("Stage: Failed to create window");
            stagecraft_stage_destroy(stage);
            return NULL;
        }
    }

    stage->canvas = stagecraft_canvas_create(stage->config.width, stage->config.height);
    if (!stage->canvas) {
        stagecraft_stage_destroy(stage);
        return NULL;
    }

    Stagecraft_PhysicsConfig physics = STAGECRAFT_PHYSICS_DEFAULT;
    physics.gravity_x = stage->config.gravity_x;
    physics.gravity_y = stage->config.gravity_y;
    physics.sleep_time_threshold = stage->config.sleep_time_threshold;
    stage->space = stagecraft_physics_space_create(&physics);
    stage->camera = stagecraft_camera_create();
    stage->assets = stagecraft_assets_create();
    if (!stage->space || !stage->camera || !stage->assets) {
        stagecraft_stage_destroy(stage);
        return NULL;
    }

    if (stage->config.background_image[0] && !stagecraft_stage_rebuild_background(stage)) {
        stagecraft_stage_destroy(stage);
        return NULL;
    }

    stage->state = STAGECRAFT_STAGE_RUNNING;
    stage->last_frame_ns = SDL_GetTicksNS();

    stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Stage '%s' %dx%d created (%s, %d fps, %d substeps)",
                        stage->config.title, stage->config.width, stage->config.height,
                        stage->config.headless ? "headless" : "windowed",
                        stage->config.fps, stage->config.substeps);
    return stage;
}

void stagecraft_stage_destroy(Stagecraft_Stage *stage) {
    if (!stage) return;

    for (int i = 0; i < stage->actor_count; i++) {
        stagecraft_actor_destroy_internal(stage->actors[i]);
    }
    free(stage->actors);

    for (int i = 0; i < STAGECRAFT_EVENT_KIND_COUNT; i++) {
        free(stage->handlers[i].entries);
    }
    stagecraft_text_list_free(&stage->texts);

    if (stage->background_scaled) SDL_DestroySurface(stage->background_scaled);
    if (stage->canvas) SDL_DestroySurface(stage->canvas);
    if (stage->window) SDL_DestroyWindow(stage->window);

    stagecraft_camera_destroy(stage->camera);
    stagecraft_assets_destroy(stage->assets);
    stagecraft_physics_space_destroy(stage->space);

    SDL_QuitSubSystem(init_flags(&stage->config));
    stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Stage destroyed after %llu frame(s)",
                        (unsigned long long)stage->frame_count);
    free(stage);
}

const Stagecraft_StageConfig *stagecraft_stage_get_config(const Stagecraft_Stage *stage) {
    return stage ? &stage->config : NULL;
}

/* ============================================================================
 * Factory Helpers
 * ============================================================================ */

static bool resolve_options(const Stagecraft_ActorOptions *opts, Stagecraft_ActorOptions *out,
                            const char *factory) {
    Stagecraft_ActorOptions defaults = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    *out = opts ? *opts : defaults;

    if (out->has_bottom_left && out->has_center) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG,
                                  "%s: Specify bottom_left or center, not both", factory);
        return false;
    }
    return true;
}

static bool is_dynamic(const Stagecraft_ActorOptions *opts) {
    return opts->has_density || opts->has_mass || opts->has_moment;
}

/*
 * Body kind follows the options: static when fixed, dynamic when any of
 * density, mass or moment is given, kinematic otherwise. unit_moment is the
 * shape's moment for the given (or placeholder) mass.
 */
static Stagecraft_PhysicsBody *create_body(Stagecraft_Stage *stage, const Stagecraft_ActorOptions *opts,
                                           float unit_moment, Stagecraft_Vec2 position) {
    Stagecraft_PhysicsBody *body = NULL;

    if (opts->fixed_object) {
        body = stagecraft_physics_body_create_static(stage->space);
    } else if (is_dynamic(opts)) {
        /* Density alone starts from a placeholder mass the shape then overrides */
        float mass = opts->has_mass ? opts->mass : 1.0f;
        float moment = opts->has_moment ? opts->moment : unit_moment;
        body = stagecraft_physics_body_create_dynamic(stage->space, mass, moment);
    } else {
        body = stagecraft_physics_body_create_kinematic(stage->space);
    }
    if (!body) return NULL;

    stagecraft_physics_body_set_position(body, position.x, position.y);
    stagecraft_physics_body_set_angle(body, STAGECRAFT_DEG_TO_RAD(opts->angle));
    stagecraft_physics_body_set_velocity(body, opts->velocity.x, opts->velocity.y);
    stagecraft_physics_body_set_angular_velocity(body, STAGECRAFT_DEG_TO_RAD(opts->angular_velocity));
    return body;
}

static Stagecraft_Actor *finish_actor(Stagecraft_Stage *stage, Stagecraft_PhysicsBody *body,
                                      Stagecraft_PhysicsShape *shape, const Stagecraft_ActorOptions *opts) {
    if (!shape) {
        stagecraft_physics_body_destroy(body);
        return NULL;
    }

    if (opts->has_density) stagecraft_physics_shape_set_density(shape, opts->density);
    if (opts->has_elasticity) stagecraft_physics_shape_set_elasticity(shape, opts->elasticity);
    if (opts->has_friction) stagecraft_physics_shape_set_friction(shape, opts->friction);

    if (!opts->can_rotate && stagecraft_physics_body_get_kind(body) == STAGECRAFT_BODY_DYNAMIC) {
        stagecraft_physics_body_set_moment(body, INFINITY);
    }

    return stagecraft_actor_create_internal(stage, body, shape, opts);
}

/* Box whose bottom-left sits at bottom_left (or origin), or centered on center */
static Stagecraft_Actor *create_box(Stagecraft_Stage *stage, float width, float height,
                                    const Stagecraft_ActorOptions *opts) {
    Stagecraft_Vec2 center;
    if (opts->has_center) {
        center = opts->center;
    } else {
        Stagecraft_Vec2 bl = opts->has_bottom_left ? opts->bottom_left : stagecraft_vec2(0.0f, 0.0f);
        center = stagecraft_vec2(bl.x + width / 2.0f, bl.y + height / 2.0f);
    }

    float mass = opts->has_mass ? opts->mass : 1.0f;
    Stagecraft_PhysicsBody *body = create_body(stage, opts, stagecraft_physics_moment_for_box(mass, width, height),
                                               center);
    if (!body) return NULL;

    Stagecraft_PhysicsShape *shape = stagecraft_physics_shape_box(body, width, height, opts->radius);
    return finish_actor(stage, body, shape, opts);
}

/* ============================================================================
 * Actor Factories
 * ============================================================================ */

Stagecraft_Actor *stagecraft_stage_create_rect(Stagecraft_Stage *stage, float width, float height,
                                               const Stagecraft_ActorOptions *opts) {
    if (!stage) return NULL;

    Stagecraft_ActorOptions o;
    if (!resolve_options(opts, &o, "create_rect")) return NULL;

    if (!(width > 0.0f) || !(height > 0.0f)) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "create_rect: Invalid size %gx%g",
                                  (double)width, (double)height);
        return NULL;
    }
    return create_box(stage, width, height, &o);
}

Stagecraft_Actor *stagecraft_stage_create_circle(Stagecraft_Stage *stage, float radius,
                                                 const Stagecraft_ActorOptions *opts) {
    if (!stage) return NULL;

    Stagecraft_ActorOptions o;
    if (!resolve_options(opts, &o, "create_circle")) return NULL;

    if (!(radius > 0.0f)) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "create_circle: Invalid radius %g", (double)radius);
        return NULL;
    }

    Stagecraft_Vec2 center = stagecraft_vec2(0.0f, 0.0f);
    if (o.has_bottom_left) {
        center = stagecraft_vec2(o.bottom_left.x + radius, o.bottom_left.y + radius);
    } else if (o.has_center) {
        center = o.center;
    }

    float mass = o.has_mass ? o.mass : 1.0f;
    Stagecraft_PhysicsBody *body = create_body(stage, &o,
                                               stagecraft_physics_moment_for_circle(mass, 0.0f, radius), center);
    if (!body) return NULL;

    Stagecraft_PhysicsShape *shape = stagecraft_physics_shape_circle(body, radius, 0.0f, 0.0f);
    return finish_actor(stage, body, shape, &o);
}

Stagecraft_Actor *stagecraft_stage_create_polygon_any(Stagecraft_Stage *stage, const Stagecraft_Vec2 *points,
                                                      int count, const Stagecraft_ActorOptions *opts) {
    if (!stage) return NULL;

    Stagecraft_ActorOptions o;
    if (!resolve_options(opts, &o, "create_polygon_any")) return NULL;

    if (!points || count < 3 || count > STAGECRAFT_SHAPE_MAX_VERTICES) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG,
                                  "create_polygon_any: Need 3 to %d points (got %d)",
                                  STAGECRAFT_SHAPE_MAX_VERTICES, count);
        return NULL;
    }

    Stagecraft_Vec2 local[STAGECRAFT_SHAPE_MAX_VERTICES];
    bool clockwise = stagecraft_shape_signed_area2(points, count) < 0.0f;

    Stagecraft_Vec2 centroid = stagecraft_vec2(0.0f, 0.0f);
    for (int i = 0; i < count; i++) {
        centroid = stagecraft_vec2_add(centroid, points[i]);
    }
    centroid = stagecraft_vec2_scale(centroid, 1.0f / (float)count);

    /* Chipmunk expects counter-clockwise winding */
    for (int i = 0; i < count; i++) {
        Stagecraft_Vec2 p = clockwise ? points[count - 1 - i] : points[i];
        local[i] = stagecraft_vec2_sub(p, centroid);
    }

    Stagecraft_Vec2 position = centroid;
    if (o.has_bottom_left) {
        float min_x, min_y, max_x, max_y;
        stagecraft_shape_points_bounds(local, count, &min_x, &min_y, &max_x, &max_y);
        position = stagecraft_vec2(o.bottom_left.x - min_x, o.bottom_left.y - min_y);
    } else if (o.has_center) {
        position = o.center;
    }

    float mass = o.has_mass ? o.mass : 1.0f;
    float unit_moment = stagecraft_physics_moment_for_polygon(mass, count, local, o.radius);
    Stagecraft_PhysicsBody *body = create_body(stage, &o, unit_moment, position);
    if (!body) return NULL;

    Stagecraft_PhysicsShape *shape = stagecraft_physics_shape_polygon(body, count, local, o.radius);
    return finish_actor(stage, body, shape, &o);
}

Stagecraft_Actor *stagecraft_stage_create_polygon(Stagecraft_Stage *stage, int sides, float width,
                                                  float height, const Stagecraft_ActorOptions *opts) {
    if (!stage) return NULL;

    if (sides < 3 || sides > STAGECRAFT_SHAPE_MAX_VERTICES) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "create_polygon: Invalid side count %d", sides);
        return NULL;
    }

    Stagecraft_Vec2 points[STAGECRAFT_SHAPE_MAX_VERTICES];
    int count = stagecraft_shape_regular_polygon(sides, width, height, points, STAGECRAFT_SHAPE_MAX_VERTICES);
    return stagecraft_stage_create_polygon_any(stage, points, count, opts);
}

Stagecraft_Actor *stagecraft_stage_create_image(Stagecraft_Stage *stage, const char *const *paths, int count,
                                                const Stagecraft_ActorOptions *opts) {
    if (!stage) return NULL;

    Stagecraft_ActorOptions o;
    if (!resolve_options(opts, &o, "create_image")) return NULL;

    if (!paths || count <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "create_image: At least one image path is required");
        return NULL;
    }

    SDL_Surface *first = stagecraft_assets_get_image(stage->assets, paths[0]);
    if (!first) return NULL;

    float width = (float)first->w * o.scale_x;
    float height = (float)first->h * o.scale_y;

    o.image_paths = paths;
    o.image_count = count;
    o.color = STAGECRAFT_COLOR_TRANSPARENT;
    return create_box(stage, width, height, &o);
}

int stagecraft_stage_create_screen_walls(Stagecraft_Stage *stage, const Stagecraft_ScreenWalls *walls,
                                         Stagecraft_Actor *out[4]) {
    if (!stage) return -1;

    Stagecraft_ScreenWalls defaults = STAGECRAFT_SCREEN_WALLS_DEFAULT;
    if (!walls) walls = &defaults;

    if (out) {
        for (int i = 0; i < 4; i++) out[i] = NULL;
    }

    Stagecraft_ActorOptions o = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    o.color = walls->color;
    o.border = walls->border;
    o.transparency_enabled = false;
    o.fixed_object = true;
    o.has_elasticity = walls->has_elasticity;
    o.elasticity = walls->elasticity;
    o.has_friction = walls->has_friction;
    o.friction = walls->friction;
    o.has_bottom_left = true;

    float w = (float)stage->config.width;
    float h = (float)stage->config.height;
    float t = walls->thickness;
    float border = (float)walls->border;
    int created = 0;

    struct {
        bool enabled;
        float width, height;
        Stagecraft_Vec2 bottom_left;
    } specs[4] = {
        {walls->left, t, h, {walls->left_inset, 0.0f}},
        {walls->right, t, h, {w - walls->right_inset - border * 2.0f - t - 1.0f, 0.0f}},
        {walls->top, w, t, {0.0f, h - walls->top_inset - border * 2.0f - t - 1.0f}},
        {walls->bottom, w, t, {0.0f, walls->bottom_inset}},
    };

    for (int i = 0; i < 4; i++) {
        if (!specs[i].enabled) continue;

        o.bottom_left = specs[i].bottom_left;
        Stagecraft_Actor *wall = stagecraft_stage_create_rect(stage, specs[i].width, specs[i].height, &o);
        if (!wall) return -1;

        if (out) out[i] = wall;
        created++;
    }
    return created;
}

/* ============================================================================
 * Removal
 * ============================================================================ */

static void remove_from_live_set(Stagecraft_Stage *stage, Stagecraft_Actor *actor) {
    for (int i = 0; i < stage->actor_count; i++) {
        if (stage->actors[i] == actor) {
            for (int j = i + 1; j < stage->actor_count; j++) {
                stage->actors[j - 1] = stage->actors[j];
            }
            stage->actor_count--;
            return;
        }
    }
}

void stagecraft_stage_remove(Stagecraft_Stage *stage, Stagecraft_Actor *actor) {
    if (!stage || !actor || actor->stage != stage) return;
    if (actor->pending_removal) return;

    if (stage->in_tick) {
        actor->pending_removal = true;
        stage->pending_removals++;
        return;
    }

    stagecraft_stage_clear_actor_handlers(stage, actor);
    remove_from_live_set(stage, actor);
    stagecraft_actor_destroy_internal(actor);
}

static void compact_handlers(Stagecraft_HandlerList *list) {
    int write = 0;
    for (int read = 0; read < list->count; read++) {
        if (list->entries[read].handler && !list->entries[read].actor->pending_removal) {
            list->entries[write++] = list->entries[read];
        }
    }
    list->count = write;
}

void stagecraft_stage_flush_removals(Stagecraft_Stage *stage) {
    for (int k = 0; k < STAGECRAFT_EVENT_KIND_COUNT; k++) {
        compact_handlers(&stage->handlers[k]);
    }

    if (stage->pending_removals == 0) return;

    int write = 0;
    for (int read = 0; read < stage->actor_count; read++) {
        Stagecraft_Actor *actor = stage->actors[read];
        if (actor->pending_removal) {
            stagecraft_actor_destroy_internal(actor);
        } else {
            stage->actors[write++] = actor;
        }
    }
    stage->actor_count = write;
    stage->pending_removals = 0;
}

int stagecraft_stage_get_actor_count(const Stagecraft_Stage *stage) {
    return stage ? stage->actor_count - stage->pending_removals : 0;
}

Stagecraft_Actor *stagecraft_stage_get_actor(const Stagecraft_Stage *stage, int index) {
    if (!stage || index < 0) return NULL;

    for (int i = 0; i < stage->actor_count; i++) {
        if (stage->actors[i]->pending_removal) continue;
        if (index-- == 0) return stage->actors[i];
    }
    return NULL;
}

/* ============================================================================
 * Handler Registry
 * ============================================================================ */

static Stagecraft_HandlerEntry *find_handler(Stagecraft_HandlerList *list, const Stagecraft_Actor *actor) {
    for (int i = 0; i < list->count; i++) {
        if (list->entries[i].actor == actor) return &list->entries[i];
    }
    return NULL;
}

bool stagecraft_stage_set_handler(Stagecraft_Stage *stage, Stagecraft_EventKind kind, Stagecraft_Actor *actor,
                                  Stagecraft_EventHandler handler, void *user_data) {
    if (!stage || !actor || !handler) return false;
    if ((int)kind < 0 || kind >= STAGECRAFT_EVENT_KIND_COUNT) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Stage: Invalid event kind %d", (int)kind);
        return false;
    }

    Stagecraft_HandlerList *list = &stage->handlers[kind];
    Stagecraft_HandlerEntry *entry = find_handler(list, actor);
    if (!entry) {
        if (list->count >= list->capacity) {
            int capacity = list->capacity > 0 ? list->capacity * 2 : 8;
            Stagecraft_HandlerEntry *entries = STAGECRAFT_REALLOC(list->entries, Stagecraft_HandlerEntry, capacity);
            if (!entries) {
                stagecraft_set_error("Stage: Failed to grow handler list");
                return false;
            }
            list->entries = entries;
            list->capacity = capacity;
        }
        entry = &list->entries[list->count++];
        entry->actor = actor;
    }

    entry->handler = handler;
    entry->user_data = user_data;
    return true;
}

void stagecraft_stage_clear_handler(Stagecraft_Stage *stage, Stagecraft_EventKind kind, Stagecraft_Actor *actor) {
    if (!stage || (int)kind < 0 || kind >= STAGECRAFT_EVENT_KIND_COUNT) return;

    Stagecraft_HandlerList *list = &stage->handlers[kind];
    Stagecraft_HandlerEntry *entry = find_handler(list, actor);
    if (!entry) return;

    /* Dispatch may be walking the list; compact after the tick */
    entry->handler = NULL;
    if (!stage->in_tick) {
        compact_handlers(list);
    }
}

void stagecraft_stage_clear_actor_handlers(Stagecraft_Stage *stage, Stagecraft_Actor *actor) {
    for (int k = 0; k < STAGECRAFT_EVENT_KIND_COUNT; k++) {
        stagecraft_stage_clear_handler(stage, (Stagecraft_EventKind)k, actor);
    }
}

/* ============================================================================
 * Screen
 * ============================================================================ */

int stagecraft_stage_width(const Stagecraft_Stage *stage) {
    return stage ? stage->config.width : 0;
}

int stagecraft_stage_height(const Stagecraft_Stage *stage) {
    return stage ? stage->config.height : 0;
}

void stagecraft_stage_size(const Stagecraft_Stage *stage, int *width, int *height) {
    if (width) *width = stagecraft_stage_width(stage);
    if (height) *height = stagecraft_stage_height(stage);
}

float stagecraft_stage_top(const Stagecraft_Stage *stage) {
    return (float)stagecraft_stage_height(stage);
}

float stagecraft_stage_bottom(const Stagecraft_Stage *stage) {
    (void)stage;
    return 0.0f;
}

float stagecraft_stage_left(const Stagecraft_Stage *stage) {
    (void)stage;
    return 0.0f;
}

float stagecraft_stage_right(const Stagecraft_Stage *stage) {
    return (float)stagecraft_stage_width(stage);
}

Stagecraft_Vec2 stagecraft_stage_center(const Stagecraft_Stage *stage) {
    return stagecraft_vec2((float)(stagecraft_stage_width(stage) / 2),
                           (float)(stagecraft_stage_height(stage) / 2));
}

bool stagecraft_stage_too_left(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor) {
    return stagecraft_actor_left(actor) < stagecraft_stage_left(stage);
}

bool stagecraft_stage_too_right(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor) {
    return stagecraft_actor_right(actor) > stagecraft_stage_right(stage);
}

bool stagecraft_stage_too_top(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor) {
    return stagecraft_actor_top(actor) > stagecraft_stage_top(stage);
}

bool stagecraft_stage_too_bottom(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor) {
    return stagecraft_actor_bottom(actor) < stagecraft_stage_bottom(stage);
}

bool stagecraft_stage_rebuild_background(Stagecraft_Stage *stage) {
    if (stage->background_scaled) {
        SDL_DestroySurface(stage->background_scaled);
        stage->background_scaled = NULL;
    }
    if (!stage->config.background_image[0]) return true;

    SDL_Surface *image = stagecraft_assets_get_image(stage->assets, stage->config.background_image);
    if (!image) return false;

    stage->background_scaled = stagecraft_canvas_scale(image, stage->config.width, stage->config.height);
    return stage->background_scaled != NULL;
}

bool stagecraft_stage_set_size(Stagecraft_Stage *stage, int width, int height) {
    if (!stage) return false;
    if (width <= 0 || height <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Stage: Invalid size %dx%d", width, height);
        return false;
    }

    SDL_Surface *canvas = stagecraft_canvas_create(width, height);
    if (!canvas) return false;

    SDL_DestroySurface(stage->canvas);
    stage->canvas = canvas;
    stage->config.width = width;
    stage->config.height = height;

    if (stage->window && !SDL_SetWindowSize(stage->window, width, height)) {
        stagecraft_set_error_from_sdl("Stage: Failed to resize window");
        stagecraft_log_and_clear_error();
    }
    return stagecraft_stage_rebuild_background(stage);
}

void stagecraft_stage_set_color(Stagecraft_Stage *stage, Stagecraft_Color color) {
    if (!stage) return;
    stage->config.background = color;
}

bool stagecraft_stage_set_background_image(Stagecraft_Stage *stage, const char *path) {
    if (!stage) return false;
    SDL_strlcpy(stage->config.background_image, path ? path : "", sizeof(stage->config.background_image));
    return stagecraft_stage_rebuild_background(stage);
}

void stagecraft_stage_set_fps(Stagecraft_Stage *stage, int fps) {
    if (!stage || fps <= 0) return;
    stage->config.fps = fps;
}

void stagecraft_stage_set_title(Stagecraft_Stage *stage, const char *title) {
    if (!stage || !title) return;
    SDL_strlcpy(stage->config.title, title, sizeof(stage->config.title));
    if (stage->window) {
        SDL_SetWindowTitle(stage->window, stage->config.title);
    }
}

void stagecraft_stage_set_on_frame(Stagecraft_Stage *stage, Stagecraft_FrameFunc func, void *user_data) {
    if (!stage) return;
    stage->config.on_frame = func;
    stage->config.on_frame_data = user_data;
}

void stagecraft_stage_set_show_mouse_coordinates(Stagecraft_Stage *stage, bool show) {
    if (!stage) return;
    stage->config.show_mouse_coordinates = show;
}

Stagecraft_Vec2 stagecraft_stage_mouse_xy(const Stagecraft_Stage *stage) {
    float x = 0.0f, y = 0.0f;
    SDL_GetMouseState(&x, &y);
    return stagecraft_vec2(x, (float)stagecraft_stage_height(stage) - y);
}

/* ============================================================================
 * Stage Text
 * ============================================================================ */

Stagecraft_TextOverlay *stagecraft_stage_add_text(Stagecraft_Stage *stage, const char *text,
                                                  const Stagecraft_Vec2 *pos, const char *font_path,
                                                  int size, Stagecraft_Color color,
                                                  const Stagecraft_Color *background, const char *name) {
    if (!stage) return NULL;

    Stagecraft_Vec2 at = pos ? *pos : stagecraft_stage_center(stage);
    Stagecraft_TextOverlay overlay;
    if (!stagecraft_text_overlay_init(&overlay, text, at, font_path, size, color, background, name)) {
        return NULL;
    }
    return stagecraft_text_list_put(&stage->texts, &overlay);
}

void stagecraft_stage_remove_text(Stagecraft_Stage *stage, const char *name_or_text) {
    if (!stage) return;
    stagecraft_text_list_remove(&stage->texts, name_or_text);
}

/* ============================================================================
 * Access
 * ============================================================================ */

Stagecraft_Camera *stagecraft_stage_get_camera(Stagecraft_Stage *stage) {
    return stage ? stage->camera : NULL;
}

SDL_Surface *stagecraft_stage_get_canvas(Stagecraft_Stage *stage) {
    return stage ? stage->canvas : NULL;
}

SDL_Window *stagecraft_stage_get_window(Stagecraft_Stage *stage) {
    return stage ? stage->window : NULL;
}

Stagecraft_PhysicsSpace *stagecraft_stage_get_space(Stagecraft_Stage *stage) {
    return stage ? stage->space : NULL;
}

Stagecraft_Assets *stagecraft_stage_get_assets(Stagecraft_Stage *stage) {
    return stage ? stage->assets : NULL;
}
