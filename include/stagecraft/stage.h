#ifndef STAGECRAFT_STAGE_H
#define STAGECRAFT_STAGE_H

#include "stagecraft/vec2.h"
#include "stagecraft/color.h"
#include "stagecraft/costume.h"
#include "stagecraft/render.h"
#include "stagecraft/text.h"
#include "stagecraft/actor.h"
#include <stdbool.h>
#include <stdint.h>

typedef struct SDL_Surface SDL_Surface;
typedef struct SDL_Window SDL_Window;

/**
 * Stagecraft Stage
 *
 * Session context owning the window (none when headless), the canvas, the
 * physics space, the camera, the asset cache, every live actor and the
 * per-event-kind handler registry. One tick steps physics, dispatches
 * input, calls the frame hook, then updates and draws every actor.
 *
 * Usage:
 *   Stagecraft_StageConfig cfg = STAGECRAFT_STAGE_DEFAULT;
 *   cfg.gravity_y = -900.0f;
 *   cfg.on_frame = my_frame;
 *
 *   Stagecraft_Stage *stage = stagecraft_stage_create(&cfg);
 *   if (!stage) {
 *       printf("Failed: %s\n", stagecraft_get_last_error());
 *       return 1;
 *   }
 *
 *   Stagecraft_Actor *box = stagecraft_stage_create_rect(stage, 40, 40, NULL);
 *   stagecraft_stage_run(stage);   // Returns once the stage stops
 *   stagecraft_stage_destroy(stage);
 */

#ifdef __cplusplus
extern "C" {
#endif

#define STAGECRAFT_STAGE_TITLE_MAX 128
#define STAGECRAFT_STAGE_PATH_MAX 256

typedef enum Stagecraft_StageState {
    STAGECRAFT_STAGE_RUNNING = 0,
    STAGECRAFT_STAGE_STOPPED      /**< Terminal */
} Stagecraft_StageState;

/* Called once per tick after input dispatch */
typedef void (*Stagecraft_FrameFunc)(Stagecraft_Stage *stage, void *user_data);

/* ============================================================================
 * Configuration
 * ============================================================================ */

typedef struct Stagecraft_StageConfig {
    /* Window */
    char title[STAGECRAFT_STAGE_TITLE_MAX];
    int width;
    int height;
    Stagecraft_Color background;
    char background_image[STAGECRAFT_STAGE_PATH_MAX];  /* Empty for none; scaled to the canvas */
    bool headless;                  /* Off-screen canvas, no window */

    /* Timing */
    int fps;
    bool cap_frame_rate;            /* Sleep to hold fps */

    /* Physics */
    int substeps;                   /* Fixed sub-steps per tick */
    float gravity_x;
    float gravity_y;
    float sleep_time_threshold;

    /* Text */
    char font_path[STAGECRAFT_STAGE_PATH_MAX];  /* Default font, empty for none */
    int font_size;
    bool show_mouse_coordinates;

    /* Hook */
    Stagecraft_FrameFunc on_frame;
    void *on_frame_data;
} Stagecraft_StageConfig;

#define STAGECRAFT_STAGE_DEFAULT { \
    .title = "Stagecraft", \
    .width = 1280, \
    .height = 720, \
    .background = {160, 32, 240, 255}, \
    .background_image = "", \
    .headless = false, \
    .fps = 60, \
    .cap_frame_rate = true, \
    .substeps = 4, \
    .gravity_x = 0.0f, \
    .gravity_y = 0.0f, \
    .sleep_time_threshold = 0.3f, \
    .font_path = "", \
    .font_size = STAGECRAFT_TEXT_DEFAULT_SIZE, \
    .show_mouse_coordinates = false, \
    .on_frame = NULL, \
    .on_frame_data = NULL \
}

/**
 * Overlay the keys of a TOML file onto config. Keys live under [stage],
 * [physics] and [text]; unknown keys are ignored.
 *
 * [stage]   title, width, height, background (name or #hex),
 *           background_image, fps, cap_frame_rate, headless,
 *           show_mouse_coordinates
 * [physics] substeps, gravity = [x, y], sleep_time_threshold
 * [text]    font, size
 *
 * @return false with STAGECRAFT_ERROR_CONFIG on parse or value errors
 */
bool stagecraft_stage_config_load_toml(const char *path, Stagecraft_StageConfig *config);
bool stagecraft_stage_config_parse_toml(const char *text, Stagecraft_StageConfig *config);

/* ============================================================================
 * Actor Options
 * ============================================================================ */

/**
 * Factory arguments. Optional values carry a has_ flag. bottom_left and
 * center are mutually exclusive.
 */
typedef struct Stagecraft_ActorOptions {
    /* Appearance */
    Stagecraft_Color color;
    int border;
    bool visible;
    const Stagecraft_DrawOptions *draw_options;   /* Copied; NULL for none */

    /* Costume built from images, named "default" */
    const char *const *image_paths;
    int image_count;
    float scale_x;
    float scale_y;
    bool has_transparent_color;
    Stagecraft_Color transparent_color;
    bool transparency_enabled;
    Stagecraft_PaintMode paint_mode;

    /* Placement */
    bool has_bottom_left;
    Stagecraft_Vec2 bottom_left;
    bool has_center;
    Stagecraft_Vec2 center;
    float angle;                    /* Degrees */

    /* Body */
    bool has_density;
    float density;
    bool has_mass;
    float mass;
    bool has_moment;
    float moment;
    bool has_elasticity;
    float elasticity;
    bool has_friction;
    float friction;
    bool fixed_object;              /* Static body */
    bool can_rotate;                /* false locks rotation (infinite moment) */
    Stagecraft_Vec2 velocity;
    float angular_velocity;         /* Degrees per second */
    float radius;                   /* Polygon corner radius */
} Stagecraft_ActorOptions;

#define STAGECRAFT_ACTOR_OPTIONS_DEFAULT { \
    .color = {255, 0, 0, 255}, \
    .border = 0, \
    .visible = true, \
    .draw_options = NULL, \
    .image_paths = NULL, \
    .image_count = 0, \
    .scale_x = 1.0f, \
    .scale_y = 1.0f, \
    .has_transparent_color = false, \
    .transparent_color = {0, 0, 0, 0}, \
    .transparency_enabled = true, \
    .paint_mode = STAGECRAFT_PAINT_CENTER, \
    .has_bottom_left = false, \
    .bottom_left = {0.0f, 0.0f}, \
    .has_center = false, \
    .center = {0.0f, 0.0f}, \
    .angle = 0.0f, \
    .has_density = false, \
    .density = 0.0f, \
    .has_mass = false, \
    .mass = 0.0f, \
    .has_moment = false, \
    .moment = 0.0f, \
    .has_elasticity = false, \
    .elasticity = 0.0f, \
    .has_friction = false, \
    .friction = 0.0f, \
    .fixed_object = false, \
    .can_rotate = true, \
    .velocity = {0.0f, 0.0f}, \
    .angular_velocity = 0.0f, \
    .radius = 0.0f \
}

/* Static boundary walls along the screen edges */
typedef struct Stagecraft_ScreenWalls {
    bool left;
    bool right;
    bool top;
    bool bottom;
    float left_inset;               /* Distance from the matching edge */
    float right_inset;
    float top_inset;
    float bottom_inset;
    float thickness;
    Stagecraft_Color color;
    int border;
    bool has_elasticity;
    float elasticity;
    bool has_friction;
    float friction;
} Stagecraft_ScreenWalls;

#define STAGECRAFT_SCREEN_WALLS_DEFAULT { \
    .left = true, \
    .right = true, \
    .top = true, \
    .bottom = true, \
    .left_inset = 0.0f, \
    .right_inset = 0.0f, \
    .top_inset = 0.0f, \
    .bottom_inset = 0.0f, \
    .thickness = 1.0f, \
    .color = {0, 0, 0, 0}, \
    .border = 0, \
    .has_elasticity = false, \
    .elasticity = 0.0f, \
    .has_friction = false, \
    .friction = 0.0f \
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/**
 * Create a stage. Initializes SDL (events only when headless), the canvas,
 * physics space, camera and asset cache.
 *
 * @param config NULL for STAGECRAFT_STAGE_DEFAULT
 * @return Stage, or NULL with STAGECRAFT_ERROR_BACKEND
 */
Stagecraft_Stage *stagecraft_stage_create(const Stagecraft_StageConfig *config);

/* Destroy every actor, then the stage. Safe with NULL. */
void stagecraft_stage_destroy(Stagecraft_Stage *stage);

const Stagecraft_StageConfig *stagecraft_stage_get_config(const Stagecraft_Stage *stage);

/* ============================================================================
 * Actor Factories
 *
 * Each returns NULL with STAGECRAFT_ERROR_CONFIG when both bottom_left and
 * center are given. opts may be NULL for defaults.
 * ============================================================================ */

/* Box placed by its bottom-left corner (default origin) or center */
Stagecraft_Actor *stagecraft_stage_create_rect(Stagecraft_Stage *stage, float width, float height,
                                               const Stagecraft_ActorOptions *opts);

/* Circle placed by its bounding box bottom-left or center */
Stagecraft_Actor *stagecraft_stage_create_circle(Stagecraft_Stage *stage, float radius,
                                                 const Stagecraft_ActorOptions *opts);

/* Regular polygon inscribed in a width x height ellipse */
Stagecraft_Actor *stagecraft_stage_create_polygon(Stagecraft_Stage *stage, int sides, float width,
                                                  float height, const Stagecraft_ActorOptions *opts);

/**
 * Convex polygon from world points. The body sits on the vertex average;
 * without placement the points stay where they are. Clockwise input is
 * reversed.
 */
Stagecraft_Actor *stagecraft_stage_create_polygon_any(Stagecraft_Stage *stage, const Stagecraft_Vec2 *points,
                                                      int count, const Stagecraft_ActorOptions *opts);

/**
 * Box sized to the first image times the image scale, wearing the images
 * as its "default" costume. Fails with STAGECRAFT_ERROR_RESOURCE when an
 * image does not load.
 */
Stagecraft_Actor *stagecraft_stage_create_image(Stagecraft_Stage *stage, const char *const *paths, int count,
                                                const Stagecraft_ActorOptions *opts);

/**
 * Static walls along the enabled edges.
 *
 * @param out Optional; receives left, right, top, bottom (NULL if disabled)
 * @return Number of walls created, -1 on failure
 */
int stagecraft_stage_create_screen_walls(Stagecraft_Stage *stage, const Stagecraft_ScreenWalls *walls,
                                         Stagecraft_Actor *out[4]);

/**
 * Unregister the actor's shape, body and handlers and free it. During a
 * tick the removal is deferred to the end of the tick.
 */
void stagecraft_stage_remove(Stagecraft_Stage *stage, Stagecraft_Actor *actor);

int stagecraft_stage_get_actor_count(const Stagecraft_Stage *stage);
Stagecraft_Actor *stagecraft_stage_get_actor(const Stagecraft_Stage *stage, int index);

/* ============================================================================
 * Screen
 * ============================================================================ */

int stagecraft_stage_width(const Stagecraft_Stage *stage);
int stagecraft_stage_height(const Stagecraft_Stage *stage);
void stagecraft_stage_size(const Stagecraft_Stage *stage, int *width, int *height);
float stagecraft_stage_top(const Stagecraft_Stage *stage);
float stagecraft_stage_bottom(const Stagecraft_Stage *stage);
float stagecraft_stage_left(const Stagecraft_Stage *stage);
float stagecraft_stage_right(const Stagecraft_Stage *stage);
Stagecraft_Vec2 stagecraft_stage_center(const Stagecraft_Stage *stage);

/* Actor bounds beyond the matching screen edge */
bool stagecraft_stage_too_left(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor);
bool stagecraft_stage_too_right(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor);
bool stagecraft_stage_too_top(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor);
bool stagecraft_stage_too_bottom(const Stagecraft_Stage *stage, const Stagecraft_Actor *actor);

/* Recreates the canvas and rescales the background image */
bool stagecraft_stage_set_size(Stagecraft_Stage *stage, int width, int height);
void stagecraft_stage_set_color(Stagecraft_Stage *stage, Stagecraft_Color color);

/* NULL or "" clears the background image */
bool stagecraft_stage_set_background_image(Stagecraft_Stage *stage, const char *path);
void stagecraft_stage_set_fps(Stagecraft_Stage *stage, int fps);
void stagecraft_stage_set_title(Stagecraft_Stage *stage, const char *title);
void stagecraft_stage_set_on_frame(Stagecraft_Stage *stage, Stagecraft_FrameFunc func, void *user_data);
void stagecraft_stage_set_show_mouse_coordinates(Stagecraft_Stage *stage, bool show);

/* Mouse position, y up */
Stagecraft_Vec2 stagecraft_stage_mouse_xy(const Stagecraft_Stage *stage);

/* ============================================================================
 * Stage Text
 * ============================================================================ */

/**
 * Text drawn over everything at canvas coordinates (top-left, y down).
 *
 * @param pos NULL centers it on the screen
 */
Stagecraft_TextOverlay *stagecraft_stage_add_text(Stagecraft_Stage *stage, const char *text,
                                                  const Stagecraft_Vec2 *pos, const char *font_path,
                                                  int size, Stagecraft_Color color,
                                                  const Stagecraft_Color *background, const char *name);
void stagecraft_stage_remove_text(Stagecraft_Stage *stage, const char *name_or_text);

/* ============================================================================
 * Scheduler
 * ============================================================================ */

/**
 * Run one tick. No-op once stopped.
 *
 * @return false when drawing failed; the stage is then stopped
 */
bool stagecraft_stage_update(Stagecraft_Stage *stage);

/* Tick until stopped */
void stagecraft_stage_run(Stagecraft_Stage *stage);

/* Stop the stage; terminal */
void stagecraft_stage_end(Stagecraft_Stage *stage);

bool stagecraft_stage_is_running(const Stagecraft_Stage *stage);
Stagecraft_StageState stagecraft_stage_get_state(const Stagecraft_Stage *stage);
uint64_t stagecraft_stage_get_frame_count(const Stagecraft_Stage *stage);

/* Keys and mouse buttons held as of the last poll */
const Stagecraft_HeldSet *stagecraft_stage_get_keys_held(const Stagecraft_Stage *stage);
const Stagecraft_HeldSet *stagecraft_stage_get_buttons_held(const Stagecraft_Stage *stage);

/* ============================================================================
 * Access
 * ============================================================================ */

Stagecraft_Camera *stagecraft_stage_get_camera(Stagecraft_Stage *stage);
SDL_Surface *stagecraft_stage_get_canvas(Stagecraft_Stage *stage);
SDL_Window *stagecraft_stage_get_window(Stagecraft_Stage *stage);
Stagecraft_PhysicsSpace *stagecraft_stage_get_space(Stagecraft_Stage *stage);
Stagecraft_Assets *stagecraft_stage_get_assets(Stagecraft_Stage *stage);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_STAGE_H */
