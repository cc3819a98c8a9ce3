/**
 * Stagecraft - Glide and Look Example
 *
 * A triangle turns toward the mouse and glides after it at a fixed speed.
 * It shows "BOOM!!" while the mouse touches it. The camera follows the
 * triangle.
 *
 * Controls:
 *   Mouse      - Target point
 *   D          - Toggle heading and centroid markers
 *   +/-        - Zoom the camera
 *   ESC        - Quit
 *
 * Usage:
 *   glide_look [config.toml]
 */

#include "stagecraft/stagecraft.h"
#include <stdio.h>
#include <string.h>

typedef struct AppState {
    Stagecraft_Actor *arrow;
    Stagecraft_DrawOptions debug;
    bool show_debug;
    float speed;
} AppState;

static const Stagecraft_Vec2 ARROW_POINTS[3] = {{0.0f, 0.0f}, {-30.0f, 60.0f}, {30.0f, 60.0f}};

static void on_frame(Stagecraft_Stage *stage, void *user_data) {
    AppState *app = (AppState *)user_data;
    Stagecraft_Camera *cam = stagecraft_stage_get_camera(stage);

    /* Mouse is in screen space; undo the camera pan to get a world target */
    Stagecraft_Vec2 mouse = stagecraft_stage_mouse_xy(stage);
    Stagecraft_Vec2 cam_pos = stagecraft_camera_get_position(cam);
    float scale = stagecraft_camera_get_scale(cam);
    float tx = (mouse.x + cam_pos.x) / scale;
    float ty = (mouse.y + cam_pos.y) / scale;

    stagecraft_actor_turn_towards(app->arrow, tx, ty);
    stagecraft_actor_glide_to(app->arrow, tx, ty, app->speed);

    if (stagecraft_actor_touches_at(app->arrow, tx, ty)) {
        if (!stagecraft_actor_add_text(app->arrow, "BOOM!!", stagecraft_vec2(0.0f, 0.0f), NULL, 0,
                                       STAGECRAFT_COLOR_RED, NULL, "boom")) {
            stagecraft_log_and_clear_error();
        }
    } else {
        stagecraft_actor_remove_text(app->arrow, "boom");
    }

    /* Keep the arrow in the middle of the screen */
    Stagecraft_Vec2 center = stagecraft_stage_center(stage);
    Stagecraft_Vec2 pos = stagecraft_actor_center(app->arrow);
    stagecraft_camera_move_to(cam, pos.x * scale - center.x, pos.y * scale - center.y);
}

static bool on_key_down(Stagecraft_Actor *actor, const Stagecraft_InputEvent *event, void *user_data) {
    AppState *app = (AppState *)user_data;
    Stagecraft_Stage *stage = stagecraft_actor_get_stage(actor);
    Stagecraft_Camera *cam = stagecraft_stage_get_camera(stage);

    if (strcmp(event->key.name, "escape") == 0) {
        stagecraft_stage_end(stage);
    } else if (strcmp(event->key.name, "d") == 0) {
        app->show_debug = !app->show_debug;
        stagecraft_actor_set_draw_options(actor, app->show_debug ? &app->debug : NULL);
    } else if (strcmp(event->key.name, "=") == 0 || strcmp(event->key.name, "+") == 0) {
        stagecraft_camera_zoom_by(cam, 1.25f);
    } else if (strcmp(event->key.name, "-") == 0) {
        stagecraft_camera_zoom_by(cam, 0.8f);
    }
    return false;
}

int main(int argc, char **argv) {
    stagecraft_log_init();

    AppState app = {};
    app.speed = 4.0f;
    app.show_debug = true;
    Stagecraft_DrawOptions debug = STAGECRAFT_DRAW_OPTIONS_DEFAULT;
    debug.angle_line_width = 2;
    debug.center_radius = 3.0f;
    app.debug = debug;

    Stagecraft_StageConfig config = STAGECRAFT_STAGE_DEFAULT;
    snprintf(config.title, sizeof(config.title), "Stagecraft - Glide and Look");
    if (argc > 1 && !stagecraft_stage_config_load_toml(argv[1], &config)) {
        fprintf(stderr, "Config error: %s\n", stagecraft_get_last_error());
        stagecraft_log_shutdown();
        return 1;
    }
    config.on_frame = on_frame;
    config.on_frame_data = &app;

    Stagecraft_Stage *stage = stagecraft_stage_create(&config);
    if (!stage) {
        fprintf(stderr, "Failed to create stage: %s\n", stagecraft_get_last_error());
        stagecraft_log_shutdown();
        return 1;
    }

    Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    opts.color = STAGECRAFT_COLOR_WHITE;
    opts.draw_options = &app.debug;
    app.arrow = stagecraft_stage_create_polygon_any(stage, ARROW_POINTS, 3, &opts);
    if (!app.arrow) {
        fprintf(stderr, "Failed to create actor: %s\n", stagecraft_get_last_error());
        stagecraft_stage_destroy(stage);
        stagecraft_log_shutdown();
        return 1;
    }
    stagecraft_actor_move_to(app.arrow, config.width / 2.0f, config.height / 2.0f);
    stagecraft_actor_on(app.arrow, STAGECRAFT_EVENT_KEY_DOWN, on_key_down, &app);

    Stagecraft_Vec2 help_pos = stagecraft_vec2(10.0f, 10.0f);
    stagecraft_stage_add_text(stage, "Move the mouse. D toggles markers, +/- zoom.",
                              &help_pos, NULL, 0, STAGECRAFT_COLOR_WHITE, NULL, "help");

    stagecraft_stage_run(stage);

    stagecraft_stage_destroy(stage);
    stagecraft_log_shutdown();
    return 0;
}
