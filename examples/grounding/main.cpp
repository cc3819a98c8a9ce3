/**
 * Stagecraft - Grounding Example
 *
 * A box walks and jumps on a physics floor bounded by screen walls. Jumps
 * are only allowed while the box is standing on something. Clicking drops
 * a ball at the mouse.
 *
 * Controls:
 *   Left/Right - Walk
 *   Space      - Jump (when grounded)
 *   Click      - Drop a ball
 *   ESC        - Quit
 *
 * Usage:
 *   grounding [config.toml]
 */

#include "stagecraft/stagecraft.h"
#include <stdio.h>
#include <string.h>

static const float WALK_SPEED = 220.0f;
static const float JUMP_SPEED = 520.0f;

typedef struct AppState {
    Stagecraft_Actor *player;
    int balls_dropped;
} AppState;

static void on_frame(Stagecraft_Stage *stage, void *user_data) {
    AppState *app = (AppState *)user_data;

    const char *label = stagecraft_actor_is_grounded(app->player) ? "Grounded" : "Airborne";
    Stagecraft_Vec2 pos = stagecraft_vec2(10.0f, 10.0f);
    stagecraft_stage_add_text(stage, label, &pos, NULL, 0, STAGECRAFT_COLOR_WHITE, NULL, "state");
}

static bool on_keys_held(Stagecraft_Actor *actor, const Stagecraft_InputEvent *event, void *user_data) {
    (void)user_data;
    Stagecraft_Vec2 v = stagecraft_actor_get_velocity(actor);
    float vx = 0.0f;

    for (int i = 0; i < event->held.count; i++) {
        if (strcmp(event->held.names[i], "left") == 0) vx -= WALK_SPEED;
        if (strcmp(event->held.names[i], "right") == 0) vx += WALK_SPEED;
    }

    /* Walking on a moving platform carries its velocity */
    Stagecraft_Grounding ground = stagecraft_actor_get_grounding(actor);
    if (ground.has_body) {
        vx += ground.velocity.x;
    }
    stagecraft_actor_set_velocity(actor, vx, v.y);
    return false;
}

static bool on_key_down(Stagecraft_Actor *actor, const Stagecraft_InputEvent *event, void *user_data) {
    (void)user_data;
    Stagecraft_Stage *stage = stagecraft_actor_get_stage(actor);

    if (strcmp(event->key.name, "escape") == 0) {
        stagecraft_stage_end(stage);
    } else if (strcmp(event->key.name, "space") == 0 && stagecraft_actor_is_grounded(actor)) {
        Stagecraft_Vec2 v = stagecraft_actor_get_velocity(actor);
        stagecraft_actor_set_velocity(actor, v.x, JUMP_SPEED);
    }
    return false;
}

static bool on_mouse_down(Stagecraft_Actor *actor, const Stagecraft_InputEvent *event, void *user_data) {
    AppState *app = (AppState *)user_data;
    Stagecraft_Stage *stage = stagecraft_actor_get_stage(actor);

    Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    opts.color = STAGECRAFT_RGB(255, 200, 40);
    opts.has_center = true;
    opts.center = event->button.pos;
    opts.has_density = true;
    opts.density = 0.01f;
    opts.has_elasticity = true;
    opts.elasticity = 0.6f;

    if (stagecraft_stage_create_circle(stage, 12.0f, &opts)) {
        app->balls_dropped++;
        stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Dropped ball %d", app->balls_dropped);
    }
    return false;
}

int main(int argc, char **argv) {
    stagecraft_log_init();

    AppState app = {};

    Stagecraft_StageConfig config = STAGECRAFT_STAGE_DEFAULT;
    snprintf(config.title, sizeof(config.title), "Stagecraft - Grounding");
    config.gravity_y = -1200.0f;
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

    Stagecraft_ScreenWalls walls = STAGECRAFT_SCREEN_WALLS_DEFAULT;
    walls.thickness = 20.0f;
    walls.color = STAGECRAFT_RGB(90, 90, 90);
    walls.has_friction = true;
    walls.friction = 0.8f;
    if (stagecraft_stage_create_screen_walls(stage, &walls, NULL) < 0) {
        fprintf(stderr, "Failed to create walls: %s\n", stagecraft_get_last_error());
        stagecraft_stage_destroy(stage);
        stagecraft_log_shutdown();
        return 1;
    }

    /* A ledge to jump onto */
    Stagecraft_ActorOptions ledge = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    ledge.color = STAGECRAFT_RGB(90, 90, 90);
    ledge.fixed_object = true;
    ledge.has_bottom_left = true;
    ledge.bottom_left = stagecraft_vec2(config.width * 0.6f, 140.0f);
    stagecraft_stage_create_rect(stage, 200.0f, 20.0f, &ledge);

    Stagecraft_ActorOptions opts = STAGECRAFT_ACTOR_OPTIONS_DEFAULT;
    opts.color = STAGECRAFT_RGB(40, 160, 255);
    opts.has_bottom_left = true;
    opts.bottom_left = stagecraft_vec2(100.0f, 40.0f);
    opts.has_mass = true;
    opts.mass = 1.0f;
    opts.can_rotate = false;
    opts.has_friction = true;
    opts.friction = 0.8f;
    app.player = stagecraft_stage_create_rect(stage, 40.0f, 40.0f, &opts);
    if (!app.player) {
        fprintf(stderr, "Failed to create player: %s\n", stagecraft_get_last_error());
        stagecraft_stage_destroy(stage);
        stagecraft_log_shutdown();
        return 1;
    }

    stagecraft_actor_on(app.player, STAGECRAFT_EVENT_KEYS_HELD, on_keys_held, &app);
    stagecraft_actor_on(app.player, STAGECRAFT_EVENT_KEY_DOWN, on_key_down, &app);
    stagecraft_actor_on(app.player, STAGECRAFT_EVENT_MOUSE_DOWN, on_mouse_down, &app);

    stagecraft_stage_run(stage);

    stagecraft_stage_destroy(stage);
    stagecraft_log_shutdown();
    return 0;
}
