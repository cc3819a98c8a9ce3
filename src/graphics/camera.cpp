/*
 * Stagecraft 2D Camera Implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/camera.h"
#include <cglm/cglm.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>

/* ============================================================================
 * Internal Structure
 * ============================================================================ */

struct Stagecraft_Camera {
    float x, y;          /* Bottom-left of the view in world space */
    float angle;         /* Degrees */
    float scale;         /* 1.0 = normal, 2.0 = 2x magnification */

    float theta;         /* Cached radians */
    mat2 rotation;
    mat2 scaling;
};

/* ============================================================================
 * Internal: Matrix Computation
 * ============================================================================ */

static void camera_compute_matrices(Stagecraft_Camera *cam)
{
    if (cam->angle == 0.0f) {
        cam->theta = 0.0f;
        glm_mat2_identity(cam->rotation);
    } else {
        cam->theta = STAGECRAFT_DEG_TO_RAD(cam->angle);
        float c = cosf(cam->theta);
        float s = sinf(cam->theta);
        /* Column-major: columns are the images of the x and y axes */
        cam->rotation[0][0] = c;
        cam->rotation[0][1] = s;
        cam->rotation[1][0] = -s;
        cam->rotation[1][1] = c;
    }

    glm_mat2_identity(cam->scaling);
    glm_mat2_scale(cam->scaling, cam->scale);
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Stagecraft_Camera *stagecraft_camera_create(void)
{
    Stagecraft_Camera *cam = STAGECRAFT_ALLOC(Stagecraft_Camera);
    if (!cam) {
        stagecraft_set_error("Failed to allocate camera");
        return NULL;
    }

    cam->scale = 1.0f;
    camera_compute_matrices(cam);
    return cam;
}

void stagecraft_camera_destroy(Stagecraft_Camera *camera)
{
    free(camera);
}

/* ============================================================================
 * Transform
 * ============================================================================ */

bool stagecraft_camera_is_identity(const Stagecraft_Camera *cam)
{
    if (!cam) return true;
    return cam->angle == 0.0f && cam->scale == 1.0f && cam->x == 0.0f && cam->y == 0.0f;
}

void stagecraft_camera_apply(const Stagecraft_Camera *cam,
                             const Stagecraft_Vec2 *points, int count,
                             Stagecraft_Vec2 *out)
{
    if (!points || !out || count <= 0) return;

    if (stagecraft_camera_is_identity(cam)) {
        if (out != points) {
            memmove(out, points, sizeof(Stagecraft_Vec2) * (size_t)count);
        }
        return;
    }

    mat2 transform;
    glm_mat2_mul((vec2 *)cam->rotation, (vec2 *)cam->scaling, transform);

    for (int i = 0; i < count; i++) {
        vec2 p = {points[i].x, points[i].y};
        vec2 r;
        glm_mat2_mulv(transform, p, r);
        out[i].x = r[0] - cam->x;
        out[i].y = r[1] - cam->y;
    }
}

/* ============================================================================
 * Mutators
 * ============================================================================ */

void stagecraft_camera_move_by(Stagecraft_Camera *cam, float dx, float dy)
{
    if (!cam) return;
    cam->x += dx;
    cam->y += dy;
    camera_compute_matrices(cam);
}

void stagecraft_camera_move_to(Stagecraft_Camera *cam, float x, float y)
{
    if (!cam) return;
    cam->x = x;
    cam->y = y;
    camera_compute_matrices(cam);
}

void stagecraft_camera_turn_by(Stagecraft_Camera *cam, float degrees)
{
    if (!cam) return;
    cam->angle += degrees;
    camera_compute_matrices(cam);
}

void stagecraft_camera_turn_to(Stagecraft_Camera *cam, float degrees)
{
    if (!cam) return;
    cam->angle = degrees;
    camera_compute_matrices(cam);
}

void stagecraft_camera_zoom_by(Stagecraft_Camera *cam, float factor)
{
    if (!cam) return;
    cam->scale *= factor;
    camera_compute_matrices(cam);
}

void stagecraft_camera_zoom_to(Stagecraft_Camera *cam, float scale)
{
    if (!cam) return;
    cam->scale = scale;
    camera_compute_matrices(cam);
}

void stagecraft_camera_reset(Stagecraft_Camera *cam)
{
    if (!cam) return;
    cam->x = 0.0f;
    cam->y = 0.0f;
    cam->angle = 0.0f;
    cam->scale = 1.0f;
    camera_compute_matrices(cam);
}

/* ============================================================================
 * Getters
 * ============================================================================ */

Stagecraft_Vec2 stagecraft_camera_get_position(const Stagecraft_Camera *cam)
{
    if (!cam) return stagecraft_vec2(0.0f, 0.0f);
    return stagecraft_vec2(cam->x, cam->y);
}

float stagecraft_camera_get_angle(const Stagecraft_Camera *cam)
{
    return cam ? cam->angle : 0.0f;
}

float stagecraft_camera_get_theta(const Stagecraft_Camera *cam)
{
    return cam ? cam->theta : 0.0f;
}

float stagecraft_camera_get_scale(const Stagecraft_Camera *cam)
{
    return cam ? cam->scale : 1.0f;
}
