/*
 * Stagecraft 2D Camera
 * World-to-camera transform applied to actor outlines before drawing:
 * - Zoom (uniform scale about the origin)
 * - Rotation about the origin
 * - Pan (position is the bottom-left of the view in world space)
 */

#ifndef STAGECRAFT_CAMERA_H
#define STAGECRAFT_CAMERA_H

#include "stagecraft/vec2.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Opaque camera handle */
typedef struct Stagecraft_Camera Stagecraft_Camera;

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/* Create an identity camera */
Stagecraft_Camera *stagecraft_camera_create(void);

void stagecraft_camera_destroy(Stagecraft_Camera *camera);

/* ============================================================================
 * Transform
 * ============================================================================ */

/*
 * Transform world points to camera space: scale, then rotate, then
 * subtract the camera position. With the identity camera the points are
 * copied through untouched. out may alias points.
 */
void stagecraft_camera_apply(const Stagecraft_Camera *cam,
                             const Stagecraft_Vec2 *points, int count,
                             Stagecraft_Vec2 *out);

/* True when angle is 0, scale is 1 and position is the origin */
bool stagecraft_camera_is_identity(const Stagecraft_Camera *cam);

/* ============================================================================
 * Mutators (each recomputes the cached matrices)
 * ============================================================================ */

void stagecraft_camera_move_by(Stagecraft_Camera *cam, float dx, float dy);
void stagecraft_camera_move_to(Stagecraft_Camera *cam, float x, float y);

/* Angles in degrees, counter-clockwise */
void stagecraft_camera_turn_by(Stagecraft_Camera *cam, float degrees);
void stagecraft_camera_turn_to(Stagecraft_Camera *cam, float degrees);

void stagecraft_camera_zoom_by(Stagecraft_Camera *cam, float factor);
void stagecraft_camera_zoom_to(Stagecraft_Camera *cam, float scale);

void stagecraft_camera_reset(Stagecraft_Camera *cam);

/* ============================================================================
 * Getters
 * ============================================================================ */

Stagecraft_Vec2 stagecraft_camera_get_position(const Stagecraft_Camera *cam);
float stagecraft_camera_get_angle(const Stagecraft_Camera *cam);

/* Rotation in radians, as cached by the last mutator */
float stagecraft_camera_get_theta(const Stagecraft_Camera *cam);

float stagecraft_camera_get_scale(const Stagecraft_Camera *cam);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_CAMERA_H */
