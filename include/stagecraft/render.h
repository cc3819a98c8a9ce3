/*
 * Stagecraft Render Pipeline
 *
 * Turns one physics shape (local geometry + body pose) into pixels:
 * world transform, camera, y-flip into canvas space, then a scratch
 * surface holding the filled shape, the costume clipped to the shape
 * silhouette, debug marks and text, blitted at the shape's bounds.
 *
 * Usage:
 *   Stagecraft_RenderInput in = STAGECRAFT_RENDER_INPUT_DEFAULT;
 *   in.geometry = &geometry;
 *   in.position = body_pos;
 *   in.angle = body_angle_radians;
 *   in.camera = camera;
 *   if (!stagecraft_render_shape(canvas, &in)) {
 *       stagecraft_log_and_clear_error();
 *   }
 */

#ifndef STAGECRAFT_RENDER_H
#define STAGECRAFT_RENDER_H

#include "stagecraft/vec2.h"
#include "stagecraft/color.h"
#include "stagecraft/shape.h"
#include "stagecraft/text.h"
#include <stdbool.h>

typedef struct SDL_Surface SDL_Surface;

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Camera Stagecraft_Camera;
typedef struct Stagecraft_Costume Stagecraft_Costume;
typedef struct Stagecraft_Assets Stagecraft_Assets;

/* Debug annotations */
typedef struct Stagecraft_DrawOptions {
    int angle_line_width;            /**< Heading line width, 0 disables */
    Stagecraft_Color angle_line_color;
    float center_radius;             /**< Centroid dot radius, 0 disables */
    Stagecraft_Color center_color;
} Stagecraft_DrawOptions;

#define STAGECRAFT_DRAW_OPTIONS_DEFAULT { \
    .angle_line_width = 0, \
    .angle_line_color = {0, 0, 0, 255}, \
    .center_radius = 0.0f, \
    .center_color = {255, 0, 255, 255} \
}

typedef struct Stagecraft_RenderInput {
    const Stagecraft_ShapeGeometry *geometry;   /**< Local geometry */
    Stagecraft_Vec2 position;                   /**< Body position, world */
    float angle;                                /**< Body angle, radians */
    Stagecraft_Color color;                     /**< Shape fill */
    int border;                                 /**< 0 fills, >0 strokes */
    const Stagecraft_DrawOptions *draw_options; /**< NULL for none */
    const Stagecraft_Camera *camera;            /**< NULL for identity */
    const Stagecraft_Costume *costume;          /**< NULL for plain shape */
    Stagecraft_TextOverlay *texts;
    int text_count;
    Stagecraft_Assets *assets;                  /**< Font cache for texts */
    const char *default_font_path;
} Stagecraft_RenderInput;

#define STAGECRAFT_RENDER_INPUT_DEFAULT { \
    .geometry = NULL, \
    .position = {0.0f, 0.0f}, \
    .angle = 0.0f, \
    .color = {0, 255, 0, 255}, \
    .border = 0, \
    .draw_options = NULL, \
    .camera = NULL, \
    .costume = NULL, \
    .texts = NULL, \
    .text_count = 0, \
    .assets = NULL, \
    .default_font_path = NULL \
}

/* Canvas-space projection of a shape (steps 1-4 of the pipeline) */
typedef struct Stagecraft_RenderProjection {
    int count;
    Stagecraft_Vec2 points[STAGECRAFT_SHAPE_MAX_VERTICES];  /**< Outline, y down */
    Stagecraft_Vec2 centroid;
    Stagecraft_Vec2 heading;      /**< Canvas-space image of the local unit x vector */
    bool is_circle;
    float radius;                 /**< Camera-scaled, valid when is_circle */
    float min_x, min_y, max_x, max_y;
} Stagecraft_RenderProjection;

/**
 * Project a shape into canvas space without drawing.
 *
 * @return false with STAGECRAFT_ERROR_UNSUPPORTED_SHAPE for unknown kinds
 */
bool stagecraft_render_project(const Stagecraft_RenderInput *input, int canvas_height,
                               Stagecraft_RenderProjection *out);

/**
 * Draw a shape with its costume, debug marks and texts onto the canvas.
 *
 * @return false on unsupported shape, missing costume frame or font failure
 */
bool stagecraft_render_shape(SDL_Surface *canvas, const Stagecraft_RenderInput *input);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_RENDER_H */
