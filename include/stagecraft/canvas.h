/*
 * Stagecraft Canvas
 *
 * CPU raster operations on SDL surfaces in SDL_PIXELFORMAT_RGBA32.
 * Coordinates are canvas pixels with y pointing down. Shape drawing
 * writes pixels directly (no blending); blits blend.
 */

#ifndef STAGECRAFT_CANVAS_H
#define STAGECRAFT_CANVAS_H

#include "stagecraft/vec2.h"
#include "stagecraft/color.h"
#include <stdbool.h>

typedef struct SDL_Surface SDL_Surface;

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Surfaces
 * ============================================================================ */

/**
 * Create a transparent RGBA32 surface. Sizes below 1 are clamped to 1.
 * Caller owns the result (SDL_DestroySurface).
 */
SDL_Surface *stagecraft_canvas_create(int width, int height);

/**
 * Copy any surface into a new RGBA32 surface.
 */
SDL_Surface *stagecraft_canvas_copy(SDL_Surface *src);

void stagecraft_canvas_fill(SDL_Surface *surface, Stagecraft_Color color);

Stagecraft_Color stagecraft_canvas_get_pixel(SDL_Surface *surface, int x, int y);
void stagecraft_canvas_set_pixel(SDL_Surface *surface, int x, int y, Stagecraft_Color color);

/* ============================================================================
 * Compositing
 * ============================================================================ */

/* Alpha-blended blit of src with its top-left at (x, y) */
bool stagecraft_canvas_blit(SDL_Surface *src, SDL_Surface *dst, int x, int y);

/*
 * Per-channel minimum of src and dst, written into dst. Used to clip an
 * image to a solid-alpha mask of the same size.
 */
void stagecraft_canvas_blit_min(SDL_Surface *src, SDL_Surface *dst, int x, int y);

/* Repeat src across dst starting at (start_x, start_y), wrapping negatives */
void stagecraft_canvas_tile(SDL_Surface *src, SDL_Surface *dst, float start_x, float start_y);

/* ============================================================================
 * Primitives
 * ============================================================================ */

/* border == 0 fills, border > 0 strokes the outline with that width */
void stagecraft_canvas_draw_polygon(SDL_Surface *surface, const Stagecraft_Vec2 *points, int count,
                                    Stagecraft_Color color, int border);

void stagecraft_canvas_draw_circle(SDL_Surface *surface, float cx, float cy, float radius,
                                   Stagecraft_Color color, int border);

void stagecraft_canvas_draw_line(SDL_Surface *surface, Stagecraft_Vec2 from, Stagecraft_Vec2 to,
                                 Stagecraft_Color color, int width);

/* ============================================================================
 * Transforms (return new surfaces, caller owns)
 * ============================================================================ */

/* Nearest-neighbour resize; sizes below 1 are clamped to 1 */
SDL_Surface *stagecraft_canvas_scale(SDL_Surface *src, int width, int height);

/*
 * Rotate counter-clockwise (as seen on screen) by degrees. The result is
 * enlarged to hold the whole rotated image; uncovered pixels are
 * transparent.
 */
SDL_Surface *stagecraft_canvas_rotate(SDL_Surface *src, float degrees);

/* ============================================================================
 * Transparency
 * ============================================================================ */

/* Make every pixel matching key's RGB fully transparent */
void stagecraft_canvas_apply_color_key(SDL_Surface *surface, Stagecraft_Color key);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_CANVAS_H */
