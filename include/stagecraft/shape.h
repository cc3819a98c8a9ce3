/*
 * Stagecraft shape geometry
 *
 * Tagged view of a physics shape's local geometry. Every geometry
 * operation (outline, bounds, rescale) switches on the kind; kinds outside
 * circle/polygon/segment fail with STAGECRAFT_ERROR_UNSUPPORTED_SHAPE.
 */

#ifndef STAGECRAFT_SHAPE_H
#define STAGECRAFT_SHAPE_H

#include "stagecraft/vec2.h"
#include "stagecraft/physics.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define STAGECRAFT_SHAPE_MAX_VERTICES 64

typedef struct Stagecraft_ShapeGeometry {
    Stagecraft_ShapeKind kind;
    union {
        struct {
            float radius;
            Stagecraft_Vec2 offset;
        } circle;
        struct {
            int count;
            Stagecraft_Vec2 vertices[STAGECRAFT_SHAPE_MAX_VERTICES];
            float radius;
        } polygon;
        struct {
            Stagecraft_Vec2 a;
            Stagecraft_Vec2 b;
            float radius;
        } segment;
    };
} Stagecraft_ShapeGeometry;

/* Local outline: at most the polygon vertices, or four corners */
typedef struct Stagecraft_ShapeOutline {
    int count;
    Stagecraft_Vec2 points[STAGECRAFT_SHAPE_MAX_VERTICES];
    bool is_circle;
    float radius;   /* Valid when is_circle */
} Stagecraft_ShapeOutline;

/**
 * Read the local geometry of a physics shape.
 *
 * @return false with UNSUPPORTED_SHAPE for unknown kinds or polygons
 *         with more than STAGECRAFT_SHAPE_MAX_VERTICES vertices
 */
bool stagecraft_shape_read(const Stagecraft_PhysicsShape *shape, Stagecraft_ShapeGeometry *out);

/**
 * Write geometry back onto a physics shape of the same kind.
 */
bool stagecraft_shape_write(Stagecraft_PhysicsShape *shape, const Stagecraft_ShapeGeometry *geometry);

/**
 * Local-space outline used by the renderer.
 * Polygon: its vertices. Segment: a width-1 rectangle around the line.
 * Circle: its bounding square, with the radius reported separately.
 */
bool stagecraft_shape_outline(const Stagecraft_ShapeGeometry *geometry, Stagecraft_ShapeOutline *out);

/**
 * Local-space width and height of the geometry.
 */
bool stagecraft_shape_size(const Stagecraft_ShapeGeometry *geometry, float *width, float *height);

/**
 * Resize the geometry so its local bounds become new_width x new_height.
 * Circles take radius max(w, h) / 2; polygon vertices and segment
 * endpoints scale per axis.
 */
bool stagecraft_shape_rescale(Stagecraft_ShapeGeometry *geometry, float new_width, float new_height);

/**
 * Corners of a width-1 rectangle around the segment p1-p2.
 * A zero-length segment gives four copies of p1.
 */
void stagecraft_shape_rectangle_from_line(Stagecraft_Vec2 p1, Stagecraft_Vec2 p2, Stagecraft_Vec2 out[4]);

/**
 * Vertices of a regular polygon inscribed in a width x height ellipse
 * centered on the origin, starting at the bottom and going
 * counter-clockwise (y up).
 */
int stagecraft_shape_regular_polygon(int sides, float width, float height,
                                     Stagecraft_Vec2 *out, int max_out);

/**
 * Twice the signed area of a polygon; positive for counter-clockwise.
 */
float stagecraft_shape_signed_area2(const Stagecraft_Vec2 *points, int count);

/**
 * Axis-aligned bounds of a point set.
 */
void stagecraft_shape_points_bounds(const Stagecraft_Vec2 *points, int count,
                                    float *min_x, float *min_y, float *max_x, float *max_y);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_SHAPE_H */
