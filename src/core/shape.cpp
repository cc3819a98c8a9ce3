/*
 * Stagecraft shape geometry
 */

#include "stagecraft/shape.h"
#include "stagecraft/error.h"
#include <math.h>
#include <string.h>

static bool unsupported(const char *operation, Stagecraft_ShapeKind kind) {
    stagecraft_set_error_kind(STAGECRAFT_ERROR_UNSUPPORTED_SHAPE,
                              "%s: unsupported shape kind %d", operation, (int)kind);
    return false;
}

/* ============================================================================
 * Physics Shape <-> Geometry
 * ============================================================================ */

bool stagecraft_shape_read(const Stagecraft_PhysicsShape *shape, Stagecraft_ShapeGeometry *out) {
    if (!out) return false;
    memset(out, 0, sizeof(*out));
    out->kind = stagecraft_physics_shape_get_kind(shape);

    switch (out->kind) {
        case STAGECRAFT_SHAPE_CIRCLE:
            out->circle.radius = stagecraft_physics_circle_get_radius(shape);
            out->circle.offset = stagecraft_physics_circle_get_offset(shape);
            return true;

        case STAGECRAFT_SHAPE_POLYGON: {
            int count = stagecraft_physics_polygon_get_count(shape);
            if (count > STAGECRAFT_SHAPE_MAX_VERTICES) {
                stagecraft_set_error_kind(STAGECRAFT_ERROR_UNSUPPORTED_SHAPE,
                                          "Polygon has %d vertices (max %d)",
                                          count, STAGECRAFT_SHAPE_MAX_VERTICES);
                return false;
            }
            out->polygon.count = count;
            for (int i = 0; i < count; i++) {
                out->polygon.vertices[i] = stagecraft_physics_polygon_get_vertex(shape, i);
            }
            out->polygon.radius = stagecraft_physics_polygon_get_radius(shape);
            return true;
        }

        case STAGECRAFT_SHAPE_SEGMENT:
            out->segment.a = stagecraft_physics_segment_get_a(shape);
            out->segment.b = stagecraft_physics_segment_get_b(shape);
            out->segment.radius = stagecraft_physics_segment_get_radius(shape);
            return true;

        case STAGECRAFT_SHAPE_UNKNOWN:
            break;
    }
    return unsupported("read", out->kind);
}

bool stagecraft_shape_write(Stagecraft_PhysicsShape *shape, const Stagecraft_ShapeGeometry *geometry) {
    if (!shape || !geometry) return false;

    if (stagecraft_physics_shape_get_kind(shape) != geometry->kind) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_UNSUPPORTED_SHAPE,
                                  "write: geometry kind %d does not match shape kind %d",
                                  (int)geometry->kind, (int)stagecraft_physics_shape_get_kind(shape));
        return false;
    }

    switch (geometry->kind) {
        case STAGECRAFT_SHAPE_CIRCLE:
            stagecraft_physics_circle_set_radius(shape, geometry->circle.radius);
            return true;
        case STAGECRAFT_SHAPE_POLYGON:
            return stagecraft_physics_polygon_set_vertices(shape, geometry->polygon.count,
                                                           geometry->polygon.vertices);
        case STAGECRAFT_SHAPE_SEGMENT:
            stagecraft_physics_segment_set_endpoints(shape, geometry->segment.a, geometry->segment.b);
            return true;
        case STAGECRAFT_SHAPE_UNKNOWN:
            break;
    }
    return unsupported("write", geometry->kind);
}

/* ============================================================================
 * Geometry Operations
 * ============================================================================ */

void stagecraft_shape_rectangle_from_line(Stagecraft_Vec2 p1, Stagecraft_Vec2 p2, Stagecraft_Vec2 out[4]) {
    Stagecraft_Vec2 line = stagecraft_vec2_sub(p2, p1);
    Stagecraft_Vec2 perp = stagecraft_vec2_scale(stagecraft_vec2_normalize(stagecraft_vec2(-line.y, line.x)), 0.5f);

    out[0] = stagecraft_vec2_add(p1, perp);
    out[1] = stagecraft_vec2_sub(p1, perp);
    out[2] = stagecraft_vec2_sub(p2, perp);
    out[3] = stagecraft_vec2_add(p2, perp);
}

bool stagecraft_shape_outline(const Stagecraft_ShapeGeometry *geometry, Stagecraft_ShapeOutline *out) {
    if (!geometry || !out) return false;
    memset(out, 0, sizeof(*out));

    switch (geometry->kind) {
        case STAGECRAFT_SHAPE_POLYGON:
            out->count = geometry->polygon.count;
            memcpy(out->points, geometry->polygon.vertices,
                   sizeof(Stagecraft_Vec2) * (size_t)geometry->polygon.count);
            return true;

        case STAGECRAFT_SHAPE_SEGMENT:
            out->count = 4;
            stagecraft_shape_rectangle_from_line(geometry->segment.a, geometry->segment.b, out->points);
            return true;

        case STAGECRAFT_SHAPE_CIRCLE: {
            float r = geometry->circle.radius;
            out->count = 4;
            out->points[0] = stagecraft_vec2(r, r);
            out->points[1] = stagecraft_vec2(r, -r);
            out->points[2] = stagecraft_vec2(-r, -r);
            out->points[3] = stagecraft_vec2(-r, r);
            out->is_circle = true;
            out->radius = r;
            return true;
        }

        case STAGECRAFT_SHAPE_UNKNOWN:
            break;
    }
    return unsupported("outline", geometry->kind);
}

bool stagecraft_shape_size(const Stagecraft_ShapeGeometry *geometry, float *width, float *height) {
    if (!geometry) return false;

    float min_x, min_y, max_x, max_y;
    switch (geometry->kind) {
        case STAGECRAFT_SHAPE_CIRCLE:
            if (width) *width = geometry->circle.radius * 2.0f;
            if (height) *height = geometry->circle.radius * 2.0f;
            return true;

        case STAGECRAFT_SHAPE_POLYGON:
            stagecraft_shape_points_bounds(geometry->polygon.vertices, geometry->polygon.count,
                                           &min_x, &min_y, &max_x, &max_y);
            break;

        case STAGECRAFT_SHAPE_SEGMENT: {
            Stagecraft_Vec2 ends[2] = {geometry->segment.a, geometry->segment.b};
            stagecraft_shape_points_bounds(ends, 2, &min_x, &min_y, &max_x, &max_y);
            break;
        }

        case STAGECRAFT_SHAPE_UNKNOWN:
        default:
            return unsupported("size", geometry->kind);
    }

    if (width) *width = max_x - min_x;
    if (height) *height = max_y - min_y;
    return true;
}

static float axis_scale(float new_size, float old_size) {
    return old_size > 0.0f ? new_size / old_size : 1.0f;
}

bool stagecraft_shape_rescale(Stagecraft_ShapeGeometry *geometry, float new_width, float new_height) {
    if (!geometry) return false;

    float old_width = 0.0f, old_height = 0.0f;
    if (!stagecraft_shape_size(geometry, &old_width, &old_height)) {
        return false;
    }
    float sx = axis_scale(new_width, old_width);
    float sy = axis_scale(new_height, old_height);

    switch (geometry->kind) {
        case STAGECRAFT_SHAPE_CIRCLE:
            geometry->circle.radius = fmaxf(new_width, new_height) / 2.0f;
            return true;

        case STAGECRAFT_SHAPE_POLYGON:
            for (int i = 0; i < geometry->polygon.count; i++) {
                geometry->polygon.vertices[i].x *= sx;
                geometry->polygon.vertices[i].y *= sy;
            }
            return true;

        case STAGECRAFT_SHAPE_SEGMENT:
            geometry->segment.a = stagecraft_vec2(geometry->segment.a.x * sx, geometry->segment.a.y * sy);
            geometry->segment.b = stagecraft_vec2(geometry->segment.b.x * sx, geometry->segment.b.y * sy);
            return true;

        case STAGECRAFT_SHAPE_UNKNOWN:
            break;
    }
    return unsupported("rescale", geometry->kind);
}

/* ============================================================================
 * Point Set Helpers
 * ============================================================================ */

int stagecraft_shape_regular_polygon(int sides, float width, float height,
                                     Stagecraft_Vec2 *out, int max_out) {
    if (sides < 3 || !out || max_out < sides) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG,
                                  "Regular polygon needs 3..%d sides (got %d)", max_out, sides);
        return 0;
    }

    float rx = width / 2.0f;
    float ry = height / 2.0f;
    for (int i = 0; i < sides; i++) {
        float angle = STAGECRAFT_DEG_TO_RAD(360.0f / (float)sides * (float)i - 90.0f);
        out[i] = stagecraft_vec2(rx * cosf(angle), ry * sinf(angle));
    }
    return sides;
}

float stagecraft_shape_signed_area2(const Stagecraft_Vec2 *points, int count) {
    float area = 0.0f;
    for (int i = 0; i < count; i++) {
        Stagecraft_Vec2 a = points[i];
        Stagecraft_Vec2 b = points[(i + 1) % count];
        area += a.x * b.y - b.x * a.y;
    }
    return area;
}

void stagecraft_shape_points_bounds(const Stagecraft_Vec2 *points, int count,
                                    float *min_x, float *min_y, float *max_x, float *max_y) {
    float lx = 0, ly = 0, hx = 0, hy = 0;
    if (points && count > 0) {
        lx = hx = points[0].x;
        ly = hy = points[0].y;
        for (int i = 1; i < count; i++) {
            lx = fminf(lx, points[i].x);
            hx = fmaxf(hx, points[i].x);
            ly = fminf(ly, points[i].y);
            hy = fmaxf(hy, points[i].y);
        }
    }
    if (min_x) *min_x = lx;
    if (min_y) *min_y = ly;
    if (max_x) *max_x = hx;
    if (max_y) *max_y = hy;
}
