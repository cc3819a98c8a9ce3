/*
 * Stagecraft Render Pipeline Implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/render.h"
#include "stagecraft/camera.h"
#include "stagecraft/canvas.h"
#include "stagecraft/costume.h"
#include "stagecraft/error.h"

#include <SDL3/SDL.h>
#include <math.h>
#include <string.h>

/* Outline plus the synthetic centroid and heading points */
#define MAX_PROJECTED_POINTS (STAGECRAFT_SHAPE_MAX_VERTICES + 2)

static const Stagecraft_Color MASK_SOLID = {255, 255, 255, 255};

/* ============================================================================
 * Projection
 * ============================================================================ */

bool stagecraft_render_project(const Stagecraft_RenderInput *input, int canvas_height,
                               Stagecraft_RenderProjection *out) {
    if (!input || !input->geometry || !out) return false;
    memset(out, 0, sizeof(*out));

    Stagecraft_ShapeOutline outline;
    if (!stagecraft_shape_outline(input->geometry, &outline)) {
        return false;
    }
    if (outline.count > STAGECRAFT_SHAPE_MAX_VERTICES) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_UNSUPPORTED_SHAPE, "Render: outline too large");
        return false;
    }

    Stagecraft_Vec2 points[MAX_PROJECTED_POINTS];
    int n = outline.count;
    memcpy(points, outline.points, sizeof(Stagecraft_Vec2) * (size_t)n);
    points[n] = stagecraft_vec2(0.0f, 0.0f);
    points[n + 1] = stagecraft_vec2(1.0f, 0.0f);
    int total = n + 2;

    for (int i = 0; i < total; i++) {
        if (input->angle != 0.0f) {
            points[i] = stagecraft_vec2_rotate(points[i], input->angle);
        }
        points[i] = stagecraft_vec2_add(points[i], input->position);
    }

    float radius = outline.radius;
    if (input->camera) {
        stagecraft_camera_apply(input->camera, points, total, points);
        radius *= stagecraft_camera_get_scale(input->camera);
    }

    /* Canvas rows grow downward */
    for (int i = 0; i < total; i++) {
        points[i].y = (float)canvas_height - points[i].y;
    }

    out->count = n;
    memcpy(out->points, points, sizeof(Stagecraft_Vec2) * (size_t)n);
    out->centroid = points[n];
    out->heading = stagecraft_vec2_sub(points[n + 1], points[n]);
    out->is_circle = outline.is_circle;
    out->radius = radius;
    stagecraft_shape_points_bounds(out->points, n, &out->min_x, &out->min_y, &out->max_x, &out->max_y);
    return true;
}

/* ============================================================================
 * Drawing
 * ============================================================================ */

static void draw_silhouette(SDL_Surface *target, const Stagecraft_RenderProjection *proj,
                            const Stagecraft_Vec2 *local, Stagecraft_Vec2 origin,
                            Stagecraft_Color color, int border) {
    if (proj->is_circle) {
        float cx = (proj->min_x + proj->max_x) / 2.0f - origin.x;
        float cy = (proj->min_y + proj->max_y) / 2.0f - origin.y;
        stagecraft_canvas_draw_circle(target, cx, cy, proj->radius, color, border);
    } else {
        stagecraft_canvas_draw_polygon(target, local, proj->count, color, border);
    }
}

/* Scale, tile, rotate and place the costume frame, then clip it to the mask */
static bool composite_costume(SDL_Surface *scratch, const Stagecraft_RenderInput *input,
                              const Stagecraft_RenderProjection *proj,
                              const Stagecraft_Vec2 *local, Stagecraft_Vec2 origin) {
    SDL_Surface *mask = stagecraft_canvas_create(scratch->w, scratch->h);
    if (!mask) return false;
    draw_silhouette(mask, proj, local, origin, MASK_SOLID, input->border);

    SDL_Surface *frame = stagecraft_costume_get_image(input->costume);
    if (!frame) {
        SDL_DestroySurface(mask);
        return false;
    }

    /* Every transform below yields a new surface owned here */
    SDL_Surface *image = NULL;
    float zoom = input->camera ? stagecraft_camera_get_scale(input->camera) : 1.0f;
    if (zoom != 1.0f) {
        image = stagecraft_canvas_scale(frame, (int)((float)frame->w * zoom), (int)((float)frame->h * zoom));
    } else {
        image = stagecraft_canvas_copy(frame);
    }
    if (!image) {
        SDL_DestroySurface(mask);
        return false;
    }

    if (stagecraft_costume_get_paint_mode(input->costume) == STAGECRAFT_PAINT_TILE) {
        SDL_Surface *tiled = stagecraft_canvas_create(scratch->w, scratch->h);
        if (!tiled) {
            SDL_DestroySurface(image);
            SDL_DestroySurface(mask);
            return false;
        }
        stagecraft_canvas_tile(image, tiled, 0.0f, 0.0f);
        SDL_DestroySurface(image);
        image = tiled;
    }

    float theta = input->angle + (input->camera ? stagecraft_camera_get_theta(input->camera) : 0.0f);
    if (theta != 0.0f) {
        SDL_Surface *rotated = stagecraft_canvas_rotate(image, STAGECRAFT_RAD_TO_DEG(theta));
        SDL_DestroySurface(image);
        if (!rotated) {
            SDL_DestroySurface(mask);
            return false;
        }
        image = rotated;
    }

    /* Image center sits on the shape centroid */
    int x = (int)lroundf(proj->centroid.x - (float)image->w / 2.0f - origin.x);
    int y = (int)lroundf(proj->centroid.y - (float)image->h / 2.0f - origin.y);
    bool ok = stagecraft_canvas_blit(image, scratch, x, y);
    SDL_DestroySurface(image);

    if (ok) {
        stagecraft_canvas_blit_min(mask, scratch, 0, 0);
    }
    SDL_DestroySurface(mask);
    return ok;
}

static void draw_debug(SDL_Surface *scratch, const Stagecraft_RenderInput *input,
                       const Stagecraft_RenderProjection *proj, Stagecraft_Vec2 origin) {
    const Stagecraft_DrawOptions *opts = input->draw_options;
    float zoom = input->camera ? stagecraft_camera_get_scale(input->camera) : 1.0f;
    Stagecraft_Vec2 start = stagecraft_vec2_sub(proj->centroid, origin);

    if (opts->angle_line_width > 0) {
        float width = proj->max_x - proj->min_x;
        float height = proj->max_y - proj->min_y;
        float length = proj->is_circle ? proj->radius : fmaxf(fmaxf(width, height), 2.0f) / 2.0f;
        Stagecraft_Vec2 end = stagecraft_vec2_add(start, stagecraft_vec2_scale(proj->heading, length));
        int line_width = (int)lroundf((float)opts->angle_line_width * zoom);
        stagecraft_canvas_draw_line(scratch, start, end, opts->angle_line_color, line_width);
    }

    if (opts->center_radius > 0.0f) {
        stagecraft_canvas_draw_circle(scratch, start.x, start.y, opts->center_radius * zoom,
                                      opts->center_color, 0);
    }
}

bool stagecraft_render_shape(SDL_Surface *canvas, const Stagecraft_RenderInput *input) {
    if (!canvas || !input) return false;

    Stagecraft_RenderProjection proj;
    if (!stagecraft_render_project(input, canvas->h, &proj)) {
        return false;
    }

    /* Scratch surface covers the bounds, anchored on whole pixels */
    Stagecraft_Vec2 origin = stagecraft_vec2(floorf(proj.min_x), floorf(proj.min_y));
    int width = (int)ceilf(proj.max_x - origin.x);
    int height = (int)ceilf(proj.max_y - origin.y);

    SDL_Surface *scratch = stagecraft_canvas_create(width, height);
    if (!scratch) return false;

    Stagecraft_Vec2 local[STAGECRAFT_SHAPE_MAX_VERTICES];
    for (int i = 0; i < proj.count; i++) {
        local[i] = stagecraft_vec2_sub(proj.points[i], origin);
    }

    draw_silhouette(scratch, &proj, local, origin, input->color, input->border);

    bool ok = true;
    if (input->costume) {
        ok = composite_costume(scratch, input, &proj, local, origin);
    }

    if (ok && input->draw_options) {
        draw_debug(scratch, input, &proj, origin);
    }

    if (ok && input->text_count > 0) {
        ok = stagecraft_text_draw_overlays(scratch, input->assets, input->texts, input->text_count,
                                           stagecraft_vec2(0.0f, 0.0f), input->default_font_path);
    }

    if (ok) {
        ok = stagecraft_canvas_blit(scratch, canvas, (int)origin.x, (int)origin.y);
    }

    SDL_DestroySurface(scratch);
    return ok;
}
