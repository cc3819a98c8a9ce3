/*
 * Stagecraft Canvas Implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/canvas.h"
#include "stagecraft/error.h"
#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>

/* ============================================================================
 * Pixel Access
 * ============================================================================ */

/* RGBA32 stores bytes as R, G, B, A regardless of endianness */
static inline Uint8 *pixel_at(SDL_Surface *s, int x, int y) {
    return (Uint8 *)s->pixels + (size_t)y * (size_t)s->pitch + (size_t)x * 4;
}

static inline void write_pixel(SDL_Surface *s, int x, int y, Stagecraft_Color c) {
    if (x < 0 || y < 0 || x >= s->w || y >= s->h) return;
    Uint8 *p = pixel_at(s, x, y);
    p[0] = c.r;
    p[1] = c.g;
    p[2] = c.b;
    p[3] = c.a;
}

static void fill_span(SDL_Surface *s, int y, int x0, int x1, Stagecraft_Color c) {
    if (y < 0 || y >= s->h) return;
    if (x0 < 0) x0 = 0;
    if (x1 >= s->w) x1 = s->w - 1;
    for (int x = x0; x <= x1; x++) {
        write_pixel(s, x, y, c);
    }
}

/* ============================================================================
 * Surfaces
 * ============================================================================ */

SDL_Surface *stagecraft_canvas_create(int width, int height) {
    if (width < 1) width = 1;
    if (height < 1) height = 1;

    SDL_Surface *surface = SDL_CreateSurface(width, height, SDL_PIXELFORMAT_RGBA32);
    if (!surface) {
        stagecraft_set_error_from_sdl("Canvas: Failed to create surface");
        return NULL;
    }
    SDL_SetSurfaceBlendMode(surface, SDL_BLENDMODE_BLEND);
    SDL_FillSurfaceRect(surface, NULL, 0);
    return surface;
}

SDL_Surface *stagecraft_canvas_copy(SDL_Surface *src) {
    if (!src) return NULL;

    SDL_Surface *copy = SDL_ConvertSurface(src, SDL_PIXELFORMAT_RGBA32);
    if (!copy) {
        stagecraft_set_error_from_sdl("Canvas: Failed to copy surface");
        return NULL;
    }
    SDL_SetSurfaceBlendMode(copy, SDL_BLENDMODE_BLEND);
    return copy;
}

void stagecraft_canvas_fill(SDL_Surface *surface, Stagecraft_Color color) {
    if (!surface) return;
    SDL_FillSurfaceRect(surface, NULL, SDL_MapSurfaceRGBA(surface, color.r, color.g, color.b, color.a));
}

Stagecraft_Color stagecraft_canvas_get_pixel(SDL_Surface *surface, int x, int y) {
    if (!surface || x < 0 || y < 0 || x >= surface->w || y >= surface->h) {
        return STAGECRAFT_COLOR_TRANSPARENT;
    }
    SDL_LockSurface(surface);
    Uint8 *p = pixel_at(surface, x, y);
    Stagecraft_Color c = STAGECRAFT_RGBA(p[0], p[1], p[2], p[3]);
    SDL_UnlockSurface(surface);
    return c;
}

void stagecraft_canvas_set_pixel(SDL_Surface *surface, int x, int y, Stagecraft_Color color) {
    if (!surface) return;
    SDL_LockSurface(surface);
    write_pixel(surface, x, y, color);
    SDL_UnlockSurface(surface);
}

/* ============================================================================
 * Compositing
 * ============================================================================ */

bool stagecraft_canvas_blit(SDL_Surface *src, SDL_Surface *dst, int x, int y) {
    if (!src || !dst) return false;

    SDL_Rect dst_rect = {x, y, src->w, src->h};
    SDL_SetSurfaceBlendMode(src, SDL_BLENDMODE_BLEND);
    if (!SDL_BlitSurface(src, NULL, dst, &dst_rect)) {
        stagecraft_set_error_from_sdl("Canvas: Blit failed");
        return false;
    }
    return true;
}

void stagecraft_canvas_blit_min(SDL_Surface *src, SDL_Surface *dst, int x, int y) {
    if (!src || !dst) return;

    SDL_LockSurface(src);
    SDL_LockSurface(dst);
    for (int sy = 0; sy < src->h; sy++) {
        int dy = y + sy;
        if (dy < 0 || dy >= dst->h) continue;
        for (int sx = 0; sx < src->w; sx++) {
            int dx = x + sx;
            if (dx < 0 || dx >= dst->w) continue;
            const Uint8 *s = pixel_at(src, sx, sy);
            Uint8 *d = pixel_at(dst, dx, dy);
            for (int ch = 0; ch < 4; ch++) {
                if (s[ch] < d[ch]) d[ch] = s[ch];
            }
        }
    }
    SDL_UnlockSurface(dst);
    SDL_UnlockSurface(src);
}

void stagecraft_canvas_tile(SDL_Surface *src, SDL_Surface *dst, float start_x, float start_y) {
    if (!src || !dst || src->w <= 0 || src->h <= 0) return;

    float w = (float)src->w;
    float h = (float)src->h;

    /* Back up to the tile boundary left of and above the start */
    if (start_x < 0) start_x = w - fmodf(-start_x, w);
    if (start_y < 0) start_y = h - fmodf(-start_y, h);
    start_x = fmodf(start_x, w) - w;
    start_y = fmodf(start_y, h) - h;

    for (int x = (int)lroundf(start_x); x < dst->w; x += src->w) {
        for (int y = (int)lroundf(start_y); y < dst->h; y += src->h) {
            stagecraft_canvas_blit(src, dst, x, y);
        }
    }
}

/* ============================================================================
 * Primitives
 * ============================================================================ */

static int compare_floats(const void *a, const void *b) {
    float fa = *(const float *)a;
    float fb = *(const float *)b;
    return (fa > fb) - (fa < fb);
}

/* Even-odd scanline fill sampled at pixel centers */
static void fill_polygon_locked(SDL_Surface *s, const Stagecraft_Vec2 *pts, int count, Stagecraft_Color c) {
    if (count < 3) return;

    float min_y = pts[0].y, max_y = pts[0].y;
    for (int i = 1; i < count; i++) {
        min_y = fminf(min_y, pts[i].y);
        max_y = fmaxf(max_y, pts[i].y);
    }

    int y0 = (int)floorf(min_y);
    int y1 = (int)ceilf(max_y);
    if (y0 < 0) y0 = 0;
    if (y1 > s->h - 1) y1 = s->h - 1;

    float *xs = STAGECRAFT_ALLOC_ARRAY(float, count);
    if (!xs) return;

    for (int y = y0; y <= y1; y++) {
        float sample_y = (float)y + 0.5f;
        int n = 0;
        for (int i = 0; i < count; i++) {
            Stagecraft_Vec2 a = pts[i];
            Stagecraft_Vec2 b = pts[(i + 1) % count];
            if ((a.y <= sample_y && b.y > sample_y) || (b.y <= sample_y && a.y > sample_y)) {
                float t = (sample_y - a.y) / (b.y - a.y);
                xs[n++] = a.x + t * (b.x - a.x);
            }
        }
        qsort(xs, (size_t)n, sizeof(float), compare_floats);
        for (int i = 0; i + 1 < n; i += 2) {
            int xa = (int)ceilf(xs[i] - 0.5f);
            int xb = (int)floorf(xs[i + 1] - 0.5f);
            fill_span(s, y, xa, xb, c);
        }
    }

    free(xs);
}

static void draw_line_locked(SDL_Surface *s, Stagecraft_Vec2 from, Stagecraft_Vec2 to,
                             Stagecraft_Color c, int width) {
    float half = (width < 1 ? 1.0f : (float)width) / 2.0f;
    Stagecraft_Vec2 dir = stagecraft_vec2_sub(to, from);

    if (stagecraft_vec2_length(dir) <= 0.0f) {
        Stagecraft_Vec2 dot[4] = {
            {from.x - half, from.y - half}, {from.x + half, from.y - half},
            {from.x + half, from.y + half}, {from.x - half, from.y + half},
        };
        fill_polygon_locked(s, dot, 4, c);
        return;
    }

    Stagecraft_Vec2 n = stagecraft_vec2_scale(stagecraft_vec2_normalize(stagecraft_vec2(-dir.y, dir.x)), half);
    Stagecraft_Vec2 quad[4] = {
        stagecraft_vec2_add(from, n),
        stagecraft_vec2_add(to, n),
        stagecraft_vec2_sub(to, n),
        stagecraft_vec2_sub(from, n),
    };
    fill_polygon_locked(s, quad, 4, c);
}

void stagecraft_canvas_draw_polygon(SDL_Surface *surface, const Stagecraft_Vec2 *points, int count,
                                    Stagecraft_Color color, int border) {
    if (!surface || !points || count < 2) return;

    SDL_LockSurface(surface);
    if (border <= 0) {
        fill_polygon_locked(surface, points, count, color);
    } else {
        for (int i = 0; i < count; i++) {
            draw_line_locked(surface, points[i], points[(i + 1) % count], color, border);
        }
    }
    SDL_UnlockSurface(surface);
}

void stagecraft_canvas_draw_circle(SDL_Surface *surface, float cx, float cy, float radius,
                                   Stagecraft_Color color, int border) {
    if (!surface || radius <= 0.0f) return;

    float inner = border > 0 ? radius - (float)border : -1.0f;
    int x0 = (int)floorf(cx - radius);
    int x1 = (int)ceilf(cx + radius);
    int y0 = (int)floorf(cy - radius);
    int y1 = (int)ceilf(cy + radius);

    SDL_LockSurface(surface);
    for (int y = y0; y <= y1; y++) {
        float dy = (float)y + 0.5f - cy;
        for (int x = x0; x <= x1; x++) {
            float dx = (float)x + 0.5f - cx;
            float d = sqrtf(dx * dx + dy * dy);
            if (d <= radius && d > inner) {
                write_pixel(surface, x, y, color);
            }
        }
    }
    SDL_UnlockSurface(surface);
}

void stagecraft_canvas_draw_line(SDL_Surface *surface, Stagecraft_Vec2 from, Stagecraft_Vec2 to,
                                 Stagecraft_Color color, int width) {
    if (!surface) return;
    SDL_LockSurface(surface);
    draw_line_locked(surface, from, to, color, width);
    SDL_UnlockSurface(surface);
}

/* ============================================================================
 * Transforms
 * ============================================================================ */

SDL_Surface *stagecraft_canvas_scale(SDL_Surface *src, int width, int height) {
    if (!src) return NULL;
    if (width < 1) width = 1;
    if (height < 1) height = 1;

    SDL_Surface *scaled = SDL_ScaleSurface(src, width, height, SDL_SCALEMODE_NEAREST);
    if (!scaled) {
        stagecraft_set_error_from_sdl("Canvas: Failed to scale surface");
        return NULL;
    }
    if (scaled->format != SDL_PIXELFORMAT_RGBA32) {
        SDL_Surface *converted = stagecraft_canvas_copy(scaled);
        SDL_DestroySurface(scaled);
        return converted;
    }
    SDL_SetSurfaceBlendMode(scaled, SDL_BLENDMODE_BLEND);
    return scaled;
}

SDL_Surface *stagecraft_canvas_rotate(SDL_Surface *src, float degrees) {
    if (!src) return NULL;

    float theta = STAGECRAFT_DEG_TO_RAD(degrees);
    float c = cosf(theta);
    float s = sinf(theta);

    float sw = (float)src->w;
    float sh = (float)src->h;
    int dw = (int)ceilf(fabsf(sw * c) + fabsf(sh * s) - 1e-4f);
    int dh = (int)ceilf(fabsf(sw * s) + fabsf(sh * c) - 1e-4f);

    SDL_Surface *dst = stagecraft_canvas_create(dw, dh);
    if (!dst) return NULL;

    float scx = sw / 2.0f, scy = sh / 2.0f;
    float dcx = (float)dst->w / 2.0f, dcy = (float)dst->h / 2.0f;

    SDL_LockSurface(src);
    SDL_LockSurface(dst);
    for (int y = 0; y < dst->h; y++) {
        float ry = (float)y + 0.5f - dcy;
        for (int x = 0; x < dst->w; x++) {
            float rx = (float)x + 0.5f - dcx;
            /* Inverse of an on-screen counter-clockwise turn with y down */
            float sx = rx * c - ry * s + scx;
            float sy = rx * s + ry * c + scy;
            int ix = (int)floorf(sx);
            int iy = (int)floorf(sy);
            if (ix < 0 || iy < 0 || ix >= src->w || iy >= src->h) continue;
            memcpy(pixel_at(dst, x, y), pixel_at(src, ix, iy), 4);
        }
    }
    SDL_UnlockSurface(dst);
    SDL_UnlockSurface(src);

    return dst;
}

/* ============================================================================
 * Transparency
 * ============================================================================ */

void stagecraft_canvas_apply_color_key(SDL_Surface *surface, Stagecraft_Color key) {
    if (!surface) return;

    SDL_LockSurface(surface);
    for (int y = 0; y < surface->h; y++) {
        for (int x = 0; x < surface->w; x++) {
            Uint8 *p = pixel_at(surface, x, y);
            if (p[0] == key.r && p[1] == key.g && p[2] == key.b) {
                p[3] = 0;
            }
        }
    }
    SDL_UnlockSurface(surface);
}
