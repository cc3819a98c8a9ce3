/*
 * Stagecraft Text Implementation
 *
 * Glyphs are rasterized per call with stb_truetype and composited into an
 * RGBA32 surface; there is no atlas since overlays are small and few.
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/text.h"
#include "stagecraft/assets.h"
#include "stagecraft/canvas.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"

#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

struct Stagecraft_Font {
    stbtt_fontinfo info;
    unsigned char *data;     /* Owned TTF bytes; stbtt keeps pointers into it */
    float size;
    float scale;
    float ascent;
    float descent;
    float line_height;
};

/* ============================================================================
 * UTF-8
 * ============================================================================ */

/* Decode one codepoint and advance *text. Malformed bytes become U+FFFD. */
static int next_codepoint(const char **text) {
    const unsigned char *s = (const unsigned char *)*text;
    int cp;
    int extra;

    if (s[0] < 0x80) {
        cp = s[0];
        extra = 0;
    } else if ((s[0] & 0xE0) == 0xC0) {
        cp = s[0] & 0x1F;
        extra = 1;
    } else if ((s[0] & 0xF0) == 0xE0) {
        cp = s[0] & 0x0F;
        extra = 2;
    } else if ((s[0] & 0xF8) == 0xF0) {
        cp = s[0] & 0x07;
        extra = 3;
    } else {
        *text += 1;
        return 0xFFFD;
    }

    for (int i = 1; i <= extra; i++) {
        if ((s[i] & 0xC0) != 0x80) {
            *text += i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (s[i] & 0x3F);
    }

    *text += extra + 1;
    return cp;
}

/* ============================================================================
 * Fonts
 * ============================================================================ */

Stagecraft_Font *stagecraft_font_load_memory(const void *data, int data_size, float size) {
    if (!data || data_size <= 0 || size <= 0.0f) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: Invalid font data");
        return NULL;
    }

    Stagecraft_Font *font = STAGECRAFT_ALLOC(Stagecraft_Font);
    if (!font) {
        stagecraft_set_error("Text: Failed to allocate font");
        return NULL;
    }

    const unsigned char *bytes = (const unsigned char *)data;

    /* TTC collections: use the first face */
    int offset = stbtt_GetFontOffsetForIndex(bytes, 0);
    if (offset < 0 || !stbtt_InitFont(&font->info, bytes, offset)) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: Invalid font data or unsupported format");
        free(font);
        return NULL;
    }

    font->size = size;
    font->scale = stbtt_ScaleForPixelHeight(&font->info, size);

    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(&font->info, &ascent, &descent, &line_gap);
    font->ascent = (float)ascent * font->scale;
    font->descent = (float)descent * font->scale;
    font->line_height = (float)(ascent - descent + line_gap) * font->scale;

    return font;
}

Stagecraft_Font *stagecraft_font_load(const char *path, float size) {
    if (!path) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: NULL font path");
        return NULL;
    }

    SDL_IOStream *file = SDL_IOFromFile(path, "rb");
    if (!file) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: Failed to open font file '%s': %s",
                                  path, SDL_GetError());
        return NULL;
    }

    Sint64 file_size = SDL_GetIOSize(file);
    if (file_size <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: Invalid font file size for '%s'", path);
        SDL_CloseIO(file);
        return NULL;
    }

    unsigned char *data = (unsigned char *)malloc((size_t)file_size);
    if (!data) {
        stagecraft_set_error("Text: Failed to allocate font data buffer");
        SDL_CloseIO(file);
        return NULL;
    }

    size_t read = SDL_ReadIO(file, data, (size_t)file_size);
    SDL_CloseIO(file);

    if (read != (size_t)file_size) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: Failed to read font file '%s'", path);
        free(data);
        return NULL;
    }

    Stagecraft_Font *font = stagecraft_font_load_memory(data, (int)file_size, size);
    if (!font) {
        free(data);
        return NULL;
    }
    font->data = data;

    stagecraft_log_debug(STAGECRAFT_LOG_ASSETS, "Loaded font '%s' at size %.1f", path, (double)size);
    return font;
}

void stagecraft_font_destroy(Stagecraft_Font *font) {
    if (!font) return;
    free(font->data);
    free(font);
}

float stagecraft_font_get_size(const Stagecraft_Font *font) {
    return font ? font->size : 0.0f;
}

float stagecraft_font_get_line_height(const Stagecraft_Font *font) {
    return font ? font->line_height : 0.0f;
}

float stagecraft_font_get_ascent(const Stagecraft_Font *font) {
    return font ? font->ascent : 0.0f;
}

/* ============================================================================
 * Rendering
 * ============================================================================ */

float stagecraft_text_measure(const Stagecraft_Font *font, const char *text) {
    if (!font || !text) return 0.0f;

    float width = 0.0f;
    int prev = 0;
    const char *p = text;
    while (*p) {
        int cp = next_codepoint(&p);
        if (prev) {
            width += (float)stbtt_GetCodepointKernAdvance(&font->info, prev, cp) * font->scale;
        }
        int advance, lsb;
        stbtt_GetCodepointHMetrics(&font->info, cp, &advance, &lsb);
        width += (float)advance * font->scale;
        prev = cp;
    }
    return width;
}

/* Source-over of a coverage value in fg color onto an RGBA pixel */
static void blend_coverage(Uint8 *dst, Stagecraft_Color fg, Uint8 coverage) {
    float sa = ((float)coverage / 255.0f) * ((float)fg.a / 255.0f);
    if (sa <= 0.0f) return;

    float da = (float)dst[3] / 255.0f;
    float out_a = sa + da * (1.0f - sa);
    if (out_a <= 0.0f) return;

    const Uint8 src[3] = {fg.r, fg.g, fg.b};
    for (int ch = 0; ch < 3; ch++) {
        float c = ((float)src[ch] * sa + (float)dst[ch] * da * (1.0f - sa)) / out_a;
        dst[ch] = (Uint8)lroundf(c);
    }
    dst[3] = (Uint8)lroundf(out_a * 255.0f);
}

SDL_Surface *stagecraft_text_render(const Stagecraft_Font *font, const char *text,
                                    Stagecraft_Color color, const Stagecraft_Color *background) {
    if (!font || !text) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Text: Render needs a font and text");
        return NULL;
    }

    int width = (int)ceilf(stagecraft_text_measure(font, text));
    int height = (int)ceilf(font->ascent - font->descent);

    SDL_Surface *surface = stagecraft_canvas_create(width, height);
    if (!surface) return NULL;

    if (background) {
        stagecraft_canvas_fill(surface, *background);
    }

    int baseline = (int)lroundf(font->ascent);
    float pen_x = 0.0f;
    int prev = 0;

    SDL_LockSurface(surface);
    const char *p = text;
    while (*p) {
        int cp = next_codepoint(&p);
        if (prev) {
            pen_x += (float)stbtt_GetCodepointKernAdvance(&font->info, prev, cp) * font->scale;
        }

        int x0, y0, x1, y1;
        stbtt_GetCodepointBitmapBox(&font->info, cp, font->scale, font->scale, &x0, &y0, &x1, &y1);
        int gw = x1 - x0;
        int gh = y1 - y0;

        if (gw > 0 && gh > 0) {
            unsigned char *glyph = (unsigned char *)calloc((size_t)gw * (size_t)gh, 1);
            if (glyph) {
                stbtt_MakeCodepointBitmap(&font->info, glyph, gw, gh, gw, font->scale, font->scale, cp);
                int origin_x = (int)lroundf(pen_x) + x0;
                int origin_y = baseline + y0;
                for (int gy = 0; gy < gh; gy++) {
                    int sy = origin_y + gy;
                    if (sy < 0 || sy >= surface->h) continue;
                    for (int gx = 0; gx < gw; gx++) {
                        int sx = origin_x + gx;
                        if (sx < 0 || sx >= surface->w) continue;
                        Uint8 *dst = (Uint8 *)surface->pixels + (size_t)sy * (size_t)surface->pitch + (size_t)sx * 4;
                        blend_coverage(dst, color, glyph[gy * gw + gx]);
                    }
                }
                free(glyph);
            }
        }

        int advance, lsb;
        stbtt_GetCodepointHMetrics(&font->info, cp, &advance, &lsb);
        pen_x += (float)advance * font->scale;
        prev = cp;
    }
    SDL_UnlockSurface(surface);

    return surface;
}

/* ============================================================================
 * Overlays
 * ============================================================================ */

static char *copy_string(const char *src) {
    return strdup(src ? src : "");
}

bool stagecraft_text_overlay_init(Stagecraft_TextOverlay *overlay, const char *text,
                                  Stagecraft_Vec2 pos, const char *font_path, int size,
                                  Stagecraft_Color color, const Stagecraft_Color *background,
                                  const char *name) {
    if (!overlay) return false;
    memset(overlay, 0, sizeof(*overlay));

    overlay->text = copy_string(text);
    overlay->name = copy_string((name && name[0]) ? name : text);
    overlay->font_path = copy_string(font_path);
    if (!overlay->text || !overlay->name || !overlay->font_path) {
        stagecraft_text_overlay_free(overlay);
        stagecraft_set_error("Text: Failed to copy overlay strings");
        return false;
    }

    overlay->pos = pos;
    overlay->size = size > 0 ? size : STAGECRAFT_TEXT_DEFAULT_SIZE;
    overlay->color = color;
    if (background) {
        overlay->background = *background;
        overlay->has_background = true;
    }
    return true;
}

void stagecraft_text_overlay_free(Stagecraft_TextOverlay *overlay) {
    if (!overlay) return;
    free(overlay->name);
    free(overlay->text);
    free(overlay->font_path);
    overlay->name = NULL;
    overlay->text = NULL;
    overlay->font_path = NULL;
}

Stagecraft_TextOverlay *stagecraft_text_list_find(Stagecraft_TextOverlayList *list, const char *name) {
    if (!list || !name) return NULL;
    for (int i = 0; i < list->count; i++) {
        if (list->items[i].name && strcmp(list->items[i].name, name) == 0) return &list->items[i];
    }
    return NULL;
}

Stagecraft_TextOverlay *stagecraft_text_list_put(Stagecraft_TextOverlayList *list,
                                                 const Stagecraft_TextOverlay *overlay) {
    if (!list || !overlay) return NULL;
    if (!overlay->name) {
        Stagecraft_TextOverlay dropped = *overlay;
        stagecraft_text_overlay_free(&dropped);
        stagecraft_set_error("Text: Overlay has no name");
        return NULL;
    }

    Stagecraft_TextOverlay *existing = stagecraft_text_list_find(list, overlay->name);
    if (existing) {
        bool warned = existing->font_warned;
        stagecraft_text_overlay_free(existing);
        *existing = *overlay;
        existing->font_warned = existing->font_warned || warned;
        return existing;
    }

    if (list->count >= list->capacity) {
        int capacity = list->capacity > 0 ? list->capacity * 2 : 4;
        Stagecraft_TextOverlay *items = STAGECRAFT_REALLOC(list->items, Stagecraft_TextOverlay, capacity);
        if (!items) {
            Stagecraft_TextOverlay dropped = *overlay;
            stagecraft_text_overlay_free(&dropped);
            stagecraft_set_error("Text: Failed to grow overlay list");
            return NULL;
        }
        list->items = items;
        list->capacity = capacity;
    }

    list->items[list->count] = *overlay;
    return &list->items[list->count++];
}

bool stagecraft_text_list_remove(Stagecraft_TextOverlayList *list, const char *name) {
    Stagecraft_TextOverlay *found = stagecraft_text_list_find(list, name);
    if (!found) return false;

    int index = (int)(found - list->items);
    stagecraft_text_overlay_free(found);
    memmove(&list->items[index], &list->items[index + 1],
            sizeof(Stagecraft_TextOverlay) * (size_t)(list->count - index - 1));
    list->count--;
    return true;
}

void stagecraft_text_list_free(Stagecraft_TextOverlayList *list) {
    if (!list) return;
    for (int i = 0; i < list->count; i++) {
        stagecraft_text_overlay_free(&list->items[i]);
    }
    free(list->items);
    list->items = NULL;
    list->count = 0;
    list->capacity = 0;
}

bool stagecraft_text_draw_overlays(SDL_Surface *surface, Stagecraft_Assets *assets,
                                   Stagecraft_TextOverlay *overlays, int count,
                                   Stagecraft_Vec2 offset, const char *default_font_path) {
    if (!surface || !overlays || count <= 0) return true;

    for (int i = 0; i < count; i++) {
        Stagecraft_TextOverlay *overlay = &overlays[i];
        if (!overlay->text || !overlay->text[0]) continue;

        const char *path = (overlay->font_path && overlay->font_path[0]) ? overlay->font_path : default_font_path;
        if (!path || !path[0]) {
            if (!overlay->font_warned) {
                stagecraft_log_warning(STAGECRAFT_LOG_RENDER, "No font for text '%s', skipped", overlay->name);
                overlay->font_warned = true;
            }
            continue;
        }

        Stagecraft_Font *font = stagecraft_assets_get_font(assets, path, (float)overlay->size);
        if (!font) return false;

        SDL_Surface *rendered = stagecraft_text_render(font, overlay->text, overlay->color,
                                                       overlay->has_background ? &overlay->background : NULL);
        if (!rendered) return false;

        int x = (int)lroundf(overlay->pos.x + offset.x);
        int y = (int)lroundf(overlay->pos.y + offset.y);
        bool ok = stagecraft_canvas_blit(rendered, surface, x, y);
        SDL_DestroySurface(rendered);
        if (!ok) return false;
    }
    return true;
}
