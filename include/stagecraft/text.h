/*
 * Stagecraft Text
 *
 * TrueType fonts rasterized with stb_truetype straight into RGBA32
 * surfaces, plus named text overlays drawn on top of actors or the stage.
 */

#ifndef STAGECRAFT_TEXT_H
#define STAGECRAFT_TEXT_H

#include "stagecraft/vec2.h"
#include "stagecraft/color.h"
#include <stdbool.h>

typedef struct SDL_Surface SDL_Surface;

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Font Stagecraft_Font;
typedef struct Stagecraft_Assets Stagecraft_Assets;

#define STAGECRAFT_TEXT_DEFAULT_SIZE 20

/* ============================================================================
 * Fonts
 * ============================================================================ */

/**
 * Load a TTF/TTC file at a pixel height.
 * Fails with STAGECRAFT_ERROR_RESOURCE when the file cannot be read or parsed.
 */
Stagecraft_Font *stagecraft_font_load(const char *path, float size);
Stagecraft_Font *stagecraft_font_load_memory(const void *data, int data_size, float size);
void stagecraft_font_destroy(Stagecraft_Font *font);

float stagecraft_font_get_size(const Stagecraft_Font *font);
float stagecraft_font_get_line_height(const Stagecraft_Font *font);
float stagecraft_font_get_ascent(const Stagecraft_Font *font);

/* Advance width of a UTF-8 string in pixels */
float stagecraft_text_measure(const Stagecraft_Font *font, const char *text);

/**
 * Render a single line of UTF-8 text into a new surface.
 *
 * @param background Optional fill behind the glyphs; NULL leaves it transparent
 * @return Caller-owned surface at least 1x1, or NULL on failure
 */
SDL_Surface *stagecraft_text_render(const Stagecraft_Font *font, const char *text,
                                    Stagecraft_Color color, const Stagecraft_Color *background);

/* ============================================================================
 * Overlays
 * ============================================================================ */

/* Strings are heap copies owned by the overlay (or the list holding it) */
typedef struct Stagecraft_TextOverlay {
    char *name;                  /**< Key; defaults to the text itself */
    char *text;
    Stagecraft_Vec2 pos;         /**< Top-left, relative to the target surface */
    char *font_path;             /**< Empty selects the default font */
    int size;
    Stagecraft_Color color;
    Stagecraft_Color background;
    bool has_background;
    bool font_warned;            /**< Missing-font warning already logged */
} Stagecraft_TextOverlay;

/**
 * Fill an overlay, copying every string. A NULL or empty name keys it by
 * its text. Release with stagecraft_text_overlay_free unless it is handed
 * to stagecraft_text_list_put.
 *
 * @return false if a copy could not be allocated; the overlay is left empty
 */
bool stagecraft_text_overlay_init(Stagecraft_TextOverlay *overlay, const char *text,
                                  Stagecraft_Vec2 pos, const char *font_path, int size,
                                  Stagecraft_Color color, const Stagecraft_Color *background,
                                  const char *name);

/* Free the overlay's strings. Safe on a zeroed or freed overlay. */
void stagecraft_text_overlay_free(Stagecraft_TextOverlay *overlay);

/* Name-keyed overlay collection, in insertion order */
typedef struct Stagecraft_TextOverlayList {
    Stagecraft_TextOverlay *items;
    int count;
    int capacity;
} Stagecraft_TextOverlayList;

/**
 * Insert an overlay, replacing (and freeing) any overlay with the same
 * name. A replaced overlay that already warned about a missing font stays
 * quiet. The list takes ownership of the overlay's strings, also on failure.
 *
 * @return Pointer into the list, valid until the list next changes
 */
Stagecraft_TextOverlay *stagecraft_text_list_put(Stagecraft_TextOverlayList *list,
                                                 const Stagecraft_TextOverlay *overlay);

/* Remove by name; missing names are ignored. Returns true if removed. */
bool stagecraft_text_list_remove(Stagecraft_TextOverlayList *list, const char *name);

Stagecraft_TextOverlay *stagecraft_text_list_find(Stagecraft_TextOverlayList *list, const char *name);
void stagecraft_text_list_free(Stagecraft_TextOverlayList *list);

/**
 * Draw overlays onto a surface at pos + offset, resolving fonts through
 * the asset cache. Overlays with no font path and no default font are
 * skipped; each logs one warning for its lifetime.
 *
 * @return false with STAGECRAFT_ERROR_RESOURCE when a font fails to load
 */
bool stagecraft_text_draw_overlays(SDL_Surface *surface, Stagecraft_Assets *assets,
                                   Stagecraft_TextOverlay *overlays, int count,
                                   Stagecraft_Vec2 offset, const char *default_font_path);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_TEXT_H */
