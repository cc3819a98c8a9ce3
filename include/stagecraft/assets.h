/*
 * Stagecraft Assets
 *
 * Path-keyed caches for decoded images and rasterizer fonts. The cache owns
 * everything it hands out; callers copy an image before mutating it.
 *
 * Usage:
 *   Stagecraft_Assets *assets = stagecraft_assets_create();
 *   SDL_Surface *img = stagecraft_assets_get_image(assets, "hero.png");
 *   Stagecraft_Font *font = stagecraft_assets_get_font(assets, "ui.ttf", 20);
 *   stagecraft_assets_destroy(assets);
 */

#ifndef STAGECRAFT_ASSETS_H
#define STAGECRAFT_ASSETS_H

#include <stdbool.h>

typedef struct SDL_Surface SDL_Surface;

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Assets Stagecraft_Assets;
typedef struct Stagecraft_Font Stagecraft_Font;

Stagecraft_Assets *stagecraft_assets_create(void);
void stagecraft_assets_destroy(Stagecraft_Assets *assets);

/**
 * Decode an image file (PNG, JPEG, BMP, TGA) into a new RGBA32 surface.
 * Not cached; caller owns the result.
 *
 * @return NULL with STAGECRAFT_ERROR_RESOURCE on failure
 */
SDL_Surface *stagecraft_image_load(const char *path);

/**
 * Cached image lookup. Loads on first use.
 *
 * @return Cache-owned surface, or NULL with STAGECRAFT_ERROR_RESOURCE
 */
SDL_Surface *stagecraft_assets_get_image(Stagecraft_Assets *assets, const char *path);

/**
 * Cached font lookup keyed by path and pixel size.
 */
Stagecraft_Font *stagecraft_assets_get_font(Stagecraft_Assets *assets, const char *path, float size);

bool stagecraft_assets_has_image(const Stagecraft_Assets *assets, const char *path);
int stagecraft_assets_get_image_count(const Stagecraft_Assets *assets);
int stagecraft_assets_get_font_count(const Stagecraft_Assets *assets);

/* Free every cached image and font */
void stagecraft_assets_clear(Stagecraft_Assets *assets);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_ASSETS_H */
