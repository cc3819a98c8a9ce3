/*
 * Stagecraft Assets Implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/assets.h"
#include "stagecraft/canvas.h"
#include "stagecraft/text.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"

#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>

/* STB image for decoding */
#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#define STBI_ONLY_TGA
#include "stb_image.h"

#define INITIAL_CAPACITY 16

/* ============================================================================
 * Internal Types
 * ============================================================================ */

typedef struct ImageEntry {
    char *path;
    uint32_t hash;
    SDL_Surface *surface;
} ImageEntry;

typedef struct FontEntry {
    char *path;
    uint32_t hash;
    float size;
    Stagecraft_Font *font;
} FontEntry;

struct Stagecraft_Assets {
    ImageEntry *images;
    int image_count;
    int image_capacity;

    FontEntry *fonts;
    int font_count;
    int font_capacity;
};

/* FNV-1a; cheap prefilter before strcmp */
static uint32_t hash_string(const char *str) {
    uint32_t hash = 2166136261u;
    while (*str) {
        hash ^= (uint8_t)*str++;
        hash *= 16777619u;
    }
    return hash;
}

static char *duplicate_string(const char *str) {
    size_t len = strlen(str);
    char *copy = (char *)malloc(len + 1);
    if (copy) memcpy(copy, str, len + 1);
    return copy;
}

static int grown_capacity(int capacity, int needed) {
    int new_capacity = capacity > 0 ? capacity * 2 : INITIAL_CAPACITY;
    while (new_capacity < needed) new_capacity *= 2;
    return new_capacity;
}

static bool reserve_images(Stagecraft_Assets *assets, int needed) {
    if (needed <= assets->image_capacity) return true;

    int capacity = grown_capacity(assets->image_capacity, needed);
    ImageEntry *grown = STAGECRAFT_REALLOC(assets->images, ImageEntry, capacity);
    if (!grown) {
        stagecraft_set_error("Assets: Failed to grow image cache");
        return false;
    }
    assets->images = grown;
    assets->image_capacity = capacity;
    return true;
}

static bool reserve_fonts(Stagecraft_Assets *assets, int needed) {
    if (needed <= assets->font_capacity) return true;

    int capacity = grown_capacity(assets->font_capacity, needed);
    FontEntry *grown = STAGECRAFT_REALLOC(assets->fonts, FontEntry, capacity);
    if (!grown) {
        stagecraft_set_error("Assets: Failed to grow font cache");
        return false;
    }
    assets->fonts = grown;
    assets->font_capacity = capacity;
    return true;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Stagecraft_Assets *stagecraft_assets_create(void) {
    Stagecraft_Assets *assets = STAGECRAFT_ALLOC(Stagecraft_Assets);
    if (!assets) {
        stagecraft_set_error("Assets: Failed to allocate cache");
        return NULL;
    }
    return assets;
}

void stagecraft_assets_clear(Stagecraft_Assets *assets) {
    if (!assets) return;

    for (int i = 0; i < assets->image_count; i++) {
        SDL_DestroySurface(assets->images[i].surface);
        free(assets->images[i].path);
    }
    assets->image_count = 0;

    for (int i = 0; i < assets->font_count; i++) {
        stagecraft_font_destroy(assets->fonts[i].font);
        free(assets->fonts[i].path);
    }
    assets->font_count = 0;
}

void stagecraft_assets_destroy(Stagecraft_Assets *assets) {
    if (!assets) return;

    stagecraft_assets_clear(assets);
    free(assets->images);
    free(assets->fonts);
    free(assets);
}

/* ============================================================================
 * Images
 * ============================================================================ */

SDL_Surface *stagecraft_image_load(const char *path) {
    if (!path || !path[0]) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Assets: Empty image path");
        return NULL;
    }

    int width, height, channels;
    unsigned char *pixels = stbi_load(path, &width, &height, &channels, 4);  /* Force RGBA */
    if (!pixels) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Assets: Failed to load image '%s': %s",
                                  path, stbi_failure_reason());
        return NULL;
    }

    SDL_Surface *surface = stagecraft_canvas_create(width, height);
    if (!surface) {
        stbi_image_free(pixels);
        return NULL;
    }

    SDL_LockSurface(surface);
    for (int y = 0; y < height; y++) {
        memcpy((Uint8 *)surface->pixels + (size_t)y * (size_t)surface->pitch,
               pixels + (size_t)y * (size_t)width * 4, (size_t)width * 4);
    }
    SDL_UnlockSurface(surface);
    stbi_image_free(pixels);

    stagecraft_log_debug(STAGECRAFT_LOG_ASSETS, "Loaded image '%s' (%dx%d, %d channels)",
                         path, width, height, channels);
    return surface;
}

static ImageEntry *find_image(const Stagecraft_Assets *assets, const char *path) {
    uint32_t hash = hash_string(path);
    for (int i = 0; i < assets->image_count; i++) {
        ImageEntry *entry = &assets->images[i];
        if (entry->hash == hash && strcmp(entry->path, path) == 0) {
            return entry;
        }
    }
    return NULL;
}

SDL_Surface *stagecraft_assets_get_image(Stagecraft_Assets *assets, const char *path) {
    if (!assets || !path) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Assets: Invalid image request");
        return NULL;
    }

    ImageEntry *cached = find_image(assets, path);
    if (cached) return cached->surface;

    if (!reserve_images(assets, assets->image_count + 1)) {
        return NULL;
    }

    SDL_Surface *surface = stagecraft_image_load(path);
    if (!surface) return NULL;

    char *key = duplicate_string(path);
    if (!key) {
        SDL_DestroySurface(surface);
        stagecraft_set_error("Assets: Failed to allocate path");
        return NULL;
    }

    ImageEntry *entry = &assets->images[assets->image_count++];
    entry->path = key;
    entry->hash = hash_string(path);
    entry->surface = surface;
    return surface;
}

bool stagecraft_assets_has_image(const Stagecraft_Assets *assets, const char *path) {
    if (!assets || !path) return false;
    return find_image(assets, path) != NULL;
}

int stagecraft_assets_get_image_count(const Stagecraft_Assets *assets) {
    return assets ? assets->image_count : 0;
}

/* ============================================================================
 * Fonts
 * ============================================================================ */

Stagecraft_Font *stagecraft_assets_get_font(Stagecraft_Assets *assets, const char *path, float size) {
    if (!assets || !path || !path[0]) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Assets: Invalid font request");
        return NULL;
    }

    uint32_t hash = hash_string(path);
    for (int i = 0; i < assets->font_count; i++) {
        FontEntry *entry = &assets->fonts[i];
        if (entry->hash == hash && entry->size == size && strcmp(entry->path, path) == 0) {
            return entry->font;
        }
    }

    if (!reserve_fonts(assets, assets->font_count + 1)) {
        return NULL;
    }

    Stagecraft_Font *font = stagecraft_font_load(path, size);
    if (!font) return NULL;

    char *key = duplicate_string(path);
    if (!key) {
        stagecraft_font_destroy(font);
        stagecraft_set_error("Assets: Failed to allocate path");
        return NULL;
    }

    FontEntry *entry = &assets->fonts[assets->font_count++];
    entry->path = key;
    entry->hash = hash;
    entry->size = size;
    entry->font = font;
    return font;
}

int stagecraft_assets_get_font_count(const Stagecraft_Assets *assets) {
    return assets ? assets->font_count : 0;
}
