/*
 * Stagecraft Costume Implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/costume.h"
#include "stagecraft/assets.h"
#include "stagecraft/canvas.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"

#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>

#define INITIAL_FRAME_CAPACITY 4

struct Stagecraft_Costume {
    char name[STAGECRAFT_COSTUME_NAME_MAX];
    Stagecraft_CostumeConfig config;

    SDL_Surface **images;         /* Originals, transparency applied */
    SDL_Surface **scaled_images;  /* Derived from images at config scale */
    int image_count;
    int image_capacity;

    Stagecraft_Animation animation;
};

/* ============================================================================
 * Internal Helpers
 * ============================================================================ */

static SDL_Surface *make_scaled(const Stagecraft_Costume *costume, SDL_Surface *image) {
    float sx = costume->config.scale_x;
    float sy = costume->config.scale_y;
    if (sx == 1.0f && sy == 1.0f) {
        return stagecraft_canvas_copy(image);
    }
    return stagecraft_canvas_scale(image, (int)((float)image->w * sx), (int)((float)image->h * sy));
}

/* Images are RGBA32 copies, so loaded alpha is kept; only the color key rewrites it */
static void apply_transparency(const Stagecraft_Costume *costume, SDL_Surface *image) {
    if (costume->config.has_transparent_color) {
        stagecraft_canvas_apply_color_key(image, costume->config.transparent_color);
    }
}

static bool reserve_frames(Stagecraft_Costume *costume, int needed) {
    if (needed <= costume->image_capacity) return true;

    int capacity = costume->image_capacity > 0 ? costume->image_capacity * 2 : INITIAL_FRAME_CAPACITY;
    while (capacity < needed) capacity *= 2;

    SDL_Surface **images = STAGECRAFT_REALLOC(costume->images, SDL_Surface *, capacity);
    if (!images) {
        stagecraft_set_error("Costume: Failed to grow frame list");
        return false;
    }
    costume->images = images;

    SDL_Surface **scaled = STAGECRAFT_REALLOC(costume->scaled_images, SDL_Surface *, capacity);
    if (!scaled) {
        stagecraft_set_error("Costume: Failed to grow frame list");
        return false;
    }
    costume->scaled_images = scaled;
    costume->image_capacity = capacity;
    return true;
}

/* Takes ownership of image */
static bool append_frame(Stagecraft_Costume *costume, SDL_Surface *image) {
    if (!reserve_frames(costume, costume->image_count + 1)) {
        SDL_DestroySurface(image);
        return false;
    }

    apply_transparency(costume, image);

    SDL_Surface *scaled = make_scaled(costume, image);
    if (!scaled) {
        SDL_DestroySurface(image);
        return false;
    }

    costume->images[costume->image_count] = image;
    costume->scaled_images[costume->image_count] = scaled;
    costume->image_count++;
    return true;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Stagecraft_Costume *stagecraft_costume_create(const char *name, const Stagecraft_CostumeConfig *config) {
    Stagecraft_Costume *costume = STAGECRAFT_ALLOC(Stagecraft_Costume);
    if (!costume) {
        stagecraft_set_error("Costume: Failed to allocate costume");
        return NULL;
    }

    if (name) {
        strncpy(costume->name, name, sizeof(costume->name) - 1);
    }

    Stagecraft_CostumeConfig defaults = STAGECRAFT_COSTUME_DEFAULT;
    costume->config = config ? *config : defaults;

    Stagecraft_Animation animation = STAGECRAFT_ANIMATION_DEFAULT;
    costume->animation = animation;

    return costume;
}

void stagecraft_costume_destroy(Stagecraft_Costume *costume) {
    if (!costume) return;

    for (int i = 0; i < costume->image_count; i++) {
        SDL_DestroySurface(costume->images[i]);
        SDL_DestroySurface(costume->scaled_images[i]);
    }
    free(costume->images);
    free(costume->scaled_images);
    free(costume);
}

/* ============================================================================
 * Frames
 * ============================================================================ */

bool stagecraft_costume_add_images(Stagecraft_Costume *costume, Stagecraft_Assets *assets,
                                   const char *const *paths, int count) {
    if (!costume || !assets || (!paths && count > 0)) return false;

    for (int i = 0; i < count; i++) {
        SDL_Surface *cached = stagecraft_assets_get_image(assets, paths[i]);
        if (!cached) {
            return false;
        }

        /* Cached images are shared; never mutate them */
        SDL_Surface *image = stagecraft_canvas_copy(cached);
        if (!image || !append_frame(costume, image)) {
            return false;
        }
    }

    stagecraft_log_debug(STAGECRAFT_LOG_ASSETS, "Costume '%s' now has %d frame(s)",
                         costume->name, costume->image_count);
    return true;
}

bool stagecraft_costume_add_surface(Stagecraft_Costume *costume, SDL_Surface *surface) {
    if (!costume || !surface) return false;

    SDL_Surface *image = stagecraft_canvas_copy(surface);
    if (!image) return false;
    return append_frame(costume, image);
}

bool stagecraft_costume_set_scale(Stagecraft_Costume *costume, float scale_x, float scale_y) {
    if (!costume) return false;

    costume->config.scale_x = scale_x;
    costume->config.scale_y = scale_y;

    /* Always from the originals so repeated calls never compound */
    for (int i = 0; i < costume->image_count; i++) {
        SDL_Surface *scaled = make_scaled(costume, costume->images[i]);
        if (!scaled) return false;
        SDL_DestroySurface(costume->scaled_images[i]);
        costume->scaled_images[i] = scaled;
    }
    return true;
}

void stagecraft_costume_get_scale(const Stagecraft_Costume *costume, float *scale_x, float *scale_y) {
    if (scale_x) *scale_x = costume ? costume->config.scale_x : 1.0f;
    if (scale_y) *scale_y = costume ? costume->config.scale_y : 1.0f;
}

SDL_Surface *stagecraft_costume_get_image(const Stagecraft_Costume *costume) {
    if (!costume || costume->image_count == 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_RESOURCE, "Costume '%s' has no images",
                                  costume ? costume->name : "(null)");
        return NULL;
    }

    int index = costume->animation.image_index;
    if (index < 0) index = 0;
    if (index >= costume->image_count) index = costume->image_count - 1;
    return costume->scaled_images[index];
}

SDL_Surface *stagecraft_costume_get_original(const Stagecraft_Costume *costume, int index) {
    if (!costume || index < 0 || index >= costume->image_count) return NULL;
    return costume->images[index];
}

void stagecraft_costume_update(Stagecraft_Costume *costume) {
    if (!costume) return;
    stagecraft_animation_update(&costume->animation, costume->image_count);
}

/* ============================================================================
 * Accessors
 * ============================================================================ */

int stagecraft_costume_get_image_count(const Stagecraft_Costume *costume) {
    return costume ? costume->image_count : 0;
}

const char *stagecraft_costume_get_name(const Stagecraft_Costume *costume) {
    return costume ? costume->name : NULL;
}

Stagecraft_PaintMode stagecraft_costume_get_paint_mode(const Stagecraft_Costume *costume) {
    return costume ? costume->config.paint_mode : STAGECRAFT_PAINT_CENTER;
}

void stagecraft_costume_set_paint_mode(Stagecraft_Costume *costume, Stagecraft_PaintMode mode) {
    if (!costume) return;
    costume->config.paint_mode = mode;
}

Stagecraft_Animation *stagecraft_costume_get_animation(Stagecraft_Costume *costume) {
    return costume ? &costume->animation : NULL;
}
