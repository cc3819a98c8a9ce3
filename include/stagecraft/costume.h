/*
 * Stagecraft Costume
 *
 * A named, scalable, animatable image set. Each costume keeps its original
 * images untouched and derives a scaled copy of every frame from them.
 */

#ifndef STAGECRAFT_COSTUME_H
#define STAGECRAFT_COSTUME_H

#include "stagecraft/color.h"
#include "stagecraft/animation.h"
#include <stdbool.h>

typedef struct SDL_Surface SDL_Surface;

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Assets Stagecraft_Assets;
typedef struct Stagecraft_Costume Stagecraft_Costume;

#define STAGECRAFT_COSTUME_NAME_MAX 64

/* How the frame fills the shape */
typedef enum Stagecraft_PaintMode {
    STAGECRAFT_PAINT_CENTER = 1,  /**< One copy centered on the shape */
    STAGECRAFT_PAINT_TILE = 2     /**< Repeated across the shape bounds */
} Stagecraft_PaintMode;

typedef struct Stagecraft_CostumeConfig {
    float scale_x;
    float scale_y;
    bool has_transparent_color;
    Stagecraft_Color transparent_color;   /**< Color key; wins over alpha */
    bool transparency_enabled;            /**< Accepted for loaders; RGBA32 copies always keep alpha */
    Stagecraft_PaintMode paint_mode;
} Stagecraft_CostumeConfig;

#define STAGECRAFT_COSTUME_DEFAULT { \
    .scale_x = 1.0f, \
    .scale_y = 1.0f, \
    .has_transparent_color = false, \
    .transparent_color = {0, 0, 0, 0}, \
    .transparency_enabled = false, \
    .paint_mode = STAGECRAFT_PAINT_CENTER \
}

Stagecraft_Costume *stagecraft_costume_create(const char *name, const Stagecraft_CostumeConfig *config);
void stagecraft_costume_destroy(Stagecraft_Costume *costume);

/**
 * Load images through the asset cache and append them as frames.
 * Each image is copied before the transparency policy is applied.
 *
 * @return false with STAGECRAFT_ERROR_RESOURCE if any image fails to load;
 *         frames added before the failure are kept
 */
bool stagecraft_costume_add_images(Stagecraft_Costume *costume, Stagecraft_Assets *assets,
                                   const char *const *paths, int count);

/* Append a copy of an in-memory surface as a frame */
bool stagecraft_costume_add_surface(Stagecraft_Costume *costume, SDL_Surface *surface);

/**
 * Set the scale and rebuild every scaled frame from the originals.
 */
bool stagecraft_costume_set_scale(Stagecraft_Costume *costume, float scale_x, float scale_y);
void stagecraft_costume_get_scale(const Stagecraft_Costume *costume, float *scale_x, float *scale_y);

/**
 * Scaled frame at the animation index.
 *
 * @return Costume-owned surface, or NULL with STAGECRAFT_ERROR_RESOURCE
 *         when the costume has no frames
 */
SDL_Surface *stagecraft_costume_get_image(const Stagecraft_Costume *costume);

/* Unscaled frame by index, NULL when out of range */
SDL_Surface *stagecraft_costume_get_original(const Stagecraft_Costume *costume, int index);

/* Advance the embedded animation */
void stagecraft_costume_update(Stagecraft_Costume *costume);

int stagecraft_costume_get_image_count(const Stagecraft_Costume *costume);
const char *stagecraft_costume_get_name(const Stagecraft_Costume *costume);
Stagecraft_PaintMode stagecraft_costume_get_paint_mode(const Stagecraft_Costume *costume);
void stagecraft_costume_set_paint_mode(Stagecraft_Costume *costume, Stagecraft_PaintMode mode);
Stagecraft_Animation *stagecraft_costume_get_animation(Stagecraft_Costume *costume);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_COSTUME_H */
