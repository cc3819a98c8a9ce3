/*
 * Stagecraft colors
 * 8-bit RGBA colors with a small table of named colors.
 */

#ifndef STAGECRAFT_COLOR_H
#define STAGECRAFT_COLOR_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Color {
    uint8_t r, g, b, a;
} Stagecraft_Color;

#define STAGECRAFT_RGBA(r, g, b, a) Stagecraft_Color{(uint8_t)(r), (uint8_t)(g), (uint8_t)(b), (uint8_t)(a)}
#define STAGECRAFT_RGB(r, g, b) STAGECRAFT_RGBA(r, g, b, 255)

#define STAGECRAFT_COLOR_TRANSPARENT STAGECRAFT_RGBA(0, 0, 0, 0)
#define STAGECRAFT_COLOR_BLACK       STAGECRAFT_RGB(0, 0, 0)
#define STAGECRAFT_COLOR_WHITE       STAGECRAFT_RGB(255, 255, 255)
#define STAGECRAFT_COLOR_RED         STAGECRAFT_RGB(255, 0, 0)
#define STAGECRAFT_COLOR_GREEN       STAGECRAFT_RGB(0, 255, 0)
#define STAGECRAFT_COLOR_PURPLE      STAGECRAFT_RGB(160, 32, 240)
#define STAGECRAFT_COLOR_MAGENTA     STAGECRAFT_RGB(255, 0, 255)

/**
 * Look up a color by name ("red", "purple", ...) or hex ("#rrggbb",
 * "#rrggbbaa"). Names are case-insensitive.
 *
 * @return false (with error) when the name is unknown
 */
bool stagecraft_color_parse(const char *name, Stagecraft_Color *out);

/**
 * Random opaque color, or random alpha too when requested.
 */
Stagecraft_Color stagecraft_color_random(bool random_alpha);

bool stagecraft_color_equal(Stagecraft_Color a, Stagecraft_Color b);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_COLOR_H */
