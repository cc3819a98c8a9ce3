#include "stagecraft/color.h"
#include "stagecraft/error.h"
#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>

struct NamedColor {
    const char *name;
    Stagecraft_Color color;
};

static const NamedColor s_named_colors[] = {
    {"black",       STAGECRAFT_RGB(0, 0, 0)},
    {"white",       STAGECRAFT_RGB(255, 255, 255)},
    {"red",         STAGECRAFT_RGB(255, 0, 0)},
    {"green",       STAGECRAFT_RGB(0, 255, 0)},
    {"blue",        STAGECRAFT_RGB(0, 0, 255)},
    {"yellow",      STAGECRAFT_RGB(255, 255, 0)},
    {"cyan",        STAGECRAFT_RGB(0, 255, 255)},
    {"magenta",     STAGECRAFT_RGB(255, 0, 255)},
    {"orange",      STAGECRAFT_RGB(255, 165, 0)},
    {"purple",      STAGECRAFT_RGB(160, 32, 240)},
    {"pink",        STAGECRAFT_RGB(255, 192, 203)},
    {"brown",       STAGECRAFT_RGB(165, 42, 42)},
    {"gray",        STAGECRAFT_RGB(190, 190, 190)},
    {"grey",        STAGECRAFT_RGB(190, 190, 190)},
    {"darkgreen",   STAGECRAFT_RGB(0, 100, 0)},
    {"darkblue",    STAGECRAFT_RGB(0, 0, 139)},
    {"lightblue",   STAGECRAFT_RGB(173, 216, 230)},
    {"skyblue",     STAGECRAFT_RGB(135, 206, 235)},
    {"transparent", STAGECRAFT_RGBA(0, 0, 0, 0)},
};

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool parse_hex(const char *hex, Stagecraft_Color *out) {
    size_t len = strlen(hex);
    if (len != 6 && len != 8) return false;

    uint8_t channels[4] = {0, 0, 0, 255};
    for (size_t i = 0; i < len; i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        channels[i / 2] = (uint8_t)(hi * 16 + lo);
    }
    *out = STAGECRAFT_RGBA(channels[0], channels[1], channels[2], channels[3]);
    return true;
}

bool stagecraft_color_parse(const char *name, Stagecraft_Color *out) {
    if (!name || !out) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Color name is NULL");
        return false;
    }

    if (name[0] == '#') {
        if (parse_hex(name + 1, out)) return true;
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Invalid hex color '%s'", name);
        return false;
    }

    for (size_t i = 0; i < SDL_arraysize(s_named_colors); i++) {
        if (SDL_strcasecmp(s_named_colors[i].name, name) == 0) {
            *out = s_named_colors[i].color;
            return true;
        }
    }

    stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Unknown color '%s'", name);
    return false;
}

Stagecraft_Color stagecraft_color_random(bool random_alpha) {
    return STAGECRAFT_RGBA(SDL_rand(256), SDL_rand(256), SDL_rand(256),
                           random_alpha ? SDL_rand(256) : 255);
}

bool stagecraft_color_equal(Stagecraft_Color a, Stagecraft_Color b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}
