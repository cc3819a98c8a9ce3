/**
 * Stagecraft - Stage Configuration Loading
 *
 * Overlays [stage], [physics] and [text] tables from TOML onto a
 * Stagecraft_StageConfig. Keys that are absent leave the field untouched.
 */

#include "stagecraft/stage.h"
#include "stagecraft/color.h"
#include "stagecraft/error.h"
#include "stagecraft/log.h"

#include <SDL3/SDL.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

/* TOML parsing */
extern "C" {
#include "toml.h"
}

/* ============================================================================
 * Value Helpers
 * ============================================================================ */

static void read_string(toml_table_t *table, const char *key, char *out, size_t out_size) {
    toml_datum_t datum = toml_string_in(table, key);
    if (datum.ok) {
        strncpy(out, datum.u.s, out_size - 1);
        out[out_size - 1] = '\0';
        free(datum.u.s);
    }
}

static void read_int(toml_table_t *table, const char *key, int *out) {
    toml_datum_t datum = toml_int_in(table, key);
    if (datum.ok) *out = (int)datum.u.i;
}

/* Accepts integers too, so "gravity_y = -900" works */
static void read_float(toml_table_t *table, const char *key, float *out) {
    toml_datum_t datum = toml_double_in(table, key);
    if (datum.ok) {
        *out = (float)datum.u.d;
        return;
    }
    datum = toml_int_in(table, key);
    if (datum.ok) *out = (float)datum.u.i;
}

static void read_bool(toml_table_t *table, const char *key, bool *out) {
    toml_datum_t datum = toml_bool_in(table, key);
    if (datum.ok) *out = datum.u.b != 0;
}

static bool read_array_float(toml_array_t *array, int index, float *out) {
    toml_datum_t datum = toml_double_at(array, index);
    if (datum.ok) {
        *out = (float)datum.u.d;
        return true;
    }
    datum = toml_int_at(array, index);
    if (datum.ok) {
        *out = (float)datum.u.i;
        return true;
    }
    return false;
}

/* ============================================================================
 * Sections
 * ============================================================================ */

static bool apply_stage_table(toml_table_t *table, Stagecraft_StageConfig *config) {
    read_string(table, "title", config->title, sizeof(config->title));
    read_int(table, "width", &config->width);
    read_int(table, "height", &config->height);
    read_string(table, "background_image", config->background_image, sizeof(config->background_image));
    read_int(table, "fps", &config->fps);
    read_bool(table, "cap_frame_rate", &config->cap_frame_rate);
    read_bool(table, "headless", &config->headless);
    read_bool(table, "show_mouse_coordinates", &config->show_mouse_coordinates);

    toml_datum_t background = toml_string_in(table, "background");
    if (background.ok) {
        bool parsed = stagecraft_color_parse(background.u.s, &config->background);
        if (!parsed) {
            stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: unknown background color '%s'",
                                      background.u.s);
        }
        free(background.u.s);
        if (!parsed) return false;
    }

    if (config->width <= 0 || config->height <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: invalid stage size %dx%d",
                                  config->width, config->height);
        return false;
    }
    if (config->fps <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: fps must be positive (got %d)", config->fps);
        return false;
    }
    return true;
}

static bool apply_physics_table(toml_table_t *table, Stagecraft_StageConfig *config) {
    read_int(table, "substeps", &config->substeps);
    read_float(table, "sleep_time_threshold", &config->sleep_time_threshold);

    toml_array_t *gravity = toml_array_in(table, "gravity");
    if (gravity) {
        if (toml_array_nelem(gravity) != 2 ||
            !read_array_float(gravity, 0, &config->gravity_x) ||
            !read_array_float(gravity, 1, &config->gravity_y)) {
            stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: gravity must be [x, y]");
            return false;
        }
    }

    if (config->substeps <= 0) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: substeps must be positive (got %d)",
                                  config->substeps);
        return false;
    }
    return true;
}

static void apply_text_table(toml_table_t *table, Stagecraft_StageConfig *config) {
    read_string(table, "font", config->font_path, sizeof(config->font_path));
    read_int(table, "size", &config->font_size);
}

static bool apply_root(toml_table_t *root, Stagecraft_StageConfig *config) {
    toml_table_t *stage = toml_table_in(root, "stage");
    if (stage && !apply_stage_table(stage, config)) return false;

    toml_table_t *physics = toml_table_in(root, "physics");
    if (physics && !apply_physics_table(physics, config)) return false;

    toml_table_t *text = toml_table_in(root, "text");
    if (text) apply_text_table(text, config);

    return true;
}

/* ============================================================================
 * Public API
 * ============================================================================ */

bool stagecraft_stage_config_load_toml(const char *path, Stagecraft_StageConfig *config) {
    if (!path || !config) return false;

    FILE *fp = fopen(path, "r");
    if (!fp) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: failed to open %s", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: failed to parse %s: %s", path, errbuf);
        return false;
    }

    bool ok = apply_root(root, config);
    toml_free(root);

    if (ok) {
        stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Loaded config %s", path);
    }
    return ok;
}

bool stagecraft_stage_config_parse_toml(const char *text, Stagecraft_StageConfig *config) {
    if (!text || !config) return false;

    /* toml_parse needs mutable string */
    char *copy = strdup(text);
    if (!copy) {
        stagecraft_set_error("config: out of memory");
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse(copy, errbuf, sizeof(errbuf));
    free(copy);

    if (!root) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "config: parse error: %s", errbuf);
        return false;
    }

    bool ok = apply_root(root, config);
    toml_free(root);
    return ok;
}
