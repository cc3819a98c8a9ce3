#ifndef STAGECRAFT_ERROR_H
#define STAGECRAFT_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

/**
 * Stagecraft Error Handling
 *
 * Thread-local error storage with printf-style formatting and an error kind.
 * Fallible functions return NULL or false and leave a message here.
 *
 * Usage:
 *   Stagecraft_Actor *a = stagecraft_stage_create_rect(stage, 10, 10, &opts);
 *   if (!a) {
 *       if (stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_CONFIG) { ... }
 *       SDL_Log("Error: %s", stagecraft_get_last_error());
 *   }
 */

/**
 * Error categories
 */
typedef enum {
    STAGECRAFT_ERROR_NONE = 0,
    STAGECRAFT_ERROR_GENERIC,            /**< Unclassified failure */
    STAGECRAFT_ERROR_CONFIG,             /**< Contradictory or invalid arguments */
    STAGECRAFT_ERROR_UNSUPPORTED_SHAPE,  /**< Shape kind outside circle/polygon/segment */
    STAGECRAFT_ERROR_RESOURCE,           /**< Image or font could not be loaded */
    STAGECRAFT_ERROR_BACKEND             /**< SDL or physics backend refused an operation */
} Stagecraft_ErrorKind;

/**
 * Set an error message with printf-style formatting.
 * The kind is set to STAGECRAFT_ERROR_GENERIC.
 *
 * @param fmt Format string (printf-style)
 * @param ... Format arguments
 */
void stagecraft_set_error(const char *fmt, ...);

/**
 * Set an error message with va_list arguments.
 *
 * @param fmt Format string (printf-style)
 * @param args va_list of format arguments
 */
void stagecraft_set_error_v(const char *fmt, va_list args);

/**
 * Set an error kind together with its message.
 *
 * @param kind Error category
 * @param fmt Format string (printf-style)
 * @param ... Format arguments
 */
void stagecraft_set_error_kind(Stagecraft_ErrorKind kind, const char *fmt, ...);

/**
 * Get the last error message.
 * Returns an empty string if no error has been set.
 *
 * @return Pointer to the error message (thread-local, do not free)
 */
const char *stagecraft_get_last_error(void);

/**
 * Get the kind of the last error, STAGECRAFT_ERROR_NONE if none is set.
 */
Stagecraft_ErrorKind stagecraft_get_last_error_kind(void);

/**
 * Clear the last error message and kind.
 */
void stagecraft_clear_error(void);

/**
 * Check if an error is currently set.
 */
bool stagecraft_has_error(void);

/**
 * Set error from SDL_GetError() with kind STAGECRAFT_ERROR_BACKEND.
 *
 * @param prefix Optional prefix to prepend (can be NULL)
 */
void stagecraft_set_error_from_sdl(const char *prefix);

/**
 * Log the last error through the log system and clear it.
 */
void stagecraft_log_and_clear_error(void);

/**
 * Human-readable name of an error kind.
 */
const char *stagecraft_error_kind_name(Stagecraft_ErrorKind kind);

#endif /* STAGECRAFT_ERROR_H */
