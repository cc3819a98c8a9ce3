#include "stagecraft/error.h"
#include "stagecraft/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>

#define STAGECRAFT_ERROR_BUFFER_SIZE 1024

#if defined(_MSC_VER)
    #define STAGECRAFT_THREAD_LOCAL __declspec(thread)
#elif defined(__cplusplus)
    #define STAGECRAFT_THREAD_LOCAL thread_local
#else
    #define STAGECRAFT_THREAD_LOCAL _Thread_local
#endif

/* Last error of the calling thread; kind is only meaningful while message is set */
typedef struct ErrorState {
    Stagecraft_ErrorKind kind;
    char message[STAGECRAFT_ERROR_BUFFER_SIZE];
} ErrorState;

static STAGECRAFT_THREAD_LOCAL ErrorState last_error = {STAGECRAFT_ERROR_NONE, {0}};

static void reset_state(void) {
    last_error.kind = STAGECRAFT_ERROR_NONE;
    last_error.message[0] = '\0';
}

static void record(Stagecraft_ErrorKind kind, const char *fmt, va_list args) {
    if (!fmt) {
        reset_state();
        return;
    }
    last_error.kind = kind;
    vsnprintf(last_error.message, sizeof(last_error.message), fmt, args);
}

/* ============================================================================
 * Setters
 * ============================================================================ */

void stagecraft_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    record(STAGECRAFT_ERROR_GENERIC, fmt, args);
    va_end(args);
}

void stagecraft_set_error_v(const char *fmt, va_list args) {
    record(STAGECRAFT_ERROR_GENERIC, fmt, args);
}

void stagecraft_set_error_kind(Stagecraft_ErrorKind kind, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    record(kind, fmt, args);
    va_end(args);
}

void stagecraft_set_error_from_sdl(const char *prefix) {
    const char *reason = SDL_GetError();
    if (!reason || !*reason) {
        reason = "Unknown SDL error";
    }

    last_error.kind = STAGECRAFT_ERROR_BACKEND;
    if (prefix && *prefix) {
        snprintf(last_error.message, sizeof(last_error.message), "%s: %s", prefix, reason);
    } else {
        SDL_strlcpy(last_error.message, reason, sizeof(last_error.message));
    }
}

/* ============================================================================
 * Queries
 * ============================================================================ */

const char *stagecraft_get_last_error(void) {
    return last_error.message;
}

Stagecraft_ErrorKind stagecraft_get_last_error_kind(void) {
    return stagecraft_has_error() ? last_error.kind : STAGECRAFT_ERROR_NONE;
}

bool stagecraft_has_error(void) {
    return last_error.message[0] != '\0';
}

void stagecraft_clear_error(void) {
    reset_state();
}

void stagecraft_log_and_clear_error(void) {
    if (!stagecraft_has_error()) return;

    stagecraft_log_error(STAGECRAFT_LOG_CORE, "%s: %s",
                         stagecraft_error_kind_name(last_error.kind), last_error.message);
    reset_state();
}

const char *stagecraft_error_kind_name(Stagecraft_ErrorKind kind) {
    switch (kind) {
        case STAGECRAFT_ERROR_NONE:              return "none";
        case STAGECRAFT_ERROR_GENERIC:           return "error";
        case STAGECRAFT_ERROR_CONFIG:            return "configuration error";
        case STAGECRAFT_ERROR_UNSUPPORTED_SHAPE: return "unsupported shape";
        case STAGECRAFT_ERROR_RESOURCE:          return "resource error";
        case STAGECRAFT_ERROR_BACKEND:           return "backend error";
    }
    return "unknown";
}
