#ifndef STAGECRAFT_LOG_H
#define STAGECRAFT_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * Stagecraft Logging System
 *
 * File-based logging with subsystem tags and log levels.
 *
 * Usage:
 *   stagecraft_log_init();  // /tmp/stagecraft.log (Unix) or stagecraft.log (Windows)
 *   stagecraft_log_info(STAGECRAFT_LOG_STAGE, "Stage %dx%d created", w, h);
 *   stagecraft_log_warning(STAGECRAFT_LOG_ASSETS, "Image not found: %s", path);
 *   stagecraft_log_shutdown();
 *
 * Output format:
 *   [2024-01-15 14:30:22] [ERROR  ] [Render    ] Unsupported shape
 */

typedef enum {
    STAGECRAFT_LOG_LEVEL_ERROR = 0,    /**< Always logged, auto-flush */
    STAGECRAFT_LOG_LEVEL_WARNING = 1,
    STAGECRAFT_LOG_LEVEL_INFO = 2,
    STAGECRAFT_LOG_LEVEL_DEBUG = 3
} Stagecraft_LogLevel;

#define STAGECRAFT_LOG_CORE     "Core"
#define STAGECRAFT_LOG_PHYSICS  "Physics"
#define STAGECRAFT_LOG_RENDER   "Render"
#define STAGECRAFT_LOG_ACTOR    "Actor"
#define STAGECRAFT_LOG_STAGE    "Stage"
#define STAGECRAFT_LOG_INPUT    "Input"
#define STAGECRAFT_LOG_ASSETS   "Assets"

/**
 * Callback invoked for every message that passes the level filter.
 * The subsystem string is padded to 10 characters.
 */
typedef void (*Stagecraft_LogCallback)(Stagecraft_LogLevel level, const char *subsystem,
                                       const char *message, void *userdata);

/**
 * Initialize the logging system with the default log file path.
 *
 * @return true on success, false on failure
 */
bool stagecraft_log_init(void);

/**
 * Initialize the logging system with a custom log file path.
 *
 * @param path Path to the log file (NULL uses default)
 * @return true on success, false on failure
 */
bool stagecraft_log_init_with_path(const char *path);

/**
 * Write the session end marker and close the log file.
 */
void stagecraft_log_shutdown(void);

bool stagecraft_log_is_initialized(void);

/**
 * Set the maximum level that gets logged. Errors always pass.
 */
void stagecraft_log_set_level(Stagecraft_LogLevel level);
Stagecraft_LogLevel stagecraft_log_get_level(void);

/**
 * Echo messages to SDL_Log as well. Enabled by default.
 */
void stagecraft_log_set_console_output(bool enabled);

void stagecraft_log_error(const char *subsystem, const char *fmt, ...);
void stagecraft_log_warning(const char *subsystem, const char *fmt, ...);
void stagecraft_log_info(const char *subsystem, const char *fmt, ...);
void stagecraft_log_debug(const char *subsystem, const char *fmt, ...);

/**
 * Log with explicit level.
 */
void stagecraft_log_v(Stagecraft_LogLevel level, const char *subsystem, const char *fmt, va_list args);

void stagecraft_log_flush(void);

/**
 * @return Path to log file, or NULL if not initialized
 */
const char *stagecraft_log_get_path(void);

/**
 * Register a log callback.
 *
 * @return Handle for removal, 0 when all slots are taken
 */
uint32_t stagecraft_log_add_callback(Stagecraft_LogCallback callback, void *userdata);

void stagecraft_log_remove_callback(uint32_t handle);

#endif /* STAGECRAFT_LOG_H */
