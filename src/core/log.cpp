#include "stagecraft/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#define MAX_LOG_CALLBACKS 8
#define LOG_MESSAGE_SIZE 1024

#if defined(_WIN32)
    #define DEFAULT_LOG_PATH "stagecraft.log"
#else
    #define DEFAULT_LOG_PATH "/tmp/stagecraft.log"
#endif

struct LogCallbackEntry {
    Stagecraft_LogCallback callback;
    void *userdata;
    uint32_t handle;
};

struct LogState {
    FILE *file;
    char path[512];
    Stagecraft_LogLevel level;
    bool console;
    bool initialized;
    LogCallbackEntry callbacks[MAX_LOG_CALLBACKS];
    uint32_t next_handle;
};

static LogState s_log = {
    NULL, {0}, STAGECRAFT_LOG_LEVEL_INFO, true, false, {}, 1
};

/* Padded to 7 chars for alignment */
static const char *level_names[] = {
    "ERROR  ",
    "WARNING",
    "INFO   ",
    "DEBUG  "
};

static void format_timestamp(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm *tm_info = localtime(&now);
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", tm_info);
}

static void write_marker(const char *label, bool leading_blank) {
    if (!s_log.file) return;

    char timestamp[32];
    format_timestamp(timestamp, sizeof(timestamp));

    const char *rule = "================================================================================";
    if (leading_blank) fputc('\n', s_log.file);
    fprintf(s_log.file, "%s\n=== %s: %s\n%s\n", rule, label, timestamp, rule);
    if (!leading_blank) fputc('\n', s_log.file);
    fflush(s_log.file);
}

bool stagecraft_log_init(void) {
    return stagecraft_log_init_with_path(NULL);
}

bool stagecraft_log_init_with_path(const char *path) {
    if (s_log.initialized) {
        return true;
    }

    snprintf(s_log.path, sizeof(s_log.path), "%s", path ? path : DEFAULT_LOG_PATH);

    s_log.file = fopen(s_log.path, "a");
    if (!s_log.file) {
        SDL_Log("Failed to open log file: %s", s_log.path);
        s_log.path[0] = '\0';
        return false;
    }

    s_log.initialized = true;
    write_marker("Stagecraft - Session Start", true);
    return true;
}

void stagecraft_log_shutdown(void) {
    if (!s_log.initialized) return;

    write_marker("Session End", false);
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
    s_log.initialized = false;
}

bool stagecraft_log_is_initialized(void) {
    return s_log.initialized;
}

void stagecraft_log_set_level(Stagecraft_LogLevel level) {
    s_log.level = level;
}

Stagecraft_LogLevel stagecraft_log_get_level(void) {
    return s_log.level;
}

void stagecraft_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

static void echo_to_console(Stagecraft_LogLevel level, const char *subsystem, const char *message) {
    switch (level) {
        case STAGECRAFT_LOG_LEVEL_ERROR:
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
        case STAGECRAFT_LOG_LEVEL_WARNING:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
        case STAGECRAFT_LOG_LEVEL_INFO:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
        case STAGECRAFT_LOG_LEVEL_DEBUG:
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
    }
}

void stagecraft_log_v(Stagecraft_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    if (level != STAGECRAFT_LOG_LEVEL_ERROR && level > s_log.level) {
        return;
    }

    char message[LOG_MESSAGE_SIZE];
    vsnprintf(message, sizeof(message), fmt, args);

    char tag[11];
    snprintf(tag, sizeof(tag), "%-10s", subsystem ? subsystem : "Unknown");

    if (s_log.file) {
        char timestamp[32];
        format_timestamp(timestamp, sizeof(timestamp));
        fprintf(s_log.file, "[%s] [%s] [%s] %s\n", timestamp, level_names[level], tag, message);

        /* Errors flush immediately so a crash keeps them */
        if (level == STAGECRAFT_LOG_LEVEL_ERROR) {
            fflush(s_log.file);
        }
    }

    if (s_log.console) {
        echo_to_console(level, tag, message);
    }

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        const LogCallbackEntry &entry = s_log.callbacks[i];
        if (entry.handle != 0 && entry.callback) {
            entry.callback(level, tag, message, entry.userdata);
        }
    }
}

#define STAGECRAFT_LOG_LEVEL_FN(name, level)                          \
    void stagecraft_log_##name(const char *subsystem, const char *fmt, ...) { \
        va_list args;                                                  \
        va_start(args, fmt);                                           \
        stagecraft_log_v(level, subsystem, fmt, args);                 \
        va_end(args);                                                  \
    }

STAGECRAFT_LOG_LEVEL_FN(error, STAGECRAFT_LOG_LEVEL_ERROR)
STAGECRAFT_LOG_LEVEL_FN(warning, STAGECRAFT_LOG_LEVEL_WARNING)
STAGECRAFT_LOG_LEVEL_FN(info, STAGECRAFT_LOG_LEVEL_INFO)
STAGECRAFT_LOG_LEVEL_FN(debug, STAGECRAFT_LOG_LEVEL_DEBUG)

#undef STAGECRAFT_LOG_LEVEL_FN

void stagecraft_log_flush(void) {
    if (s_log.file) {
        fflush(s_log.file);
    }
}

const char *stagecraft_log_get_path(void) {
    return s_log.initialized ? s_log.path : NULL;
}

uint32_t stagecraft_log_add_callback(Stagecraft_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogCallbackEntry &entry = s_log.callbacks[i];
        if (entry.handle == 0) {
            entry.callback = callback;
            entry.userdata = userdata;
            entry.handle = s_log.next_handle++;
            return entry.handle;
        }
    }
    return 0;
}

void stagecraft_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogCallbackEntry &entry = s_log.callbacks[i];
        if (entry.handle == handle) {
            entry.callback = NULL;
            entry.userdata = NULL;
            entry.handle = 0;
            return;
        }
    }
}
