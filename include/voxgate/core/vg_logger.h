/**
 * @file vg_logger.h
 * @brief voxgate - Category-tagged logging
 *
 * Every component logs under a short category ("SpeechQueue", "EchoSuppressor",
 * ...). By default messages go to stderr; a host application can install a
 * callback to route them into its own logging system.
 *
 * Usage:
 *   VG_LOG_INFO("SpeechLock", "Acquired by %s", caller.c_str());
 *   vg_log(VG_LOG_WARNING, "SpeechQueue", "Dropped request");
 *
 * The function-like macros only expand when followed by '(', so the level
 * constants and the macros share their names.
 */

#ifndef VOXGATE_VG_LOGGER_H
#define VOXGATE_VG_LOGGER_H

#include <cstdarg>

typedef enum vg_log_level {
    VG_LOG_TRACE = 0,
    VG_LOG_DEBUG = 1,
    VG_LOG_INFO = 2,
    VG_LOG_WARNING = 3,
    VG_LOG_ERROR = 4,
} vg_log_level_t;

/**
 * Log sink installed by the host.
 *
 * @param level Message level
 * @param category Component category
 * @param message Fully formatted message (no trailing newline)
 * @param user_data Opaque pointer given to vg_log_set_callback()
 */
typedef void (*vg_log_callback_fn)(vg_log_level_t level, const char* category,
                                   const char* message, void* user_data);

/**
 * Installs a log sink. Passing nullptr restores the stderr sink.
 */
void vg_log_set_callback(vg_log_callback_fn callback, void* user_data);

/**
 * Messages below this level are discarded (default: VG_LOG_INFO).
 */
void vg_log_set_min_level(vg_log_level_t level);

vg_log_level_t vg_log_get_min_level(void);

/**
 * Parses "trace", "debug", "info", "warning"/"warn", "error" (case-insensitive).
 *
 * @return true if the name was recognised
 */
bool vg_log_parse_level(const char* name, vg_log_level_t* out_level);

const char* vg_log_level_name(vg_log_level_t level);

void vg_log(vg_log_level_t level, const char* category, const char* message);

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void vg_logf(vg_log_level_t level, const char* category, const char* fmt, ...);

void vg_logv(vg_log_level_t level, const char* category, const char* fmt, va_list args);

#define VG_LOG_TRACE(category, ...) vg_logf(VG_LOG_TRACE, category, __VA_ARGS__)
#define VG_LOG_DEBUG(category, ...) vg_logf(VG_LOG_DEBUG, category, __VA_ARGS__)
#define VG_LOG_INFO(category, ...) vg_logf(VG_LOG_INFO, category, __VA_ARGS__)
#define VG_LOG_WARNING(category, ...) vg_logf(VG_LOG_WARNING, category, __VA_ARGS__)
#define VG_LOG_ERROR(category, ...) vg_logf(VG_LOG_ERROR, category, __VA_ARGS__)

#endif  // VOXGATE_VG_LOGGER_H
