/**
 * @file log.h
 * @brief Logging subsystem with support for console and file sinks.
 * @ingroup Core
 */
#pragma once

#include "defines.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
* @brief Defines the severity levels for log messages.
*/
typedef enum {
	SB_LOG_LVL_TRACE,    ///< Verbose debug information (lowest priority).
	SB_LOG_LVL_DEBUG,    ///< Information useful for debugging software defects.
	SB_LOG_LVL_INFO,     ///< General operational messages (startup, shutdown, etc.).
	SB_LOG_LVL_WARN,     ///< Warnings about potential issues that do not stop execution.
	SB_LOG_LVL_ERROR,    ///< Runtime errors that are recoverable.
	SB_LOG_LVL_CRITICAL  ///< Severe errors causing premature termination or instability.
} Sb_Log_Level;

/**
 * @brief Logs a formatted message to all active sinks.
 *
 * @param level Severity level. Messages below the current global level will be ignored.
 * @param fmt The printf-style format string.
 * @param ... Arguments for the format string.
 */
SB_API void sb_logf(Sb_Log_Level level, const char* fmt, ...);

/**
 * @brief Logs a raw string message.
 * @note Faster than sb_logf as it avoids formatting overhead.
 */
SB_API void sb_log(Sb_Log_Level level, const char* str);

/**
 * @brief Adds a file sink to the logger.
 * logs will be written to both console and this file.
 *
 * There is at most one file sink. Enabling a different path closes the
 * previous file, enabling the same path again does nothing.
 *
 * @param filename Path to the log file. If it exists, new logs are appended.
 * @return 0 when the sink could not be created.
 */
SB_API int sb_log_enable_file_sink(const char* filename);

/** @brief Closes the file sink, if any. Console output is unaffected. */
SB_API void sb_log_disable_file_sink();

/** @brief Path of the active file sink, or NULL when logging to the console only. */
SB_API const char* sb_log_file_path();

/**
 * @brief Customizes the log output format.
 * Pattern syntax follows spdlog conventions (e.g. "[%H:%M:%S] [%l] %v").
 */
SB_API void sb_log_set_pattern(const char* pattern);

/** @brief Sets the global filtering level. */
SB_API void sb_log_set_level(Sb_Log_Level level);

/** @brief Gets the current global logging level. */
SB_API Sb_Log_Level sb_log_get_level();

/** @brief Parses "trace", "debug", "info", "warn", "error" or "critical". Returns 0 on unknown names. */
SB_API int sb_log_level_from_str(const char* name, Sb_Log_Level* out);

/** @brief Inverse of sb_log_level_from_str. */
SB_API const char* sb_log_level_to_str(Sb_Log_Level level);

#ifdef __cplusplus
} // extern "C"
#endif

// Convenience macros for logging
#define SB_LOG_TRACE(...) sb_logf(SB_LOG_LVL_TRACE, __VA_ARGS__)
#define SB_LOG_DEBUG(...) sb_logf(SB_LOG_LVL_DEBUG, __VA_ARGS__)
#define SB_LOG_INFO(...) sb_logf(SB_LOG_LVL_INFO, __VA_ARGS__)
#define SB_LOG_WARN(...) sb_logf(SB_LOG_LVL_WARN, __VA_ARGS__)
#define SB_LOG_ERROR(...) sb_logf(SB_LOG_LVL_ERROR, __VA_ARGS__)
#define SB_LOG_CRITICAL(...) sb_logf(SB_LOG_LVL_CRITICAL, __VA_ARGS__)
