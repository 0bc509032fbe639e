// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef SQLSAN_H
#define SQLSAN_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum SQLSAN_LOG_LEVEL
 *
 * Internal logging levels, ordered by severity.
 **/
typedef enum
{
    SQLSAN_LOG_TRACE,
    SQLSAN_LOG_DEBUG,
    SQLSAN_LOG_INFO,
    SQLSAN_LOG_WARN,
    SQLSAN_LOG_ERROR,
    SQLSAN_LOG_OFF,
} SQLSAN_LOG_LEVEL;

typedef struct _sqlsan_config sqlsan_config;

/**
 * @struct sqlsan_config
 *
 * Sanitizer configuration, a zero-initialised structure (or NULL) provides
 * the default behaviour.
 **/
struct _sqlsan_config
{
    /** Leave comments in the sanitized output instead of stripping them */
    bool keep_comments;
    /** Leave the second and later rows of INSERT ... VALUES intact */
    bool keep_insert_rows;
};

/**
 * @typedef sqlsan_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message, NUL-terminated. (nonnull)
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*sqlsan_log_cb)(
    SQLSAN_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * sqlsan_sanitize
 *
 * Replace every literal value of an SQL query with a placeholder, collapse
 * value lists and repeated INSERT rows and strip comments.
 *
 * @param query The SQL query, not necessarily NUL-terminated. (nonnull)
 * @param length The length of the query in bytes.
 * @param config Optional sanitizer configuration. (nullable)
 * @param output_length Optional output for the length of the result. (nullable)
 *
 * @return A NUL-terminated sanitized query which must be freed with
 *         sqlsan_free, or NULL if the query was NULL or an error occurred.
 **/
char *sqlsan_sanitize(const char *query, size_t length, const sqlsan_config *config,
    size_t *output_length);

/**
 * sqlsan_free
 *
 * Free a string returned by sqlsan_sanitize.
 *
 * @param sanitized The string to free. (nullable)
 **/
void sqlsan_free(char *sanitized);

/**
 * sqlsan_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *sqlsan_get_version();

/**
 * sqlsan_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool sqlsan_set_log_cb(sqlsan_log_cb cb, SQLSAN_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* SQLSAN_H */
