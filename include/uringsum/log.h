/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the diagnostic output interface. Messages are written to
/// standard error, one line per message, prefixed with their severity.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_LOG_H
#define URINGSUM_LOG_H

/*////////////////
//   Includes   //
////////////////*/
#include <stdarg.h>
#include <stdint.h>

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary Define the name of the environment variable that selects the log level.
#define URINGSUM_LOG_ENV              "URINGSUM_LOG"

/// @summary Define the supported message severities, from most to least severe.
enum log_level_e
{
    LOG_LEVEL_ERROR = 0, /// A fatal condition or a failed run.
    LOG_LEVEL_WARN  = 1, /// A recoverable condition the user should know about.
    LOG_LEVEL_INFO  = 2, /// Engine setup and summary information.
    LOG_LEVEL_DEBUG = 3, /// Per-file outcomes.
    LOG_LEVEL_TRACE = 4  /// Per-operation submission and completion events.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Set the most verbose severity that will be written. Levels above
/// LOG_LEVEL_TRACE are clamped.
/// @param level One of log_level_e.
void log_set_level(int32_t level);

/// @summary Retrieve the current log level.
/// @return One of log_level_e.
int32_t log_get_level(void);

/// @summary Parse a log level name (error, warn, info, debug, trace) or digit.
/// @param str The NULL-terminated string to parse.
/// @param level On return, set to the parsed level if the string is valid.
/// @return true if str named a valid level.
bool log_parse_level(char const *str, int32_t &level);

/// @summary Set the log level from the URINGSUM_LOG environment variable, if
/// it is set and valid. Call before starting any threads.
void log_init_from_env(void);

/// @summary Determine whether messages at a given severity are written.
/// @param level One of log_level_e.
/// @return true if a message at level would be written.
bool log_enabled(int32_t level);

/// @summary Write a message to standard error regardless of the current level.
/// @param level One of log_level_e; selects the line prefix.
/// @param fmt A printf-style format string.
/// @param args The format arguments.
void log_vwrite(int32_t level, char const *fmt, va_list args);

/*////////////////////////
//   Inline Functions   //
////////////////////////*/
inline void log_error(char const *fmt, ...) __attribute__((format(printf, 1, 2)));
inline void log_error(char const *fmt, ...)
{
    if (log_enabled(LOG_LEVEL_ERROR))
    {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LOG_LEVEL_ERROR, fmt, args);
        va_end(args);
    }
}

inline void log_warn(char const *fmt, ...) __attribute__((format(printf, 1, 2)));
inline void log_warn(char const *fmt, ...)
{
    if (log_enabled(LOG_LEVEL_WARN))
    {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LOG_LEVEL_WARN, fmt, args);
        va_end(args);
    }
}

inline void log_info(char const *fmt, ...) __attribute__((format(printf, 1, 2)));
inline void log_info(char const *fmt, ...)
{
    if (log_enabled(LOG_LEVEL_INFO))
    {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LOG_LEVEL_INFO, fmt, args);
        va_end(args);
    }
}

inline void log_debug(char const *fmt, ...) __attribute__((format(printf, 1, 2)));
inline void log_debug(char const *fmt, ...)
{
    if (log_enabled(LOG_LEVEL_DEBUG))
    {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LOG_LEVEL_DEBUG, fmt, args);
        va_end(args);
    }
}

inline void log_trace(char const *fmt, ...) __attribute__((format(printf, 1, 2)));
inline void log_trace(char const *fmt, ...)
{
    if (log_enabled(LOG_LEVEL_TRACE))
    {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LOG_LEVEL_TRACE, fmt, args);
        va_end(args);
    }
}

#endif /* !defined(URINGSUM_LOG_H) */
