/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements leveled diagnostic output to standard error.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <stdio.h>
#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include "uringsum/common.h"
#include "uringsum/log.h"

/*///////////////
//   Globals   //
///////////////*/
/// @summary The most verbose level currently written. Set before any thread
/// other than the main thread is started.
global_variable volatile int32_t LOG_LEVEL = LOG_LEVEL_WARN;

/// @summary The name and message prefix of each level, indexed by log_level_e.
global_variable char const *LOG_LEVEL_NAME[]   = { "error" , "warn"  , "info"  , "debug"  , "trace"   };
global_variable char const *LOG_LEVEL_PREFIX[] = { "ERROR:", "WARN:" , "INFO:" , "DEBUG:" , "TRACE:"  };

/*////////////////////////
//   Public Functions   //
////////////////////////*/
void log_set_level(int32_t level)
{
    if (level < LOG_LEVEL_ERROR) level = LOG_LEVEL_ERROR;
    if (level > LOG_LEVEL_TRACE) level = LOG_LEVEL_TRACE;
    LOG_LEVEL = level;
}

int32_t log_get_level(void)
{
    return LOG_LEVEL;
}

bool log_parse_level(char const *str, int32_t &level)
{
    if (str == NULL || str[0] == '\0')
        return false;

    if (str[0] >= '0' && str[0] <= '4' && str[1] == '\0')
    {
        level = int32_t(str[0] - '0');
        return true;
    }
    for (int32_t i = LOG_LEVEL_ERROR; i <= LOG_LEVEL_TRACE; ++i)
    {
        if (strcasecmp(str, LOG_LEVEL_NAME[i]) == 0)
        {
            level = i;
            return true;
        }
    }
    return false;
}

void log_init_from_env(void)
{
    char const *value = getenv(URINGSUM_LOG_ENV);
    int32_t     level = LOG_LEVEL_WARN;
    if (value == NULL)
        return;
    if (log_parse_level(value, level))
    {
        log_set_level(level);
    }
    else
    {
        fprintf(stderr, "WARN: Ignoring unrecognized %s value \'%s\'.\n", URINGSUM_LOG_ENV, value);
    }
}

bool log_enabled(int32_t level)
{
    return (level <= LOG_LEVEL);
}

void log_vwrite(int32_t level, char const *fmt, va_list args)
{   // format into a local buffer so the line reaches stderr with one write,
    // and lines from different threads do not interleave.
    char    line[1024];
    int     n = 0;

    if (level < LOG_LEVEL_ERROR) level = LOG_LEVEL_ERROR;
    if (level > LOG_LEVEL_TRACE) level = LOG_LEVEL_TRACE;

    n = snprintf(line, sizeof(line), "%s ", LOG_LEVEL_PREFIX[level]);
    vsnprintf(line + n, sizeof(line) - size_t(n), fmt, args);
    fprintf(stderr, "%s\n", line);
}
