/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements error kind descriptions and fatal error reporting.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdio.h>
#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include <execinfo.h>

#include "uringsum/common.h"
#include "uringsum/error.h"

/*///////////////
//   Globals   //
///////////////*/
/// @summary The description of each error kind, indexed by error_kind_e.
global_variable char const *ERROR_KIND_NAME[ERROR_KIND_COUNT] = {
    "success",
    "cannot open file",
    "cannot determine file size",
    "read failed",
    "file ended early",
    "digest update failed",
    "invalid configuration",
    "cannot create io_uring instance",
    "io_uring cannot read files on this kernel",
    "unsupported io_uring operation",
    "cannot register files",
    "cannot register fixed buffers",
    "out of memory",
    "cannot start thread"
};

/*////////////////////////
//   Public Functions   //
////////////////////////*/
char const* error_kind_name(int32_t kind)
{
    if (kind < 0 || kind >= ERROR_KIND_COUNT)
    {
        return "unknown error";
    }
    return ERROR_KIND_NAME[kind];
}

bool error_kind_is_per_file(int32_t kind)
{
    return (kind >= ERROR_KIND_OPEN && kind <= ERROR_KIND_DIGEST);
}

bool error_kind_allows_fallback(int32_t kind)
{
    return (kind == ERROR_KIND_RING_SETUP || kind == ERROR_KIND_RING_UNSUPPORTED);
}

char* format_error(int32_t kind, int oserror, char *buf, size_t buf_size)
{
    if (buf == NULL || buf_size == 0)
        return buf;

    if (oserror != 0)
    {   // strerror_r with _GNU_SOURCE may return a static string rather than
        // filling the supplied buffer, so always use its return value.
        char  sysbuf[128];
        char const *syserr = strerror_r(oserror, sysbuf, sizeof(sysbuf));
        snprintf(buf, buf_size, "%s: %s", error_kind_name(kind), syserr);
    }
    else
    {
        snprintf(buf, buf_size, "%s", error_kind_name(kind));
    }
    return buf;
}

void clear_engine_error(engine_error_t *error)
{
    if (error != NULL)
    {
        error->Kind       = ERROR_KIND_NONE;
        error->OSError    = 0;
        error->Message[0] = '\0';
    }
}

int set_engine_error(engine_error_t *error, int32_t kind, int oserror, char const *fmt, ...)
{
    if (error != NULL)
    {
        va_list args;
        va_start(args, fmt);
        vsnprintf(error->Message, sizeof(error->Message), fmt, args);
        va_end(args);
        error->Kind    = kind;
        error->OSError = oserror;
    }
    return (oserror != 0) ? oserror : EINVAL;
}

void uringsum_verify_failed(char const *cond, char const *file, int line)
{
    void  *frames[32];
    int    nframes = backtrace(frames, 32);
    fprintf(stderr, "FATAL: engine invariant violated: %s (%s:%d)\n", cond, file, line);
    backtrace_symbols_fd(frames, nframes, 2);
    abort();
}
