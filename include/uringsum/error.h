/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the error kinds reported by the checksum engine, both the
/// per-file outcomes delivered through the result queue and the fatal errors
/// that stop a run before any file is processed.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_ERROR_H
#define URINGSUM_ERROR_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary Define the maximum length of a fatal error message, including the
/// terminating NULL.
#define URINGSUM_MAX_ERROR_MESSAGE    256

/// @summary Define the categories of error reported by the engine. Values
/// ERROR_KIND_OPEN through ERROR_KIND_DIGEST describe a single file and never
/// stop the run. The remaining values are fatal for the run.
enum error_kind_e
{
    ERROR_KIND_NONE             = 0,  /// The operation completed successfully.
    ERROR_KIND_OPEN             = 1,  /// The file could not be opened.
    ERROR_KIND_STAT             = 2,  /// The file size could not be determined.
    ERROR_KIND_READ             = 3,  /// A read operation against the file failed.
    ERROR_KIND_TRUNCATED        = 4,  /// The file ended before its recorded size was read.
    ERROR_KIND_DIGEST           = 5,  /// The digest accumulator rejected an update.
    ERROR_KIND_CONFIG           = 6,  /// The engine configuration is invalid.
    ERROR_KIND_RING_SETUP       = 7,  /// The kernel I/O ring could not be created.
    ERROR_KIND_RING_UNSUPPORTED = 8,  /// The ring exists but cannot perform plain reads.
    ERROR_KIND_CAPABILITY       = 9,  /// An operation the selected strategy requires is not supported.
    ERROR_KIND_REGISTER_FILES   = 10, /// The kernel refused the file table registration.
    ERROR_KIND_REGISTER_BUFFERS = 11, /// The kernel refused the buffer registration.
    ERROR_KIND_OUT_OF_MEMORY    = 12, /// Engine state could not be allocated.
    ERROR_KIND_THREAD           = 13, /// A worker thread could not be started.
    ERROR_KIND_COUNT                  /// The number of defined error kinds. Must be last.
};

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary Describes a fatal error that stopped an engine run.
struct engine_error_t
{
    int32_t            Kind;         /// One of error_kind_e.
    int                OSError;      /// The errno value associated with the error, or 0.
    char               Message[URINGSUM_MAX_ERROR_MESSAGE]; /// Human-readable description.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Retrieve a short description of an error kind.
/// @param kind One of error_kind_e.
/// @return A pointer to a static NULL-terminated string.
char const* error_kind_name(int32_t kind);

/// @summary Determine whether an error kind describes a single file.
/// @param kind One of error_kind_e.
/// @return true if the kind is a per-file outcome.
bool error_kind_is_per_file(int32_t kind);

/// @summary Determine whether a fatal error means the kernel I/O ring cannot
/// be used at all, so the synchronous engine may run in its place.
/// @param kind One of error_kind_e.
/// @return true for ERROR_KIND_RING_SETUP and ERROR_KIND_RING_UNSUPPORTED.
bool error_kind_allows_fallback(int32_t kind);

/// @summary Format the cause of a per-file or fatal error as a single line.
/// @param kind One of error_kind_e.
/// @param oserror The errno value associated with the error, or 0.
/// @param buf The destination buffer.
/// @param buf_size The size of buf, in bytes.
/// @return The buf pointer.
char* format_error(int32_t kind, int oserror, char *buf, size_t buf_size);

/// @summary Reset an error record to ERROR_KIND_NONE.
/// @param error The error record to clear. May be NULL.
void clear_engine_error(engine_error_t *error);

/// @summary Fill out an error record describing a fatal error.
/// @param error The error record to populate. May be NULL.
/// @param kind One of error_kind_e.
/// @param oserror The errno value associated with the error, or 0.
/// @param fmt A printf-style format string for the message.
/// @return The value the failing entry point should return: oserror if it is
/// non-zero, otherwise EINVAL.
int set_engine_error(engine_error_t *error, int32_t kind, int oserror, char const *fmt, ...) __attribute__((format(printf, 4, 5)));

#endif /* !defined(URINGSUM_ERROR_H) */
