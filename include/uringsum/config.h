/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the engine capacity constants and the runtime strategy
/// configuration shared by the ring-based engine and the synchronous fallback.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_CONFIG_H
#define URINGSUM_CONFIG_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

#include "uringsum/error.h"

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary Define the default number of I/O slots, which bounds the number
/// of concurrently open files and in-flight reads.
#ifndef URINGSUM_SLOT_COUNT
#define URINGSUM_SLOT_COUNT           16
#endif

/// @summary Define the default maximum number of bytes requested by one read.
#ifndef URINGSUM_MAX_CHUNK
#define URINGSUM_MAX_CHUNK           (4096 * 16)
#endif

/// @summary Define the buffer address, offset and length alignment required
/// for unbuffered (O_DIRECT) reads.
#ifndef URINGSUM_DIO_ALIGNMENT
#define URINGSUM_DIO_ALIGNMENT        4096
#endif

/// @summary Define the largest slot count accepted at runtime.
#define URINGSUM_MAX_SLOT_COUNT       4096

/// @summary Define the largest chunk size accepted at runtime.
#define URINGSUM_MAX_CHUNK_LIMIT     (1024U * 1024U * 1024U)

/// @summary Define the ways a slot can own its I/O buffer.
enum buffer_mode_e
{
    BUFFER_MODE_ADHOC      = 0, /// A growable heap buffer sized per request.
    BUFFER_MODE_PINNED     = 1, /// An aligned block allocated once and reused across files.
    BUFFER_MODE_REGISTERED = 2, /// A pinned block also registered with the kernel by index.
};

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary Describes how a run should read and checksum its input files.
struct checksum_config_t
{
    uint32_t           SlotCount;          /// The number of I/O slots (N).
    uint32_t           MaxChunkSize;       /// The maximum number of bytes per read.
    bool               UseRegisteredFiles; /// Reference open files by a kernel file table index.
    bool               UseFixedBuffers;    /// Read into kernel-registered buffers. Implies UseRegisteredFiles.
    bool               UseDirectIO;        /// Open files with O_DIRECT. Requires slot-owned aligned buffers.
    bool               DisableUring;       /// Use the synchronous engine only.
    bool               AllowFallback;      /// Use the synchronous engine if no ring can be created.
};

/// @summary The strategy selected once from a normalized configuration.
struct strategy_t
{
    int32_t            BufferMode;         /// One of buffer_mode_e.
    bool               RegisterFiles;      /// true to register each admitted file in the kernel file table.
    bool               DirectIO;           /// true to request O_DIRECT for each file.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Retrieve a configuration populated with the compile-time defaults
/// and every optional feature disabled.
/// @return The default configuration.
checksum_config_t default_checksum_config(void);

/// @summary Apply implied options and validate a configuration in place.
/// UseFixedBuffers switches on UseRegisteredFiles.
/// @param config The configuration to normalize.
/// @param error On failure, receives an ERROR_KIND_CONFIG description. May be NULL.
/// @return true if the configuration is usable.
bool normalize_checksum_config(checksum_config_t &config, engine_error_t *error);

/// @summary Derive the engine strategy from a normalized configuration.
/// @param config The normalized configuration.
/// @return The strategy for the ring-based engine.
strategy_t select_strategy(checksum_config_t const &config);

/// @summary Retrieve a short name for a buffer mode, for diagnostics.
/// @param mode One of buffer_mode_e.
/// @return A pointer to a static NULL-terminated string.
char const* buffer_mode_name(int32_t mode);

#endif /* !defined(URINGSUM_CONFIG_H) */
