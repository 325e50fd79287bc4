/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the io_uring-based checksum engine. One thread owns the
/// ring, the slot table and every file read state for the duration of a run.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_URING_ENGINE_H
#define URINGSUM_URING_ENGINE_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

#include <liburing.h>

#include "uringsum/bridge.h"
#include "uringsum/probe.h"
#include "uringsum/slot_pool.h"

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary The state owned by a single ring engine instance.
struct uring_engine_t
{
    struct io_uring    Ring;         /// The submission and completion queues.
    bool               RingValid;    /// true once Ring has been initialized.
    bool               FilesRegistered;   /// true if the sparse file table is registered.
    bool               BuffersRegistered; /// true if the slot buffers are registered.
    strategy_t         Strategy;     /// The strategy selected at creation.
    capabilities_t     Caps;         /// The supported ring operations.
    slot_pool_t        Pool;         /// The slot table.
    uint32_t           InFlight;     /// The number of submitted, uncompleted reads.
    uint32_t           MaxChunk;     /// The maximum number of bytes per read.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Create the ring, check capabilities, allocate the slot table and
/// perform any file table and buffer registration the strategy requires.
/// @param engine The engine to initialize.
/// @param config A normalized configuration.
/// @param error On failure, receives a description of the fatal error. May be NULL.
/// @return Zero if the engine is ready; otherwise, the errno-style error code.
int  create_uring_engine(uring_engine_t *engine, checksum_config_t const &config, engine_error_t *error);

/// @summary Unregister resources and release the ring and slot table.
/// @param engine The engine to delete.
void delete_uring_engine(uring_engine_t *engine);

/// @summary Checksum a list of files with a ready engine.
/// @param engine The engine returned by create_uring_engine().
/// @param paths The NULL-terminated input paths.
/// @param path_count The number of items in paths.
/// @param results The queue receiving one result per path.
/// @param stats On return, receives the run counters. May be NULL.
/// @param error On failure, receives a description of the fatal error. May be NULL.
/// @return Zero if the run completed; otherwise, the errno-style error code.
int  run_uring_engine(uring_engine_t *engine, char const * const *paths, size_t path_count, result_queue_t *results, engine_stats_t *stats, engine_error_t *error);

/// @summary Create an engine, run it over a list of files and delete it.
/// Implements checksum_engine_fn.
int  checksum_files_uring(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error);

#endif /* !defined(URINGSUM_URING_ENGINE_H) */
