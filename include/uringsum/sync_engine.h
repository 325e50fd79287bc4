/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the synchronous checksum engine, used when the ring is
/// disabled or cannot be created. Files are processed one at a time on the
/// calling thread.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_SYNC_ENGINE_H
#define URINGSUM_SYNC_ENGINE_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>

#include "uringsum/bridge.h"
#include "uringsum/file_read.h"

/*////////////////
//   Functions  //
////////////////*/
/// @summary Digest an open file with a sequence of blocking pread() calls.
/// @param read The read state, after file_read_begin() returned true.
/// @param block The destination block, at least MaxChunk plus one alignment
/// unit in size and aligned for direct I/O.
/// @param stats The run counters to update. Only ReadsIssued is changed.
/// On return the read state is READ_STATE_FINISHED or READ_STATE_ERRORED.
void sync_read_file(file_read_t &read, uint8_t *block, engine_stats_t &stats);

/// @summary Checksum a list of files without the ring, one file at a time,
/// reading chunks into a single aligned block. Implements checksum_engine_fn.
int  checksum_files_sync(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error);

#endif /* !defined(URINGSUM_SYNC_ENGINE_H) */
