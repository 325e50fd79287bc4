/*/////////////////////////////////////////////////////////////////////////////
/// @summary Forward-declares the types and functions shared between the
/// checksum engines and the application. Both the ring-based engine and the
/// synchronous engine implement checksum_engine_fn; the application selects
/// one through checksum_files().
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_BRIDGE_H
#define URINGSUM_BRIDGE_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

#include "uringsum/config.h"
#include "uringsum/error.h"

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary The size of the digest reported for each file, in bytes.
#define URINGSUM_DIGEST_SIZE          16

/*////////////////////////////
//   Forward Declarations   //
////////////////////////////*/
struct result_queue_t;

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary The terminal outcome for one input path. Instances are stored as
/// the nodes of a result_queue_t; a result retrieved from the queue owns its
/// Path string until free_checksum_result() is called.
struct checksum_result_t
{
    checksum_result_t *Next;         /// Pointer to the next node in the queue.
    char              *Path;         /// The NULL-terminated input path.
    size_t             Index;        /// The zero-based position of the path in the input list.
    int32_t            Kind;         /// One of error_kind_e; ERROR_KIND_NONE on success.
    int                OSError;      /// The errno value for a failure, or 0.
    uint8_t            Digest[URINGSUM_DIGEST_SIZE]; /// The file digest. Valid on success only.
};

/// @summary Counters describing a completed engine run.
struct engine_stats_t
{
    size_t             FilesOk;      /// The number of files checksummed successfully.
    size_t             FilesFailed;  /// The number of files that produced an error result.
    size_t             Dropped;      /// The number of results that could not be queued.
    uint64_t           BytesRead;    /// The number of file bytes fed to the digests.
    uint64_t           ReadsIssued;  /// The number of read operations performed.
    uint64_t           ShortReads;   /// The number of reads that transferred less than requested.
    uint32_t           PeakOccupied; /// The maximum number of simultaneously occupied slots.
    uint64_t           ElapsedNanos; /// The wall-clock duration of the run.
    bool               UsedFallback; /// true if the synchronous engine processed the files.
};

/// @summary Function signature shared by the checksum engines. Every path
/// yields exactly one result in results, in completion order. Per-file errors
/// are reported as results; only a fatal error fails the call, and in that case
/// no file has been processed.
/// @param paths The NULL-terminated input paths. Must remain valid for the call.
/// @param path_count The number of items in paths.
/// @param config A configuration previously passed to normalize_checksum_config().
/// @param results The queue receiving one result per path. The engine does not close it.
/// @param stats On return, receives the run counters. May be NULL.
/// @param error On failure, receives a description of the fatal error. May be NULL.
/// @return Zero if the run completed; otherwise, the errno-style error code.
typedef int (*checksum_engine_fn)(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error);

/*////////////////
//   Functions  //
////////////////*/
/// @summary Checksum a list of files with the engine selected by config. The
/// configuration is normalized first. The ring-based engine is used unless
/// config.DisableUring is set; if no ring can be created and config.AllowFallback
/// is set, the synchronous engine is used instead. The result queue is closed
/// before returning, whether or not the run succeeded.
/// @param paths The NULL-terminated input paths. Must remain valid for the call.
/// @param path_count The number of items in paths.
/// @param config The requested configuration.
/// @param results The queue receiving one result per path.
/// @param stats On return, receives the run counters. May be NULL.
/// @param error On failure, receives a description of the fatal error. May be NULL.
/// @return Zero if the run completed; otherwise, the errno-style error code.
int checksum_files(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error);

/// @summary Retrieve the checksum engine selected for a normalized configuration.
/// @param config The normalized configuration.
/// @return The engine entry point.
checksum_engine_fn select_checksum_engine(checksum_config_t const &config);

#endif /* !defined(URINGSUM_BRIDGE_H) */
