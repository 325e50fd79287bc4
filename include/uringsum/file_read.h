/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the per-file read state. A file_read_t tracks one input
/// file from the point it is opened until its digest is final: the open
/// descriptor, the size recorded at open, the read cursor, the next read
/// request and the running digest.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_FILE_READ_H
#define URINGSUM_FILE_READ_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

#include "uringsum/md5.h"

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary Define the states of a file read.
enum read_state_e
{
    READ_STATE_CLOSED   = 0, /// No file is bound to the state.
    READ_STATE_CREATED  = 1, /// The file is open; no read has been requested.
    READ_STATE_AWAITING = 2, /// A read request is outstanding.
    READ_STATE_FINISHED = 3, /// Every byte has been digested.
    READ_STATE_ERRORED  = 4  /// The file failed; ErrorKind and OSError say why.
};

/// @summary Define the outcomes of processing a read completion.
enum read_status_e
{
    READ_STATUS_RESUBMIT = 0, /// Submit Request for the same slot.
    READ_STATUS_DONE     = 1, /// The digest is final; the slot can be released.
    READ_STATUS_ERROR    = 2  /// The file failed; the slot can be released.
};

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary Describes the next read to submit for a file. Without direct I/O
/// the request is exactly the next chunk. With direct I/O the offset is rounded
/// down and the length rounded up to the alignment, and SkipAmount leading
/// bytes of the transfer precede the chunk.
struct read_request_t
{
    int64_t            FileOffset;   /// The absolute byte offset passed to the kernel.
    uint32_t           DataAmount;   /// The number of bytes requested from the kernel.
    uint32_t           SkipAmount;   /// The number of leading transferred bytes to ignore.
    uint32_t           ChunkSize;    /// min(FileSize - Cursor, MaxChunk).
};

/// @summary The progress of a single file through the engine.
struct file_read_t
{
    char const        *Path;         /// The input path. Not owned.
    size_t             Index;        /// The zero-based position of the path in the input list.
    int                Fildes;       /// The open file descriptor, or -1.
    int                FileIndex;    /// The kernel file table index, or -1.
    uint32_t           SlotIndex;    /// The owning slot index.
    int32_t            State;        /// One of read_state_e.
    int64_t            FileSize;     /// The file size recorded when the file was opened.
    int64_t            Cursor;       /// The number of bytes digested so far.
    uint32_t           MaxChunk;     /// The maximum number of bytes per read.
    uint32_t           Alignment;    /// The direct I/O alignment, or 0 for buffered reads.
    int32_t            ErrorKind;    /// One of error_kind_e.
    int                OSError;      /// The errno value for a failure, or 0.
    uint32_t           ShortReads;   /// The number of completions shorter than requested.
    read_request_t     Request;      /// The outstanding or next read request.
    md5_accumulator_t  Digest;       /// The running digest of bytes [0, Cursor).
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Reset a read state to READ_STATE_CLOSED without touching the digest context.
/// @param read The read state to initialize.
void init_file_read(file_read_t &read);

/// @summary Open a file and bind it to a read state. On failure the state
/// moves to READ_STATE_ERRORED with ErrorKind set to ERROR_KIND_OPEN or
/// ERROR_KIND_STAT, and no descriptor remains open.
/// @param read The read state, which must be READ_STATE_CLOSED.
/// @param path The NULL-terminated path of the file. Must outlive the read.
/// @param index The zero-based position of the path in the input list.
/// @param max_chunk The maximum number of bytes per read.
/// @param direct_io true to request unbuffered reads. Files on remote mounts
/// and filesystems that reject O_DIRECT are read buffered.
/// @return true if the file is open and the state is READ_STATE_CREATED.
bool open_file_read(file_read_t &read, char const *path, size_t index, uint32_t max_chunk, bool direct_io);

/// @summary Assign the file to a slot and compute the first request.
/// @param read The read state, which must be READ_STATE_CREATED.
/// @param slot_index The index of the owning slot.
/// @return true if a read must be submitted. false if the file is empty, in
/// which case the state is READ_STATE_FINISHED and no read is needed.
bool file_read_begin(file_read_t &read, uint32_t slot_index);

/// @summary Process the completion of the outstanding request.
/// @param read The read state, which must be READ_STATE_AWAITING.
/// @param data The buffer the request transferred into.
/// @param result The kernel result: the number of bytes transferred, or a
/// negated errno value.
/// @return One of read_status_e. For READ_STATUS_RESUBMIT, Request describes
/// the next read.
int32_t file_read_complete(file_read_t &read, uint8_t const *data, int32_t result);

/// @summary Mark a file as failed and close it.
/// @param read The read state.
/// @param kind One of error_kind_e.
/// @param oserror The errno value, or 0.
void file_read_fail(file_read_t &read, int32_t kind, int oserror);

/// @summary Produce the final digest of a finished file.
/// @param read The read state, which must be READ_STATE_FINISHED.
/// @param digest On return, receives the MD5_DIGEST_SIZE byte digest.
/// @return true if the digest was produced.
bool file_read_digest(file_read_t &read, uint8_t digest[MD5_DIGEST_SIZE]);

/// @summary Close the descriptor and return the state to READ_STATE_CLOSED.
/// @param read The read state.
void close_file_read(file_read_t &read);

/// @summary Determine whether a file descriptor references a file on a remote mount point.
/// @param fd The file descriptor to check.
/// @return true if the file exists on a remote mount point.
bool is_remote(int fd);

#endif /* !defined(URINGSUM_FILE_READ_H) */
