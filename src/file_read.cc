/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the per-file read state machine shared by the ring
/// engine and its tests.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////////
//   Preprocessor   //
////////////////////*/
#ifndef _LARGEFILE_SOURCE
#define _LARGEFILE_SOURCE
#endif
#ifndef _LARGEFILE64_SOURCE
#define _LARGEFILE64_SOURCE
#endif

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>

#include "uringsum/common.h"
#include "uringsum/config.h"
#include "uringsum/error.h"
#include "uringsum/file_read.h"
#include "uringsum/log.h"

/*///////////////////////
//   Local Functions   //
///////////////////////*/
/// @summary Compute the request for the chunk starting at the cursor.
/// @param read The read state to update. FileSize must exceed Cursor.
internal_function void prepare_request(file_read_t &read)
{
    int64_t  const remaining = read.FileSize - read.Cursor;
    uint32_t const chunk     = uint32_t(clamp_to(size_t(remaining), read.MaxChunk));
    read_request_t &req      = read.Request;
    if (read.Alignment != 0)
    {   // unbuffered reads must start and end on an alignment boundary. the
        // cursor is aligned unless a previous read came back short.
        int64_t aligned      = align_down(read.Cursor, read.Alignment);
        req.FileOffset       = aligned;
        req.SkipAmount       = uint32_t(read.Cursor - aligned);
        req.DataAmount       = uint32_t(align_up(size_t(req.SkipAmount) + chunk, read.Alignment));
    }
    else
    {
        req.FileOffset       = read.Cursor;
        req.SkipAmount       = 0;
        req.DataAmount       = chunk;
    }
    req.ChunkSize            = chunk;
    read.State               = READ_STATE_AWAITING;
}

/*////////////////////////
//   Public Functions   //
////////////////////////*/
bool is_remote(int fd)
{
    struct statfs    st;
    if (fstatfs(fd, &st) < 0)
    {   // unable to stat the file.
        return false;
    }
    switch (st.f_type)
    {
        case 0xFF534D42: // CIFS_MAGIC_NUMBER
        case 0xFE534D42: // SMB2_MAGIC_NUMBER
        case 0x0000517B: // SMB_SUPER_MAGIC
        case 0x00006969: // NFS_SUPER_MAGIC
            return true;
        default:
            break;
    }
    return false;
}

void init_file_read(file_read_t &read)
{
    read.Path       = NULL;
    read.Index      = 0;
    read.Fildes     = -1;
    read.FileIndex  = -1;
    read.SlotIndex  = 0;
    read.State      = READ_STATE_CLOSED;
    read.FileSize   = 0;
    read.Cursor     = 0;
    read.MaxChunk   = 0;
    read.Alignment  = 0;
    read.ErrorKind  = ERROR_KIND_NONE;
    read.OSError    = 0;
    read.ShortReads = 0;
    read.Request.FileOffset = 0;
    read.Request.DataAmount = 0;
    read.Request.SkipAmount = 0;
    read.Request.ChunkSize  = 0;
}

bool open_file_read(file_read_t &read, char const *path, size_t index, uint32_t max_chunk, bool direct_io)
{
    struct stat st;
    int fildes = -1;

    URINGSUM_VERIFY(read.State == READ_STATE_CLOSED);
    init_file_read(read);
    read.Path     = path;
    read.Index    = index;
    read.MaxChunk = max_chunk;

    if (read.Digest.reset() == false)
    {   // the digest context could not be initialized.
        file_read_fail(read, ERROR_KIND_DIGEST, ENOMEM);
        return false;
    }
    if ((fildes = open(path, O_RDONLY | O_LARGEFILE | O_CLOEXEC)) == -1)
    {   // unable to open the file. check errno to find out why.
        file_read_fail(read, ERROR_KIND_OPEN, errno);
        return false;
    }
    read.Fildes = fildes;
    if (fstat(fildes, &st) < 0)
    {   // unable to retrieve the file size; fail.
        file_read_fail(read, ERROR_KIND_STAT, errno);
        return false;
    }
    if (S_ISDIR(st.st_mode))
    {   // directories open fine but cannot be read.
        file_read_fail(read, ERROR_KIND_READ, EISDIR);
        return false;
    }
    if (direct_io && is_remote(fildes) == false)
    {   // if this fails, fall back to buffered I/O; it is not a fatal error.
        // never use O_DIRECT for files mounted with NFS or CIFS.
        if (fcntl(fildes, F_SETFL, O_RDONLY | O_LARGEFILE | O_DIRECT) == 0)
        {
            read.Alignment = URINGSUM_DIO_ALIGNMENT;
        }
        else
        {
            log_debug("%s: O_DIRECT unavailable (errno %d); reading buffered.", path, errno);
        }
    }
    read.FileSize = st.st_size;
    read.State    = READ_STATE_CREATED;
    return true;
}

bool file_read_begin(file_read_t &read, uint32_t slot_index)
{
    URINGSUM_VERIFY(read.State == READ_STATE_CREATED);
    read.SlotIndex = slot_index;
    if (read.FileSize == 0)
    {   // nothing to read; the digest is that of the empty stream.
        read.State = READ_STATE_FINISHED;
        return false;
    }
    prepare_request(read);
    return true;
}

int32_t file_read_complete(file_read_t &read, uint8_t const *data, int32_t result)
{
    URINGSUM_VERIFY(read.State == READ_STATE_AWAITING);
    read_request_t const &req = read.Request;

    if (result < 0)
    {   // interrupted reads are retried unchanged; anything else fails the file.
        if (result == -EINTR || result == -EAGAIN)
            return READ_STATUS_RESUBMIT;
        file_read_fail(read, ERROR_KIND_READ, -result);
        return READ_STATUS_ERROR;
    }

    // only the kernel-reported byte count is trusted. under direct I/O the
    // transfer may include SkipAmount leading bytes and, at end-of-file,
    // run up to the true end of the file; only the chunk itself is digested.
    uint32_t transferred = uint32_t(result);
    uint32_t usable      = 0;
    if (transferred > req.SkipAmount)
    {
        usable = uint32_t(clamp_to(transferred - req.SkipAmount, req.ChunkSize));
    }
    if (usable == 0)
    {   // end-of-file before FileSize bytes; the file shrank during the run.
        file_read_fail(read, ERROR_KIND_TRUNCATED, 0);
        return READ_STATUS_ERROR;
    }
    if (read.Digest.update(data + req.SkipAmount, usable) == false)
    {
        file_read_fail(read, ERROR_KIND_DIGEST, 0);
        return READ_STATUS_ERROR;
    }
    if (usable < req.ChunkSize)
    {
        read.ShortReads++;
    }
    read.Cursor += usable;
    URINGSUM_VERIFY(read.Cursor <= read.FileSize);

    if (read.Cursor == read.FileSize)
    {
        read.State = READ_STATE_FINISHED;
        return READ_STATUS_DONE;
    }
    prepare_request(read);
    return READ_STATUS_RESUBMIT;
}

void file_read_fail(file_read_t &read, int32_t kind, int oserror)
{
    if (read.Fildes != -1)
    {
        close(read.Fildes);
        read.Fildes = -1;
    }
    read.ErrorKind = kind;
    read.OSError   = oserror;
    read.State     = READ_STATE_ERRORED;
}

bool file_read_digest(file_read_t &read, uint8_t digest[MD5_DIGEST_SIZE])
{
    URINGSUM_VERIFY(read.State == READ_STATE_FINISHED);
    return read.Digest.finalize(digest);
}

void close_file_read(file_read_t &read)
{
    if (read.Fildes != -1)
    {
        close(read.Fildes);
        read.Fildes = -1;
    }
    read.FileIndex = -1;
    read.State     = READ_STATE_CLOSED;
}
