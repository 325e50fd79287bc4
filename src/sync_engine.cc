/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the synchronous checksum engine. Each file is read
/// with pread() into a single aligned block using the same per-file state
/// machine as the ring engine, so a file that shrinks during the run fails
/// with ERROR_KIND_TRUNCATED rather than faulting.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <new>

#include "uringsum/common.h"
#include "uringsum/file_read.h"
#include "uringsum/iobuf.h"
#include "uringsum/log.h"
#include "uringsum/result_queue.h"
#include "uringsum/sync_engine.h"

/*////////////////////////
//   Public Functions   //
////////////////////////*/
void sync_read_file(file_read_t &read, uint8_t *block, engine_stats_t &stats)
{
    int32_t status = READ_STATUS_RESUBMIT;
    while (status == READ_STATUS_RESUBMIT)
    {
        read_request_t const &req = read.Request;
        ssize_t n = pread(read.Fildes, block, req.DataAmount, off_t(req.FileOffset));
        stats.ReadsIssued++;
        status = file_read_complete(read, block, (n < 0) ? -errno : int32_t(n));
    }
}

int checksum_files_sync(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error)
{
    iobuf_alloc_t  alloc;
    engine_stats_t counters;
    uint64_t const start = nanotime();
    uint8_t       *block = NULL;
    file_read_t   *read  = NULL;
    int            ret   = 0;

    memset(&counters, 0, sizeof(counters));
    clear_engine_error(error);
    if ((ret = create_iobuf_allocator(alloc, 1, size_t(config.MaxChunkSize) + URINGSUM_DIO_ALIGNMENT)) != 0)
    {
        return set_engine_error(error, ERROR_KIND_OUT_OF_MEMORY, ret, "cannot allocate the read buffer: %s", strerror(ret));
    }
    if ((read = new (std::nothrow) file_read_t) == NULL)
    {
        delete_iobuf_allocator(alloc);
        return set_engine_error(error, ERROR_KIND_OUT_OF_MEMORY, ENOMEM, "cannot allocate the read state");
    }
    block = (uint8_t*) iobuf_get(alloc);
    init_file_read(*read);
    log_info("synchronous engine: %zu files, %u byte chunks%s.", path_count, config.MaxChunkSize,
        config.UseDirectIO ? ", direct I/O" : "");

    for (size_t i = 0; i < path_count; ++i)
    {
        uint8_t digest[MD5_DIGEST_SIZE];
        bool    queued = false;

        if (open_file_read(*read, paths[i], i, config.MaxChunkSize, config.UseDirectIO) &&
            file_read_begin (*read, 0))
        {
            sync_read_file(*read, block, counters);
        }
        counters.BytesRead  += uint64_t(read->Cursor);
        counters.ShortReads += read->ShortReads;

        if (read->State == READ_STATE_FINISHED && file_read_digest(*read, digest) == false)
        {
            file_read_fail(*read, ERROR_KIND_DIGEST, 0);
        }
        if (read->State == READ_STATE_FINISHED)
        {
            queued = result_queue_put(results, paths[i], i, ERROR_KIND_NONE, 0, digest);
            counters.FilesOk++;
        }
        else
        {
            log_debug("%s: %s (errno %d).", paths[i], error_kind_name(read->ErrorKind), read->OSError);
            queued = result_queue_put(results, paths[i], i, read->ErrorKind, read->OSError, NULL);
            counters.FilesFailed++;
        }
        if (queued == false)
        {
            log_error("%s: result could not be delivered.", paths[i]);
            counters.Dropped++;
        }
        close_file_read(*read);
    }

    iobuf_put(alloc, block);
    delete read;
    delete_iobuf_allocator(alloc);
    counters.PeakOccupied = (path_count > 0) ? 1 : 0;
    counters.ElapsedNanos = nanotime() - start;
    counters.UsedFallback = true;
    if (stats != NULL) *stats = counters;
    return 0;
}
