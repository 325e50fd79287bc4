/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the io_uring checksum engine. The engine admits files
/// into free slots, submits reads tagged with the slot index, and routes each
/// completion back to the file occupying that slot until every file has
/// produced a result.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/uio.h>

#include <liburing.h>

#include "uringsum/common.h"
#include "uringsum/log.h"
#include "uringsum/result_queue.h"
#include "uringsum/uring_engine.h"

/*///////////////////////
//   Local Functions   //
///////////////////////*/
/// @summary Point a slot's kernel file table entry at a descriptor, or clear it.
/// @param engine The engine owning the registered file table.
/// @param slot_index The slot, which is also the file table index.
/// @param fd The descriptor to install, or -1 to clear the entry.
/// @return Zero on success, or a negated errno value.
internal_function int update_file_table(uring_engine_t *engine, uint32_t slot_index, int fd)
{
    int ret = io_uring_register_files_update(&engine->Ring, slot_index, &fd, 1);
    return (ret < 0) ? ret : 0;
}

/// @summary Deliver the terminal result of the file occupying a slot, close
/// the file and return the slot to the free stack.
/// @param engine The engine owning the slot.
/// @param slot_index The slot to release.
/// @param results The queue receiving the result.
/// @param stats The run counters to update.
internal_function void finish_slot(uring_engine_t *engine, uint32_t slot_index, result_queue_t *results, engine_stats_t &stats)
{
    slot_t      &slot = slot_at(&engine->Pool, slot_index);
    file_read_t &read = slot.Read;
    uint8_t      digest[MD5_DIGEST_SIZE];
    bool         queued = false;

    if (read.State == READ_STATE_FINISHED && file_read_digest(read, digest) == false)
    {   // the digest context failed while producing the final value.
        file_read_fail(read, ERROR_KIND_DIGEST, 0);
    }
    if (read.State == READ_STATE_FINISHED)
    {
        log_trace("slot %u: finished %s (%lld bytes).", slot_index, read.Path, (long long) read.FileSize);
        queued = result_queue_put(results, read.Path, read.Index, ERROR_KIND_NONE, 0, digest);
        stats.FilesOk++;
    }
    else
    {
        log_debug("%s: %s (errno %d).", read.Path, error_kind_name(read.ErrorKind), read.OSError);
        queued = result_queue_put(results, read.Path, read.Index, read.ErrorKind, read.OSError, NULL);
        stats.FilesFailed++;
    }
    if (queued == false)
    {
        log_error("%s: result could not be delivered.", read.Path);
        stats.Dropped++;
    }

    if (read.FileIndex >= 0)
    {   // drop the kernel's reference to the file before the descriptor closes.
        int ret = update_file_table(engine, slot_index, -1);
        if (ret < 0)
        {
            log_warn("slot %u: clearing registered file failed: %s.", slot_index, strerror(-ret));
        }
    }
    stats.ShortReads += read.ShortReads;
    close_file_read(read);
    slot_release(&engine->Pool, slot_index);
}

/// @summary Queue the read described by a slot's file request. The read is
/// handed to the kernel by the next io_uring_submit_and_wait().
/// @param engine The engine owning the slot.
/// @param slot_index The slot whose file should be read.
/// @param stats The run counters to update.
/// @return true if the read was queued, false if the buffer could not be sized.
internal_function bool submit_read(uring_engine_t *engine, uint32_t slot_index, engine_stats_t &stats)
{
    slot_t               &slot = slot_at(&engine->Pool, slot_index);
    file_read_t          &read = slot.Read;
    read_request_t const &req  = read.Request;

    if (slot.Buffer.resize(req.DataAmount) == false)
    {   // fixed blocks always hold a full request; growable buffers may not.
        URINGSUM_VERIFY(slot.Buffer.is_fixed() == false);
        return false;
    }

    // there is never more than one read per slot, and the ring holds at
    // least as many entries as there are slots.
    struct io_uring_sqe *sqe = io_uring_get_sqe(&engine->Ring);
    URINGSUM_VERIFY(sqe != NULL);

    void *buf = slot.Buffer.checkout();
    int   fd  = (read.FileIndex >= 0) ? read.FileIndex : read.Fildes;
    if (engine->Strategy.BufferMode == BUFFER_MODE_REGISTERED)
    {   // the slot's block was registered at the slot's index.
        io_uring_prep_read_fixed(sqe, fd, buf, req.DataAmount, uint64_t(req.FileOffset), int(slot_index));
    }
    else
    {
        io_uring_prep_read(sqe, fd, buf, req.DataAmount, uint64_t(req.FileOffset));
    }
    if (read.FileIndex >= 0)
    {
        io_uring_sqe_set_flags(sqe, IOSQE_FIXED_FILE);
    }
    io_uring_sqe_set_data(sqe, (void*) uintptr_t(slot_index));

    log_trace("slot %u: read %u bytes at %lld of %s.", slot_index, req.DataAmount, (long long) req.FileOffset, read.Path);
    engine->InFlight++;
    stats.ReadsIssued++;
    return true;
}

/// @summary Admit one pending path into a free slot. Files that fail to open,
/// and empty files, produce their result immediately and free the slot again.
/// @param engine The engine owning the slots. At least one slot must be free.
/// @param path The NULL-terminated input path.
/// @param index The zero-based position of the path in the input list.
/// @param results The queue receiving results.
/// @param stats The run counters to update.
internal_function void admit_file(uring_engine_t *engine, char const *path, size_t index, result_queue_t *results, engine_stats_t &stats)
{
    uint32_t slot_index = 0;
    bool     acquired   = slot_acquire(&engine->Pool, slot_index);
    URINGSUM_VERIFY(acquired);

    file_read_t &read = slot_at(&engine->Pool, slot_index).Read;
    if (open_file_read(read, path, index, engine->MaxChunk, engine->Strategy.DirectIO) == false)
    {
        finish_slot(engine, slot_index, results, stats);
        return;
    }
    if (engine->Strategy.RegisterFiles)
    {
        int ret = update_file_table(engine, slot_index, read.Fildes);
        if (ret < 0)
        {
            file_read_fail(read, ERROR_KIND_OPEN, -ret);
            finish_slot(engine, slot_index, results, stats);
            return;
        }
        read.FileIndex = int(slot_index);
    }
    log_trace("slot %u: admitted %s (%lld bytes).", slot_index, path, (long long) read.FileSize);

    if (file_read_begin(read, slot_index) == false)
    {   // empty file; there is nothing to submit.
        finish_slot(engine, slot_index, results, stats);
        return;
    }
    if (submit_read(engine, slot_index, stats) == false)
    {
        file_read_fail(read, ERROR_KIND_READ, ENOMEM);
        finish_slot(engine, slot_index, results, stats);
    }
}

/// @summary Route one completion to the file occupying the tagged slot.
/// @param engine The engine owning the slots.
/// @param slot_index The slot index carried in the completion user data.
/// @param res The completion result: bytes transferred or a negated errno value.
/// @param results The queue receiving results.
/// @param stats The run counters to update.
internal_function void complete_read(uring_engine_t *engine, uint32_t slot_index, int32_t res, result_queue_t *results, engine_stats_t &stats)
{
    URINGSUM_VERIFY(slot_index < engine->Pool.SlotCount);
    URINGSUM_VERIFY(engine->InFlight > 0);
    slot_t      &slot = slot_at(&engine->Pool, slot_index);
    file_read_t &read = slot.Read;
    URINGSUM_VERIFY(slot.Occupied && read.State == READ_STATE_AWAITING);

    engine->InFlight--;
    slot.Buffer.checkin();

    int64_t cursor = read.Cursor;
    int32_t status = file_read_complete(read, slot.Buffer.contents(), res);
    stats.BytesRead += uint64_t(read.Cursor - cursor);
    log_trace("slot %u: completed with %d, %lld of %lld bytes of %s.",
        slot_index, res, (long long) read.Cursor, (long long) read.FileSize, read.Path);

    switch (status)
    {
        case READ_STATUS_RESUBMIT:
            if (submit_read(engine, slot_index, stats) == false)
            {
                file_read_fail(read, ERROR_KIND_READ, ENOMEM);
                finish_slot(engine, slot_index, results, stats);
            }
            break;
        case READ_STATUS_DONE:
        case READ_STATUS_ERROR:
            finish_slot(engine, slot_index, results, stats);
            break;
        default:
            URINGSUM_VERIFY(!"unknown read status");
            break;
    }
}

/*////////////////////////
//   Public Functions   //
////////////////////////*/
int create_uring_engine(uring_engine_t *engine, checksum_config_t const &config, engine_error_t *error)
{
    struct iovec *iov    = NULL;
    int          *fds    = NULL;
    int           result = 0;
    int           ret    = 0;

    memset(&engine->Ring , 0, sizeof(engine->Ring));
    memset(&engine->Caps , 0, sizeof(engine->Caps));
    memset(&engine->Pool , 0, sizeof(engine->Pool));
    engine->RingValid         = false;
    engine->FilesRegistered   = false;
    engine->BuffersRegistered = false;
    engine->Strategy          = select_strategy(config);
    engine->InFlight          = 0;
    engine->MaxChunk          = config.MaxChunkSize;
    clear_engine_error(error);

    // the ring is created once per run. every slot has at most one read
    // outstanding, so a ring of SlotCount entries can never overflow.
    if ((ret = io_uring_queue_init(config.SlotCount, &engine->Ring, 0)) < 0)
    {
        result = set_engine_error(error, ERROR_KIND_RING_SETUP, -ret,
            "io_uring_queue_init(%u) failed: %s", config.SlotCount, strerror(-ret));
        goto error_cleanup;
    }
    engine->RingValid = true;

    probe_capabilities(&engine->Ring, engine->Caps);
    if (check_capabilities(engine->Caps, engine->Strategy, error) == false)
    {
        result = EOPNOTSUPP;
        goto error_cleanup;
    }

    if ((ret = create_slot_pool(&engine->Pool, config.SlotCount, engine->Strategy.BufferMode, config.MaxChunkSize, URINGSUM_DIO_ALIGNMENT)) != 0)
    {
        result = set_engine_error(error, ERROR_KIND_OUT_OF_MEMORY, ret,
            "cannot allocate %u I/O slots: %s", config.SlotCount, strerror(ret));
        goto error_cleanup;
    }

    if (engine->Strategy.BufferMode == BUFFER_MODE_REGISTERED)
    {   // describe every slot block to the kernel once; reads then name a
        // block by its slot index.
        if ((iov = (struct iovec*) malloc(config.SlotCount * sizeof(struct iovec))) == NULL)
        {
            result = set_engine_error(error, ERROR_KIND_OUT_OF_MEMORY, ENOMEM, "cannot allocate buffer descriptors");
            goto error_cleanup;
        }
        slot_pool_iovecs(&engine->Pool, iov);
        if ((ret = io_uring_register_buffers(&engine->Ring, iov, config.SlotCount)) < 0)
        {
            result = set_engine_error(error, ERROR_KIND_REGISTER_BUFFERS, -ret,
                "failed to register %u fixed buffers: %s (is RLIMIT_MEMLOCK too low, or are you running without root?)",
                config.SlotCount, strerror(-ret));
            goto error_cleanup;
        }
        engine->BuffersRegistered = true;
    }

    if (engine->Strategy.RegisterFiles)
    {   // register an empty table with one entry per slot. each admitted
        // file is installed at its slot's index and removed when it finishes.
        if ((fds = (int*) malloc(config.SlotCount * sizeof(int))) == NULL)
        {
            result = set_engine_error(error, ERROR_KIND_OUT_OF_MEMORY, ENOMEM, "cannot allocate file table");
            goto error_cleanup;
        }
        for (uint32_t i = 0; i < config.SlotCount; ++i)
        {
            fds[i] = -1;
        }
        if ((ret = io_uring_register_files(&engine->Ring, fds, config.SlotCount)) < 0)
        {
            result = set_engine_error(error, ERROR_KIND_REGISTER_FILES, -ret,
                "failed to register a %u entry file table: %s", config.SlotCount, strerror(-ret));
            goto error_cleanup;
        }
        engine->FilesRegistered = true;
    }

    log_info("io_uring engine ready: %u slots, %u byte chunks, %s buffers, %s files%s.",
        config.SlotCount, config.MaxChunkSize, buffer_mode_name(engine->Strategy.BufferMode),
        engine->Strategy.RegisterFiles ? "registered" : "plain",
        engine->Strategy.DirectIO ? ", direct I/O" : "");
    free(fds);
    free(iov);
    return 0;

error_cleanup:
    log_error("%s", (error != NULL) ? error->Message : "io_uring engine setup failed");
    free(fds);
    free(iov);
    delete_uring_engine(engine);
    return result;
}

void delete_uring_engine(uring_engine_t *engine)
{
    URINGSUM_VERIFY(engine->InFlight == 0);
    if (engine->FilesRegistered)
    {
        io_uring_unregister_files(&engine->Ring);
        engine->FilesRegistered = false;
    }
    if (engine->BuffersRegistered)
    {
        io_uring_unregister_buffers(&engine->Ring);
        engine->BuffersRegistered = false;
    }
    delete_slot_pool(&engine->Pool);
    if (engine->RingValid)
    {
        io_uring_queue_exit(&engine->Ring);
        engine->RingValid = false;
    }
}

int run_uring_engine(uring_engine_t *engine, char const * const *paths, size_t path_count, result_queue_t *results, engine_stats_t *stats, engine_error_t *error)
{
    engine_stats_t counters;
    uint64_t const start = nanotime();
    size_t         next  = 0;

    memset(&counters, 0, sizeof(counters));
    clear_engine_error(error);
    URINGSUM_VERIFY(engine->RingValid && engine->InFlight == 0);
    slot_pool_check(&engine->Pool);

    for ( ; ; )
    {   // refill: admit pending files while a slot is free.
        while (next < path_count && engine->Pool.FreeCount > 0)
        {
            admit_file(engine, paths[next], next, results, counters);
            next++;
        }
        URINGSUM_VERIFY(engine->InFlight == slot_occupied_count(&engine->Pool));

        if (engine->InFlight == 0)
        {   // every admitted file finished without a read. stop once
            // nothing is pending either.
            if (next >= path_count)
                break;
            continue;
        }

        // drain: submit queued reads, then block until one completes.
        int ret = io_uring_submit_and_wait(&engine->Ring, 1);
        if (ret < 0 && ret != -EINTR && ret != -EAGAIN)
        {
            log_error("io_uring_submit_and_wait failed: %s.", strerror(-ret));
            URINGSUM_VERIFY(ret >= 0);
        }

        // process every completion that is available before admitting more work.
        struct io_uring_cqe *cqe   = NULL;
        unsigned             head  = 0;
        unsigned             count = 0;
        io_uring_for_each_cqe(&engine->Ring, head, cqe)
        {
            uint32_t slot_index = uint32_t(uintptr_t(io_uring_cqe_get_data(cqe)));
            complete_read(engine, slot_index, cqe->res, results, counters);
            count++;
        }
        io_uring_cq_advance(&engine->Ring, count);
    }

    slot_pool_check(&engine->Pool);
    URINGSUM_VERIFY(slot_occupied_count(&engine->Pool) == 0);
    counters.PeakOccupied = engine->Pool.PeakOccupied;
    counters.ElapsedNanos = nanotime() - start;
    log_info("io_uring engine finished: %zu ok, %zu failed, %llu bytes, %llu reads.",
        counters.FilesOk, counters.FilesFailed,
        (unsigned long long) counters.BytesRead, (unsigned long long) counters.ReadsIssued);
    if (stats != NULL) *stats = counters;
    return 0;
}

int checksum_files_uring(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error)
{
    uring_engine_t *engine = (uring_engine_t*) malloc(sizeof(uring_engine_t));
    int             result = 0;
    if (engine == NULL)
    {
        return set_engine_error(error, ERROR_KIND_OUT_OF_MEMORY, ENOMEM, "cannot allocate engine state");
    }
    if ((result = create_uring_engine(engine, config, error)) == 0)
    {
        result = run_uring_engine(engine, paths, path_count, results, stats, error);
        delete_uring_engine(engine);
    }
    free(engine);
    return result;
}
