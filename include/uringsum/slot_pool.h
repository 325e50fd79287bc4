/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the fixed table of I/O slots. Each slot owns one buffer
/// and one file read state; the free slots are tracked by an explicit stack of
/// indices, so acquiring or releasing a slot never scans the table.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_SLOT_POOL_H
#define URINGSUM_SLOT_POOL_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>
#include <sys/uio.h>

#include "uringsum/iobuf.h"
#include "uringsum/file_read.h"

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary One unit of engine capacity. A slot is free, or it is occupied by
/// exactly one file, which has at most one read in flight.
struct slot_t
{
    io_buffer_t        Buffer;       /// The buffer targeted by the slot's reads.
    void              *Block;        /// The fixed storage block attached to Buffer, or NULL.
    file_read_t        Read;         /// The state of the file occupying the slot.
    bool               Occupied;     /// true between slot_acquire() and slot_release().
};

/// @summary The slot table and its free-index stack.
struct slot_pool_t
{
    uint32_t           SlotCount;    /// The number of slots, N.
    uint32_t           FreeCount;    /// The number of valid entries in FreeList.
    uint32_t          *FreeList;     /// The indices of the free slots [FreeCount valid].
    slot_t            *Slots;        /// The slot table [SlotCount].
    uint32_t           PeakOccupied; /// The maximum number of simultaneously occupied slots.
    int32_t            BufferMode;   /// One of buffer_mode_e.
    size_t             BlockSize;    /// The capacity of each fixed buffer, or 0.
    iobuf_alloc_t      Allocator;    /// The storage for fixed buffers.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Allocate the slot table. Every slot starts free. For the pinned
/// and registered buffer modes each slot receives one aligned block able to
/// hold a full chunk plus one alignment unit.
/// @param pool The pool to initialize.
/// @param slot_count The number of slots.
/// @param buffer_mode One of buffer_mode_e.
/// @param max_chunk The maximum number of bytes per read.
/// @param alignment The direct I/O alignment. Must be a power of two.
/// @return Zero if the pool was created; otherwise, the errno value.
int  create_slot_pool(slot_pool_t *pool, uint32_t slot_count, int32_t buffer_mode, size_t max_chunk, size_t alignment);

/// @summary Free the slot table and buffers. Every slot must be free.
/// @param pool The pool to delete.
void delete_slot_pool(slot_pool_t *pool);

/// @summary Take a free slot.
/// @param pool The pool to update.
/// @param index On return, receives the index of the acquired slot.
/// @return true if a slot was acquired, false if every slot is occupied.
bool slot_acquire(slot_pool_t *pool, uint32_t &index);

/// @summary Return an occupied slot to the free stack. The slot's buffer must
/// be checked in and its file read closed.
/// @param pool The pool to update.
/// @param index The index of the slot to release.
void slot_release(slot_pool_t *pool, uint32_t index);

/// @summary Retrieve the number of occupied slots.
uint32_t slot_occupied_count(slot_pool_t const *pool);

/// @summary Retrieve a slot by index.
slot_t& slot_at(slot_pool_t *pool, uint32_t index);

/// @summary Verify that the free stack and the occupied flags agree.
/// Scans every slot, so it runs at the start and end of a run only.
/// Terminates the process if they do not.
/// @param pool The pool to check.
void slot_pool_check(slot_pool_t const *pool);

/// @summary Describe the fixed buffers of every slot, in slot order.
/// @param pool The pool to query. The buffer mode must not be BUFFER_MODE_ADHOC.
/// @param iov The destination array of at least pool->SlotCount items.
/// @return The number of descriptors written.
size_t slot_pool_iovecs(slot_pool_t *pool, struct iovec *iov);

#endif /* !defined(URINGSUM_SLOT_POOL_H) */
