/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the I/O slot table and its free-index stack.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <new>

#include "uringsum/common.h"
#include "uringsum/config.h"
#include "uringsum/slot_pool.h"

/*////////////////////////
//   Public Functions   //
////////////////////////*/
int create_slot_pool(slot_pool_t *pool, uint32_t slot_count, int32_t buffer_mode, size_t max_chunk, size_t alignment)
{
    int result = 0;

    URINGSUM_VERIFY(is_pow2(alignment));
    memset(&pool->Allocator, 0, sizeof(iobuf_alloc_t));
    pool->SlotCount    = 0;
    pool->FreeCount    = 0;
    pool->FreeList     = NULL;
    pool->Slots        = NULL;
    pool->PeakOccupied = 0;
    pool->BufferMode   = buffer_mode;
    pool->BlockSize    = 0;

    if (slot_count == 0)
    {
        return EINVAL;
    }
    if ((pool->FreeList = (uint32_t*) malloc(slot_count * sizeof(uint32_t))) == NULL)
    {
        result = ENOMEM;
        goto error_cleanup;
    }
    if ((pool->Slots = new (std::nothrow) slot_t[slot_count]) == NULL)
    {
        result = ENOMEM;
        goto error_cleanup;
    }
    pool->SlotCount = slot_count;

    if (buffer_mode != BUFFER_MODE_ADHOC)
    {   // one block per slot, large enough for a full chunk that starts up
        // to one alignment unit past an aligned offset.
        if ((result = create_iobuf_allocator(pool->Allocator, slot_count, max_chunk + alignment)) != 0)
        {
            goto error_cleanup;
        }
        pool->BlockSize = pool->Allocator.AllocSize;
    }

    for (uint32_t i = 0; i < slot_count; ++i)
    {
        slot_t &slot   = pool->Slots[i];
        slot.Occupied  = false;
        slot.Block     = NULL;
        init_file_read(slot.Read);
        if (buffer_mode != BUFFER_MODE_ADHOC)
        {
            slot.Block = iobuf_get(pool->Allocator);
            URINGSUM_VERIFY(slot.Block != NULL);
            slot.Buffer.attach_fixed(slot.Block, pool->BlockSize);
        }
        // the stack pops from the end, so slot 0 is handed out first.
        pool->FreeList[slot_count - i - 1] = i;
    }
    pool->FreeCount = slot_count;
    return 0;

error_cleanup:
    delete [] pool->Slots;
    free(pool->FreeList);
    pool->Slots     = NULL;
    pool->FreeList  = NULL;
    pool->SlotCount = 0;
    return result;
}

void delete_slot_pool(slot_pool_t *pool)
{
    if (pool->Slots != NULL)
    {
        URINGSUM_VERIFY(pool->FreeCount == pool->SlotCount);
        for (uint32_t i = 0; i < pool->SlotCount; ++i)
        {
            slot_t &slot = pool->Slots[i];
            close_file_read(slot.Read);
            if (slot.Block != NULL)
            {
                slot.Buffer.detach_fixed();
                iobuf_put(pool->Allocator, slot.Block);
                slot.Block = NULL;
            }
        }
        delete [] pool->Slots;
    }
    delete_iobuf_allocator(pool->Allocator);
    free(pool->FreeList);
    pool->Slots     = NULL;
    pool->FreeList  = NULL;
    pool->SlotCount = 0;
    pool->FreeCount = 0;
}

bool slot_acquire(slot_pool_t *pool, uint32_t &index)
{
    if (pool->FreeCount == 0)
        return false;

    uint32_t slot_index = pool->FreeList[--pool->FreeCount];
    URINGSUM_VERIFY(slot_index < pool->SlotCount);
    slot_t  &slot = pool->Slots[slot_index];
    URINGSUM_VERIFY(slot.Occupied == false);
    slot.Occupied = true;

    uint32_t occupied = pool->SlotCount - pool->FreeCount;
    if (occupied > pool->PeakOccupied)
        pool->PeakOccupied = occupied;
    index = slot_index;
    return true;
}

void slot_release(slot_pool_t *pool, uint32_t index)
{
    URINGSUM_VERIFY(index < pool->SlotCount);
    URINGSUM_VERIFY(pool->FreeCount < pool->SlotCount);
    slot_t &slot = pool->Slots[index];
    URINGSUM_VERIFY(slot.Occupied == true);
    URINGSUM_VERIFY(slot.Buffer.checked_out() == false);
    URINGSUM_VERIFY(slot.Read.State == READ_STATE_CLOSED);
    slot.Occupied = false;
    pool->FreeList[pool->FreeCount++] = index;
}

uint32_t slot_occupied_count(slot_pool_t const *pool)
{
    return pool->SlotCount - pool->FreeCount;
}

slot_t& slot_at(slot_pool_t *pool, uint32_t index)
{
    URINGSUM_VERIFY(index < pool->SlotCount);
    return pool->Slots[index];
}

void slot_pool_check(slot_pool_t const *pool)
{
    uint32_t occupied = 0;
    for (uint32_t i = 0; i < pool->SlotCount; ++i)
    {
        if (pool->Slots[i].Occupied)
            occupied++;
    }
    URINGSUM_VERIFY(occupied + pool->FreeCount == pool->SlotCount);
    for (uint32_t i = 0; i < pool->FreeCount; ++i)
    {
        URINGSUM_VERIFY(pool->FreeList[i] < pool->SlotCount);
        URINGSUM_VERIFY(pool->Slots[pool->FreeList[i]].Occupied == false);
    }
}

size_t slot_pool_iovecs(slot_pool_t *pool, struct iovec *iov)
{
    URINGSUM_VERIFY(pool->BufferMode != BUFFER_MODE_ADHOC);
    for (uint32_t i = 0; i < pool->SlotCount; ++i)
    {
        iov[i].iov_base = pool->Slots[i].Block;
        iov[i].iov_len  = pool->BlockSize;
    }
    return pool->SlotCount;
}
