#include <errno.h>
#include <stdint.h>

#include <set>

#include <catch2/catch.hpp>

#include "uringsum/config.h"
#include "uringsum/slot_pool.h"

TEST_CASE("slot pool acquire and release", "[slot_pool]")
{
    slot_pool_t pool;
    REQUIRE(create_slot_pool(&pool, 4, BUFFER_MODE_ADHOC, URINGSUM_MAX_CHUNK, URINGSUM_DIO_ALIGNMENT) == 0);
    REQUIRE(pool.SlotCount == 4);
    REQUIRE(pool.FreeCount == 4);
    REQUIRE(pool.BlockSize == 0);
    REQUIRE(slot_occupied_count(&pool) == 0);

    uint32_t index = 99;
    REQUIRE(slot_acquire(&pool, index));
    REQUIRE(index == 0);
    REQUIRE(slot_at(&pool, 0).Occupied);

    std::set<uint32_t> held;
    held.insert(index);
    while (slot_acquire(&pool, index))
    {
        REQUIRE(held.insert(index).second);
    }
    REQUIRE(held.size() == 4);
    REQUIRE(slot_occupied_count(&pool) == 4);
    REQUIRE(pool.PeakOccupied == 4);
    slot_pool_check(&pool);

    slot_release(&pool, 2);
    REQUIRE(slot_occupied_count(&pool) == 3);
    REQUIRE(slot_acquire(&pool, index));
    REQUIRE(index == 2);

    for (uint32_t i = 0; i < 4; ++i)
    {
        slot_release(&pool, i);
    }
    slot_pool_check(&pool);
    REQUIRE(pool.PeakOccupied == 4);
    delete_slot_pool(&pool);
}

TEST_CASE("slot pool fixed buffers", "[slot_pool]")
{
    slot_pool_t pool;
    uint32_t const chunk = 4096 * 4;
    REQUIRE(create_slot_pool(&pool, 3, BUFFER_MODE_REGISTERED, chunk, URINGSUM_DIO_ALIGNMENT) == 0);
    REQUIRE(pool.BlockSize >= chunk + URINGSUM_DIO_ALIGNMENT);

    struct iovec iov[3];
    REQUIRE(slot_pool_iovecs(&pool, iov) == 3);
    for (uint32_t i = 0; i < 3; ++i)
    {
        slot_t &slot = slot_at(&pool, i);
        REQUIRE(slot.Block != NULL);
        REQUIRE(slot.Buffer.is_fixed());
        REQUIRE(slot.Buffer.capacity() == pool.BlockSize);
        REQUIRE(iov[i].iov_base == slot.Block);
        REQUIRE(iov[i].iov_len == pool.BlockSize);
        REQUIRE(uintptr_t(slot.Block) % URINGSUM_DIO_ALIGNMENT == 0);
        REQUIRE(slot.Read.State == READ_STATE_CLOSED);
    }
    REQUIRE(iov[0].iov_base != iov[1].iov_base);
    delete_slot_pool(&pool);
}

TEST_CASE("slot pool rejects zero slots", "[slot_pool]")
{
    slot_pool_t pool;
    REQUIRE(create_slot_pool(&pool, 0, BUFFER_MODE_ADHOC, URINGSUM_MAX_CHUNK, URINGSUM_DIO_ALIGNMENT) == EINVAL);
    delete_slot_pool(&pool);
}
