/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the page-aligned block allocator and the slot-owned
/// I/O buffer.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/mman.h>

#include "uringsum/common.h"
#include "uringsum/iobuf.h"
#include "uringsum/log.h"

#ifndef MAP_ANONYMOUS
#define MAP_ANONYMOUS              MAP_ANON
#endif

/*////////////////////////
//   Public Functions   //
////////////////////////*/
io_buffer_t::io_buffer_t(void)
    :
    Memory(NULL),
    Size(0),
    Capacity(0),
    Fixed(false),
    CheckedOut(false)
{
    /* empty */
}

io_buffer_t::~io_buffer_t(void)
{
    URINGSUM_VERIFY(CheckedOut == false);
    if (Fixed == false && Memory != NULL)
    {
        free(Memory);
    }
    Memory   = NULL;
    Size     = 0;
    Capacity = 0;
}

void io_buffer_t::attach_fixed(void *block, size_t capacity)
{
    URINGSUM_VERIFY(CheckedOut == false);
    URINGSUM_VERIFY(Fixed == false && Memory == NULL);
    Memory   = (uint8_t*) block;
    Size     = 0;
    Capacity = capacity;
    Fixed    = true;
}

void* io_buffer_t::detach_fixed(void)
{
    URINGSUM_VERIFY(CheckedOut == false);
    if (Fixed == false)
        return NULL;
    void *block = Memory;
    Memory   = NULL;
    Size     = 0;
    Capacity = 0;
    Fixed    = false;
    return block;
}

bool io_buffer_t::resize(size_t size)
{
    URINGSUM_VERIFY(CheckedOut == false);
    if (size <= Capacity)
    {   // fixed buffers never move; growable buffers keep their storage.
        Size = size;
        return true;
    }
    if (Fixed)
    {   // a fixed buffer cannot hold more than its block.
        return false;
    }
    uint8_t *mem = (uint8_t*) realloc(Memory, size);
    if (mem == NULL)
    {   // the existing storage remains valid.
        return false;
    }
    Memory   = mem;
    Size     = size;
    Capacity = size;
    return true;
}

void* io_buffer_t::checkout(void)
{
    URINGSUM_VERIFY(CheckedOut == false);
    URINGSUM_VERIFY(Memory != NULL || Size == 0);
    CheckedOut = true;
    return Memory;
}

void io_buffer_t::checkin(void)
{
    URINGSUM_VERIFY(CheckedOut == true);
    CheckedOut = false;
}

uint8_t const* io_buffer_t::contents(void) const
{
    URINGSUM_VERIFY(CheckedOut == false);
    return Memory;
}

int create_iobuf_allocator(iobuf_alloc_t &alloc, size_t block_count, size_t alloc_size)
{
    // round the allocation size up to an even multiple of the page size.
    // the total size is then an even multiple of the allocation size.
    size_t page_size  = size_t(sysconf(_SC_PAGESIZE));
    alloc_size        = align_up(alloc_size, page_size);
    size_t total_size = alloc_size * block_count;

    memset(&alloc, 0, sizeof(iobuf_alloc_t));
    if (block_count == 0)
    {   // nothing to allocate.
        return EINVAL;
    }

    // reserve and commit the entire region. the kernel pins the pages itself
    // if the region is later registered with a ring.
    void  *baseaddr = mmap(NULL, total_size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (baseaddr == MAP_FAILED)
    {   // the requested amount of memory could not be allocated.
        return errno;
    }
    if (madvise(baseaddr, total_size, MADV_HUGEPAGE) != 0)
    {   // transparent huge pages are an optimization only.
        log_trace("madvise(MADV_HUGEPAGE) declined for %zu byte I/O region (errno %d).", total_size, errno);
    }

    void **freelist = (void**) malloc(block_count * sizeof(void*));
    if (freelist == NULL)
    {   // the requested memory could not be allocated.
        munmap(baseaddr, total_size);
        return ENOMEM;
    }

    // at this point, everything that could have failed has succeeded.
    // set the fields of the allocator and initialize the free list.
    alloc.TotalSize    = total_size;
    alloc.PageSize     = page_size;
    alloc.AllocSize    = alloc_size;
    alloc.BaseAddress  = baseaddr;
    alloc.FreeCount    = block_count;
    alloc.FreeList     = freelist;
    uint8_t *buf_it    = (uint8_t*) baseaddr;
    for (size_t i = 0; i < block_count; ++i)
    {   // hand out blocks from the start of the region first.
        freelist[block_count - i - 1] = buf_it;
        buf_it        += alloc_size;
    }
    return 0;
}

void delete_iobuf_allocator(iobuf_alloc_t &alloc)
{
    if (alloc.FreeList    != NULL) free(alloc.FreeList);
    if (alloc.BaseAddress != NULL) munmap(alloc.BaseAddress, alloc.TotalSize);
    alloc.BaseAddress      = NULL;
    alloc.TotalSize        = 0;
    alloc.FreeCount        = 0;
    alloc.FreeList         = NULL;
}

void* iobuf_get(iobuf_alloc_t &alloc)
{
    if (alloc.FreeCount > 0)
    {   // return the next buffer from the free list,
        // which is typically the most recently used buffer.
        return alloc.FreeList[--alloc.FreeCount];
    }
    else return NULL; // no buffers available for use.
}

void iobuf_put(iobuf_alloc_t &alloc, void *iobuf)
{
    URINGSUM_VERIFY(iobuf != NULL);
    URINGSUM_VERIFY(alloc.AllocSize != 0 && alloc.FreeCount < alloc.TotalSize / alloc.AllocSize);
    alloc.FreeList[alloc.FreeCount++] = iobuf;
}

size_t iobuf_buffers_used(iobuf_alloc_t const &alloc)
{
    if (alloc.AllocSize == 0)
        return 0;
    size_t const nallocs = alloc.TotalSize / alloc.AllocSize;
    size_t const nunused = alloc.FreeCount;
    return (nallocs - nunused);
}
