/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the I/O buffer types. An iobuf_alloc_t carves a single
/// page-aligned region into fixed-size blocks suitable for unbuffered I/O. An
/// io_buffer_t is the buffer owned by one I/O slot; while a read is in flight
/// the buffer is checked out and its storage cannot be resized or inspected.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_IOBUF_H
#define URINGSUM_IOBUF_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary Defines the state associated with a direct I/O buffer manager.
/// This object allocates a single large chunk of memory aligned to the system
/// page size, and then allows the caller to allocate fixed-size chunks from
/// within that buffer. The allocator can only be used from a single thread.
struct iobuf_alloc_t
{
    size_t             TotalSize;    /// The total number of bytes allocated.
    size_t             PageSize;     /// The size of a single page, in bytes.
    size_t             AllocSize;    /// The size of a single allocation, in bytes.
    void              *BaseAddress;  /// The base address of the committed range.
    size_t             FreeCount;    /// The number of unallocated AllocSize blocks.
    void             **FreeList;     /// Pointers to the start of each unallocated block.
};

/// @summary The buffer owned by a single I/O slot. A growable buffer owns heap
/// storage that is resized per request. A fixed buffer borrows one block from
/// an iobuf_alloc_t for its entire lifetime; only its logical size varies.
/// Instances are neither copyable nor movable, so the storage address stays
/// stable for as long as the owning slot exists.
class io_buffer_t
{
public:
    io_buffer_t(void);
    ~io_buffer_t(void);

    io_buffer_t(io_buffer_t const &) = delete;
    io_buffer_t& operator =(io_buffer_t const &) = delete;
    io_buffer_t(io_buffer_t &&) = delete;
    io_buffer_t& operator =(io_buffer_t &&) = delete;

    /// @summary Switch the buffer to fixed mode over caller-owned storage.
    /// The buffer must be empty and not checked out.
    /// @param block The start of the storage block.
    /// @param capacity The size of the storage block, in bytes.
    void attach_fixed(void *block, size_t capacity);

    /// @summary Release fixed storage, returning the buffer to growable mode.
    /// @return The block previously passed to attach_fixed(), or NULL.
    void* detach_fixed(void);

    /// @summary Set the logical size of the buffer ahead of the next read.
    /// @param size The number of bytes the next read will request.
    /// @return true if the buffer can hold size bytes. A fixed buffer never
    /// grows; a growable buffer fails only if memory cannot be allocated.
    bool resize(size_t size);

    /// @summary Hand the buffer storage to an in-flight operation.
    /// @return The stable address of the buffer storage.
    void* checkout(void);

    /// @summary Return the buffer storage after the matching completion was observed.
    void checkin(void);

    /// @summary Retrieve the buffer contents. Not valid while checked out.
    uint8_t const* contents(void) const;

    size_t size(void) const        { return Size; }
    size_t capacity(void) const    { return Capacity; }
    bool   is_fixed(void) const    { return Fixed; }
    bool   checked_out(void) const { return CheckedOut; }

private:
    uint8_t           *Memory;       /// The buffer storage, or NULL.
    size_t             Size;         /// The logical size, in bytes.
    size_t             Capacity;     /// The number of bytes available at Memory.
    bool               Fixed;        /// true if Memory is borrowed, fixed-size storage.
    bool               CheckedOut;   /// true while an operation targets Memory.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Create a new I/O buffer allocator with the specified number of
/// blocks and minimum block size. The block size is rounded up to an even
/// multiple of the system page size, so every block is page-aligned.
/// @param alloc The I/O buffer allocator to initialize.
/// @param block_count The number of blocks to allocate.
/// @param alloc_size The minimum size of a single block, in bytes.
/// @return Zero if the allocator was initialized; otherwise, the errno value.
int  create_iobuf_allocator(iobuf_alloc_t &alloc, size_t block_count, size_t alloc_size);

/// @summary Delete an I/O buffer allocator. All memory is freed, regardless
/// of whether any I/O buffers are in use by the application.
/// @param alloc The I/O buffer allocator to delete.
void delete_iobuf_allocator(iobuf_alloc_t &alloc);

/// @summary Retrieves an I/O buffer from the pool.
/// @param alloc The I/O buffer allocator to query.
/// @return A pointer to the I/O buffer, or NULL if no buffers are available.
void* iobuf_get(iobuf_alloc_t &alloc);

/// @summary Returns an I/O buffer to the pool.
/// @param alloc The I/O buffer allocator that owns the buffer.
/// @param iobuf The address of the buffer returned by iobuf_get().
void iobuf_put(iobuf_alloc_t &alloc, void *iobuf);

/// @summary Calculate the number of buffers currently allocated.
/// @param alloc The I/O buffer allocator to query.
/// @return The number of buffers currently in-use by the application.
size_t iobuf_buffers_used(iobuf_alloc_t const &alloc);

#endif /* !defined(URINGSUM_IOBUF_H) */
