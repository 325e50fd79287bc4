/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the one-way channel that carries per-file results from an
/// engine to the consumer. The queue is unbounded, accepts results from any
/// number of producer threads and is drained by a single consumer, which may
/// block until a result arrives or the producer closes the queue.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_RESULT_QUEUE_H
#define URINGSUM_RESULT_QUEUE_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>
#include <pthread.h>

#include "uringsum/bridge.h"

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary An unbounded multi-producer, single-consumer queue of results.
/// Head always points at a dummy node; the first queued item is Head->Next.
/// Retired nodes are recycled through FreeList. DO NOT DIRECTLY ACCESS THE
/// FIELDS OF THIS STRUCTURE.
struct result_queue_t
{
    pthread_mutex_t    Lock;         /// Mutex protecting every other field.
    pthread_cond_t     Ready;        /// Signaled when an item is queued or the queue closes.
    checksum_result_t *Head;         /// The current front-of-queue (dummy node).
    checksum_result_t *Tail;         /// The current end-of-queue.
    checksum_result_t *FreeList;     /// Recycled nodes.
    size_t             Count;        /// The number of items waiting in the queue.
    size_t             Total;        /// The number of items ever queued.
    bool               Closed;       /// true once the producer has finished.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Initialize an empty, open result queue.
/// @param queue The queue to initialize.
/// @return Zero if the queue was initialized; otherwise, the errno value.
int  create_result_queue(result_queue_t *queue);

/// @summary Free all nodes, including any results never retrieved.
/// @param queue The queue to delete.
void delete_result_queue(result_queue_t *queue);

/// @summary Append a result for one path. The path string is copied.
/// @param queue The destination queue.
/// @param path The NULL-terminated input path.
/// @param index The zero-based position of the path in the input list.
/// @param kind One of error_kind_e; ERROR_KIND_NONE for success.
/// @param oserror The errno value for a failure, or 0.
/// @param digest The URINGSUM_DIGEST_SIZE byte digest, or NULL for a failure.
/// @return true if the result was queued, false if memory could not be
/// allocated or the queue is already closed.
bool result_queue_put(result_queue_t *queue, char const *path, size_t index, int32_t kind, int oserror, uint8_t const *digest);

/// @summary Retrieve the next result without blocking.
/// @param queue The source queue.
/// @param item On return, receives the result. Release with free_checksum_result().
/// @return true if a result was retrieved.
bool result_queue_try_get(result_queue_t *queue, checksum_result_t &item);

/// @summary Retrieve the next result, blocking until one is available or the
/// queue is closed and empty.
/// @param queue The source queue.
/// @param item On return, receives the result. Release with free_checksum_result().
/// @return true if a result was retrieved, false at end-of-stream.
bool result_queue_wait(result_queue_t *queue, checksum_result_t &item);

/// @summary Mark the end of the stream and wake any waiting consumer.
/// @param queue The queue to close.
void result_queue_close(result_queue_t *queue);

/// @summary Retrieve the number of results ever queued.
size_t result_queue_total(result_queue_t *queue);

/// @summary Release the storage owned by a retrieved result.
/// @param item The result returned by result_queue_try_get() or result_queue_wait().
void free_checksum_result(checksum_result_t &item);

#endif /* !defined(URINGSUM_RESULT_QUEUE_H) */
