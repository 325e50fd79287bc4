/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the unbounded result queue connecting an engine to its
/// consumer. Nodes are recycled through a free list; the queue always holds a
/// dummy node at Head, so producers only touch Tail.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <pthread.h>

#include "uringsum/common.h"
#include "uringsum/result_queue.h"

/*///////////////////////
//   Local Functions   //
///////////////////////*/
/// @summary Allocates a node from the free list. If the free list is empty, a
/// new node is allocated on the heap. The queue lock must be held.
/// @param queue The queue owning the free list.
/// @return The allocated, uninitialized node or NULL.
internal_function checksum_result_t* result_node_get(result_queue_t *queue)
{
    checksum_result_t *node = queue->FreeList;
    if (node != NULL)
    {   // pop the node at the front of the list.
        queue->FreeList = node->Next;
        return node;
    }
    return (checksum_result_t*) malloc(sizeof(checksum_result_t));
}

/// @summary Returns a node to the free list. The queue lock must be held.
/// @param queue The queue owning the free list.
/// @param node The node to return.
internal_function void result_node_put(result_queue_t *queue, checksum_result_t *node)
{
    node->Path      = NULL;
    node->Next      = queue->FreeList;
    queue->FreeList = node;
}

/// @summary Pops the front item. The queue lock must be held and Count must
/// be non-zero.
/// @param queue The queue to update.
/// @param item On return, receives the item. Ownership of Path moves to item.
internal_function void result_queue_pop(result_queue_t *queue, checksum_result_t &item)
{
    checksum_result_t *old_head = queue->Head;       // never NULL (dummy node)
    checksum_result_t *new_head = queue->Head->Next; // the item being popped
    item        = *new_head; // copy the node contents for the caller
    item.Next   = NULL;
    new_head->Path = NULL;   // new_head becomes the dummy node
    queue->Head = new_head;
    queue->Count--;
    result_node_put(queue, old_head);
}

/*////////////////////////
//   Public Functions   //
////////////////////////*/
int create_result_queue(result_queue_t *queue)
{
    int result = 0;
    if ((result = pthread_mutex_init(&queue->Lock, NULL)) != 0)
    {
        return result;
    }
    if ((result = pthread_cond_init(&queue->Ready, NULL)) != 0)
    {
        pthread_mutex_destroy(&queue->Lock);
        return result;
    }
    queue->FreeList = NULL;
    queue->Head     = (checksum_result_t*) malloc(sizeof(checksum_result_t));
    if (queue->Head == NULL)
    {
        pthread_cond_destroy (&queue->Ready);
        pthread_mutex_destroy(&queue->Lock);
        return ENOMEM;
    }
    memset(queue->Head, 0, sizeof(checksum_result_t));
    queue->Tail   = queue->Head;
    queue->Count  = 0;
    queue->Total  = 0;
    queue->Closed = false;
    return 0;
}

void delete_result_queue(result_queue_t *queue)
{
    checksum_result_t *iter = NULL;
    if (queue->Head == NULL)
        return;

    // the dummy node never owns a path; queued items do.
    iter = queue->Head->Next;
    free(queue->Head);
    while (iter != NULL)
    {
        checksum_result_t *node = iter;
        iter = iter->Next;
        free(node->Path);
        free(node);
    }
    iter = queue->FreeList;
    while (iter != NULL)
    {
        checksum_result_t *node = iter;
        iter = iter->Next;
        free(node);
    }
    pthread_cond_destroy (&queue->Ready);
    pthread_mutex_destroy(&queue->Lock);
    queue->Head     = NULL;
    queue->Tail     = NULL;
    queue->FreeList = NULL;
    queue->Count    = 0;
}

bool result_queue_put(result_queue_t *queue, char const *path, size_t index, int32_t kind, int oserror, uint8_t const *digest)
{
    char *path_copy = strdup(path != NULL ? path : "");
    if (path_copy == NULL)
        return false;

    pthread_mutex_lock(&queue->Lock);
    checksum_result_t *node = queue->Closed ? NULL : result_node_get(queue);
    if (node == NULL)
    {
        pthread_mutex_unlock(&queue->Lock);
        free(path_copy);
        return false;
    }
    node->Next    = NULL;
    node->Path    = path_copy;
    node->Index   = index;
    node->Kind    = kind;
    node->OSError = oserror;
    if (digest != NULL) memcpy(node->Digest, digest, URINGSUM_DIGEST_SIZE);
    else memset(node->Digest, 0, URINGSUM_DIGEST_SIZE);
    queue->Tail->Next = node;
    queue->Tail       = node;
    queue->Count++;
    queue->Total++;
    pthread_cond_signal  (&queue->Ready);
    pthread_mutex_unlock(&queue->Lock);
    return true;
}

bool result_queue_try_get(result_queue_t *queue, checksum_result_t &item)
{
    bool result = false;
    pthread_mutex_lock(&queue->Lock);
    if (queue->Count > 0)
    {
        result_queue_pop(queue, item);
        result = true;
    }
    pthread_mutex_unlock(&queue->Lock);
    return result;
}

bool result_queue_wait(result_queue_t *queue, checksum_result_t &item)
{
    bool result = false;
    pthread_mutex_lock(&queue->Lock);
    while (queue->Count == 0 && queue->Closed == false)
    {
        pthread_cond_wait(&queue->Ready, &queue->Lock);
    }
    if (queue->Count > 0)
    {   // items queued before the close are still delivered.
        result_queue_pop(queue, item);
        result = true;
    }
    pthread_mutex_unlock(&queue->Lock);
    return result;
}

void result_queue_close(result_queue_t *queue)
{
    pthread_mutex_lock(&queue->Lock);
    queue->Closed = true;
    pthread_cond_broadcast(&queue->Ready);
    pthread_mutex_unlock(&queue->Lock);
}

size_t result_queue_total(result_queue_t *queue)
{
    size_t total = 0;
    pthread_mutex_lock(&queue->Lock);
    total = queue->Total;
    pthread_mutex_unlock(&queue->Lock);
    return total;
}

void free_checksum_result(checksum_result_t &item)
{
    free(item.Path);
    item.Path = NULL;
}
