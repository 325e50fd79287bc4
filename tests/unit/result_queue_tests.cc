#include <errno.h>
#include <pthread.h>
#include <stdio.h>
#include <string.h>

#include <set>
#include <string>

#include <catch2/catch.hpp>

#include "uringsum/bridge.h"
#include "uringsum/error.h"
#include "uringsum/result_queue.h"

static size_t const PRODUCER_COUNT = 1000;

static void* producer_main(void *argp)
{
    result_queue_t *queue = (result_queue_t*) argp;
    uint8_t digest[URINGSUM_DIGEST_SIZE];
    for (size_t i = 0; i < PRODUCER_COUNT; ++i)
    {
        char path[32];
        snprintf(path, sizeof(path), "file-%zu", i);
        memset(digest, int(i & 0xFF), sizeof(digest));
        result_queue_put(queue, path, i, ERROR_KIND_NONE, 0, digest);
    }
    result_queue_close(queue);
    return NULL;
}

TEST_CASE("result queue preserves results", "[result_queue]")
{
    result_queue_t    queue;
    checksum_result_t item;
    uint8_t           digest[URINGSUM_DIGEST_SIZE];
    memset(digest, 0x5A, sizeof(digest));
    REQUIRE(create_result_queue(&queue) == 0);
    REQUIRE_FALSE(result_queue_try_get(&queue, item));

    char path[] = "a/b";
    REQUIRE(result_queue_put(&queue, path, 0, ERROR_KIND_NONE, 0, digest));
    REQUIRE(result_queue_put(&queue, "missing", 1, ERROR_KIND_OPEN, ENOENT, NULL));
    path[0] = 'z';
    REQUIRE(result_queue_total(&queue) == 2);

    REQUIRE(result_queue_try_get(&queue, item));
    REQUIRE(std::string(item.Path) == "a/b");
    REQUIRE(item.Index == 0);
    REQUIRE(item.Kind == ERROR_KIND_NONE);
    REQUIRE(memcmp(item.Digest, digest, sizeof(digest)) == 0);
    free_checksum_result(item);

    REQUIRE(result_queue_try_get(&queue, item));
    REQUIRE(std::string(item.Path) == "missing");
    REQUIRE(item.Kind == ERROR_KIND_OPEN);
    REQUIRE(item.OSError == ENOENT);
    free_checksum_result(item);

    SECTION("a closed queue drains and then ends") {
        REQUIRE(result_queue_put(&queue, "last", 2, ERROR_KIND_NONE, 0, digest));
        result_queue_close(&queue);
        REQUIRE_FALSE(result_queue_put(&queue, "late", 3, ERROR_KIND_NONE, 0, digest));
        REQUIRE(result_queue_wait(&queue, item));
        REQUIRE(item.Index == 2);
        free_checksum_result(item);
        REQUIRE_FALSE(result_queue_wait(&queue, item));
        REQUIRE(result_queue_total(&queue) == 3);
    }
    SECTION("pending results are freed with the queue") {
        REQUIRE(result_queue_put(&queue, "pending", 2, ERROR_KIND_READ, EIO, NULL));
    }
    delete_result_queue(&queue);
}

TEST_CASE("result queue hands results across threads", "[result_queue]")
{
    result_queue_t    queue;
    checksum_result_t item;
    pthread_t         producer;
    std::set<size_t>  seen;
    REQUIRE(create_result_queue(&queue) == 0);
    REQUIRE(pthread_create(&producer, NULL, producer_main, &queue) == 0);

    while (result_queue_wait(&queue, item))
    {
        char expected[32];
        snprintf(expected, sizeof(expected), "file-%zu", item.Index);
        REQUIRE(std::string(item.Path) == expected);
        REQUIRE(item.Digest[0] == uint8_t(item.Index & 0xFF));
        REQUIRE(seen.insert(item.Index).second);
        free_checksum_result(item);
    }
    REQUIRE(pthread_join(producer, NULL) == 0);
    REQUIRE(seen.size() == PRODUCER_COUNT);
    REQUIRE(result_queue_total(&queue) == PRODUCER_COUNT);
    delete_result_queue(&queue);
}
