#include <errno.h>
#include <stdint.h>
#include <unistd.h>

#include <algorithm>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "uringsum/config.h"
#include "uringsum/error.h"
#include "uringsum/file_read.h"
#include "test_files.h"

static uint32_t const TEST_CHUNK = 4096 * 2;

/// @summary Issue each request with pread until the read finishes or fails.
/// @param read An open read state on which file_read_begin() returned true.
/// @param short_limit If non-zero, no single transfer exceeds this many bytes.
/// @return The final read_status_e value.
static int32_t drive_reads(file_read_t &read, size_t short_limit = 0)
{
    std::vector<uint8_t> buffer(TEST_CHUNK + URINGSUM_DIO_ALIGNMENT);
    int32_t status = READ_STATUS_RESUBMIT;
    while (status == READ_STATUS_RESUBMIT)
    {
        size_t amount = read.Request.DataAmount;
        REQUIRE(amount <= buffer.size());
        if (short_limit != 0 && amount > short_limit)
            amount = short_limit;
        ssize_t n = pread(read.Fildes, buffer.data(), amount, read.Request.FileOffset);
        status = file_read_complete(read, buffer.data(), (n < 0) ? -errno : int32_t(n));
    }
    return status;
}

TEST_CASE("file read digests files of every size", "[file_read]")
{
    scratch_dir_t dir;
    size_t const sizes[] = { 0, 25, TEST_CHUNK - 1, TEST_CHUNK, TEST_CHUNK + 1, 3 * TEST_CHUNK };

    for (size_t i = 0; i < sizeof(sizes) / sizeof(sizes[0]); ++i)
    {
        std::string name = "file" + std::to_string(i);
        std::string path = dir.add_file(name.c_str(), sizes[i]);
        file_read_t read;
        uint8_t     digest[MD5_DIGEST_SIZE];
        init_file_read(read);

        REQUIRE(open_file_read(read, path.c_str(), i, TEST_CHUNK, false));
        REQUIRE(read.State == READ_STATE_CREATED);
        REQUIRE(read.FileSize == int64_t(sizes[i]));
        REQUIRE(read.Index == i);

        if (sizes[i] == 0)
        {
            REQUIRE_FALSE(file_read_begin(read, 5));
            REQUIRE(read.State == READ_STATE_FINISHED);
        }
        else
        {
            REQUIRE(file_read_begin(read, 5));
            REQUIRE(read.SlotIndex == 5);
            REQUIRE(read.Request.FileOffset == 0);
            REQUIRE(read.Request.SkipAmount == 0);
            REQUIRE(read.Request.DataAmount == std::min<size_t>(sizes[i], TEST_CHUNK));
            REQUIRE(drive_reads(read) == READ_STATUS_DONE);
            REQUIRE(read.ShortReads == 0);
        }
        REQUIRE(read.Cursor == read.FileSize);
        REQUIRE(file_read_digest(read, digest));
        REQUIRE(digest_hex(digest) == expected_md5_hex(path));
        close_file_read(read);
        REQUIRE(read.Fildes == -1);
        REQUIRE(read.State == READ_STATE_CLOSED);
    }
}

TEST_CASE("file read continues after short reads", "[file_read]")
{
    scratch_dir_t dir;
    std::string   path = dir.add_file("short", 3 * TEST_CHUNK + 77);
    file_read_t   read;
    uint8_t       digest[MD5_DIGEST_SIZE];
    init_file_read(read);

    REQUIRE(open_file_read(read, path.c_str(), 0, TEST_CHUNK, false));
    REQUIRE(file_read_begin(read, 0));
    REQUIRE(drive_reads(read, 1000) == READ_STATUS_DONE);
    REQUIRE(read.ShortReads > 0);
    REQUIRE(file_read_digest(read, digest));
    REQUIRE(digest_hex(digest) == expected_md5_hex(path));
    close_file_read(read);
}

TEST_CASE("file read aligned requests", "[file_read]")
{
    scratch_dir_t dir;
    std::string   path = dir.add_file("aligned", 3 * TEST_CHUNK + 100);
    file_read_t   read;
    uint8_t       digest[MD5_DIGEST_SIZE];
    std::vector<uint8_t> buffer(TEST_CHUNK + URINGSUM_DIO_ALIGNMENT);
    init_file_read(read);

    // the request arithmetic does not depend on O_DIRECT being honored.
    REQUIRE(open_file_read(read, path.c_str(), 0, TEST_CHUNK, false));
    read.Alignment = URINGSUM_DIO_ALIGNMENT;
    REQUIRE(file_read_begin(read, 0));
    REQUIRE(read.Request.FileOffset == 0);
    REQUIRE(read.Request.SkipAmount == 0);
    REQUIRE(read.Request.DataAmount == TEST_CHUNK);

    SECTION("a short transfer leaves an unaligned cursor") {
        ssize_t n = pread(read.Fildes, buffer.data(), 5000, 0);
        REQUIRE(n == 5000);
        REQUIRE(file_read_complete(read, buffer.data(), int32_t(n)) == READ_STATUS_RESUBMIT);
        REQUIRE(read.Cursor == 5000);
        REQUIRE(read.ShortReads == 1);
        REQUIRE(read.Request.FileOffset == 4096);
        REQUIRE(read.Request.SkipAmount == 904);
        REQUIRE(read.Request.ChunkSize == TEST_CHUNK);
        REQUIRE(read.Request.DataAmount == 12288);
    }
    SECTION("the final chunk is rounded up") {
        for (int i = 0; i < 3; ++i)
        {
            ssize_t n = pread(read.Fildes, buffer.data(), read.Request.DataAmount, read.Request.FileOffset);
            REQUIRE(file_read_complete(read, buffer.data(), int32_t(n)) == READ_STATUS_RESUBMIT);
        }
        REQUIRE(read.Request.ChunkSize == 100);
        REQUIRE(read.Request.DataAmount == URINGSUM_DIO_ALIGNMENT);
        REQUIRE(read.Request.FileOffset == int64_t(3 * TEST_CHUNK));
    }
    REQUIRE(drive_reads(read) == READ_STATUS_DONE);
    REQUIRE(file_read_digest(read, digest));
    REQUIRE(digest_hex(digest) == expected_md5_hex(path));
    close_file_read(read);
}

TEST_CASE("file read completion errors", "[file_read]")
{
    scratch_dir_t dir;
    std::string   path = dir.add_file("errors", TEST_CHUNK * 2);
    file_read_t   read;
    uint8_t       data[16] = { 0 };
    init_file_read(read);

    REQUIRE(open_file_read(read, path.c_str(), 0, TEST_CHUNK, false));
    REQUIRE(file_read_begin(read, 0));

    SECTION("interrupted reads are resubmitted unchanged") {
        read_request_t before = read.Request;
        REQUIRE(file_read_complete(read, data, -EINTR) == READ_STATUS_RESUBMIT);
        REQUIRE(file_read_complete(read, data, -EAGAIN) == READ_STATUS_RESUBMIT);
        REQUIRE(read.State == READ_STATE_AWAITING);
        REQUIRE(read.Cursor == 0);
        REQUIRE(read.Request.FileOffset == before.FileOffset);
        REQUIRE(read.Request.DataAmount == before.DataAmount);
        REQUIRE(drive_reads(read) == READ_STATUS_DONE);
    }
    SECTION("an I/O error fails the file") {
        REQUIRE(file_read_complete(read, data, -EIO) == READ_STATUS_ERROR);
        REQUIRE(read.State == READ_STATE_ERRORED);
        REQUIRE(read.ErrorKind == ERROR_KIND_READ);
        REQUIRE(read.OSError == EIO);
        REQUIRE(read.Fildes == -1);
    }
    SECTION("end-of-file before the recorded size is a truncation") {
        REQUIRE(file_read_complete(read, data, 0) == READ_STATUS_ERROR);
        REQUIRE(read.State == READ_STATE_ERRORED);
        REQUIRE(read.ErrorKind == ERROR_KIND_TRUNCATED);
        REQUIRE(read.Fildes == -1);
    }
    close_file_read(read);
    REQUIRE(read.State == READ_STATE_CLOSED);
}

TEST_CASE("file read open failures", "[file_read]")
{
    scratch_dir_t dir;
    file_read_t   read;
    init_file_read(read);

    SECTION("missing file") {
        std::string path = dir.path_of("missing");
        REQUIRE_FALSE(open_file_read(read, path.c_str(), 3, TEST_CHUNK, false));
        REQUIRE(read.State == READ_STATE_ERRORED);
        REQUIRE(read.ErrorKind == ERROR_KIND_OPEN);
        REQUIRE(read.OSError == ENOENT);
        REQUIRE(read.Fildes == -1);
        REQUIRE(read.Index == 3);
    }
    SECTION("directory") {
        REQUIRE_FALSE(open_file_read(read, dir.path().c_str(), 0, TEST_CHUNK, false));
        REQUIRE(read.State == READ_STATE_ERRORED);
        REQUIRE(read.ErrorKind == ERROR_KIND_READ);
        REQUIRE(read.OSError == EISDIR);
        REQUIRE(read.Fildes == -1);
    }
    close_file_read(read);
}
