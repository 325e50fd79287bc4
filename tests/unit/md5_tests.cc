#include <string.h>

#include <algorithm>
#include <utility>

#include <catch2/catch.hpp>

#include "uringsum/md5.h"
#include "test_files.h"

TEST_CASE("md5 of known inputs", "[md5]")
{
    uint8_t digest[MD5_DIGEST_SIZE];

    SECTION("empty stream") {
        md5_accumulator_t md5;
        REQUIRE(md5.is_open());
        REQUIRE(md5.finalize(digest));
        REQUIRE(digest_hex(digest) == "d41d8cd98f00b204e9800998ecf8427e");
        REQUIRE_FALSE(md5.is_open());
    }
    SECTION("abc") {
        REQUIRE(md5_buffer("abc", 3, digest));
        REQUIRE(digest_hex(digest) == "900150983cd24fb0d6963f7d28e17f72");
    }
    SECTION("pangram") {
        char const *text = "The quick brown fox jumps over the lazy dog";
        REQUIRE(md5_buffer(text, strlen(text), digest));
        REQUIRE(digest_hex(digest) == "9e107d9d372bb6826bd81d3542a419d6");
    }
}

TEST_CASE("md5 does not depend on how the stream is split", "[md5]")
{
    std::vector<uint8_t> data = pattern_bytes(100000, 7);
    uint8_t whole[MD5_DIGEST_SIZE];
    REQUIRE(md5_buffer(data.data(), data.size(), whole));

    size_t const splits[] = { 1, 63, 64, 4095, 4096, 65536 };
    for (size_t s = 0; s < sizeof(splits) / sizeof(splits[0]); ++s)
    {
        md5_accumulator_t md5;
        uint8_t parts[MD5_DIGEST_SIZE];
        for (size_t offset = 0; offset < data.size(); offset += splits[s])
        {
            size_t n = std::min(splits[s], data.size() - offset);
            REQUIRE(md5.update(data.data() + offset, n));
        }
        REQUIRE(md5.finalize(parts));
        REQUIRE(memcmp(whole, parts, MD5_DIGEST_SIZE) == 0);
    }
}

TEST_CASE("md5 accumulator lifecycle", "[md5]")
{
    uint8_t digest[MD5_DIGEST_SIZE];
    md5_accumulator_t md5;

    REQUIRE(md5.update("abc", 3));
    REQUIRE(md5.finalize(digest));
    REQUIRE_FALSE(md5.update("x", 1));
    REQUIRE_FALSE(md5.finalize(digest));

    REQUIRE(md5.reset());
    REQUIRE(md5.update(NULL, 0));
    REQUIRE(md5.finalize(digest));
    REQUIRE(digest_hex(digest) == "d41d8cd98f00b204e9800998ecf8427e");

    SECTION("moved-from accumulator can be reset") {
        md5_accumulator_t other(std::move(md5));
        REQUIRE_FALSE(md5.is_open());
        REQUIRE(md5.reset());
        REQUIRE(md5.update("abc", 3));
        REQUIRE(md5.finalize(digest));
        REQUIRE(digest_hex(digest) == "900150983cd24fb0d6963f7d28e17f72");
    }
}
