#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include <catch2/catch.hpp>

#include "uringsum/config.h"
#include "uringsum/error.h"
#include "uringsum/log.h"

TEST_CASE("default configuration", "[config]")
{
    checksum_config_t config = default_checksum_config();
    engine_error_t    error;
    REQUIRE(config.SlotCount == 16);
    REQUIRE(config.MaxChunkSize == 4096 * 16);
    REQUIRE_FALSE(config.UseRegisteredFiles);
    REQUIRE_FALSE(config.UseFixedBuffers);
    REQUIRE(normalize_checksum_config(config, &error));
    REQUIRE(error.Kind == ERROR_KIND_NONE);
    REQUIRE(select_strategy(config).BufferMode == BUFFER_MODE_ADHOC);
}

TEST_CASE("configuration validation", "[config]")
{
    checksum_config_t config = default_checksum_config();
    engine_error_t    error;

    SECTION("fixed buffers imply registered files") {
        config.UseFixedBuffers = true;
        REQUIRE(normalize_checksum_config(config, &error));
        REQUIRE(config.UseRegisteredFiles);
        strategy_t s = select_strategy(config);
        REQUIRE(s.BufferMode == BUFFER_MODE_REGISTERED);
        REQUIRE(s.RegisterFiles);
    }
    SECTION("registered files use pinned buffers") {
        config.UseRegisteredFiles = true;
        REQUIRE(normalize_checksum_config(config, &error));
        strategy_t s = select_strategy(config);
        REQUIRE(s.BufferMode == BUFFER_MODE_PINNED);
        REQUIRE(s.RegisterFiles);
    }
    SECTION("slot count bounds") {
        config.SlotCount = 0;
        REQUIRE_FALSE(normalize_checksum_config(config, &error));
        REQUIRE(error.Kind == ERROR_KIND_CONFIG);
        config.SlotCount = URINGSUM_MAX_SLOT_COUNT + 1;
        REQUIRE_FALSE(normalize_checksum_config(config, &error));
        config.SlotCount = 1;
        REQUIRE(normalize_checksum_config(config, &error));
    }
    SECTION("chunk size must be a positive multiple of the alignment") {
        config.MaxChunkSize = 0;
        REQUIRE_FALSE(normalize_checksum_config(config, &error));
        config.MaxChunkSize = 4097;
        REQUIRE_FALSE(normalize_checksum_config(config, &error));
        REQUIRE(error.Kind == ERROR_KIND_CONFIG);
        config.MaxChunkSize = 4096;
        REQUIRE(normalize_checksum_config(config, &error));
    }
    SECTION("direct I/O needs aligned buffers") {
        config.UseDirectIO = true;
        REQUIRE_FALSE(normalize_checksum_config(config, &error));
        config.UseRegisteredFiles = true;
        REQUIRE(normalize_checksum_config(config, &error));
        REQUIRE(select_strategy(config).DirectIO);
    }
    SECTION("synchronous mode rejects ring-only features") {
        config.DisableUring = true;
        config.UseDirectIO  = true;
        REQUIRE(normalize_checksum_config(config, &error));
        config.UseFixedBuffers = true;
        REQUIRE_FALSE(normalize_checksum_config(config, &error));
        REQUIRE(error.Kind == ERROR_KIND_CONFIG);
    }
}

TEST_CASE("error formatting", "[config][error]")
{
    char buf[URINGSUM_MAX_ERROR_MESSAGE];
    REQUIRE(error_kind_is_per_file(ERROR_KIND_OPEN));
    REQUIRE(error_kind_is_per_file(ERROR_KIND_TRUNCATED));
    REQUIRE_FALSE(error_kind_is_per_file(ERROR_KIND_RING_SETUP));
    REQUIRE_FALSE(error_kind_is_per_file(ERROR_KIND_NONE));
    REQUIRE(std::string(error_kind_name(-1)) == "unknown error");

    std::string msg = format_error(ERROR_KIND_OPEN, ENOENT, buf, sizeof(buf));
    REQUIRE(msg.find(error_kind_name(ERROR_KIND_OPEN)) == 0);
    REQUIRE(msg.find(strerror(ENOENT)) != std::string::npos);

    engine_error_t error;
    REQUIRE(set_engine_error(&error, ERROR_KIND_CONFIG, 0, "bad %d", 7) == EINVAL);
    REQUIRE(std::string(error.Message) == "bad 7");
    REQUIRE(set_engine_error(&error, ERROR_KIND_RING_SETUP, ENOSYS, "x") == ENOSYS);
    REQUIRE(error.Kind == ERROR_KIND_RING_SETUP);
}

TEST_CASE("log level parsing", "[config][log]")
{
    int32_t level = -1;
    REQUIRE(log_parse_level("debug", level));
    REQUIRE(level == LOG_LEVEL_DEBUG);
    REQUIRE(log_parse_level("WARN", level));
    REQUIRE(level == LOG_LEVEL_WARN);
    REQUIRE(log_parse_level("4", level));
    REQUIRE(level == LOG_LEVEL_TRACE);
    REQUIRE_FALSE(log_parse_level("5", level));
    REQUIRE_FALSE(log_parse_level("loud", level));
    REQUIRE_FALSE(log_parse_level("", level));

    int32_t saved = log_get_level();
    log_set_level(99);
    REQUIRE(log_get_level() == LOG_LEVEL_TRACE);
    REQUIRE(log_enabled(LOG_LEVEL_DEBUG));
    log_set_level(LOG_LEVEL_ERROR);
    REQUIRE_FALSE(log_enabled(LOG_LEVEL_WARN));
    log_set_level(saved);
}

TEST_CASE("log functions write enabled levels only", "[config][log]")
{
    char   templ[] = "/tmp/uringsum-log-XXXXXX";
    int    fd      = mkstemp(templ);
    REQUIRE(fd != -1);
    int    saved_fd    = dup(STDERR_FILENO);
    int32_t saved_level = log_get_level();
    REQUIRE(saved_fd != -1);

    fflush(stderr);
    REQUIRE(dup2(fd, STDERR_FILENO) != -1);
    log_set_level(LOG_LEVEL_WARN);
    log_warn("slot %u of %d", 3U, 16);
    log_debug("hidden %d", 1);
    log_error("ring failed");
    fflush(stderr);
    REQUIRE(dup2(saved_fd, STDERR_FILENO) != -1);
    close(saved_fd);
    log_set_level(saved_level);

    char    text[256] = { 0 };
    ssize_t n = pread(fd, text, sizeof(text) - 1, 0);
    close(fd);
    unlink(templ);
    REQUIRE(n > 0);
    REQUIRE(std::string(text) == "WARN: slot 3 of 16\nERROR: ring failed\n");
}
