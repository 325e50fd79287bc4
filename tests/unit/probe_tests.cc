#include <errno.h>

#include <string>

#include <catch2/catch.hpp>

#include "uringsum/config.h"
#include "uringsum/error.h"
#include "uringsum/probe.h"

static strategy_t strategy_for(bool fixed_buffers)
{
    checksum_config_t config = default_checksum_config();
    config.UseFixedBuffers   = fixed_buffers;
    REQUIRE(normalize_checksum_config(config, NULL));
    return select_strategy(config);
}

TEST_CASE("capability checks", "[probe]")
{
    capabilities_t caps;
    engine_error_t error;
    caps.Probe     = true;
    caps.Read      = true;
    caps.ReadFixed = true;

    SECTION("everything supported") {
        REQUIRE(check_capabilities(caps, strategy_for(false), &error));
        REQUIRE(check_capabilities(caps, strategy_for(true), &error));
        REQUIRE(error.Kind == ERROR_KIND_NONE);
    }
    SECTION("no plain reads falls back for every strategy") {
        caps.Read = false;
        REQUIRE_FALSE(check_capabilities(caps, strategy_for(false), &error));
        REQUIRE(error.Kind == ERROR_KIND_RING_UNSUPPORTED);
        REQUIRE(error.OSError == EOPNOTSUPP);
        REQUIRE(error_kind_allows_fallback(error.Kind));
        REQUIRE_FALSE(check_capabilities(caps, strategy_for(true), &error));
        REQUIRE(error_kind_allows_fallback(error.Kind));
    }
    SECTION("no opcode probe falls back") {
        caps.Probe     = false;
        caps.Read      = false;
        caps.ReadFixed = false;
        REQUIRE_FALSE(check_capabilities(caps, strategy_for(false), &error));
        REQUIRE(error.Kind == ERROR_KIND_RING_UNSUPPORTED);
        REQUIRE(error_kind_allows_fallback(error.Kind));
    }
    SECTION("missing fixed reads only matter for fixed buffers") {
        caps.ReadFixed = false;
        REQUIRE(check_capabilities(caps, strategy_for(false), &error));
        REQUIRE_FALSE(check_capabilities(caps, strategy_for(true), &error));
        REQUIRE(error.Kind == ERROR_KIND_CAPABILITY);
        REQUIRE(std::string(error.Message).find("IORING_OP_READ_FIXED") != std::string::npos);
        REQUIRE_FALSE(error_kind_allows_fallback(error.Kind));
    }
}

TEST_CASE("only ring failures allow the synchronous fallback", "[probe][error]")
{
    REQUIRE(error_kind_allows_fallback(ERROR_KIND_RING_SETUP));
    REQUIRE(error_kind_allows_fallback(ERROR_KIND_RING_UNSUPPORTED));
    REQUIRE_FALSE(error_kind_allows_fallback(ERROR_KIND_CAPABILITY));
    REQUIRE_FALSE(error_kind_allows_fallback(ERROR_KIND_REGISTER_FILES));
    REQUIRE_FALSE(error_kind_allows_fallback(ERROR_KIND_REGISTER_BUFFERS));
    REQUIRE_FALSE(error_kind_allows_fallback(ERROR_KIND_CONFIG));
    REQUIRE_FALSE(error_kind_allows_fallback(ERROR_KIND_OPEN));
}
