/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements configuration defaults, validation and strategy selection.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include "uringsum/common.h"
#include "uringsum/config.h"

/*////////////////////////
//   Public Functions   //
////////////////////////*/
checksum_config_t default_checksum_config(void)
{
    checksum_config_t config;
    config.SlotCount          = URINGSUM_SLOT_COUNT;
    config.MaxChunkSize       = URINGSUM_MAX_CHUNK;
    config.UseRegisteredFiles = false;
    config.UseFixedBuffers    = false;
    config.UseDirectIO        = false;
    config.DisableUring       = false;
    config.AllowFallback      = false;
    return config;
}

bool normalize_checksum_config(checksum_config_t &config, engine_error_t *error)
{
    if (config.UseFixedBuffers)
    {   // buffer registration is only used together with the file table.
        config.UseRegisteredFiles = true;
    }
    if (config.SlotCount == 0 || config.SlotCount > URINGSUM_MAX_SLOT_COUNT)
    {
        set_engine_error(error, ERROR_KIND_CONFIG, 0, "slot count %u is outside [1, %u]",
            config.SlotCount, unsigned(URINGSUM_MAX_SLOT_COUNT));
        return false;
    }
    if (config.MaxChunkSize == 0 || config.MaxChunkSize > URINGSUM_MAX_CHUNK_LIMIT ||
       (config.MaxChunkSize % URINGSUM_DIO_ALIGNMENT) != 0)
    {
        set_engine_error(error, ERROR_KIND_CONFIG, 0, "chunk size %u must be a non-zero multiple of %u no larger than %u",
            config.MaxChunkSize, unsigned(URINGSUM_DIO_ALIGNMENT), unsigned(URINGSUM_MAX_CHUNK_LIMIT));
        return false;
    }
    if (config.DisableUring && config.UseRegisteredFiles)
    {
        set_engine_error(error, ERROR_KIND_CONFIG, 0, "registered files and fixed buffers require io_uring");
        return false;
    }
    if (config.UseDirectIO && config.DisableUring == false && config.UseRegisteredFiles == false)
    {   // ad hoc heap buffers do not meet the direct I/O alignment.
        set_engine_error(error, ERROR_KIND_CONFIG, 0, "direct I/O requires registered files or fixed buffers");
        return false;
    }
    clear_engine_error(error);
    return true;
}

strategy_t select_strategy(checksum_config_t const &config)
{
    strategy_t strategy;
    if (config.UseFixedBuffers)
        strategy.BufferMode = BUFFER_MODE_REGISTERED;
    else if (config.UseRegisteredFiles)
        strategy.BufferMode = BUFFER_MODE_PINNED;
    else
        strategy.BufferMode = BUFFER_MODE_ADHOC;
    strategy.RegisterFiles  = config.UseRegisteredFiles || config.UseFixedBuffers;
    strategy.DirectIO       = config.UseDirectIO;
    return strategy;
}

char const* buffer_mode_name(int32_t mode)
{
    switch (mode)
    {
        case BUFFER_MODE_ADHOC:
            return "ad hoc";
        case BUFFER_MODE_PINNED:
            return "pinned";
        case BUFFER_MODE_REGISTERED:
            return "registered";
        default:
            break;
    }
    return "unknown";
}
