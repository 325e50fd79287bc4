/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements engine selection. The ring engine is preferred; the
/// synchronous engine runs when the ring is disabled, or when it cannot be
/// created or cannot read files and the caller allows the fallback.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <string.h>

#include "uringsum/common.h"
#include "uringsum/bridge.h"
#include "uringsum/log.h"
#include "uringsum/result_queue.h"
#include "uringsum/sync_engine.h"
#include "uringsum/uring_engine.h"

/*////////////////////////
//   Public Functions   //
////////////////////////*/
checksum_engine_fn select_checksum_engine(checksum_config_t const &config)
{
    return config.DisableUring ? checksum_files_sync : checksum_files_uring;
}

int checksum_files(char const * const *paths, size_t path_count, checksum_config_t const &config, result_queue_t *results, engine_stats_t *stats, engine_error_t *error)
{
    checksum_config_t  run_config = config;
    checksum_engine_fn engine     = NULL;
    engine_error_t     local;
    int                result     = 0;

    if (error == NULL)
    {   // the fallback decision needs the error kind.
        error = &local;
    }
    if (normalize_checksum_config(run_config, error) == false)
    {
        log_error("%s", error->Message);
        result_queue_close(results);
        return EINVAL;
    }

    engine = select_checksum_engine(run_config);
    result = engine(paths, path_count, run_config, results, stats, error);
    if (result != 0 && error_kind_allows_fallback(error->Kind) && run_config.AllowFallback && engine != checksum_files_sync)
    {   // no files were processed, so the synchronous engine can start over.
        log_warn("io_uring is unavailable (%s); using synchronous reads.", strerror(result));
        run_config.UseRegisteredFiles = false;
        run_config.UseFixedBuffers    = false;
        result = checksum_files_sync(paths, path_count, run_config, results, stats, error);
    }
    result_queue_close(results);
    return result;
}
