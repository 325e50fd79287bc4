/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the entry point of the command-line checksum tool.
/// The engine runs on a worker thread; the main thread prints each result as
/// it arrives, in completion order.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <stdio.h>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>
#include <pthread.h>

#include "uringsum/bridge.h"
#include "uringsum/common.h"
#include "uringsum/log.h"
#include "uringsum/md5.h"
#include "uringsum/result_queue.h"

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary Define the process exit codes.
enum exit_code_e
{
    EXIT_CODE_SUCCESS    = 0, /// Every file was checksummed.
    EXIT_CODE_FILE_ERROR = 1, /// At least one file produced an error result.
    EXIT_CODE_FATAL      = 2  /// Invalid usage, or the run could not start.
};

/// @summary Define identifiers for the long-only command-line options.
enum option_id_e
{
    OPTION_PREREGISTER_FILES = 256,
    OPTION_USE_FIXED_BUFFERS,
    OPTION_DIRECT_IO,
    OPTION_NO_URING,
    OPTION_NO_FALLBACK,
    OPTION_SLOTS,
    OPTION_CHUNK_SIZE
};

/*///////////////////
//   Local Types   //
///////////////////*/
/// @summary The state shared between the main thread and the engine thread.
struct engine_job_t
{
    char const * const *Paths;       /// The input paths, from argv.
    size_t              PathCount;   /// The number of input paths.
    checksum_config_t   Config;      /// The requested configuration.
    result_queue_t     *Results;     /// The queue the engine writes to.
    engine_stats_t      Stats;       /// The run counters, set by the engine thread.
    engine_error_t      Error;       /// The fatal error, set by the engine thread.
    int                 Result;      /// The checksum_files() return value.
};

/*///////////////
//   Globals   //
///////////////*/
global_variable struct option const LONG_OPTIONS[] = {
    { "preregister-files", no_argument      , NULL, OPTION_PREREGISTER_FILES },
    { "use-fixed-buffers", no_argument      , NULL, OPTION_USE_FIXED_BUFFERS },
    { "direct-io"        , no_argument      , NULL, OPTION_DIRECT_IO         },
    { "no-uring"         , no_argument      , NULL, OPTION_NO_URING          },
    { "no-fallback"      , no_argument      , NULL, OPTION_NO_FALLBACK       },
    { "slots"            , required_argument, NULL, OPTION_SLOTS             },
    { "chunk-size"       , required_argument, NULL, OPTION_CHUNK_SIZE        },
    { "verbose"          , no_argument      , NULL, 'v'                      },
    { "help"             , no_argument      , NULL, 'h'                      },
    { NULL               , 0                , NULL, 0                        }
};

/*///////////////////////
//   Local Functions   //
///////////////////////*/
/// @summary Print the command-line usage summary.
/// @param fp The destination stream.
/// @param name The program name.
internal_function void print_usage(FILE *fp, char const *name)
{
    fprintf(fp, "USAGE: %s [options] FILE...\n", name);
    fprintf(fp, "Print the MD5 checksum of each FILE, in completion order.\n\n");
    fprintf(fp, "  --preregister-files  Register each open file with io_uring before reading.\n");
    fprintf(fp, "  --use-fixed-buffers  Read into buffers registered with io_uring (implies\n");
    fprintf(fp, "                       --preregister-files).\n");
    fprintf(fp, "  --direct-io          Bypass the page cache (requires one of the above, or\n");
    fprintf(fp, "                       --no-uring).\n");
    fprintf(fp, "  --no-uring           Compute checksums without io_uring.\n");
    fprintf(fp, "  --no-fallback        Fail instead of reading synchronously if io_uring is\n");
    fprintf(fp, "                       unavailable.\n");
    fprintf(fp, "  --slots N            Files read concurrently (default %u).\n", unsigned(URINGSUM_SLOT_COUNT));
    fprintf(fp, "  --chunk-size BYTES   Bytes per read, a multiple of %u (default %u).\n",
        unsigned(URINGSUM_DIO_ALIGNMENT), unsigned(URINGSUM_MAX_CHUNK));
    fprintf(fp, "  -v, --verbose        Increase diagnostic output; repeatable.\n");
    fprintf(fp, "  -h, --help           Show this message.\n\n");
    fprintf(fp, "The %s environment variable sets the initial diagnostic level\n", URINGSUM_LOG_ENV);
    fprintf(fp, "(error, warn, info, debug or trace).\n");
}

/// @summary Parse an unsigned 32-bit command-line value.
/// @param str The NULL-terminated option argument.
/// @param value On return, receives the parsed value.
/// @return true if str is a complete decimal number that fits in 32 bits.
internal_function bool parse_uint32(char const *str, uint32_t &value)
{
    char *end = NULL;
    errno = 0;
    unsigned long long v = strtoull(str, &end, 10);
    if (errno != 0 || end == str || *end != '\0' || str[0] == '-' || v > 0xFFFFFFFFULL)
        return false;
    value = uint32_t(v);
    return true;
}

/// @summary Entry point of the engine worker thread.
/// @param argp Pointer to the engine_job_t.
/// @return NULL.
internal_function void* engine_thread_main(void *argp)
{
    engine_job_t *job = (engine_job_t*) argp;
    job->Result = checksum_files(job->Paths, job->PathCount, job->Config, job->Results, &job->Stats, &job->Error);
    return NULL;
}

/// @summary Print results as they arrive until the engine closes the queue.
/// @param results The queue to drain.
/// @param failures On return, receives the number of error results.
/// @return The number of results printed.
internal_function size_t print_results(result_queue_t *results, size_t &failures)
{
    checksum_result_t item;
    size_t            count = 0;
    failures = 0;
    while (result_queue_wait(results, item))
    {
        if (item.Kind == ERROR_KIND_NONE)
        {
            char hex[MD5_HEX_SIZE];
            fprintf(stdout, "%s  %s\n", md5_format_hex(item.Digest, hex), item.Path);
        }
        else
        {
            char cause[URINGSUM_MAX_ERROR_MESSAGE];
            fflush(stdout);
            fprintf(stderr, "%s: %s\n", item.Path, format_error(item.Kind, item.OSError, cause, sizeof(cause)));
            failures++;
        }
        free_checksum_result(item);
        count++;
    }
    return count;
}

/*////////////////////////
//   Public Functions   //
////////////////////////*/
/// @summary Entry point of the application.
/// @param argc The number of command-line arguments.
/// @param argv An array of NULL-terminated strings specifying command-line arguments.
/// @return One of exit_code_e.
int main(int argc, char **argv)
{
    checksum_config_t config   = default_checksum_config();
    result_queue_t    results;
    engine_job_t      job;
    pthread_t         worker;
    size_t            failures = 0;
    int32_t           level    = 0;
    int               opt      = 0;
    int               ret      = 0;

    log_init_from_env();
    level = log_get_level();
    config.AllowFallback = true;

    while ((opt = getopt_long(argc, argv, "vh", LONG_OPTIONS, NULL)) != -1)
    {
        switch (opt)
        {
            case OPTION_PREREGISTER_FILES:
                config.UseRegisteredFiles = true;
                break;
            case OPTION_USE_FIXED_BUFFERS:
                config.UseFixedBuffers = true;
                break;
            case OPTION_DIRECT_IO:
                config.UseDirectIO = true;
                break;
            case OPTION_NO_URING:
                config.DisableUring = true;
                break;
            case OPTION_NO_FALLBACK:
                config.AllowFallback = false;
                break;
            case OPTION_SLOTS:
                if (parse_uint32(optarg, config.SlotCount) == false)
                {
                    fprintf(stderr, "ERROR: Invalid slot count \'%s\'.\n", optarg);
                    return EXIT_CODE_FATAL;
                }
                break;
            case OPTION_CHUNK_SIZE:
                if (parse_uint32(optarg, config.MaxChunkSize) == false)
                {
                    fprintf(stderr, "ERROR: Invalid chunk size \'%s\'.\n", optarg);
                    return EXIT_CODE_FATAL;
                }
                break;
            case 'v':
                log_set_level(++level);
                break;
            case 'h':
                print_usage(stdout, argv[0]);
                return EXIT_CODE_SUCCESS;
            default:
                print_usage(stderr, argv[0]);
                return EXIT_CODE_FATAL;
        }
    }
    if (config.DisableUring && (config.UseRegisteredFiles || config.UseFixedBuffers))
    {
        fprintf(stderr, "ERROR: --no-uring cannot be combined with --preregister-files or --use-fixed-buffers.\n");
        return EXIT_CODE_FATAL;
    }
    if (normalize_checksum_config(config, &job.Error) == false)
    {
        fprintf(stderr, "ERROR: %s.\n", job.Error.Message);
        return EXIT_CODE_FATAL;
    }
    if ((ret = create_result_queue(&results)) != 0)
    {
        fprintf(stderr, "ERROR: Unable to create the result queue: %s.\n", strerror(ret));
        return EXIT_CODE_FATAL;
    }

    job.Paths     = argv + optind;
    job.PathCount = size_t(argc - optind);
    job.Config    = config;
    job.Results   = &results;
    job.Result    = 0;
    memset(&job.Stats, 0, sizeof(job.Stats));
    clear_engine_error(&job.Error);

    if ((ret = pthread_create(&worker, NULL, engine_thread_main, &job)) != 0)
    {
        fprintf(stderr, "ERROR: Unable to start the engine thread: %s.\n", strerror(ret));
        delete_result_queue(&results);
        return EXIT_CODE_FATAL;
    }
    print_results(&results, failures);
    pthread_join(worker, NULL);
    delete_result_queue(&results);
    fflush(stdout);

    if (job.Result != 0)
    {
        fprintf(stderr, "ERROR: %s.\n", job.Error.Message);
        return EXIT_CODE_FATAL;
    }
    log_info("%zu files in %.3f ms (%llu bytes, %llu reads, peak %u slots%s).",
        job.Stats.FilesOk + job.Stats.FilesFailed, double(job.Stats.ElapsedNanos) / 1000000.0,
        (unsigned long long) job.Stats.BytesRead, (unsigned long long) job.Stats.ReadsIssued,
        job.Stats.PeakOccupied, job.Stats.UsedFallback ? ", synchronous" : "");
    return (failures > 0) ? EXIT_CODE_FILE_ERROR : EXIT_CODE_SUCCESS;
}
