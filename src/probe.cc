/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the io_uring operation probe.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <errno.h>
#include <liburing.h>

#include "uringsum/common.h"
#include "uringsum/log.h"
#include "uringsum/probe.h"

/*////////////////////////
//   Public Functions   //
////////////////////////*/
void probe_capabilities(struct io_uring *ring, capabilities_t &caps)
{
    struct io_uring_probe *probe = io_uring_get_probe_ring(ring);
    caps.Probe     = false;
    caps.Read      = false;
    caps.ReadFixed = false;
    if (probe == NULL)
    {   // kernels before 5.6 cannot answer the probe, and also lack IORING_OP_READ.
        log_debug("io_uring opcode probe is not supported by this kernel.");
        return;
    }
    caps.Probe     = true;
    caps.Read      = io_uring_opcode_supported(probe, IORING_OP_READ) != 0;
    caps.ReadFixed = io_uring_opcode_supported(probe, IORING_OP_READ_FIXED) != 0;
    io_uring_free_probe(probe);
    log_debug("io_uring probe: READ=%d READ_FIXED=%d.", int(caps.Read), int(caps.ReadFixed));
}

bool check_capabilities(capabilities_t const &caps, strategy_t const &strategy, engine_error_t *error)
{
    if (caps.Probe == false)
    {   // without the probe or plain reads no strategy can run on this ring.
        set_engine_error(error, ERROR_KIND_RING_UNSUPPORTED, EOPNOTSUPP,
            "the kernel cannot report supported io_uring operations; reading files requires a newer kernel");
        return false;
    }
    if (caps.Read == false)
    {
        set_engine_error(error, ERROR_KIND_RING_UNSUPPORTED, EOPNOTSUPP,
            "IORING_OP_READ is not supported; reading files requires a newer kernel");
        return false;
    }
    if (strategy.BufferMode == BUFFER_MODE_REGISTERED && caps.ReadFixed == false)
    {
        set_engine_error(error, ERROR_KIND_CAPABILITY, 0,
            "IORING_OP_READ_FIXED is not supported; reading into fixed buffers requires a newer kernel");
        return false;
    }
    clear_engine_error(error);
    return true;
}
