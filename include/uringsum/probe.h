/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the kernel capability checks performed once per run,
/// before any file is opened.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_PROBE_H
#define URINGSUM_PROBE_H

/*////////////////
//   Includes   //
////////////////*/
#include <liburing.h>

#include "uringsum/config.h"
#include "uringsum/error.h"

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary The ring operations supported by the running kernel.
struct capabilities_t
{
    bool               Probe;        /// true if the kernel answered the opcode probe.
    bool               Read;         /// IORING_OP_READ is supported.
    bool               ReadFixed;    /// IORING_OP_READ_FIXED is supported.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Query the operations supported by the kernel behind a ring.
/// @param ring The ring to query.
/// @param caps On return, receives the supported operations. Every field is
/// false if the kernel does not support the probe itself.
void probe_capabilities(struct io_uring *ring, capabilities_t &caps);

/// @summary Check that the operations a strategy requires are supported.
/// @param caps The result of probe_capabilities().
/// @param strategy The strategy selected for the run.
/// @param error On failure, receives the missing operation. The kind is
/// ERROR_KIND_RING_UNSUPPORTED if the ring cannot perform plain reads, or
/// ERROR_KIND_CAPABILITY if only the strategy's fixed-buffer read is missing.
/// May be NULL.
/// @return true if every required operation is supported.
bool check_capabilities(capabilities_t const &caps, strategy_t const &strategy, engine_error_t *error);

#endif /* !defined(URINGSUM_PROBE_H) */
