#pragma once

#include "opencbor/cbor_decode.h"
#include "opencbor/cbor_format.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource-budget policy for OpenCbor read/dump workflows.
 */

namespace opencbor {

/**
 * \brief Storage-agnostic resource limits for untrusted CBOR input.
 *
 * Tools and bindings start from this policy and copy the relevant parts into
 * per-call options.
 */
struct CborResourcePolicy final {
    /// File read cap for tools (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Decoder budgets.
    CborDecodeLimits decode_limits;

    /// Console output budgets.
    CborFormatOptions format;
};

inline void
apply_resource_policy(const CborResourcePolicy& policy,
                      CborDecodeOptions* decode,
                      CborFormatOptions* format) noexcept
{
    if (decode) {
        decode->limits = policy.decode_limits;
    }
    if (format) {
        *format = policy.format;
    }
}

}  // namespace opencbor
