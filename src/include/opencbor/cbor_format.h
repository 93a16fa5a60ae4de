#pragma once

#include "opencbor/cbor_document.h"

#include <cstdint>
#include <string>

/**
 * \file cbor_format.h
 * \brief RFC 8949 diagnostic notation for decoded trees.
 */

namespace opencbor {

/// Output controls for \ref format_cbor_diagnostic.
struct CborFormatOptions final {
    /// Max bytes (byte strings) or code units (text) printed per string (0 = unlimited).
    uint32_t max_bytes = 0;
    /// Max elements/pairs printed per container (0 = unlimited).
    uint32_t max_items = 0;
};

/**
 * \brief Appends the diagnostic notation of \p node to \p out.
 *
 * Text is escaped to printable ASCII (`\uXXXX` per UTF-16 unit); truncated
 * strings and containers end in "...". Returns false for an invalid node.
 */
bool
format_cbor_diagnostic(const CborDocument& doc, CborNodeId node,
                       std::string* out,
                       const CborFormatOptions& options = CborFormatOptions {});

/// Appends a double the way diagnostic notation prints it (`1.0`, `NaN`, ...).
void
append_cbor_float(double value, std::string* out);

}  // namespace opencbor
