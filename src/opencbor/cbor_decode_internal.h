#pragma once

#include "opencbor/cbor_cursor.h"
#include "opencbor/cbor_decode.h"

#include <cstdint>
#include <vector>

namespace opencbor {

// Internal-only (non-installed) building blocks of decode_cbor, exposed to
// the unit tests.

namespace cbor_internal {

    struct CborLength final {
        uint64_t value  = 0;
        bool indefinite = false;
    };

    // Interprets the additional-information field of an item header.
    CborDecodeStatus read_length(CborCursor* cursor, uint8_t additional,
                                 CborLength* out) noexcept;

    // Reads the header of the next chunk of an indefinite-length string.
    // Sets *end when the break marker was consumed instead.
    CborDecodeStatus
    read_indefinite_string_length(CborCursor* cursor, uint8_t expected_major,
                                  bool* end, uint64_t* length) noexcept;

    // Decodes `byte_length` encoded bytes as UTF-8 and appends UTF-16 units.
    CborDecodeStatus append_utf16_units(CborCursor* cursor,
                                        uint64_t byte_length,
                                        std::vector<char16_t>* out);

}  // namespace cbor_internal
}  // namespace opencbor
