#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

/**
 * \file hex_payload.h
 * \brief Hex-encoded transport payload to raw bytes.
 */

namespace opencbor {

enum class HexPayloadStatus : uint8_t {
    Ok,
    /// Odd number of digits or a non-hex character.
    Malformed,
};

/**
 * \brief Decodes hex digit pairs (either case) from \p text into \p out.
 *
 * \p out is replaced; it is left empty on failure.
 */
HexPayloadStatus
decode_hex_payload(std::string_view text, std::vector<std::byte>* out);

}  // namespace opencbor
