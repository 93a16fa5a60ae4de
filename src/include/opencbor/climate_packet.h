#pragma once

#include "opencbor/cbor_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file climate_packet.h
 * \brief Reader for CO2 room-climate sensor packets.
 *
 * A packet is one CBOR array: a header element followed by
 * `[transmit_id, value]` arrays. Transmit ids 1, 2 and 3 carry temperature,
 * relative humidity and CO2 concentration.
 */

namespace opencbor {

inline constexpr int64_t kClimateTemperatureId = 1;
inline constexpr int64_t kClimateHumidityId    = 2;
inline constexpr int64_t kClimateCo2Id         = 3;

enum class ClimatePacketStatus : uint8_t {
    Ok,
    /// Hex payload could not be decoded.
    InvalidHex,
    /// CBOR decode failed; see \ref ClimatePacketResult::cbor.
    DecodeFailed,
    /// Root is not an array, or a searched element is not an array.
    Malformed,
};

/// Rounded readings; `has_*` is false when the id is absent or not numeric.
struct ClimateReading final {
    bool has_temperature = false;
    bool has_humidity    = false;
    bool has_co2         = false;
    int64_t temperature  = 0;
    int64_t humidity     = 0;
    int64_t co2          = 0;
};

struct ClimatePacketResult final {
    ClimatePacketStatus status = ClimatePacketStatus::Ok;
    CborDecodeResult cbor;
};

/**
 * \brief Decodes a packet and extracts the three readings into \p out.
 *
 * For each id the first element whose item 0 equals the id numerically
 * supplies item 1, rounded half up. Meeting a non-array element before the
 * id is found yields \ref ClimatePacketStatus::Malformed.
 */
ClimatePacketResult
decode_climate_packet(std::span<const std::byte> bytes, ClimateReading* out,
                      const CborDecodeOptions& options
                      = CborDecodeOptions {}) noexcept;

/// Hex-decodes \p payload and forwards to \ref decode_climate_packet.
ClimatePacketResult
decode_climate_hex(std::string_view payload, ClimateReading* out,
                   const CborDecodeOptions& options
                   = CborDecodeOptions {}) noexcept;

/// Returns a stable snake_case name for \p status.
const char*
climate_packet_status_name(ClimatePacketStatus status) noexcept;

}  // namespace opencbor
