#include "opencbor/climate_packet.h"

#include "opencbor/hex_payload.h"

#include <cmath>
#include <vector>

namespace opencbor {
namespace {

    static bool numeric_equals(const CborValue& v, int64_t id) noexcept
    {
        int64_t i = 0;
        if (cbor_to_i64(v, &i)) {
            return i == id;
        }
        if (v.kind == CborValueKind::Float) {
            return v.data.f64 == static_cast<double>(id);
        }
        return false;
    }


    static bool round_reading(const CborValue& v, int64_t* out) noexcept
    {
        double d = 0.0;
        if (!cbor_to_double(v, &d) || !std::isfinite(d)) {
            return false;
        }
        const double rounded = std::floor(d + 0.5);
        // 2^63 is the first double outside int64_t.
        if (rounded < -9223372036854775808.0
            || rounded >= 9223372036854775808.0) {
            return false;
        }
        *out = static_cast<int64_t>(rounded);
        return true;
    }


    // Searches elements after the header. Returns false on a non-array
    // element met before the match.
    static bool find_reading(const CborDocument& doc,
                             std::span<const CborNodeId> elements, int64_t id,
                             bool* has, int64_t* value) noexcept
    {
        *has = false;
        for (size_t i = 1; i < elements.size(); ++i) {
            const CborNodeId element = elements[i];
            if (doc.node(element).kind != CborValueKind::Array) {
                return false;
            }
            const std::span<const CborNodeId> pair = doc.array_items(element);
            if (pair.empty() || !numeric_equals(doc.node(pair[0]), id)) {
                continue;
            }
            if (pair.size() >= 2U) {
                *has = round_reading(doc.node(pair[1]), value);
            }
            return true;
        }
        return true;
    }

}  // namespace

ClimatePacketResult
decode_climate_packet(std::span<const std::byte> bytes, ClimateReading* out,
                      const CborDecodeOptions& options) noexcept
{
    ClimatePacketResult result;
    if (!out) {
        result.status = ClimatePacketStatus::Malformed;
        return result;
    }
    *out = ClimateReading {};

    CborDocument doc;
    result.cbor = decode_cbor(bytes, doc, options);
    if (result.cbor.status != CborDecodeStatus::Ok) {
        result.status = ClimatePacketStatus::DecodeFailed;
        return result;
    }
    if (doc.node(doc.root()).kind != CborValueKind::Array) {
        result.status = ClimatePacketStatus::Malformed;
        return result;
    }

    const std::span<const CborNodeId> elements = doc.array_items(doc.root());
    ClimateReading reading;
    if (!find_reading(doc, elements, kClimateTemperatureId,
                      &reading.has_temperature, &reading.temperature)
        || !find_reading(doc, elements, kClimateHumidityId,
                         &reading.has_humidity, &reading.humidity)
        || !find_reading(doc, elements, kClimateCo2Id, &reading.has_co2,
                         &reading.co2)) {
        result.status = ClimatePacketStatus::Malformed;
        return result;
    }

    *out          = reading;
    result.status = ClimatePacketStatus::Ok;
    return result;
}


ClimatePacketResult
decode_climate_hex(std::string_view payload, ClimateReading* out,
                   const CborDecodeOptions& options) noexcept
{
    std::vector<std::byte> bytes;
    if (decode_hex_payload(payload, &bytes) != HexPayloadStatus::Ok) {
        ClimatePacketResult result;
        result.status = ClimatePacketStatus::InvalidHex;
        return result;
    }
    return decode_climate_packet(bytes, out, options);
}


const char*
climate_packet_status_name(ClimatePacketStatus status) noexcept
{
    switch (status) {
    case ClimatePacketStatus::Ok: return "ok";
    case ClimatePacketStatus::InvalidHex: return "invalid_hex";
    case ClimatePacketStatus::DecodeFailed: return "decode_failed";
    case ClimatePacketStatus::Malformed: return "malformed";
    }
    return "unknown";
}

}  // namespace opencbor
