#pragma once

#include <cstdint>

/**
 * \file cbor_value.h
 * \brief Decoded CBOR value representation (a closed tagged union).
 */

namespace opencbor {

/// Index of a node inside a \ref CborDocument.
using CborNodeId = uint32_t;

static constexpr CborNodeId kInvalidCborNodeId = 0xffffffffU;

/// A span (offset,size) into one of the \ref CborDocument pools.
struct CborSpan final {
    uint32_t offset = 0;
    uint32_t size   = 0;
};

/// Value variant selector.
enum class CborValueKind : uint8_t {
    /// Major type 0 or 1, stored as sign + argument.
    Integer,
    /// Raw bytes in the document byte pool.
    ByteString,
    /// UTF-16 code units in the document unit pool.
    TextString,
    /// Ordered children in the document link pool.
    Array,
    /// Key/value pairs in the document pair pool.
    Map,
    /// Tag number plus one inner node.
    Tagged,
    /// One of \ref CborSimple.
    Simple,
    /// IEEE double (half/single floats are widened).
    Float,
};

/// Simple value selector (major type 7 without a float payload).
enum class CborSimple : uint8_t {
    False,
    True,
    Null,
    Undefined,
    /// Application-defined simple value; see \ref CborValue::simple_code.
    Custom,
};

/**
 * \brief One node of a decoded CBOR tree.
 *
 * Storage rules:
 * - Integer: `data.u64` is the wire argument; the value is `data.u64` when
 *   \ref negative is false and `-1 - data.u64` otherwise.
 * - ByteString/TextString/Array/Map: `data.span` points into the matching
 *   \ref CborDocument pool and \ref count is its element count (bytes, code
 *   units, children, pairs).
 * - Tagged: `data.u64` is the tag number and \ref child the inner node.
 * - Float: `data.f64`.
 * - Simple: \ref simple, plus \ref simple_code for Custom.
 */
struct CborValue final {
    CborValueKind kind  = CborValueKind::Simple;
    CborSimple simple   = CborSimple::Undefined;
    bool negative       = false;
    uint8_t simple_code = 23;
    uint32_t count      = 0;
    CborNodeId child    = kInvalidCborNodeId;

    union Data {
        uint64_t u64;
        double f64;
        CborSpan span;

        Data() noexcept
            : u64(0)
        {
        }
    } data;
};

/** \name Inline constructors
 *  @{
 */
CborValue
make_cbor_unsigned(uint64_t value) noexcept;
/// Builds the Integer `-1 - argument`.
CborValue
make_cbor_negative(uint64_t argument) noexcept;
CborValue
make_cbor_int(int64_t value) noexcept;
CborValue
make_cbor_float(double value) noexcept;
CborValue
make_cbor_bool(bool value) noexcept;
CborValue
make_cbor_simple(CborSimple simple) noexcept;
CborValue
make_cbor_custom_simple(uint8_t code) noexcept;
/** @} */

/** \name Integer accessors
 *  @{
 */
/// Returns false if \p value is not an Integer or does not fit in int64_t.
bool
cbor_to_i64(const CborValue& value, int64_t* out) noexcept;
/// Returns false if \p value is not a non-negative Integer.
bool
cbor_to_u64(const CborValue& value, uint64_t* out) noexcept;
/// Converts Integer or Float to double (Integer may lose precision above 2^53).
bool
cbor_to_double(const CborValue& value, double* out) noexcept;
/** @} */

/// Returns a stable lowercase name for \p kind (e.g. "bytes", "map").
const char*
cbor_value_kind_name(CborValueKind kind) noexcept;

}  // namespace opencbor
