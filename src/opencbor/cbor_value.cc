#include "opencbor/cbor_value.h"

#include <cstdint>

namespace opencbor {

CborValue
make_cbor_unsigned(uint64_t value) noexcept
{
    CborValue v;
    v.kind     = CborValueKind::Integer;
    v.negative = false;
    v.count    = 1;
    v.data.u64 = value;
    return v;
}


CborValue
make_cbor_negative(uint64_t argument) noexcept
{
    CborValue v;
    v.kind     = CborValueKind::Integer;
    v.negative = true;
    v.count    = 1;
    v.data.u64 = argument;
    return v;
}


CborValue
make_cbor_int(int64_t value) noexcept
{
    if (value >= 0) {
        return make_cbor_unsigned(static_cast<uint64_t>(value));
    }
    // -1 - arg == value  =>  arg == -1 - value, which never overflows.
    return make_cbor_negative(static_cast<uint64_t>(-1 - value));
}


CborValue
make_cbor_float(double value) noexcept
{
    CborValue v;
    v.kind     = CborValueKind::Float;
    v.count    = 1;
    v.data.f64 = value;
    return v;
}


CborValue
make_cbor_bool(bool value) noexcept
{
    return make_cbor_simple(value ? CborSimple::True : CborSimple::False);
}


CborValue
make_cbor_simple(CborSimple simple) noexcept
{
    CborValue v;
    v.kind   = CborValueKind::Simple;
    v.simple = simple;
    v.count  = 1;
    switch (simple) {
    case CborSimple::False: v.simple_code = 20; break;
    case CborSimple::True: v.simple_code = 21; break;
    case CborSimple::Null: v.simple_code = 22; break;
    case CborSimple::Undefined: v.simple_code = 23; break;
    case CborSimple::Custom: v.simple_code = 0; break;
    }
    return v;
}


CborValue
make_cbor_custom_simple(uint8_t code) noexcept
{
    CborValue v;
    v.kind        = CborValueKind::Simple;
    v.simple      = CborSimple::Custom;
    v.simple_code = code;
    v.count       = 1;
    return v;
}


bool
cbor_to_i64(const CborValue& value, int64_t* out) noexcept
{
    if (!out || value.kind != CborValueKind::Integer) {
        return false;
    }
    if (value.data.u64 > static_cast<uint64_t>(INT64_MAX)) {
        return false;
    }
    const int64_t arg = static_cast<int64_t>(value.data.u64);
    *out              = value.negative ? (-1 - arg) : arg;
    return true;
}


bool
cbor_to_u64(const CborValue& value, uint64_t* out) noexcept
{
    if (!out || value.kind != CborValueKind::Integer || value.negative) {
        return false;
    }
    *out = value.data.u64;
    return true;
}


bool
cbor_to_double(const CborValue& value, double* out) noexcept
{
    if (!out) {
        return false;
    }
    if (value.kind == CborValueKind::Float) {
        *out = value.data.f64;
        return true;
    }
    if (value.kind != CborValueKind::Integer) {
        return false;
    }
    const double arg = static_cast<double>(value.data.u64);
    *out             = value.negative ? (-1.0 - arg) : arg;
    return true;
}


const char*
cbor_value_kind_name(CborValueKind kind) noexcept
{
    switch (kind) {
    case CborValueKind::Integer: return "integer";
    case CborValueKind::ByteString: return "bytes";
    case CborValueKind::TextString: return "text";
    case CborValueKind::Array: return "array";
    case CborValueKind::Map: return "map";
    case CborValueKind::Tagged: return "tagged";
    case CborValueKind::Simple: return "simple";
    case CborValueKind::Float: return "float";
    }
    return "unknown";
}

}  // namespace opencbor
