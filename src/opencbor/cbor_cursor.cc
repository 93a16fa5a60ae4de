#include "opencbor/cbor_cursor.h"

#include <bit>

namespace opencbor {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }

    // 2^-24, the weight of one half-precision denormal fraction step.
    static constexpr double kPow2Minus24 = 5.960464477539063e-8;

}  // namespace

CborCursor::CborCursor(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


uint64_t
CborCursor::offset() const noexcept
{
    return offset_;
}


uint64_t
CborCursor::size() const noexcept
{
    return static_cast<uint64_t>(bytes_.size());
}


uint64_t
CborCursor::remaining() const noexcept
{
    return size() - offset_;
}


bool
CborCursor::at_end() const noexcept
{
    return offset_ >= size();
}


bool
CborCursor::read_u8(uint8_t* out) noexcept
{
    if (!out || remaining() < 1U) {
        return false;
    }
    *out = u8(bytes_[offset_]);
    offset_ += 1U;
    return true;
}


bool
CborCursor::read_u16(uint16_t* out) noexcept
{
    if (!out || remaining() < 2U) {
        return false;
    }
    *out = static_cast<uint16_t>(u8(bytes_[offset_ + 0U]) << 8U)
           | static_cast<uint16_t>(u8(bytes_[offset_ + 1U]) << 0U);
    offset_ += 2U;
    return true;
}


bool
CborCursor::read_u32(uint32_t* out) noexcept
{
    if (!out || remaining() < 4U) {
        return false;
    }
    uint32_t value = 0;
    value |= static_cast<uint32_t>(u8(bytes_[offset_ + 0U])) << 24U;
    value |= static_cast<uint32_t>(u8(bytes_[offset_ + 1U])) << 16U;
    value |= static_cast<uint32_t>(u8(bytes_[offset_ + 2U])) << 8U;
    value |= static_cast<uint32_t>(u8(bytes_[offset_ + 3U])) << 0U;
    *out = value;
    offset_ += 4U;
    return true;
}


bool
CborCursor::read_u64(uint64_t* out) noexcept
{
    if (!out || remaining() < 8U) {
        return false;
    }
    uint32_t high = 0;
    uint32_t low  = 0;
    if (!read_u32(&high) || !read_u32(&low)) {
        return false;
    }
    *out = (static_cast<uint64_t>(high) << 32U) | static_cast<uint64_t>(low);
    return true;
}


bool
CborCursor::read_f16(double* out) noexcept
{
    uint16_t bits = 0;
    if (!out || !read_u16(&bits)) {
        return false;
    }
    *out = cbor_half_to_double(bits);
    return true;
}


bool
CborCursor::read_f32(float* out) noexcept
{
    uint32_t bits = 0;
    if (!out || !read_u32(&bits)) {
        return false;
    }
    *out = std::bit_cast<float>(bits);
    return true;
}


bool
CborCursor::read_f64(double* out) noexcept
{
    uint64_t bits = 0;
    if (!out || !read_u64(&bits)) {
        return false;
    }
    *out = std::bit_cast<double>(bits);
    return true;
}


bool
CborCursor::read_bytes(uint64_t length, std::span<const std::byte>* out) noexcept
{
    if (!out || length > remaining()) {
        return false;
    }
    *out = bytes_.subspan(static_cast<size_t>(offset_),
                          static_cast<size_t>(length));
    offset_ += length;
    return true;
}


bool
CborCursor::read_break() noexcept
{
    if (at_end() || u8(bytes_[offset_]) != kCborBreak) {
        return false;
    }
    offset_ += 1U;
    return true;
}


double
cbor_half_to_double(uint16_t bits) noexcept
{
    const uint32_t sign = static_cast<uint32_t>(bits & 0x8000U);
    uint32_t exponent   = static_cast<uint32_t>(bits & 0x7C00U);
    const uint32_t frac = static_cast<uint32_t>(bits & 0x03FFU);

    // Exponent stays in its half-precision bit position (<< 10) until the
    // final shift into the single-precision layout.
    if (exponent == 0x7C00U) {
        exponent = 0xFFU << 10U;
    } else if (exponent != 0U) {
        exponent += (127U - 15U) << 10U;
    } else if (frac != 0U) {
        return (sign ? -1.0 : 1.0) * static_cast<double>(frac) * kPow2Minus24;
    }

    const uint32_t f32_bits = (sign << 16U) | (exponent << 13U)
                              | (frac << 13U);
    return static_cast<double>(std::bit_cast<float>(f32_bits));
}

}  // namespace opencbor
