#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file cbor_cursor.h
 * \brief Bounds-checked big-endian reader over an immutable byte buffer.
 */

namespace opencbor {

/// Break marker terminating indefinite-length items.
inline constexpr uint8_t kCborBreak = 0xFFU;

/**
 * \brief Read offset into one input buffer.
 *
 * Every successful read advances the offset by the width of the value. A read
 * that does not fit into the remaining bytes returns false and leaves the
 * offset unchanged, so `offset() <= size()` always holds.
 */
class CborCursor final {
public:
    explicit CborCursor(std::span<const std::byte> bytes) noexcept;

    uint64_t offset() const noexcept;
    uint64_t size() const noexcept;
    uint64_t remaining() const noexcept;
    bool at_end() const noexcept;

    bool read_u8(uint8_t* out) noexcept;
    bool read_u16(uint16_t* out) noexcept;
    bool read_u32(uint32_t* out) noexcept;
    /// Two 32-bit reads combined as `high << 32 | low` (exact).
    bool read_u64(uint64_t* out) noexcept;

    /// IEEE half precision, widened via \ref cbor_half_to_double.
    bool read_f16(double* out) noexcept;
    bool read_f32(float* out) noexcept;
    bool read_f64(double* out) noexcept;

    /// Returns a view of the next \p length bytes and advances past them.
    bool read_bytes(uint64_t length, std::span<const std::byte>* out) noexcept;

    /**
     * \brief Consumes a break marker if one is next.
     *
     * Returns false without advancing when the next byte is not `0xFF`,
     * including at the end of input.
     */
    bool read_break() noexcept;

private:
    std::span<const std::byte> bytes_;
    uint64_t offset_ = 0;
};

/**
 * \brief Expands IEEE half-precision bits to a double.
 *
 * Normal values and infinities/NaNs are rebuilt as a 32-bit float pattern;
 * denormals are computed as `fraction * 2^-24` with the sign applied.
 */
double
cbor_half_to_double(uint16_t bits) noexcept;

}  // namespace opencbor
