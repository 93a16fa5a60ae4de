#pragma once

#include "opencbor/cbor_value.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file cbor_document.h
 * \brief Owner of a decoded CBOR value tree.
 */

namespace opencbor {

/// One key/value pair of a Map node.
struct CborMapPair final {
    CborNodeId key   = kInvalidCborNodeId;
    CborNodeId value = kInvalidCborNodeId;
};

/**
 * \brief Node table plus payload pools for one decoded tree.
 *
 * Nodes only reference nodes with a smaller id, so every document is acyclic.
 * Builder calls return \ref kInvalidCborNodeId when a referenced id does not
 * exist yet or a pool would exceed 32-bit addressing.
 *
 * \note Spans returned by the accessors are invalidated by further builder
 * calls (vector reallocation).
 */
class CborDocument final {
public:
    CborDocument() = default;

    /// Discards all nodes and pools.
    void clear() noexcept;

    // Build phase.
    CborNodeId add_value(const CborValue& value);
    CborNodeId add_bytes(std::span<const std::byte> bytes);
    CborNodeId add_text_utf16(std::span<const char16_t> units);
    /// Converts well-formed UTF-8 \p text to UTF-16 and adds a TextString.
    CborNodeId add_text(std::string_view text);
    CborNodeId add_array(std::span<const CborNodeId> items);
    CborNodeId add_map(std::span<const CborMapPair> pairs);
    CborNodeId add_tagged(uint64_t tag, CborNodeId inner);
    void set_root(CborNodeId root) noexcept;

    CborNodeId root() const noexcept;
    uint32_t node_count() const noexcept;
    bool valid(CborNodeId id) const noexcept;
    /// Returns the node, or an Undefined simple value for invalid ids.
    const CborValue& node(CborNodeId id) const noexcept;

    std::span<const std::byte> bytes(CborNodeId id) const noexcept;
    std::span<const char16_t> text_utf16(CborNodeId id) const noexcept;
    /// Appends the text as UTF-8; unpaired surrogates become U+FFFD.
    bool text_utf8(CborNodeId id, std::string* out) const;
    std::span<const CborNodeId> array_items(CborNodeId id) const noexcept;
    std::span<const CborMapPair> map_pairs(CborNodeId id) const noexcept;

    /// Finds the value for an Integer key equal to \p key.
    CborNodeId find_map_int(CborNodeId map, int64_t key) const noexcept;
    /// Finds the value for a TextString key equal to UTF-8 \p key.
    CborNodeId find_map_text(CborNodeId map, std::string_view key) const;

    /// Structural equality (kind, payload and children; floats by bit pattern).
    bool equal(CborNodeId a, CborNodeId b) const noexcept;
    /// Structural hash consistent with \ref equal.
    uint64_t hash(CborNodeId id) const noexcept;

private:
    std::vector<CborValue> nodes_;
    std::vector<CborNodeId> links_;
    std::vector<CborMapPair> pairs_;
    std::vector<std::byte> bytes_;
    std::vector<char16_t> units_;
    CborNodeId root_ = kInvalidCborNodeId;
};

/** \name UTF helpers
 *  @{
 */
/// Appends UTF-16 \p units to \p out as UTF-8 (unpaired surrogates as U+FFFD).
void
append_utf16_as_utf8(std::span<const char16_t> units, std::string* out);
/// Appends UTF-8 \p text to \p out as UTF-16. Returns false on malformed input.
bool
append_utf8_as_utf16(std::string_view text, std::vector<char16_t>* out);
/** @} */

}  // namespace opencbor
