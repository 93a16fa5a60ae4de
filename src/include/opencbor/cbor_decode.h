#pragma once

#include "opencbor/cbor_document.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file cbor_decode.h
 * \brief Decoder for one CBOR (RFC 8949) item into a \ref CborDocument.
 */

namespace opencbor {

/// CBOR decode result status.
enum class CborDecodeStatus : uint8_t {
    Ok,
    /// Additional information 28..30 (reserved) in an item header.
    MalformedLengthEncoding,
    /// An indefinite-string chunk is itself indefinite or has another major type.
    InvalidIndefiniteElement,
    /// Indefinite length on an integer, tag or simple value.
    InvalidLengthForMajorType,
    /// A read would run past the end of the input.
    OutOfBoundsRead,
    /// Bytes remain after the top-level item.
    TrailingBytes,
    /// Refused due to configured resource limits.
    LimitExceeded,
    /// A \ref CborDecodeHooks callback returned an invalid node id.
    HookRejected,
};

/// Which limit produced \ref CborDecodeStatus::LimitExceeded.
enum class CborLimitReason : uint8_t {
    None,
    MaxInputBytes,
    MaxDepth,
    MaxItems,
    MaxStringBytes,
    /// The document pools would exceed 32-bit addressing.
    DocumentSize,
};

/// Resource limits for CBOR decode (0 = unlimited).
struct CborDecodeLimits final {
    /// Maximum input bytes to accept.
    uint64_t max_input_bytes = 64ULL * 1024ULL * 1024ULL;
    /// Maximum container/tag nesting depth.
    uint32_t max_depth = 256;
    /// Maximum decoded items, counting string chunks.
    uint32_t max_items = 1000000;
    /// Maximum encoded bytes of one assembled byte/text string.
    uint64_t max_string_bytes = 64ULL * 1024ULL * 1024ULL;
};

/**
 * \brief Caller-supplied transforms for tags and simple values.
 *
 * Both callbacks may add nodes to \p doc and return any valid node id of
 * \p doc. They run inside a `noexcept` decode and must not throw.
 */
class CborDecodeHooks {
public:
    virtual ~CborDecodeHooks() = default;

    /// Called after the content of tag \p tag was decoded as \p inner.
    virtual CborNodeId on_tag(CborDocument& doc, CborNodeId inner,
                              uint64_t tag)
        = 0;

    /// Called for simple values other than false/true/null/undefined.
    virtual CborNodeId on_simple(CborDocument& doc, uint8_t code) = 0;
};

/// Hooks that keep tags as Tagged nodes and custom codes as Custom simples.
class CborKeepHooks final : public CborDecodeHooks {
public:
    CborNodeId on_tag(CborDocument& doc, CborNodeId inner,
                      uint64_t tag) override;
    CborNodeId on_simple(CborDocument& doc, uint8_t code) override;
};

/// Decoder options for \ref decode_cbor.
struct CborDecodeOptions final {
    CborDecodeLimits limits;
    /**
     * Optional hooks. When null, tags resolve to their inner value (the tag
     * number is dropped) and custom simple values decode as undefined.
     */
    CborDecodeHooks* hooks = nullptr;
};

/// CBOR decode result summary.
struct CborDecodeResult final {
    CborDecodeStatus status      = CborDecodeStatus::Ok;
    CborLimitReason limit_reason = CborLimitReason::None;
    /// Root node in the output document (invalid on failure).
    CborNodeId root = kInvalidCborNodeId;
    /// Input offset where decoding stopped.
    uint64_t offset = 0;
    /// Items decoded, counting string chunks.
    uint32_t items_decoded = 0;
};

/**
 * \brief Decodes exactly one CBOR item spanning all of \p bytes into \p doc.
 *
 * \p doc is cleared first. On success it holds the tree and its root is set;
 * on failure it is left empty.
 *
 * The default \ref CborDecodeLimits reject some well-formed input, such as
 * an array of more than 1,000,000 elements, with `LimitExceeded`. Set a
 * limit to 0 to decode any well-formed item of that size.
 */
CborDecodeResult
decode_cbor(std::span<const std::byte> bytes, CborDocument& doc,
            const CborDecodeOptions& options = CborDecodeOptions {}) noexcept;

/// Returns a stable snake_case name for \p status.
const char*
cbor_decode_status_name(CborDecodeStatus status) noexcept;

/// Returns a stable snake_case name for \p reason.
const char*
cbor_limit_reason_name(CborLimitReason reason) noexcept;

}  // namespace opencbor
