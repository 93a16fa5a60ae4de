#include "opencbor/cbor_decode.h"

#include "cbor_decode_internal.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace opencbor {
namespace cbor_internal {

    CborDecodeStatus read_length(CborCursor* cursor, uint8_t additional,
                                 CborLength* out) noexcept
    {
        if (!cursor || !out) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        out->indefinite = false;
        out->value      = 0;

        if (additional < 24U) {
            out->value = additional;
            return CborDecodeStatus::Ok;
        }
        switch (additional) {
        case 24U: {
            uint8_t v = 0;
            if (!cursor->read_u8(&v)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            out->value = v;
            return CborDecodeStatus::Ok;
        }
        case 25U: {
            uint16_t v = 0;
            if (!cursor->read_u16(&v)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            out->value = v;
            return CborDecodeStatus::Ok;
        }
        case 26U: {
            uint32_t v = 0;
            if (!cursor->read_u32(&v)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            out->value = v;
            return CborDecodeStatus::Ok;
        }
        case 27U: {
            uint64_t v = 0;
            if (!cursor->read_u64(&v)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            out->value = v;
            return CborDecodeStatus::Ok;
        }
        case 31U: out->indefinite = true; return CborDecodeStatus::Ok;
        default: break;
        }
        // 28..30 are reserved.
        return CborDecodeStatus::MalformedLengthEncoding;
    }


    CborDecodeStatus
    read_indefinite_string_length(CborCursor* cursor, uint8_t expected_major,
                                  bool* end, uint64_t* length) noexcept
    {
        if (!cursor || !end || !length) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        *end    = false;
        *length = 0;

        uint8_t initial = 0;
        if (!cursor->read_u8(&initial)) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        if (initial == kCborBreak) {
            *end = true;
            return CborDecodeStatus::Ok;
        }

        CborLength chunk;
        const CborDecodeStatus status
            = read_length(cursor, static_cast<uint8_t>(initial & 0x1FU),
                          &chunk);
        if (status != CborDecodeStatus::Ok) {
            return status;
        }
        if (chunk.indefinite || (initial >> 5U) != expected_major) {
            return CborDecodeStatus::InvalidIndefiniteElement;
        }
        *length = chunk.value;
        return CborDecodeStatus::Ok;
    }


    CborDecodeStatus append_utf16_units(CborCursor* cursor,
                                        uint64_t byte_length,
                                        std::vector<char16_t>* out)
    {
        if (!cursor || !out) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        std::span<const std::byte> encoded;
        if (!cursor->read_bytes(byte_length, &encoded)) {
            return CborDecodeStatus::OutOfBoundsRead;
        }

        // Multi-byte sequences may not cross the chunk boundary.
        CborCursor chunk(encoded);
        while (!chunk.at_end()) {
            uint8_t b = 0;
            (void)chunk.read_u8(&b);
            uint32_t value = b;

            if (value & 0x80U) {
                uint8_t c1 = 0;
                uint8_t c2 = 0;
                uint8_t c3 = 0;
                if (value < 0xE0U) {
                    if (!chunk.read_u8(&c1)) {
                        return CborDecodeStatus::OutOfBoundsRead;
                    }
                    value = (value & 0x1FU) << 6U | (c1 & 0x3FU);
                } else if (value < 0xF0U) {
                    if (!chunk.read_u8(&c1) || !chunk.read_u8(&c2)) {
                        return CborDecodeStatus::OutOfBoundsRead;
                    }
                    value = (value & 0x0FU) << 12U | (c1 & 0x3FU) << 6U
                            | (c2 & 0x3FU);
                } else {
                    if (!chunk.read_u8(&c1) || !chunk.read_u8(&c2)
                        || !chunk.read_u8(&c3)) {
                        return CborDecodeStatus::OutOfBoundsRead;
                    }
                    value = (value & 0x0FU) << 18U | (c1 & 0x3FU) << 12U
                            | (c2 & 0x3FU) << 6U | (c3 & 0x3FU);
                }
            }

            if (value < 0x10000U) {
                out->push_back(static_cast<char16_t>(value));
            } else {
                value -= 0x10000U;
                out->push_back(static_cast<char16_t>(
                    (0xD800U | (value >> 10U)) & 0xFFFFU));
                out->push_back(static_cast<char16_t>(0xDC00U
                                                     | (value & 0x3FFU)));
            }
        }
        return CborDecodeStatus::Ok;
    }

}  // namespace cbor_internal

namespace {

    using cbor_internal::CborLength;

    struct DecodeContext final {
        explicit DecodeContext(std::span<const std::byte> bytes) noexcept
            : cursor(bytes)
        {
        }

        CborCursor cursor;
        CborDocument* doc      = nullptr;
        CborDecodeHooks* hooks = nullptr;
        CborDecodeLimits limits;
        CborDecodeResult result;
    };

    static CborDecodeStatus limit_exceeded(DecodeContext* ctx,
                                           CborLimitReason reason) noexcept
    {
        ctx->result.limit_reason = reason;
        return CborDecodeStatus::LimitExceeded;
    }

    static CborDecodeStatus take_item(DecodeContext* ctx) noexcept
    {
        ctx->result.items_decoded += 1U;
        const uint32_t max_items = ctx->limits.max_items;
        if (max_items != 0U && ctx->result.items_decoded > max_items) {
            return limit_exceeded(ctx, CborLimitReason::MaxItems);
        }
        return CborDecodeStatus::Ok;
    }

    static CborDecodeStatus check_string_bytes(DecodeContext* ctx,
                                               uint64_t total) noexcept
    {
        const uint64_t max_bytes = ctx->limits.max_string_bytes;
        if (max_bytes != 0U && total > max_bytes) {
            return limit_exceeded(ctx, CborLimitReason::MaxStringBytes);
        }
        return CborDecodeStatus::Ok;
    }

    static CborDecodeStatus store_node(DecodeContext* ctx, CborNodeId id,
                                       CborNodeId* out) noexcept
    {
        if (id == kInvalidCborNodeId) {
            return limit_exceeded(ctx, CborLimitReason::DocumentSize);
        }
        *out = id;
        return CborDecodeStatus::Ok;
    }


    static CborDecodeStatus decode_byte_string(DecodeContext* ctx,
                                               const CborLength& length,
                                               CborNodeId* out)
    {
        CborCursor& cursor = ctx->cursor;
        if (!length.indefinite) {
            if (length.value > cursor.remaining()) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            CborDecodeStatus status = check_string_bytes(ctx, length.value);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            std::span<const std::byte> payload;
            if (!cursor.read_bytes(length.value, &payload)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            return store_node(ctx, ctx->doc->add_bytes(payload), out);
        }

        std::vector<std::byte> joined;
        while (true) {
            bool end       = false;
            uint64_t chunk = 0;
            CborDecodeStatus status
                = cbor_internal::read_indefinite_string_length(&cursor, 2U,
                                                               &end, &chunk);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            if (end) {
                break;
            }
            status = take_item(ctx);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            if (chunk > cursor.remaining()) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            status = check_string_bytes(ctx, joined.size() + chunk);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            std::span<const std::byte> payload;
            if (!cursor.read_bytes(chunk, &payload)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            joined.insert(joined.end(), payload.begin(), payload.end());
        }
        return store_node(ctx, ctx->doc->add_bytes(joined), out);
    }


    static CborDecodeStatus decode_text_string(DecodeContext* ctx,
                                               const CborLength& length,
                                               CborNodeId* out)
    {
        CborCursor& cursor = ctx->cursor;
        std::vector<char16_t> units;

        if (!length.indefinite) {
            if (length.value > cursor.remaining()) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            CborDecodeStatus status = check_string_bytes(ctx, length.value);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            status = cbor_internal::append_utf16_units(&cursor, length.value,
                                                       &units);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            return store_node(ctx, ctx->doc->add_text_utf16(units), out);
        }

        uint64_t total = 0;
        while (true) {
            bool end       = false;
            uint64_t chunk = 0;
            CborDecodeStatus status
                = cbor_internal::read_indefinite_string_length(&cursor, 3U,
                                                               &end, &chunk);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            if (end) {
                break;
            }
            status = take_item(ctx);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            if (chunk > cursor.remaining()) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            total += chunk;
            status = check_string_bytes(ctx, total);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            status = cbor_internal::append_utf16_units(&cursor, chunk, &units);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
        }
        return store_node(ctx, ctx->doc->add_text_utf16(units), out);
    }


    static CborDecodeStatus decode_item(DecodeContext* ctx, uint32_t depth,
                                        CborNodeId* out);


    static CborDecodeStatus decode_array(DecodeContext* ctx, uint32_t depth,
                                         const CborLength& length,
                                         CborNodeId* out)
    {
        CborCursor& cursor = ctx->cursor;
        std::vector<CborNodeId> items;

        if (length.indefinite) {
            while (!cursor.read_break()) {
                CborNodeId item               = kInvalidCborNodeId;
                const CborDecodeStatus status = decode_item(ctx, depth + 1U,
                                                            &item);
                if (status != CborDecodeStatus::Ok) {
                    return status;
                }
                items.push_back(item);
            }
            return store_node(ctx, ctx->doc->add_array(items), out);
        }

        // Every element takes at least one byte.
        if (length.value > cursor.remaining()) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        items.reserve(static_cast<size_t>(length.value));
        for (uint64_t i = 0; i < length.value; ++i) {
            CborNodeId item               = kInvalidCborNodeId;
            const CborDecodeStatus status = decode_item(ctx, depth + 1U, &item);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
            items.push_back(item);
        }
        return store_node(ctx, ctx->doc->add_array(items), out);
    }


    // Pairs of one map under construction; equal keys overwrite in place.
    class MapBuilder final {
    public:
        explicit MapBuilder(const CborDocument& doc) noexcept
            : doc_(doc)
        {
        }

        void insert(CborNodeId key, CborNodeId value)
        {
            const uint64_t h = doc_.hash(key);
            auto range       = index_.equal_range(h);
            for (auto it = range.first; it != range.second; ++it) {
                CborMapPair& existing = pairs_[it->second];
                if (doc_.equal(existing.key, key)) {
                    existing.value = value;
                    return;
                }
            }
            index_.emplace(h, pairs_.size());
            pairs_.push_back(CborMapPair { key, value });
        }

        const std::vector<CborMapPair>& pairs() const noexcept
        {
            return pairs_;
        }

    private:
        const CborDocument& doc_;
        std::vector<CborMapPair> pairs_;
        std::unordered_multimap<uint64_t, size_t> index_;
    };


    static CborDecodeStatus decode_map_pair(DecodeContext* ctx, uint32_t depth,
                                            MapBuilder* builder)
    {
        CborNodeId key          = kInvalidCborNodeId;
        CborNodeId value        = kInvalidCborNodeId;
        CborDecodeStatus status = decode_item(ctx, depth + 1U, &key);
        if (status != CborDecodeStatus::Ok) {
            return status;
        }
        status = decode_item(ctx, depth + 1U, &value);
        if (status != CborDecodeStatus::Ok) {
            return status;
        }
        builder->insert(key, value);
        return CborDecodeStatus::Ok;
    }


    static CborDecodeStatus decode_map(DecodeContext* ctx, uint32_t depth,
                                       const CborLength& length,
                                       CborNodeId* out)
    {
        CborCursor& cursor = ctx->cursor;
        MapBuilder builder(*ctx->doc);

        if (length.indefinite) {
            while (!cursor.read_break()) {
                const CborDecodeStatus status = decode_map_pair(ctx, depth,
                                                                &builder);
                if (status != CborDecodeStatus::Ok) {
                    return status;
                }
            }
            return store_node(ctx, ctx->doc->add_map(builder.pairs()), out);
        }

        // Every pair takes at least two bytes.
        if (length.value > cursor.remaining() / 2U) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        for (uint64_t i = 0; i < length.value; ++i) {
            const CborDecodeStatus status = decode_map_pair(ctx, depth,
                                                            &builder);
            if (status != CborDecodeStatus::Ok) {
                return status;
            }
        }
        return store_node(ctx, ctx->doc->add_map(builder.pairs()), out);
    }


    static CborDecodeStatus decode_tag(DecodeContext* ctx, uint32_t depth,
                                       uint64_t tag, CborNodeId* out)
    {
        CborNodeId inner              = kInvalidCborNodeId;
        const CborDecodeStatus status = decode_item(ctx, depth + 1U, &inner);
        if (status != CborDecodeStatus::Ok) {
            return status;
        }
        if (!ctx->hooks) {
            *out = inner;
            return CborDecodeStatus::Ok;
        }
        const CborNodeId replaced = ctx->hooks->on_tag(*ctx->doc, inner, tag);
        if (!ctx->doc->valid(replaced)) {
            return CborDecodeStatus::HookRejected;
        }
        *out = replaced;
        return CborDecodeStatus::Ok;
    }


    static CborDecodeStatus decode_simple(DecodeContext* ctx, uint64_t code,
                                          CborNodeId* out)
    {
        switch (code) {
        case 20U:
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_simple(CborSimple::False)),
                              out);
        case 21U:
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_simple(CborSimple::True)),
                              out);
        case 22U:
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_simple(CborSimple::Null)),
                              out);
        case 23U:
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_simple(CborSimple::Undefined)),
                              out);
        default: break;
        }

        if (!ctx->hooks) {
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_simple(CborSimple::Undefined)),
                              out);
        }
        // Float widths were dispatched earlier, so the code fits one byte.
        const CborNodeId replaced
            = ctx->hooks->on_simple(*ctx->doc, static_cast<uint8_t>(code));
        if (!ctx->doc->valid(replaced)) {
            return CborDecodeStatus::HookRejected;
        }
        *out = replaced;
        return CborDecodeStatus::Ok;
    }


    static CborDecodeStatus decode_float(DecodeContext* ctx,
                                         uint8_t additional, CborNodeId* out)
    {
        CborCursor& cursor = ctx->cursor;
        double value       = 0.0;
        if (additional == 25U) {
            if (!cursor.read_f16(&value)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
        } else if (additional == 26U) {
            float f = 0.0f;
            if (!cursor.read_f32(&f)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
            value = static_cast<double>(f);
        } else {
            if (!cursor.read_f64(&value)) {
                return CborDecodeStatus::OutOfBoundsRead;
            }
        }
        return store_node(ctx, ctx->doc->add_value(make_cbor_float(value)),
                          out);
    }


    static CborDecodeStatus decode_item(DecodeContext* ctx, uint32_t depth,
                                        CborNodeId* out)
    {
        const uint32_t max_depth = ctx->limits.max_depth;
        if (max_depth != 0U && depth > max_depth) {
            return limit_exceeded(ctx, CborLimitReason::MaxDepth);
        }

        uint8_t initial = 0;
        if (!ctx->cursor.read_u8(&initial)) {
            return CborDecodeStatus::OutOfBoundsRead;
        }
        CborDecodeStatus status = take_item(ctx);
        if (status != CborDecodeStatus::Ok) {
            return status;
        }

        const uint8_t major      = static_cast<uint8_t>(initial >> 5U);
        const uint8_t additional = static_cast<uint8_t>(initial & 0x1FU);

        if (major == 7U
            && (additional == 25U || additional == 26U || additional == 27U)) {
            return decode_float(ctx, additional, out);
        }

        CborLength length;
        status = cbor_internal::read_length(&ctx->cursor, additional, &length);
        if (status != CborDecodeStatus::Ok) {
            return status;
        }
        if (length.indefinite && (major < 2U || major > 5U)) {
            return CborDecodeStatus::InvalidLengthForMajorType;
        }

        switch (major) {
        case 0U:
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_unsigned(length.value)),
                              out);
        case 1U:
            return store_node(ctx,
                              ctx->doc->add_value(
                                  make_cbor_negative(length.value)),
                              out);
        case 2U: return decode_byte_string(ctx, length, out);
        case 3U: return decode_text_string(ctx, length, out);
        case 4U: return decode_array(ctx, depth, length, out);
        case 5U: return decode_map(ctx, depth, length, out);
        case 6U: return decode_tag(ctx, depth, length.value, out);
        default: return decode_simple(ctx, length.value, out);
        }
    }

}  // namespace

CborNodeId
CborKeepHooks::on_tag(CborDocument& doc, CborNodeId inner, uint64_t tag)
{
    return doc.add_tagged(tag, inner);
}


CborNodeId
CborKeepHooks::on_simple(CborDocument& doc, uint8_t code)
{
    return doc.add_value(make_cbor_custom_simple(code));
}


CborDecodeResult
decode_cbor(std::span<const std::byte> bytes, CborDocument& doc,
            const CborDecodeOptions& options) noexcept
{
    doc.clear();

    DecodeContext ctx(bytes);
    ctx.doc    = &doc;
    ctx.hooks  = options.hooks;
    ctx.limits = options.limits;

    if (options.limits.max_input_bytes != 0U
        && bytes.size() > options.limits.max_input_bytes) {
        ctx.result.status       = CborDecodeStatus::LimitExceeded;
        ctx.result.limit_reason = CborLimitReason::MaxInputBytes;
        return ctx.result;
    }

    CborNodeId root         = kInvalidCborNodeId;
    CborDecodeStatus status = decode_item(&ctx, 0U, &root);
    if (status == CborDecodeStatus::Ok && !ctx.cursor.at_end()) {
        status = CborDecodeStatus::TrailingBytes;
    }

    ctx.result.status = status;
    ctx.result.offset = ctx.cursor.offset();
    if (status != CborDecodeStatus::Ok) {
        doc.clear();
        return ctx.result;
    }

    doc.set_root(root);
    ctx.result.root = root;
    return ctx.result;
}


const char*
cbor_decode_status_name(CborDecodeStatus status) noexcept
{
    switch (status) {
    case CborDecodeStatus::Ok: return "ok";
    case CborDecodeStatus::MalformedLengthEncoding:
        return "malformed_length_encoding";
    case CborDecodeStatus::InvalidIndefiniteElement:
        return "invalid_indefinite_element";
    case CborDecodeStatus::InvalidLengthForMajorType:
        return "invalid_length_for_major_type";
    case CborDecodeStatus::OutOfBoundsRead: return "out_of_bounds_read";
    case CborDecodeStatus::TrailingBytes: return "trailing_bytes";
    case CborDecodeStatus::LimitExceeded: return "limit_exceeded";
    case CborDecodeStatus::HookRejected: return "hook_rejected";
    }
    return "unknown";
}


const char*
cbor_limit_reason_name(CborLimitReason reason) noexcept
{
    switch (reason) {
    case CborLimitReason::None: return "none";
    case CborLimitReason::MaxInputBytes: return "max_input_bytes";
    case CborLimitReason::MaxDepth: return "max_depth";
    case CborLimitReason::MaxItems: return "max_items";
    case CborLimitReason::MaxStringBytes: return "max_string_bytes";
    case CborLimitReason::DocumentSize: return "document_size";
    }
    return "unknown";
}

}  // namespace opencbor
