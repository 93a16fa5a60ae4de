#include "opencbor/cbor_document.h"

#include <bit>
#include <cstring>
#include <limits>

namespace opencbor {
namespace {

    static constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
    static constexpr uint64_t kFnvPrime  = 1099511628211ULL;

    static uint64_t mix_u64(uint64_t h, uint64_t v) noexcept
    {
        for (uint32_t i = 0; i < 8U; ++i) {
            h ^= (v >> (i * 8U)) & 0xFFU;
            h *= kFnvPrime;
        }
        return h;
    }

    static bool fits_u32(size_t current, size_t extra) noexcept
    {
        const size_t limit = std::numeric_limits<uint32_t>::max();
        return current <= limit && extra <= limit - current;
    }

    static const CborValue kUndefinedValue = make_cbor_simple(
        CborSimple::Undefined);

}  // namespace

void
CborDocument::clear() noexcept
{
    nodes_.clear();
    links_.clear();
    pairs_.clear();
    bytes_.clear();
    units_.clear();
    root_ = kInvalidCborNodeId;
}


CborNodeId
CborDocument::add_value(const CborValue& value)
{
    if (!fits_u32(nodes_.size(), 1U) || nodes_.size() >= kInvalidCborNodeId) {
        return kInvalidCborNodeId;
    }
    switch (value.kind) {
    case CborValueKind::Integer:
    case CborValueKind::Simple:
    case CborValueKind::Float: break;
    default:
        // Pool-backed kinds go through their dedicated builders.
        return kInvalidCborNodeId;
    }
    nodes_.push_back(value);
    return static_cast<CborNodeId>(nodes_.size() - 1U);
}


CborNodeId
CborDocument::add_bytes(std::span<const std::byte> bytes)
{
    if (!fits_u32(bytes_.size(), bytes.size())
        || nodes_.size() >= kInvalidCborNodeId) {
        return kInvalidCborNodeId;
    }
    CborValue v;
    v.kind             = CborValueKind::ByteString;
    v.count            = static_cast<uint32_t>(bytes.size());
    v.data.span.offset = static_cast<uint32_t>(bytes_.size());
    v.data.span.size   = static_cast<uint32_t>(bytes.size());
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    nodes_.push_back(v);
    return static_cast<CborNodeId>(nodes_.size() - 1U);
}


CborNodeId
CborDocument::add_text_utf16(std::span<const char16_t> units)
{
    if (!fits_u32(units_.size(), units.size())
        || nodes_.size() >= kInvalidCborNodeId) {
        return kInvalidCborNodeId;
    }
    CborValue v;
    v.kind             = CborValueKind::TextString;
    v.count            = static_cast<uint32_t>(units.size());
    v.data.span.offset = static_cast<uint32_t>(units_.size());
    v.data.span.size   = static_cast<uint32_t>(units.size());
    units_.insert(units_.end(), units.begin(), units.end());
    nodes_.push_back(v);
    return static_cast<CborNodeId>(nodes_.size() - 1U);
}


CborNodeId
CborDocument::add_text(std::string_view text)
{
    std::vector<char16_t> units;
    if (!append_utf8_as_utf16(text, &units)) {
        return kInvalidCborNodeId;
    }
    return add_text_utf16(units);
}


CborNodeId
CborDocument::add_array(std::span<const CborNodeId> items)
{
    if (!fits_u32(links_.size(), items.size())
        || nodes_.size() >= kInvalidCborNodeId) {
        return kInvalidCborNodeId;
    }
    for (const CborNodeId id : items) {
        if (!valid(id)) {
            return kInvalidCborNodeId;
        }
    }
    CborValue v;
    v.kind             = CborValueKind::Array;
    v.count            = static_cast<uint32_t>(items.size());
    v.data.span.offset = static_cast<uint32_t>(links_.size());
    v.data.span.size   = static_cast<uint32_t>(items.size());
    links_.insert(links_.end(), items.begin(), items.end());
    nodes_.push_back(v);
    return static_cast<CborNodeId>(nodes_.size() - 1U);
}


CborNodeId
CborDocument::add_map(std::span<const CborMapPair> pairs)
{
    if (!fits_u32(pairs_.size(), pairs.size())
        || nodes_.size() >= kInvalidCborNodeId) {
        return kInvalidCborNodeId;
    }
    for (const CborMapPair& p : pairs) {
        if (!valid(p.key) || !valid(p.value)) {
            return kInvalidCborNodeId;
        }
    }
    CborValue v;
    v.kind             = CborValueKind::Map;
    v.count            = static_cast<uint32_t>(pairs.size());
    v.data.span.offset = static_cast<uint32_t>(pairs_.size());
    v.data.span.size   = static_cast<uint32_t>(pairs.size());
    pairs_.insert(pairs_.end(), pairs.begin(), pairs.end());
    nodes_.push_back(v);
    return static_cast<CborNodeId>(nodes_.size() - 1U);
}


CborNodeId
CborDocument::add_tagged(uint64_t tag, CborNodeId inner)
{
    if (!valid(inner) || nodes_.size() >= kInvalidCborNodeId) {
        return kInvalidCborNodeId;
    }
    CborValue v;
    v.kind     = CborValueKind::Tagged;
    v.count    = 1;
    v.child    = inner;
    v.data.u64 = tag;
    nodes_.push_back(v);
    return static_cast<CborNodeId>(nodes_.size() - 1U);
}


void
CborDocument::set_root(CborNodeId root) noexcept
{
    root_ = valid(root) ? root : kInvalidCborNodeId;
}


CborNodeId
CborDocument::root() const noexcept
{
    return root_;
}


uint32_t
CborDocument::node_count() const noexcept
{
    return static_cast<uint32_t>(nodes_.size());
}


bool
CborDocument::valid(CborNodeId id) const noexcept
{
    return id < nodes_.size();
}


const CborValue&
CborDocument::node(CborNodeId id) const noexcept
{
    if (!valid(id)) {
        return kUndefinedValue;
    }
    return nodes_[id];
}


std::span<const std::byte>
CborDocument::bytes(CborNodeId id) const noexcept
{
    const CborValue& v = node(id);
    if (v.kind != CborValueKind::ByteString) {
        return {};
    }
    return std::span<const std::byte>(bytes_.data() + v.data.span.offset,
                                      v.data.span.size);
}


std::span<const char16_t>
CborDocument::text_utf16(CborNodeId id) const noexcept
{
    const CborValue& v = node(id);
    if (v.kind != CborValueKind::TextString) {
        return {};
    }
    return std::span<const char16_t>(units_.data() + v.data.span.offset,
                                     v.data.span.size);
}


bool
CborDocument::text_utf8(CborNodeId id, std::string* out) const
{
    if (!out || node(id).kind != CborValueKind::TextString) {
        return false;
    }
    append_utf16_as_utf8(text_utf16(id), out);
    return true;
}


std::span<const CborNodeId>
CborDocument::array_items(CborNodeId id) const noexcept
{
    const CborValue& v = node(id);
    if (v.kind != CborValueKind::Array) {
        return {};
    }
    return std::span<const CborNodeId>(links_.data() + v.data.span.offset,
                                       v.data.span.size);
}


std::span<const CborMapPair>
CborDocument::map_pairs(CborNodeId id) const noexcept
{
    const CborValue& v = node(id);
    if (v.kind != CborValueKind::Map) {
        return {};
    }
    return std::span<const CborMapPair>(pairs_.data() + v.data.span.offset,
                                        v.data.span.size);
}


CborNodeId
CborDocument::find_map_int(CborNodeId map, int64_t key) const noexcept
{
    for (const CborMapPair& p : map_pairs(map)) {
        int64_t k = 0;
        if (cbor_to_i64(node(p.key), &k) && k == key) {
            return p.value;
        }
    }
    return kInvalidCborNodeId;
}


CborNodeId
CborDocument::find_map_text(CborNodeId map, std::string_view key) const
{
    std::vector<char16_t> wanted;
    if (!append_utf8_as_utf16(key, &wanted)) {
        return kInvalidCborNodeId;
    }
    for (const CborMapPair& p : map_pairs(map)) {
        const std::span<const char16_t> units = text_utf16(p.key);
        if (node(p.key).kind != CborValueKind::TextString
            || units.size() != wanted.size()) {
            continue;
        }
        if (units.empty()
            || std::memcmp(units.data(), wanted.data(),
                           units.size() * sizeof(char16_t))
                   == 0) {
            return p.value;
        }
    }
    return kInvalidCborNodeId;
}


bool
CborDocument::equal(CborNodeId a, CborNodeId b) const noexcept
{
    if (a == b) {
        return valid(a);
    }
    if (!valid(a) || !valid(b)) {
        return false;
    }
    const CborValue& va = nodes_[a];
    const CborValue& vb = nodes_[b];
    if (va.kind != vb.kind) {
        return false;
    }

    switch (va.kind) {
    case CborValueKind::Integer:
        return va.negative == vb.negative && va.data.u64 == vb.data.u64;
    case CborValueKind::Float:
        return std::bit_cast<uint64_t>(va.data.f64)
               == std::bit_cast<uint64_t>(vb.data.f64);
    case CborValueKind::Simple:
        return va.simple == vb.simple
               && (va.simple != CborSimple::Custom
                   || va.simple_code == vb.simple_code);
    case CborValueKind::ByteString: {
        const std::span<const std::byte> x = bytes(a);
        const std::span<const std::byte> y = bytes(b);
        return x.size() == y.size()
               && (x.empty() || std::memcmp(x.data(), y.data(), x.size()) == 0);
    }
    case CborValueKind::TextString: {
        const std::span<const char16_t> x = text_utf16(a);
        const std::span<const char16_t> y = text_utf16(b);
        return x.size() == y.size()
               && (x.empty()
                   || std::memcmp(x.data(), y.data(),
                                  x.size() * sizeof(char16_t))
                          == 0);
    }
    case CborValueKind::Array: {
        const std::span<const CborNodeId> x = array_items(a);
        const std::span<const CborNodeId> y = array_items(b);
        if (x.size() != y.size()) {
            return false;
        }
        for (size_t i = 0; i < x.size(); ++i) {
            if (!equal(x[i], y[i])) {
                return false;
            }
        }
        return true;
    }
    case CborValueKind::Map: {
        const std::span<const CborMapPair> x = map_pairs(a);
        const std::span<const CborMapPair> y = map_pairs(b);
        if (x.size() != y.size()) {
            return false;
        }
        for (size_t i = 0; i < x.size(); ++i) {
            if (!equal(x[i].key, y[i].key) || !equal(x[i].value, y[i].value)) {
                return false;
            }
        }
        return true;
    }
    case CborValueKind::Tagged:
        return va.data.u64 == vb.data.u64 && equal(va.child, vb.child);
    }
    return false;
}


uint64_t
CborDocument::hash(CborNodeId id) const noexcept
{
    if (!valid(id)) {
        return 0;
    }
    const CborValue& v = nodes_[id];
    uint64_t h         = mix_u64(kFnvOffset, static_cast<uint64_t>(v.kind));

    switch (v.kind) {
    case CborValueKind::Integer:
        h = mix_u64(h, v.negative ? 1U : 0U);
        return mix_u64(h, v.data.u64);
    case CborValueKind::Float:
        return mix_u64(h, std::bit_cast<uint64_t>(v.data.f64));
    case CborValueKind::Simple:
        h = mix_u64(h, static_cast<uint64_t>(v.simple));
        if (v.simple == CborSimple::Custom) {
            h = mix_u64(h, v.simple_code);
        }
        return h;
    case CborValueKind::ByteString:
        for (const std::byte b : bytes(id)) {
            h ^= static_cast<uint8_t>(b);
            h *= kFnvPrime;
        }
        return mix_u64(h, v.count);
    case CborValueKind::TextString:
        for (const char16_t u : text_utf16(id)) {
            h ^= static_cast<uint16_t>(u);
            h *= kFnvPrime;
        }
        return mix_u64(h, v.count);
    case CborValueKind::Array:
        for (const CborNodeId child : array_items(id)) {
            h = mix_u64(h, hash(child));
        }
        return mix_u64(h, v.count);
    case CborValueKind::Map:
        for (const CborMapPair& p : map_pairs(id)) {
            h = mix_u64(h, hash(p.key));
            h = mix_u64(h, hash(p.value));
        }
        return mix_u64(h, v.count);
    case CborValueKind::Tagged:
        h = mix_u64(h, v.data.u64);
        return mix_u64(h, hash(v.child));
    }
    return h;
}


void
append_utf16_as_utf8(std::span<const char16_t> units, std::string* out)
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + units.size());
    size_t i = 0;
    while (i < units.size()) {
        uint32_t cp = static_cast<uint16_t>(units[i]);
        i += 1U;
        if (cp >= 0xD800U && cp <= 0xDBFFU && i < units.size()) {
            const uint32_t lo = static_cast<uint16_t>(units[i]);
            if (lo >= 0xDC00U && lo <= 0xDFFFU) {
                cp = 0x10000U + ((cp - 0xD800U) << 10U) + (lo - 0xDC00U);
                i += 1U;
            }
        }
        if (cp >= 0xD800U && cp <= 0xDFFFU) {
            cp = 0xFFFDU;
        }

        if (cp < 0x80U) {
            out->push_back(static_cast<char>(cp));
        } else if (cp < 0x800U) {
            out->push_back(static_cast<char>(0xC0U | (cp >> 6U)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        } else if (cp < 0x10000U) {
            out->push_back(static_cast<char>(0xE0U | (cp >> 12U)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        } else {
            out->push_back(static_cast<char>(0xF0U | (cp >> 18U)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        }
    }
}


bool
append_utf8_as_utf16(std::string_view text, std::vector<char16_t>* out)
{
    if (!out) {
        return false;
    }
    size_t index = 0;
    while (index < text.size()) {
        const uint8_t c0 = static_cast<uint8_t>(text[index]);
        if ((c0 & 0x80U) == 0U) {
            out->push_back(static_cast<char16_t>(c0));
            index += 1U;
            continue;
        }

        uint32_t needed    = 0U;
        uint32_t min_cp    = 0U;
        uint32_t codepoint = 0U;
        if ((c0 & 0xE0U) == 0xC0U) {
            needed    = 1U;
            min_cp    = 0x80U;
            codepoint = c0 & 0x1FU;
        } else if ((c0 & 0xF0U) == 0xE0U) {
            needed    = 2U;
            min_cp    = 0x800U;
            codepoint = c0 & 0x0FU;
        } else if ((c0 & 0xF8U) == 0xF0U) {
            needed    = 3U;
            min_cp    = 0x10000U;
            codepoint = c0 & 0x07U;
        } else {
            return false;
        }
        if (needed > text.size() - index - 1U) {
            return false;
        }
        for (uint32_t j = 0U; j < needed; ++j) {
            const uint8_t c = static_cast<uint8_t>(text[index + 1U + j]);
            if ((c & 0xC0U) != 0x80U) {
                return false;
            }
            codepoint = (codepoint << 6U) | static_cast<uint32_t>(c & 0x3FU);
        }
        if (codepoint < min_cp || codepoint > 0x10FFFFU
            || (codepoint >= 0xD800U && codepoint <= 0xDFFFU)) {
            return false;
        }

        if (codepoint < 0x10000U) {
            out->push_back(static_cast<char16_t>(codepoint));
        } else {
            const uint32_t v = codepoint - 0x10000U;
            out->push_back(static_cast<char16_t>(0xD800U | (v >> 10U)));
            out->push_back(static_cast<char16_t>(0xDC00U | (v & 0x3FFU)));
        }
        index += static_cast<size_t>(needed + 1U);
    }
    return true;
}

}  // namespace opencbor
