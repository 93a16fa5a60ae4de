#include "opencbor/cbor_format.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace opencbor {
namespace {

    static void append_u64(uint64_t value, std::string* out)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%llu",
                      static_cast<unsigned long long>(value));
        out->append(buf);
    }


    static void append_integer(const CborValue& v, std::string* out)
    {
        if (!v.negative) {
            append_u64(v.data.u64, out);
            return;
        }
        out->push_back('-');
        if (v.data.u64 == UINT64_MAX) {
            out->append("18446744073709551616");
            return;
        }
        append_u64(v.data.u64 + 1U, out);
    }


    static void append_escaped_text(std::span<const char16_t> units,
                                    uint32_t max_units, std::string* out)
    {
        const size_t n = (max_units == 0U || units.size() < max_units)
                             ? units.size()
                             : static_cast<size_t>(max_units);
        out->push_back('"');
        for (size_t i = 0; i < n; ++i) {
            const uint16_t c = static_cast<uint16_t>(units[i]);
            if (c == '\\' || c == '"') {
                out->push_back('\\');
                out->push_back(static_cast<char>(c));
                continue;
            }
            if (c == '\n') {
                out->append("\\n");
                continue;
            }
            if (c == '\r') {
                out->append("\\r");
                continue;
            }
            if (c == '\t') {
                out->append("\\t");
                continue;
            }
            if (c < 0x20U || c >= 0x7FU) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04X",
                              static_cast<unsigned>(c));
                out->append(buf);
                continue;
            }
            out->push_back(static_cast<char>(c));
        }
        if (n < units.size()) {
            out->append("...");
        }
        out->push_back('"');
    }


    static void append_byte_string(std::span<const std::byte> bytes,
                                   uint32_t max_bytes, std::string* out)
    {
        const size_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                             ? bytes.size()
                             : static_cast<size_t>(max_bytes);
        out->append("h'");
        for (size_t i = 0; i < n; ++i) {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%02x",
                          static_cast<unsigned>(
                              static_cast<uint8_t>(bytes[i])));
            out->append(buf);
        }
        if (n < bytes.size()) {
            out->append("...");
        }
        out->push_back('\'');
    }


    static void append_simple(const CborValue& v, std::string* out)
    {
        switch (v.simple) {
        case CborSimple::False: out->append("false"); return;
        case CborSimple::True: out->append("true"); return;
        case CborSimple::Null: out->append("null"); return;
        case CborSimple::Undefined: out->append("undefined"); return;
        case CborSimple::Custom:
            out->append("simple(");
            append_u64(v.simple_code, out);
            out->push_back(')');
            return;
        }
    }


    static void append_node(const CborDocument& doc, CborNodeId id,
                            const CborFormatOptions& options, std::string* out)
    {
        const CborValue& v = doc.node(id);
        switch (v.kind) {
        case CborValueKind::Integer: append_integer(v, out); return;
        case CborValueKind::Float: append_cbor_float(v.data.f64, out); return;
        case CborValueKind::Simple: append_simple(v, out); return;
        case CborValueKind::ByteString:
            append_byte_string(doc.bytes(id), options.max_bytes, out);
            return;
        case CborValueKind::TextString:
            append_escaped_text(doc.text_utf16(id), options.max_bytes, out);
            return;
        case CborValueKind::Tagged:
            append_u64(v.data.u64, out);
            out->push_back('(');
            append_node(doc, v.child, options, out);
            out->push_back(')');
            return;
        case CborValueKind::Array: {
            const std::span<const CborNodeId> items = doc.array_items(id);
            out->push_back('[');
            for (size_t i = 0; i < items.size(); ++i) {
                if (i != 0U) {
                    out->append(", ");
                }
                if (options.max_items != 0U && i >= options.max_items) {
                    out->append("...");
                    break;
                }
                append_node(doc, items[i], options, out);
            }
            out->push_back(']');
            return;
        }
        case CborValueKind::Map: {
            const std::span<const CborMapPair> pairs = doc.map_pairs(id);
            out->push_back('{');
            for (size_t i = 0; i < pairs.size(); ++i) {
                if (i != 0U) {
                    out->append(", ");
                }
                if (options.max_items != 0U && i >= options.max_items) {
                    out->append("...");
                    break;
                }
                append_node(doc, pairs[i].key, options, out);
                out->append(": ");
                append_node(doc, pairs[i].value, options, out);
            }
            out->push_back('}');
            return;
        }
        }
    }

}  // namespace

void
append_cbor_float(double value, std::string* out)
{
    if (!out) {
        return;
    }
    if (std::isnan(value)) {
        out->append("NaN");
        return;
    }
    if (std::isinf(value)) {
        out->append(value < 0.0 ? "-Infinity" : "Infinity");
        return;
    }

    // Shortest of %.15g/%.17g that round-trips.
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    if (std::strtod(buf, nullptr) != value) {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
    }
    out->append(buf);
    if (!std::strpbrk(buf, ".eE")) {
        out->append(".0");
    }
}


bool
format_cbor_diagnostic(const CborDocument& doc, CborNodeId node,
                       std::string* out, const CborFormatOptions& options)
{
    if (!out || !doc.valid(node)) {
        return false;
    }
    append_node(doc, node, options, out);
    return true;
}

}  // namespace opencbor
