#include "opencbor/build_info.h"
#include "opencbor/cbor_decode.h"
#include "opencbor/cbor_format.h"
#include "opencbor/climate_packet.h"
#include "opencbor/hex_payload.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <bit>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace opencbor {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(build_info(), &line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static CborDecodeLimits make_limits(uint64_t max_input_bytes,
                                        uint32_t max_depth, uint32_t max_items,
                                        uint64_t max_string_bytes)
    {
        CborDecodeLimits limits;
        limits.max_input_bytes  = max_input_bytes;
        limits.max_depth        = max_depth;
        limits.max_items        = max_items;
        limits.max_string_bytes = max_string_bytes;
        return limits;
    }


    [[noreturn]] static void throw_decode_error(const CborDecodeResult& r)
    {
        std::string msg("CBOR decode failed: ");
        msg.append(cbor_decode_status_name(r.status));
        if (r.status == CborDecodeStatus::LimitExceeded) {
            msg.append(" (");
            msg.append(cbor_limit_reason_name(r.limit_reason));
            msg.append(")");
        }
        msg.append(" at offset ");
        msg.append(std::to_string(r.offset));
        throw std::invalid_argument(msg);
    }


    static void decode_or_throw(const nb::bytes& data,
                                const CborDecodeOptions& options,
                                CborDocument* doc)
    {
        CborDecodeResult r;
        {
            nb::gil_scoped_release gil_release;
            r = decode_cbor(bytes_view(data), *doc, options);
        }
        if (r.status != CborDecodeStatus::Ok) {
            throw_decode_error(r);
        }
    }


    static nb::object integer_to_python(const CborValue& v)
    {
        if (!v.negative) {
            return nb::int_(v.data.u64);
        }
        int64_t i = 0;
        if (cbor_to_i64(v, &i)) {
            return nb::int_(i);
        }
        // -1 - n == ~n
        PyObject* n = PyLong_FromUnsignedLongLong(
            static_cast<unsigned long long>(v.data.u64));
        if (!n) {
            nb::raise_python_error();
        }
        PyObject* inv = PyNumber_Invert(n);
        Py_DECREF(n);
        if (!inv) {
            nb::raise_python_error();
        }
        return nb::steal(inv);
    }


    static nb::object text_to_python(std::span<const char16_t> units)
    {
        int byteorder = (std::endian::native == std::endian::little) ? -1 : 1;
        PyObject* s   = PyUnicode_DecodeUTF16(
            reinterpret_cast<const char*>(units.data()),
            static_cast<Py_ssize_t>(units.size() * sizeof(char16_t)),
            "surrogatepass", &byteorder);
        if (!s) {
            nb::raise_python_error();
        }
        return nb::steal(s);
    }


    static nb::object list_to_tuple(const nb::list& items)
    {
        PyObject* t = PySequence_Tuple(items.ptr());
        if (!t) {
            nb::raise_python_error();
        }
        return nb::steal(t);
    }


    // Converts a decoded tree, applying the Python tag/simple callables.
    class PyConverter final {
    public:
        PyConverter(const CborDocument& doc, nb::object tagger,
                    nb::object simple_value)
            : doc_(doc)
            , tagger_(std::move(tagger))
            , simple_value_(std::move(simple_value))
        {
        }

        nb::object value(CborNodeId id) const
        {
            const CborValue& v = doc_.node(id);
            switch (v.kind) {
            case CborValueKind::Integer: return integer_to_python(v);
            case CborValueKind::Float: return nb::float_(v.data.f64);
            case CborValueKind::ByteString: {
                const std::span<const std::byte> b = doc_.bytes(id);
                return nb::bytes(reinterpret_cast<const char*>(b.data()),
                                 b.size());
            }
            case CborValueKind::TextString:
                return text_to_python(doc_.text_utf16(id));
            case CborValueKind::Array: {
                nb::list out;
                for (const CborNodeId item : doc_.array_items(id)) {
                    out.append(value(item));
                }
                return std::move(out);
            }
            case CborValueKind::Map: {
                nb::dict out;
                for (const CborMapPair& pair : doc_.map_pairs(id)) {
                    out[key(pair.key)] = value(pair.value);
                }
                return std::move(out);
            }
            case CborValueKind::Tagged: {
                nb::object inner = value(v.child);
                if (tagger_.is_none()) {
                    return inner;
                }
                return tagger_(inner, nb::int_(v.data.u64));
            }
            case CborValueKind::Simple: return simple(v);
            }
            return nb::none();
        }

    private:
        nb::object simple(const CborValue& v) const
        {
            switch (v.simple) {
            case CborSimple::False: return nb::bool_(false);
            case CborSimple::True: return nb::bool_(true);
            case CborSimple::Null:
            case CborSimple::Undefined: return nb::none();
            case CborSimple::Custom: break;
            }
            if (simple_value_.is_none()) {
                return nb::none();
            }
            return simple_value_(nb::int_(v.simple_code));
        }

        // dict keys must be hashable: containers, also under a tag, become
        // tuples.
        nb::object key(CborNodeId id) const
        {
            const CborValue& v = doc_.node(id);
            if (v.kind == CborValueKind::Array) {
                const std::span<const CborNodeId> items = doc_.array_items(id);
                nb::list parts;
                for (const CborNodeId item : items) {
                    parts.append(key(item));
                }
                return list_to_tuple(parts);
            }
            if (v.kind == CborValueKind::Map) {
                nb::list parts;
                for (const CborMapPair& pair : doc_.map_pairs(id)) {
                    parts.append(nb::make_tuple(key(pair.key),
                                                key(pair.value)));
                }
                return list_to_tuple(parts);
            }
            if (v.kind == CborValueKind::Tagged && tagger_.is_none()) {
                return key(v.child);
            }
            return value(id);
        }

        const CborDocument& doc_;
        nb::object tagger_;
        nb::object simple_value_;
    };


    static nb::object decode_to_python(nb::bytes data, nb::object tagger,
                                       nb::object simple_value,
                                       uint64_t max_input_bytes,
                                       uint32_t max_depth, uint32_t max_items,
                                       uint64_t max_string_bytes)
    {
        CborKeepHooks hooks;
        CborDecodeOptions options;
        options.limits = make_limits(max_input_bytes, max_depth, max_items,
                                     max_string_bytes);
        options.hooks  = &hooks;

        CborDocument doc;
        decode_or_throw(data, options, &doc);
        const PyConverter conv(doc, std::move(tagger),
                               std::move(simple_value));
        return conv.value(doc.root());
    }


    static nb::bytes hex_to_python(const std::string& text)
    {
        std::vector<std::byte> out;
        if (decode_hex_payload(text, &out) != HexPayloadStatus::Ok) {
            throw std::invalid_argument("malformed hex payload");
        }
        return nb::bytes(reinterpret_cast<const char*>(out.data()),
                         out.size());
    }


    static nb::object reading_to_python(bool has, int64_t v)
    {
        if (!has) {
            return nb::none();
        }
        return nb::int_(v);
    }


    static nb::dict climate_to_python(const ClimatePacketResult& r,
                                      const ClimateReading& reading)
    {
        if (r.status == ClimatePacketStatus::DecodeFailed) {
            throw_decode_error(r.cbor);
        }
        if (r.status != ClimatePacketStatus::Ok) {
            std::string msg("climate packet: ");
            msg.append(climate_packet_status_name(r.status));
            throw std::invalid_argument(msg);
        }
        nb::dict d;
        d["temperature"] = reading_to_python(reading.has_temperature,
                                             reading.temperature);
        d["humidity"]    = reading_to_python(reading.has_humidity,
                                             reading.humidity);
        d["co2"]         = reading_to_python(reading.has_co2, reading.co2);
        return d;
    }

}  // namespace
}  // namespace opencbor

NB_MODULE(_opencbor, m)
{
    using namespace opencbor;

    m.doc()               = "OpenCbor CBOR decoding bindings (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<CborDecodeStatus>(m, "CborDecodeStatus")
        .value("Ok", CborDecodeStatus::Ok)
        .value("MalformedLengthEncoding",
               CborDecodeStatus::MalformedLengthEncoding)
        .value("InvalidIndefiniteElement",
               CborDecodeStatus::InvalidIndefiniteElement)
        .value("InvalidLengthForMajorType",
               CborDecodeStatus::InvalidLengthForMajorType)
        .value("OutOfBoundsRead", CborDecodeStatus::OutOfBoundsRead)
        .value("TrailingBytes", CborDecodeStatus::TrailingBytes)
        .value("LimitExceeded", CborDecodeStatus::LimitExceeded)
        .value("HookRejected", CborDecodeStatus::HookRejected);

    nb::enum_<CborLimitReason>(m, "CborLimitReason")
        .value("None", CborLimitReason::None)
        .value("MaxInputBytes", CborLimitReason::MaxInputBytes)
        .value("MaxDepth", CborLimitReason::MaxDepth)
        .value("MaxItems", CborLimitReason::MaxItems)
        .value("MaxStringBytes", CborLimitReason::MaxStringBytes)
        .value("DocumentSize", CborLimitReason::DocumentSize);

    const CborDecodeLimits defaults;

    m.def("decode", &decode_to_python, "data"_a, "tagger"_a = nb::none(),
          "simple_value"_a = nb::none(),
          "max_input_bytes"_a  = defaults.max_input_bytes,
          "max_depth"_a        = defaults.max_depth,
          "max_items"_a        = defaults.max_items,
          "max_string_bytes"_a = defaults.max_string_bytes);

    m.def(
        "status",
        [](nb::bytes data) {
            CborDocument doc;
            CborDecodeResult r;
            {
                nb::gil_scoped_release gil_release;
                r = decode_cbor(bytes_view(data), doc);
            }
            return std::make_pair(r.status, r.offset);
        },
        "data"_a);

    m.def("decode_hex", &hex_to_python, "text"_a);

    m.def(
        "read_climate",
        [](nb::bytes data) {
            ClimateReading reading;
            const ClimatePacketResult r
                = decode_climate_packet(bytes_view(data), &reading);
            return climate_to_python(r, reading);
        },
        "data"_a);

    m.def(
        "read_climate_hex",
        [](const std::string& text) {
            ClimateReading reading;
            const ClimatePacketResult r = decode_climate_hex(text, &reading);
            return climate_to_python(r, reading);
        },
        "text"_a);

    m.def(
        "format_diagnostic",
        [](nb::bytes data, uint32_t max_bytes, uint32_t max_items) {
            CborKeepHooks hooks;
            CborDecodeOptions options;
            options.hooks = &hooks;
            CborDocument doc;
            decode_or_throw(data, options, &doc);

            CborFormatOptions format;
            format.max_bytes = max_bytes;
            format.max_items = max_items;
            std::string out;
            format_cbor_diagnostic(doc, doc.root(), &out, format);
            return out;
        },
        "data"_a, "max_bytes"_a = 0U, "max_items"_a = 0U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]       = sv_to_py(bi.version);
        d["timestamp_utc"] = sv_to_py(bi.timestamp_utc);
        d["build_type"]    = sv_to_py(bi.build_type);
        d["compiler"]      = sv_to_py(bi.compiler);
        d["platform"]      = sv_to_py(bi.platform);
        d["linkage"]       = library_linkage_name(bi.linkage);
        return d;
    });

    m.def("info_lines", &info_lines);
}
