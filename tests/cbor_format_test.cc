#include "opencbor/cbor_format.h"

#include "opencbor/cbor_decode.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

namespace opencbor {
namespace {

    static std::string diag(std::initializer_list<uint8_t> raw,
                            const CborFormatOptions& format
                            = CborFormatOptions {})
    {
        std::vector<std::byte> bytes;
        for (uint8_t b : raw) {
            bytes.push_back(std::byte { b });
        }

        CborKeepHooks hooks;
        CborDecodeOptions options;
        options.hooks = &hooks;

        CborDocument doc;
        const CborDecodeResult r = decode_cbor(bytes, doc, options);
        EXPECT_EQ(r.status, CborDecodeStatus::Ok);

        std::string out;
        EXPECT_TRUE(format_cbor_diagnostic(doc, r.root, &out, format));
        return out;
    }


    static std::string float_text(double v)
    {
        std::string out;
        append_cbor_float(v, &out);
        return out;
    }

}  // namespace

TEST(CborFormat, Integers)
{
    EXPECT_EQ(diag({ 0x00 }), "0");
    EXPECT_EQ(diag({ 0x38, 0x63 }), "-100");
    EXPECT_EQ(diag({ 0x1B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF }),
              "18446744073709551615");
    EXPECT_EQ(diag({ 0x3B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF }),
              "-18446744073709551616");
}


TEST(CborFormat, Floats)
{
    EXPECT_EQ(float_text(1.0), "1.0");
    EXPECT_EQ(float_text(1.5), "1.5");
    EXPECT_EQ(float_text(0.1), "0.1");
    EXPECT_EQ(float_text(-0.0), "-0.0");
    EXPECT_EQ(float_text(1e300), "1e+300");
    EXPECT_EQ(float_text(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(float_text(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(float_text(-std::numeric_limits<double>::infinity()),
              "-Infinity");
    EXPECT_EQ(diag({ 0xF9, 0x3E, 0x00 }), "1.5");
}


TEST(CborFormat, Containers)
{
    EXPECT_EQ(diag({ 0x83, 0x01, 0x21, 0x80 }), "[1, -2, []]");
    EXPECT_EQ(diag({ 0xA2, 0x61, 'a', 0x42, 0x01, 0x02, 0x01, 0xA0 }),
              "{\"a\": h'0102', 1: {}}");
}


TEST(CborFormat, SimpleValuesAndTags)
{
    EXPECT_EQ(diag({ 0x84, 0xF4, 0xF5, 0xF6, 0xF7 }),
              "[false, true, null, undefined]");
    EXPECT_EQ(diag({ 0xF8, 0x20 }), "simple(32)");
    EXPECT_EQ(diag({ 0xC1, 0x1A, 0x51, 0x4B, 0x67, 0xB0 }), "1(1363896240)");
}


TEST(CborFormat, EscapesText)
{
    EXPECT_EQ(diag({ 0x67, 'a', '"', 'b', '\\', 0x0A, 0xC3, 0xA9 }),
              "\"a\\\"b\\\\\\n\\u00E9\"");
    EXPECT_EQ(diag({ 0x64, 0xF0, 0x9F, 0x98, 0x80 }), "\"\\uD83D\\uDE00\"");
}


TEST(CborFormat, TruncatesLongValues)
{
    CborFormatOptions format;
    format.max_bytes = 2;
    format.max_items = 2;

    EXPECT_EQ(diag({ 0x43, 0x01, 0x02, 0x03 }, format), "h'0102...'");
    EXPECT_EQ(diag({ 0x64, 'a', 'b', 'c', 'd' }, format), "\"ab...\"");
    EXPECT_EQ(diag({ 0x83, 0x01, 0x02, 0x03 }, format), "[1, 2, ...]");
    EXPECT_EQ(diag({ 0x42, 0x01, 0x02 }, format), "h'0102'");
}


TEST(CborFormat, InvalidNodeFails)
{
    CborDocument doc;
    std::string out;
    EXPECT_FALSE(format_cbor_diagnostic(doc, 0, &out));
    EXPECT_TRUE(out.empty());
}

}  // namespace opencbor
