#include "opencbor/cbor_decode.h"
#include "opencbor/cbor_format.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace opencbor {

static std::vector<std::byte>
to_bytes(const std::vector<uint8_t>& raw)
{
    std::vector<std::byte> out;
    out.reserve(raw.size());
    for (uint8_t b : raw) {
        out.push_back(std::byte { b });
    }
    return out;
}


static void
cbor_decode_is_total(const std::vector<uint8_t>& raw)
{
    const std::vector<std::byte> bytes = to_bytes(raw);

    CborKeepHooks hooks;
    CborDecodeOptions options;
    options.hooks            = &hooks;
    options.limits.max_depth = 64;

    CborDocument doc;
    const CborDecodeResult r = decode_cbor(bytes, doc, options);
    ASSERT_LE(r.offset, bytes.size());
    if (r.status != CborDecodeStatus::Ok) {
        ASSERT_EQ(doc.node_count(), 0U);
        return;
    }
    ASSERT_EQ(r.offset, bytes.size());
    ASSERT_TRUE(doc.valid(r.root));

    std::string out;
    ASSERT_TRUE(format_cbor_diagnostic(doc, r.root, &out));
    ASSERT_FALSE(out.empty());
}


// Wrapping a valid item in a one-element array always decodes.
static void
cbor_array_wrap_roundtrip(const std::vector<uint8_t>& raw)
{
    const std::vector<std::byte> bytes = to_bytes(raw);

    CborDocument inner;
    if (decode_cbor(bytes, inner).status != CborDecodeStatus::Ok) {
        return;
    }

    std::vector<std::byte> wrapped;
    wrapped.push_back(std::byte { 0x81 });
    wrapped.insert(wrapped.end(), bytes.begin(), bytes.end());

    CborDecodeOptions options;
    options.limits.max_depth = 0;
    options.limits.max_items = 0;

    CborDocument outer;
    const CborDecodeResult r = decode_cbor(wrapped, outer, options);
    ASSERT_EQ(r.status, CborDecodeStatus::Ok);
    ASSERT_EQ(outer.array_items(r.root).size(), 1U);
}


FUZZ_TEST(CborDecodeFuzz, cbor_decode_is_total)
    .WithDomains(fuzztest::VectorOf(fuzztest::Arbitrary<uint8_t>())
                     .WithMaxSize(4096));

FUZZ_TEST(CborDecodeFuzz, cbor_array_wrap_roundtrip)
    .WithDomains(fuzztest::VectorOf(fuzztest::Arbitrary<uint8_t>())
                     .WithMaxSize(512));

}  // namespace opencbor
