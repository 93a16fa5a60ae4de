#include "opencbor/cbor_decode.h"
#include "opencbor/cbor_format.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <string>

namespace opencbor {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
check_tree(const CborDocument& doc, CborNodeId id) noexcept
{
    const CborValue& v = doc.node(id);
    switch (v.kind) {
    case CborValueKind::Array:
        for (const CborNodeId item : doc.array_items(id)) {
            if (item >= id) {
                fuzz_trap();
            }
        }
        break;
    case CborValueKind::Map:
        for (const CborMapPair& pair : doc.map_pairs(id)) {
            if (pair.key >= id || pair.value >= id) {
                fuzz_trap();
            }
        }
        break;
    case CborValueKind::Tagged:
        if (v.child >= id) {
            fuzz_trap();
        }
        break;
    default: break;
    }
}

}  // namespace opencbor

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace opencbor;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    CborKeepHooks hooks;
    CborDecodeOptions options;
    options.hooks                   = &hooks;
    options.limits.max_depth        = 128;
    options.limits.max_items        = 200000;
    options.limits.max_input_bytes  = 1ULL * 1024ULL * 1024ULL;
    options.limits.max_string_bytes = 256U * 1024U;

    CborDocument doc;
    const CborDecodeResult r = decode_cbor(bytes, doc, options);
    if (r.offset > size) {
        fuzz_trap();
    }
    if (r.status != CborDecodeStatus::Ok) {
        if (doc.node_count() != 0U) {
            fuzz_trap();
        }
        return 0;
    }
    if (r.offset != size || !doc.valid(r.root)) {
        fuzz_trap();
    }
    for (CborNodeId id = 0; id < doc.node_count(); ++id) {
        check_tree(doc, id);
    }

    CborFormatOptions format;
    format.max_bytes = 64;
    format.max_items = 64;
    std::string out;
    (void)format_cbor_diagnostic(doc, r.root, &out, format);
    return 0;
}
