#include "opencbor/climate_packet.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace opencbor;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    CborDecodeOptions options;
    options.limits.max_depth       = 64;
    options.limits.max_items       = 100000;
    options.limits.max_input_bytes = 1ULL * 1024ULL * 1024ULL;

    ClimateReading reading;
    (void)decode_climate_packet(bytes, &reading, options);

    const std::string_view text(reinterpret_cast<const char*>(data), size);
    (void)decode_climate_hex(text, &reading, options);
    return 0;
}
