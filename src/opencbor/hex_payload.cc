#include "opencbor/hex_payload.h"

#include <cstdint>

namespace opencbor {
namespace {

    static int hex_digit(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return 10 + (c - 'a');
        }
        if (c >= 'A' && c <= 'F') {
            return 10 + (c - 'A');
        }
        return -1;
    }

}  // namespace

HexPayloadStatus
decode_hex_payload(std::string_view text, std::vector<std::byte>* out)
{
    if (!out) {
        return HexPayloadStatus::Malformed;
    }
    out->clear();
    if ((text.size() & 1U) != 0U) {
        return HexPayloadStatus::Malformed;
    }

    out->reserve(text.size() / 2U);
    for (size_t i = 0; i < text.size(); i += 2U) {
        const int hi = hex_digit(text[i + 0U]);
        const int lo = hex_digit(text[i + 1U]);
        if (hi < 0 || lo < 0) {
            out->clear();
            return HexPayloadStatus::Malformed;
        }
        out->push_back(std::byte { static_cast<uint8_t>((hi << 4) | lo) });
    }
    return HexPayloadStatus::Ok;
}

}  // namespace opencbor
