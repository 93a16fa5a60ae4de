#include "opencbor/hex_payload.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

namespace opencbor {

TEST(HexPayload, DecodesEitherCase)
{
    std::vector<std::byte> out;
    ASSERT_EQ(decode_hex_payload("00aBFf7e", &out), HexPayloadStatus::Ok);
    ASSERT_EQ(out.size(), 4U);
    EXPECT_EQ(out[0], std::byte { 0x00 });
    EXPECT_EQ(out[1], std::byte { 0xAB });
    EXPECT_EQ(out[2], std::byte { 0xFF });
    EXPECT_EQ(out[3], std::byte { 0x7E });
}


TEST(HexPayload, EmptyInputIsEmptyPayload)
{
    std::vector<std::byte> out(3);
    ASSERT_EQ(decode_hex_payload("", &out), HexPayloadStatus::Ok);
    EXPECT_TRUE(out.empty());
}


TEST(HexPayload, RejectsMalformedText)
{
    std::vector<std::byte> out;
    EXPECT_EQ(decode_hex_payload("abc", &out), HexPayloadStatus::Malformed);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(decode_hex_payload("0g", &out), HexPayloadStatus::Malformed);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(decode_hex_payload("00 11", &out), HexPayloadStatus::Malformed);
    EXPECT_EQ(decode_hex_payload("00", nullptr), HexPayloadStatus::Malformed);
}

}  // namespace opencbor
