#include "opencbor/climate_packet.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace opencbor {
namespace {

    static ClimatePacketResult read(std::initializer_list<uint8_t> raw,
                                    ClimateReading* out)
    {
        std::vector<std::byte> bytes;
        for (uint8_t b : raw) {
            bytes.push_back(std::byte { b });
        }
        return decode_climate_packet(bytes, out);
    }

}  // namespace

TEST(ClimatePacket, ReadsAllThreeValues)
{
    // [0, [1, 21.6], [2, 45], [3, 612]]
    ClimateReading reading;
    const ClimatePacketResult r
        = decode_climate_hex("84008201fb403599999999999a8202182d8203190264",
                             &reading);
    ASSERT_EQ(r.status, ClimatePacketStatus::Ok);
    EXPECT_EQ(r.cbor.status, CborDecodeStatus::Ok);
    ASSERT_TRUE(reading.has_temperature);
    ASSERT_TRUE(reading.has_humidity);
    ASSERT_TRUE(reading.has_co2);
    EXPECT_EQ(reading.temperature, 22);
    EXPECT_EQ(reading.humidity, 45);
    EXPECT_EQ(reading.co2, 612);
}


TEST(ClimatePacket, HeaderMayBeAnyValue)
{
    ClimateReading reading;
    ASSERT_EQ(read({ 0x82, 0x61, 'x', 0x82, 0x01, 0x02 }, &reading).status,
              ClimatePacketStatus::Ok);
    EXPECT_TRUE(reading.has_temperature);
    EXPECT_EQ(reading.temperature, 2);
    EXPECT_FALSE(reading.has_humidity);
    EXPECT_FALSE(reading.has_co2);
}


TEST(ClimatePacket, RoundsHalfUp)
{
    ClimateReading reading;
    // [0, [1, -2.5]]
    ASSERT_EQ(read({ 0x82, 0x00, 0x82, 0x01, 0xF9, 0xC1, 0x00 }, &reading)
                  .status,
              ClimatePacketStatus::Ok);
    EXPECT_EQ(reading.temperature, -2);

    // [0, [2, 2.5]]
    ASSERT_EQ(read({ 0x82, 0x00, 0x82, 0x02, 0xF9, 0x41, 0x00 }, &reading)
                  .status,
              ClimatePacketStatus::Ok);
    EXPECT_EQ(reading.humidity, 3);
}


TEST(ClimatePacket, FloatIdMatchesNumerically)
{
    ClimateReading reading;
    // [0, [1.0, 7]]
    ASSERT_EQ(read({ 0x82, 0x00, 0x82, 0xF9, 0x3C, 0x00, 0x07 }, &reading)
                  .status,
              ClimatePacketStatus::Ok);
    EXPECT_TRUE(reading.has_temperature);
    EXPECT_EQ(reading.temperature, 7);
}


TEST(ClimatePacket, FirstMatchWins)
{
    ClimateReading reading;
    // [0, [3, 400], [3, 500]]
    ASSERT_EQ(read({ 0x83, 0x00, 0x82, 0x03, 0x19, 0x01, 0x90, 0x82, 0x03,
                     0x19, 0x01, 0xF4 },
                   &reading)
                  .status,
              ClimatePacketStatus::Ok);
    EXPECT_EQ(reading.co2, 400);
}


TEST(ClimatePacket, NonNumericValueIsAbsent)
{
    ClimateReading reading;
    // [0, [1, "a"], [2]]
    ASSERT_EQ(read({ 0x83, 0x00, 0x82, 0x01, 0x61, 'a', 0x81, 0x02 }, &reading)
                  .status,
              ClimatePacketStatus::Ok);
    EXPECT_FALSE(reading.has_temperature);
    EXPECT_FALSE(reading.has_humidity);
}


TEST(ClimatePacket, MalformedPackets)
{
    ClimateReading reading;
    EXPECT_EQ(read({ 0xA0 }, &reading).status, ClimatePacketStatus::Malformed);
    // [0, 5, [1, 2]]
    EXPECT_EQ(read({ 0x83, 0x00, 0x05, 0x82, 0x01, 0x02 }, &reading).status,
              ClimatePacketStatus::Malformed);
    // [0, [1, 2], 5]: found temperature, then hit 5 looking for humidity.
    EXPECT_EQ(read({ 0x83, 0x00, 0x82, 0x01, 0x02, 0x05 }, &reading).status,
              ClimatePacketStatus::Malformed);
    EXPECT_FALSE(reading.has_temperature);
}


TEST(ClimatePacket, DecodeAndHexFailures)
{
    ClimateReading reading;
    ClimatePacketResult r = read({ 0x80, 0x00 }, &reading);
    EXPECT_EQ(r.status, ClimatePacketStatus::DecodeFailed);
    EXPECT_EQ(r.cbor.status, CborDecodeStatus::TrailingBytes);

    r = decode_climate_hex("8", &reading);
    EXPECT_EQ(r.status, ClimatePacketStatus::InvalidHex);
    r = decode_climate_hex("zz", &reading);
    EXPECT_EQ(r.status, ClimatePacketStatus::InvalidHex);

    EXPECT_STREQ(climate_packet_status_name(ClimatePacketStatus::Malformed),
                 "malformed");
}

}  // namespace opencbor
