#include <gtest/gtest.h>

#include "frame.h"
#include "requests.h"
#include "responses.h"
#include "test_frames.h"

using hacklet::test::bytes;

namespace requests = hacklet::protocol::requests;
namespace responses = hacklet::protocol::responses;

TEST(Frame, BootRequestHasProperChecksum) {
    EXPECT_EQ(hacklet::protocol::checksum(requests::boot_command, { }), 0x44);
    EXPECT_EQ(hacklet::protocol::encode(requests::boot()), bytes({ 0x02, 0x40, 0x04, 0x00, 0x44 }));
}

TEST(Frame, BootConfirmRequestEncoding) {
    EXPECT_EQ(hacklet::protocol::encode(requests::boot_confirm()), bytes({ 0x02, 0x40, 0x00, 0x00, 0x40 }));
}

TEST(Frame, DecodeRejectsInvalidChecksum) {
    const auto res = hacklet::protocol::decode(bytes({ 0x02, 0x40, 0x80, 0x01, 0x10, 0x01 }));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), "Invalid checksum.");
}

TEST(Frame, DecodeRejectsInvalidHeader) {
    const auto res = hacklet::protocol::decode(bytes({ 0x03, 0x40, 0x04, 0x00, 0x44 }));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), "Invalid header 0x03.");
}

TEST(Frame, DecodeRejectsTruncatedPayload) {
    EXPECT_FALSE(hacklet::protocol::decode(bytes({ 0x02, 0x40 })).has_value());
    const auto res = hacklet::protocol::decode(bytes({ 0x02, 0x40, 0x80, 0x04, 0x10, 0x11 }));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), "Incomplete frame.");
}

TEST(Frame, DecodeExtractsCommandAndPayload) {
    const auto res = hacklet::protocol::decode(bytes({ 0x02, 0x40, 0x80, 0x01, 0x10, 0xD1 }));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->command, 0x4080);
    EXPECT_EQ(res->payload, bytes({ 0x10 }));
}

TEST(Requests, UnlockAndLockDifferOnlyInData) {
    EXPECT_EQ(hacklet::protocol::encode(requests::unlock()), bytes({ 0x02, 0xA2, 0x36, 0x04, 0xFC, 0xFF, 0x90, 0x01, 0x02 }));
    EXPECT_EQ(hacklet::protocol::encode(requests::lock()), bytes({ 0x02, 0xA2, 0x36, 0x04, 0xFC, 0xFF, 0x00, 0x01, 0x92 }));
}

TEST(Requests, HandshakeEncoding) {
    EXPECT_EQ(hacklet::protocol::encode(requests::handshake(0x1234)), bytes({ 0x02, 0x40, 0x03, 0x04, 0x12, 0x34, 0x05, 0x00, 0x64 }));
}

TEST(Requests, SamplesEncoding) {
    EXPECT_EQ(hacklet::protocol::encode(requests::samples(0x1234, 1)), bytes({ 0x02, 0x40, 0x24, 0x06, 0x12, 0x34, 0x00, 0x01, 0x0A, 0x00, 0x4F }));
}

TEST(Requests, UpdateTimeWritesTimeLittleEndian) {
    EXPECT_EQ(hacklet::protocol::encode(requests::update_time(0x1234, 0x01020304)), bytes({ 0x02, 0x40, 0x22, 0x06, 0x12, 0x34, 0x04, 0x03, 0x02, 0x01, 0x46 }));
}

TEST(Requests, ScheduleCarriesFullWeekBitmap) {
    const auto encoded = hacklet::protocol::encode(requests::schedule(0x1234, 1, requests::always_on()));
    ASSERT_EQ(encoded.size(), 64u);
    EXPECT_EQ(std::to_integer<int>(encoded[3]), 59);
    EXPECT_EQ(std::to_integer<int>(encoded[4]), 0x12);
    EXPECT_EQ(std::to_integer<int>(encoded[5]), 0x34);
    EXPECT_EQ(std::to_integer<int>(encoded[6]), 0x01);
    const auto decoded = hacklet::protocol::decode(encoded);
    ASSERT_TRUE(decoded.has_value());
}

TEST(Requests, AlwaysOnAndAlwaysOffBitmaps) {
    const auto on = requests::always_on();
    const auto off = requests::always_off();
    for (size_t i = 0; i < on.size(); i++) {
        if (i == 5) continue;
        EXPECT_EQ(std::to_integer<int>(on[i]), 0xFF);
        EXPECT_EQ(std::to_integer<int>(off[i]), 0x7F);
    }
    EXPECT_EQ(std::to_integer<int>(on[5]), 0xA5);
    EXPECT_EQ(std::to_integer<int>(off[5]), 0x25);
}

TEST(Responses, BootResponseCarriesDeviceId) {
    const auto res = responses::parse_boot(hacklet::protocol::encode(hacklet::test::boot_frame(0x0123456789ABCDEF)));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->device_id, 0x0123456789ABCDEFull);
}

TEST(Responses, BootResponseHasFixedLength) {
    const auto message = hacklet::test::boot_frame(1);
    EXPECT_EQ(hacklet::protocol::encode(message).size(), responses::boot_length);
}

TEST(Responses, StatusParserRejectsOtherCommands) {
    const auto res = responses::parse_lock(hacklet::protocol::encode(hacklet::test::status_frame(responses::handshake_command)));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), "Unexpected command 0x4003, expected 0xa0f9.");
}

TEST(Responses, StatusParserRejectsWrongLength) {
    hacklet::protocol::frame message { responses::lock_command, bytes({ 0x00, 0x00 }) };
    const auto res = responses::parse_lock(hacklet::protocol::encode(message));
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().find("Unexpected payload length 2"), std::string::npos);
}

TEST(Responses, BroadcastFields) {
    const auto res = responses::parse_broadcast(hacklet::protocol::encode(hacklet::test::broadcast_frame(0xBEEF, 0x1122334455667788)));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->network_id, 0xBEEF);
    EXPECT_EQ(res->device_id, 0x1122334455667788ull);
}

TEST(Responses, SamplesParsesLittleEndianFields) {
    const auto encoded = hacklet::protocol::encode(hacklet::test::samples_frame(0x1234, 1, 1400000000, { 100, 0x0201 }, 0x030201));
    const auto res = responses::parse_samples(encoded);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->network_id, 0x1234);
    EXPECT_EQ(res->channel_id, 1);
    EXPECT_EQ(res->time, 1400000000u);
    EXPECT_EQ(res->sample_count, 2);
    EXPECT_EQ(res->stored_sample_count, 0x030201u);
    EXPECT_EQ(res->values, (std::vector<uint16_t> { 100, 0x0201 }));
}

TEST(Responses, SamplesRejectsShortSampleData) {
    auto message = hacklet::test::samples_frame(0x1234, 1, 0, { 1, 2, 3 }, 0);
    message.payload.pop_back();
    const auto res = responses::parse_samples(hacklet::protocol::encode(message));
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().find("3 samples"), std::string::npos);
}

TEST(Responses, ConvertedSamplesAreSpacedAndScaled) {
    responses::samples response;
    response.time = 1000;
    response.values = { 100, 200 };
    const auto converted = response.converted();
    ASSERT_EQ(converted.size(), 2u);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(converted[0].time), 1000);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(converted[1].time), 1010);
    EXPECT_DOUBLE_EQ(converted[0].watts, 13.0);
    EXPECT_DOUBLE_EQ(converted[1].watts, 26.0);
}
