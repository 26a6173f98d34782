#pragma once

#include <cstdint>
#include <vector>

#include "frame.h"
#include "responses.h"
#include "../serial/test_transport.h"

// Dongle replies as they appear on the wire, for feeding scripted transports.
namespace hacklet::test {

    inline protocol::frame status_frame(const uint16_t &command, const uint8_t &code = 0) {
        protocol::frame message { command, { } };
        protocol::put_u8(message.payload, code);
        return message;
    }

    inline protocol::frame boot_frame(const uint64_t &device_id) {
        protocol::frame message { protocol::responses::boot_command, std::vector<std::byte>(12, std::byte { 0x00 }) };
        protocol::put_u64_be(message.payload, device_id);
        protocol::put_u16_be(message.payload, 0x0000);
        return message;
    }

    inline protocol::frame broadcast_frame(const uint16_t &network_id, const uint64_t &device_id) {
        protocol::frame message { protocol::responses::broadcast_command, { } };
        protocol::put_u16_be(message.payload, network_id);
        protocol::put_u64_be(message.payload, device_id);
        protocol::put_u8(message.payload, 0x00);
        return message;
    }

    inline protocol::frame update_time_frame(const uint16_t &network_id) {
        protocol::frame message { protocol::responses::update_time_command, { } };
        protocol::put_u16_be(message.payload, network_id);
        protocol::put_u8(message.payload, 0x00);
        return message;
    }

    inline protocol::frame samples_frame(const uint16_t &network_id, const uint16_t &channel_id, const uint32_t &time, const std::vector<uint16_t> &values, const uint32_t &stored) {
        protocol::frame message { protocol::responses::samples_command, { } };
        protocol::put_u16_be(message.payload, network_id);
        protocol::put_u16_be(message.payload, channel_id);
        protocol::put_u16_be(message.payload, 0x0000);
        protocol::put_u32_le(message.payload, time);
        protocol::put_u8(message.payload, static_cast<uint8_t>(values.size()));
        for (int shift = 0; shift < 24; shift += 8) protocol::put_u8(message.payload, static_cast<uint8_t>(stored >> shift));
        for (const auto value : values) {
            protocol::put_u8(message.payload, static_cast<uint8_t>(value));
            protocol::put_u8(message.payload, static_cast<uint8_t>(value >> 8));
        }
        return message;
    }

    constexpr uint64_t dongle_device_id = 0x0123456789ABCDEF;

    inline void script_boot(scripted_transport &port) {
        port.reply({ boot_frame(dongle_device_id) });
        port.reply({ status_frame(protocol::responses::boot_confirm_command, 0x10) });
    }
}
