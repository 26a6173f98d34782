#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "frame.h"

namespace hacklet::protocol::requests {

    constexpr uint16_t boot_command = 0x4004;
    constexpr uint16_t boot_confirm_command = 0x4000;
    constexpr uint16_t network_lock_command = 0xA236;
    constexpr uint16_t update_time_command = 0x4022;
    constexpr uint16_t handshake_command = 0x4003;
    constexpr uint16_t samples_command = 0x4024;
    constexpr uint16_t schedule_command = 0x4023;

    constexpr uint32_t unlock_data = 0xFCFF9001;
    constexpr uint32_t lock_data = 0xFCFF0001;
    constexpr uint16_t handshake_data = 0x0500;
    constexpr uint16_t samples_data = 0x0A00;

    // One entry per schedule slot of the week.
    using schedule_bitmap = std::array<std::byte, 56>;

    schedule_bitmap always_on();
    schedule_bitmap always_off();

    frame boot();
    frame boot_confirm();
    frame unlock();
    frame lock();
    frame update_time(const uint16_t &network_id, const uint32_t &unix_time);
    frame handshake(const uint16_t &network_id);
    frame samples(const uint16_t &network_id, const uint16_t &channel_id);
    frame schedule(const uint16_t &network_id, const uint8_t &channel_id, const schedule_bitmap &bitmap);
}
