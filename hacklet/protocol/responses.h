#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "frame.h"

namespace hacklet::protocol::responses {

    constexpr uint16_t boot_command = 0x4084;
    constexpr uint16_t boot_confirm_command = 0x4080;
    constexpr uint16_t broadcast_command = 0xA013;
    constexpr uint16_t lock_command = 0xA0F9;
    constexpr uint16_t update_time_ack_command = 0x4022;
    constexpr uint16_t update_time_command = 0x40A2;
    constexpr uint16_t handshake_command = 0x4003;
    constexpr uint16_t ack_command = 0x4024;
    constexpr uint16_t samples_command = 0x40A4;
    constexpr uint16_t schedule_command = 0x4023;

    // Total frame sizes, header and checksum included.
    constexpr size_t boot_length = 27;
    constexpr size_t status_length = 6;
    constexpr size_t broadcast_length = 16;
    constexpr size_t update_time_length = 8;

    constexpr std::chrono::seconds sample_interval { 10 };

    struct boot {

        std::array<std::byte, 12> info;
        uint64_t device_id = 0;
        uint16_t trailer = 0;
    };

    // Replies that carry a single status byte.
    struct status {

        uint16_t command = 0;
        uint8_t code = 0;
    };

    struct broadcast {

        uint16_t network_id = 0;
        uint64_t device_id = 0;
        uint8_t status = 0;
    };

    struct update_time {

        uint16_t network_id = 0;
        uint8_t status = 0;
    };

    struct sample {

        std::chrono::system_clock::time_point time;
        uint16_t raw = 0;
        double watts = 0;
    };

    struct samples {

        uint16_t network_id = 0;
        uint16_t channel_id = 0;
        uint16_t data = 0;
        uint32_t time = 0;
        uint8_t sample_count = 0;
        uint32_t stored_sample_count = 0;
        std::vector<uint16_t> values;

        std::vector<sample> converted() const;
    };

    double to_watts(const uint16_t &raw);

    tl::expected<boot, std::string> parse_boot(const std::vector<std::byte> &bytes);
    tl::expected<status, std::string> parse_boot_confirm(const std::vector<std::byte> &bytes);
    tl::expected<broadcast, std::string> parse_broadcast(const std::vector<std::byte> &bytes);
    tl::expected<status, std::string> parse_lock(const std::vector<std::byte> &bytes);
    tl::expected<status, std::string> parse_update_time_ack(const std::vector<std::byte> &bytes);
    tl::expected<update_time, std::string> parse_update_time(const std::vector<std::byte> &bytes);
    tl::expected<status, std::string> parse_handshake(const std::vector<std::byte> &bytes);
    tl::expected<status, std::string> parse_ack(const std::vector<std::byte> &bytes);
    tl::expected<samples, std::string> parse_samples(const std::vector<std::byte> &bytes);
    tl::expected<status, std::string> parse_schedule(const std::vector<std::byte> &bytes);
}
