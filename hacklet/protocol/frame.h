#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace hacklet::protocol {

    constexpr std::byte frame_header { 0x02 };

    // Header, two command bytes, length byte and checksum.
    constexpr size_t frame_overhead = 5;

    // Bytes read before the payload length is known.
    constexpr size_t frame_head_length = 4;

    struct frame {

        uint16_t command = 0;
        std::vector<std::byte> payload;
    };

    uint8_t checksum(const uint16_t &command, const std::vector<std::byte> &payload);
    std::vector<std::byte> encode(const frame &message);
    tl::expected<frame, std::string> decode(const std::vector<std::byte> &bytes);

    void put_u8(std::vector<std::byte> &buffer, const uint8_t &value);
    void put_u16_be(std::vector<std::byte> &buffer, const uint16_t &value);
    void put_u32_be(std::vector<std::byte> &buffer, const uint32_t &value);
    void put_u32_le(std::vector<std::byte> &buffer, const uint32_t &value);
    void put_u64_be(std::vector<std::byte> &buffer, const uint64_t &value);

    // Callers check bounds before reading.
    uint8_t get_u8(const std::vector<std::byte> &buffer, const size_t &offset);
    uint16_t get_u16_be(const std::vector<std::byte> &buffer, const size_t &offset);
    uint16_t get_u16_le(const std::vector<std::byte> &buffer, const size_t &offset);
    uint32_t get_u24_le(const std::vector<std::byte> &buffer, const size_t &offset);
    uint32_t get_u32_le(const std::vector<std::byte> &buffer, const size_t &offset);
    uint64_t get_u64_be(const std::vector<std::byte> &buffer, const size_t &offset);
}
