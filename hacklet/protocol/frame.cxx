#include "frame.h"

#include <fmt/format.h>

uint8_t hacklet::protocol::checksum(const uint16_t &command, const std::vector<std::byte> &payload) {
    auto sum = static_cast<uint8_t>((command >> 8) ^ (command & 0xFF) ^ payload.size());
    for (const auto value : payload) sum ^= std::to_integer<uint8_t>(value);
    return sum;
}

std::vector<std::byte> hacklet::protocol::encode(const frame &message) {
    std::vector<std::byte> buffer;
    buffer.reserve(message.payload.size() + frame_overhead);
    buffer.push_back(frame_header);
    put_u16_be(buffer, message.command);
    put_u8(buffer, static_cast<uint8_t>(message.payload.size()));
    buffer.insert(buffer.end(), message.payload.begin(), message.payload.end());
    put_u8(buffer, checksum(message.command, message.payload));
    return buffer;
}

tl::expected<hacklet::protocol::frame, std::string> hacklet::protocol::decode(const std::vector<std::byte> &bytes) {
    if (bytes.size() < frame_overhead) return tl::make_unexpected("Incomplete frame.");
    if (bytes[0] != frame_header) return tl::make_unexpected(fmt::format("Invalid header 0x{:02x}.", std::to_integer<uint8_t>(bytes[0])));
    const size_t payload_length = get_u8(bytes, 3);
    if (bytes.size() < payload_length + frame_overhead) return tl::make_unexpected("Incomplete frame.");
    frame message;
    message.command = get_u16_be(bytes, 1);
    message.payload.assign(bytes.begin() + frame_head_length, bytes.begin() + frame_head_length + payload_length);
    if (checksum(message.command, message.payload) != get_u8(bytes, frame_head_length + payload_length)) return tl::make_unexpected("Invalid checksum.");
    return message;
}

void hacklet::protocol::put_u8(std::vector<std::byte> &buffer, const uint8_t &value) {
    buffer.push_back(static_cast<std::byte>(value));
}

void hacklet::protocol::put_u16_be(std::vector<std::byte> &buffer, const uint16_t &value) {
    put_u8(buffer, static_cast<uint8_t>(value >> 8));
    put_u8(buffer, static_cast<uint8_t>(value));
}

void hacklet::protocol::put_u32_be(std::vector<std::byte> &buffer, const uint32_t &value) {
    put_u16_be(buffer, static_cast<uint16_t>(value >> 16));
    put_u16_be(buffer, static_cast<uint16_t>(value));
}

void hacklet::protocol::put_u32_le(std::vector<std::byte> &buffer, const uint32_t &value) {
    for (int shift = 0; shift < 32; shift += 8) put_u8(buffer, static_cast<uint8_t>(value >> shift));
}

void hacklet::protocol::put_u64_be(std::vector<std::byte> &buffer, const uint64_t &value) {
    put_u32_be(buffer, static_cast<uint32_t>(value >> 32));
    put_u32_be(buffer, static_cast<uint32_t>(value));
}

uint8_t hacklet::protocol::get_u8(const std::vector<std::byte> &buffer, const size_t &offset) {
    return std::to_integer<uint8_t>(buffer.at(offset));
}

uint16_t hacklet::protocol::get_u16_be(const std::vector<std::byte> &buffer, const size_t &offset) {
    return static_cast<uint16_t>((get_u8(buffer, offset) << 8) | get_u8(buffer, offset + 1));
}

uint16_t hacklet::protocol::get_u16_le(const std::vector<std::byte> &buffer, const size_t &offset) {
    return static_cast<uint16_t>(get_u8(buffer, offset) | (get_u8(buffer, offset + 1) << 8));
}

uint32_t hacklet::protocol::get_u24_le(const std::vector<std::byte> &buffer, const size_t &offset) {
    return static_cast<uint32_t>(get_u8(buffer, offset)) | (static_cast<uint32_t>(get_u8(buffer, offset + 1)) << 8) | (static_cast<uint32_t>(get_u8(buffer, offset + 2)) << 16);
}

uint32_t hacklet::protocol::get_u32_le(const std::vector<std::byte> &buffer, const size_t &offset) {
    return get_u24_le(buffer, offset) | (static_cast<uint32_t>(get_u8(buffer, offset + 3)) << 24);
}

uint64_t hacklet::protocol::get_u64_be(const std::vector<std::byte> &buffer, const size_t &offset) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; i++) value = (value << 8) | get_u8(buffer, offset + i);
    return value;
}
