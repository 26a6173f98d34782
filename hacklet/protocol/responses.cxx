#include "responses.h"

#include <algorithm>
#include <optional>

#include <fmt/format.h>

namespace hacklet::protocol::responses {

    // Samples payload up to and including the stored sample count.
    constexpr size_t samples_header_length = 14;

    static tl::expected<frame, std::string> expect(const std::vector<std::byte> &bytes, const uint16_t &command, const std::optional<size_t> &payload_length) {
        auto message = decode(bytes);
        if (!message.has_value()) return tl::make_unexpected(message.error());
        if (message->command != command) return tl::make_unexpected(fmt::format("Unexpected command 0x{:04x}, expected 0x{:04x}.", message->command, command));
        if (payload_length && message->payload.size() != *payload_length) return tl::make_unexpected(fmt::format("Unexpected payload length {} for command 0x{:04x}, expected {}.", message->payload.size(), command, *payload_length));
        return message;
    }

    static tl::expected<status, std::string> parse_status(const std::vector<std::byte> &bytes, const uint16_t &command) {
        const auto message = expect(bytes, command, 1);
        if (!message.has_value()) return tl::make_unexpected(message.error());
        return status { command, get_u8(message->payload, 0) };
    }
}

double hacklet::protocol::responses::to_watts(const uint16_t &raw) {
    return raw * 13.0 / 100.0;
}

std::vector<hacklet::protocol::responses::sample> hacklet::protocol::responses::samples::converted() const {
    std::vector<sample> list;
    const auto base = std::chrono::system_clock::time_point(std::chrono::seconds(time));
    for (size_t i = 0; i < values.size(); i++) list.push_back({ base + sample_interval * static_cast<int>(i), values[i], to_watts(values[i]) });
    return list;
}

tl::expected<hacklet::protocol::responses::boot, std::string> hacklet::protocol::responses::parse_boot(const std::vector<std::byte> &bytes) {
    const auto message = expect(bytes, boot_command, boot_length - frame_overhead);
    if (!message.has_value()) return tl::make_unexpected(message.error());
    boot response;
    std::copy_n(message->payload.begin(), response.info.size(), response.info.begin());
    response.device_id = get_u64_be(message->payload, 12);
    response.trailer = get_u16_be(message->payload, 20);
    return response;
}

tl::expected<hacklet::protocol::responses::status, std::string> hacklet::protocol::responses::parse_boot_confirm(const std::vector<std::byte> &bytes) {
    return parse_status(bytes, boot_confirm_command);
}

tl::expected<hacklet::protocol::responses::broadcast, std::string> hacklet::protocol::responses::parse_broadcast(const std::vector<std::byte> &bytes) {
    const auto message = expect(bytes, broadcast_command, broadcast_length - frame_overhead);
    if (!message.has_value()) return tl::make_unexpected(message.error());
    return broadcast { get_u16_be(message->payload, 0), get_u64_be(message->payload, 2), get_u8(message->payload, 10) };
}

tl::expected<hacklet::protocol::responses::status, std::string> hacklet::protocol::responses::parse_lock(const std::vector<std::byte> &bytes) {
    return parse_status(bytes, lock_command);
}

tl::expected<hacklet::protocol::responses::status, std::string> hacklet::protocol::responses::parse_update_time_ack(const std::vector<std::byte> &bytes) {
    return parse_status(bytes, update_time_ack_command);
}

tl::expected<hacklet::protocol::responses::update_time, std::string> hacklet::protocol::responses::parse_update_time(const std::vector<std::byte> &bytes) {
    const auto message = expect(bytes, update_time_command, update_time_length - frame_overhead);
    if (!message.has_value()) return tl::make_unexpected(message.error());
    return update_time { get_u16_be(message->payload, 0), get_u8(message->payload, 2) };
}

tl::expected<hacklet::protocol::responses::status, std::string> hacklet::protocol::responses::parse_handshake(const std::vector<std::byte> &bytes) {
    return parse_status(bytes, handshake_command);
}

tl::expected<hacklet::protocol::responses::status, std::string> hacklet::protocol::responses::parse_ack(const std::vector<std::byte> &bytes) {
    return parse_status(bytes, ack_command);
}

tl::expected<hacklet::protocol::responses::samples, std::string> hacklet::protocol::responses::parse_samples(const std::vector<std::byte> &bytes) {
    const auto message = expect(bytes, samples_command, std::nullopt);
    if (!message.has_value()) return tl::make_unexpected(message.error());
    const auto &payload = message->payload;
    if (payload.size() < samples_header_length) return tl::make_unexpected(fmt::format("Samples payload too short: {} bytes.", payload.size()));
    samples response;
    response.network_id = get_u16_be(payload, 0);
    response.channel_id = get_u16_be(payload, 2);
    response.data = get_u16_be(payload, 4);
    response.time = get_u32_le(payload, 6);
    response.sample_count = get_u8(payload, 10);
    response.stored_sample_count = get_u24_le(payload, 11);
    const auto expected_length = samples_header_length + response.sample_count * sizeof(uint16_t);
    if (payload.size() != expected_length) return tl::make_unexpected(fmt::format("Samples payload holds {} bytes, {} samples need {}.", payload.size(), response.sample_count, expected_length));
    for (size_t offset = samples_header_length; offset < expected_length; offset += sizeof(uint16_t)) response.values.push_back(get_u16_le(payload, offset));
    return response;
}

tl::expected<hacklet::protocol::responses::status, std::string> hacklet::protocol::responses::parse_schedule(const std::vector<std::byte> &bytes) {
    return parse_status(bytes, schedule_command);
}
