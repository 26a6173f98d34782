#include "requests.h"

static hacklet::protocol::requests::schedule_bitmap filled_bitmap(const uint8_t &fill, const uint8_t &marker) {
    hacklet::protocol::requests::schedule_bitmap bitmap;
    bitmap.fill(static_cast<std::byte>(fill));
    bitmap[5] = static_cast<std::byte>(marker);
    return bitmap;
}

hacklet::protocol::requests::schedule_bitmap hacklet::protocol::requests::always_on() {
    return filled_bitmap(0xFF, 0xA5);
}

hacklet::protocol::requests::schedule_bitmap hacklet::protocol::requests::always_off() {
    return filled_bitmap(0x7F, 0x25);
}

hacklet::protocol::frame hacklet::protocol::requests::boot() {
    return { boot_command, { } };
}

hacklet::protocol::frame hacklet::protocol::requests::boot_confirm() {
    return { boot_confirm_command, { } };
}

hacklet::protocol::frame hacklet::protocol::requests::unlock() {
    frame message { network_lock_command, { } };
    put_u32_be(message.payload, unlock_data);
    return message;
}

hacklet::protocol::frame hacklet::protocol::requests::lock() {
    frame message { network_lock_command, { } };
    put_u32_be(message.payload, lock_data);
    return message;
}

hacklet::protocol::frame hacklet::protocol::requests::update_time(const uint16_t &network_id, const uint32_t &unix_time) {
    frame message { update_time_command, { } };
    put_u16_be(message.payload, network_id);
    put_u32_le(message.payload, unix_time);
    return message;
}

hacklet::protocol::frame hacklet::protocol::requests::handshake(const uint16_t &network_id) {
    frame message { handshake_command, { } };
    put_u16_be(message.payload, network_id);
    put_u16_be(message.payload, handshake_data);
    return message;
}

hacklet::protocol::frame hacklet::protocol::requests::samples(const uint16_t &network_id, const uint16_t &channel_id) {
    frame message { samples_command, { } };
    put_u16_be(message.payload, network_id);
    put_u16_be(message.payload, channel_id);
    put_u16_be(message.payload, samples_data);
    return message;
}

hacklet::protocol::frame hacklet::protocol::requests::schedule(const uint16_t &network_id, const uint8_t &channel_id, const schedule_bitmap &bitmap) {
    frame message { schedule_command, { } };
    put_u16_be(message.payload, network_id);
    put_u8(message.payload, channel_id);
    message.payload.insert(message.payload.end(), bitmap.begin(), bitmap.end());
    return message;
}
