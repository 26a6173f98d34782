#include "dongle.h"

#include <ctime>
#include <memory>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "../defer.h"
#include "../protocol/requests.h"

namespace requests = hacklet::protocol::requests;
namespace responses = hacklet::protocol::responses;

hacklet::dongle::session::session(serial::connection &comm, const settings &config) : comm(comm), commission_timeout(config.commission_timeout) {

}

tl::expected<std::vector<std::byte>, std::string> hacklet::dongle::session::exchange(const protocol::frame &request, const size_t &response_length) {
    if (const auto err = comm.transmit(protocol::encode(request)); err) return tl::make_unexpected(*err);
    return comm.receive(response_length);
}

tl::expected<std::vector<std::byte>, std::string> hacklet::dongle::session::receive_frame(const std::optional<std::chrono::milliseconds> &timeout) {
    auto buffer = comm.receive(protocol::frame_head_length, timeout);
    if (!buffer.has_value()) return buffer;
    const auto remaining = static_cast<size_t>(protocol::get_u8(*buffer, protocol::frame_head_length - 1)) + 1;
    const auto rest = comm.receive(remaining);
    if (!rest.has_value()) return tl::make_unexpected(rest.error());
    buffer->insert(buffer->end(), rest->begin(), rest->end());
    return buffer;
}

std::optional<std::string> hacklet::dongle::session::boot() {
    spdlog::info("Booting");
    const auto bytes = exchange(requests::boot(), responses::boot_length);
    if (!bytes.has_value()) return fmt::format("Unable to boot dongle: {}", bytes.error());
    const auto response = responses::parse_boot(*bytes);
    if (!response.has_value()) return fmt::format("Unable to boot dongle: {}", response.error());
    device_id = response->device_id;
    spdlog::debug("Dongle device ID: 0x{:x}", response->device_id);
    return std::nullopt;
}

std::optional<std::string> hacklet::dongle::session::boot_confirm() {
    const auto bytes = exchange(requests::boot_confirm(), responses::status_length);
    if (!bytes.has_value()) return fmt::format("Unable to confirm boot: {}", bytes.error());
    if (const auto response = responses::parse_boot_confirm(*bytes); !response.has_value()) return fmt::format("Unable to confirm boot: {}", response.error());
    spdlog::info("Booting complete");
    return std::nullopt;
}

tl::expected<std::optional<hacklet::protocol::responses::broadcast>, std::string> hacklet::dongle::session::commission() {
    if (const auto err = unlock_network(); err) return tl::make_unexpected(*err);
    std::optional<responses::broadcast> found;
    std::optional<std::string> failure;
    const auto start = std::chrono::steady_clock::now();
    for (;;) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (elapsed >= commission_timeout) break;
        spdlog::info("Listening for devices ...");
        const auto buffer = receive_frame(commission_timeout - elapsed);
        if (!buffer.has_value()) {
            if (std::chrono::steady_clock::now() - start < commission_timeout) failure = buffer.error();
            else if (!comm.buffer.empty()) {
                spdlog::debug("Dropping {} bytes of an incomplete frame", comm.buffer.size());
                comm.buffer.clear();
            }
            break;
        }
        if (protocol::get_u16_be(*buffer, 1) != responses::broadcast_command) {
            spdlog::debug("Ignoring frame 0x{:04x} while listening", protocol::get_u16_be(*buffer, 1));
            continue;
        }
        const auto response = responses::parse_broadcast(*buffer);
        if (!response.has_value()) {
            failure = response.error();
            break;
        }
        spdlog::info("Found device 0x{:x} on network 0x{:x}", response->device_id, response->network_id);
        found = *response;
        break;
    }
    if (found && !failure) failure = update_time(found->network_id);
    if (const auto err = lock_network(); err) {
        if (failure) spdlog::warn(*err);
        else failure = err;
    }
    if (failure) return tl::make_unexpected(fmt::format("Unable to commission device: {}", *failure));
    return found;
}

std::optional<std::string> hacklet::dongle::session::select_network(const uint16_t &network_id) {
    const auto bytes = exchange(requests::handshake(network_id), responses::status_length);
    if (!bytes.has_value()) return fmt::format("Unable to select network 0x{:x}: {}", network_id, bytes.error());
    if (const auto response = responses::parse_handshake(*bytes); !response.has_value()) return fmt::format("Unable to select network 0x{:x}: {}", network_id, response.error());
    return std::nullopt;
}

tl::expected<hacklet::protocol::responses::samples, std::string> hacklet::dongle::session::request_samples(const uint16_t &network_id, const uint16_t &channel_id) {
    spdlog::info("Requesting samples");
    const auto ack = exchange(requests::samples(network_id, channel_id), responses::status_length);
    if (!ack.has_value()) return tl::make_unexpected(fmt::format("Unable to request samples: {}", ack.error()));
    if (const auto response = responses::parse_ack(*ack); !response.has_value()) return tl::make_unexpected(fmt::format("Unable to request samples: {}", response.error()));
    const auto buffer = receive_frame();
    if (!buffer.has_value()) return tl::make_unexpected(fmt::format("Unable to read samples: {}", buffer.error()));
    auto response = responses::parse_samples(*buffer);
    if (!response.has_value()) return tl::make_unexpected(fmt::format("Unable to read samples: {}", response.error()));
    for (const auto &sample : response->converted()) {
        spdlog::info("{:.2f}w at {:%Y-%m-%d %H:%M:%S}", sample.watts, fmt::gmtime(std::chrono::system_clock::to_time_t(sample.time)));
    }
    spdlog::info("{} returned, {} remaining", response->sample_count, response->stored_sample_count);
    return response;
}

std::optional<std::string> hacklet::dongle::session::switch_socket(const uint16_t &network_id, const uint8_t &channel_id, const bool &state) {
    spdlog::info("Turning {} channel {} on network 0x{:x}", state ? "on" : "off", channel_id, network_id);
    const auto request = requests::schedule(network_id, channel_id, state ? requests::always_on() : requests::always_off());
    const auto bytes = exchange(request, responses::status_length);
    if (!bytes.has_value()) return fmt::format("Unable to switch channel {}: {}", channel_id, bytes.error());
    if (const auto response = responses::parse_schedule(*bytes); !response.has_value()) return fmt::format("Unable to switch channel {}: {}", channel_id, response.error());
    return std::nullopt;
}

std::optional<std::string> hacklet::dongle::session::unlock_network() {
    spdlog::info("Unlocking network");
    const auto bytes = exchange(requests::unlock(), responses::status_length);
    if (!bytes.has_value()) return fmt::format("Unable to unlock network: {}", bytes.error());
    if (const auto response = responses::parse_lock(*bytes); !response.has_value()) return fmt::format("Unable to unlock network: {}", response.error());
    spdlog::info("Unlocking complete");
    return std::nullopt;
}

std::optional<std::string> hacklet::dongle::session::lock_network() {
    spdlog::info("Locking network");
    const auto bytes = exchange(requests::lock(), responses::status_length);
    if (!bytes.has_value()) return fmt::format("Unable to lock network: {}", bytes.error());
    if (const auto response = responses::parse_lock(*bytes); !response.has_value()) return fmt::format("Unable to lock network: {}", response.error());
    spdlog::info("Locking complete");
    return std::nullopt;
}

std::optional<std::string> hacklet::dongle::session::update_time(const uint16_t &network_id, const std::optional<uint32_t> &unix_time) {
    const auto now = unix_time ? *unix_time : static_cast<uint32_t>(std::time(nullptr));
    const auto ack = exchange(requests::update_time(network_id, now), responses::status_length);
    if (!ack.has_value()) return fmt::format("Unable to update time: {}", ack.error());
    if (const auto response = responses::parse_update_time_ack(*ack); !response.has_value()) return fmt::format("Unable to update time: {}", response.error());
    const auto bytes = comm.receive(responses::update_time_length);
    if (!bytes.has_value()) return fmt::format("Unable to update time: {}", bytes.error());
    if (const auto response = responses::parse_update_time(*bytes); !response.has_value()) return fmt::format("Unable to update time: {}", response.error());
    spdlog::debug("Updated time on network 0x{:x} to {}", network_id, now);
    return std::nullopt;
}

std::optional<std::string> hacklet::dongle::run(serial::connection &comm, const settings &config, const session_callback &callback) {
    DEFER(comm.close());
    session instance(comm, config);
    if (const auto err = instance.boot(); err) return err;
    if (const auto err = instance.boot_confirm(); err) return err;
    return callback(instance);
}

std::optional<std::string> hacklet::dongle::open(const settings &config, const session_callback &callback) {
    auto port = std::make_unique<serial::ftdi_transport>();
    if (const auto err = port->open(config.device); err) return err;
    serial::connection comm(std::move(port), config.device);
    return run(comm, config, callback);
}
