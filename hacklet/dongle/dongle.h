#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "../serial/serial.h"
#include "../protocol/frame.h"
#include "../protocol/responses.h"

namespace hacklet::dongle {

    struct settings {

        serial::settings device;
        std::chrono::milliseconds commission_timeout { std::chrono::seconds(30) };
    };

    struct session {

        serial::connection &comm;
        std::chrono::milliseconds commission_timeout;
        std::optional<uint64_t> device_id;

        session(serial::connection &comm, const settings &config = { });

        std::optional<std::string> boot();
        std::optional<std::string> boot_confirm();
        tl::expected<std::optional<protocol::responses::broadcast>, std::string> commission();
        std::optional<std::string> select_network(const uint16_t &network_id);
        tl::expected<protocol::responses::samples, std::string> request_samples(const uint16_t &network_id, const uint16_t &channel_id);
        std::optional<std::string> switch_socket(const uint16_t &network_id, const uint8_t &channel_id, const bool &state);
        std::optional<std::string> unlock_network();
        std::optional<std::string> lock_network();
        std::optional<std::string> update_time(const uint16_t &network_id, const std::optional<uint32_t> &unix_time = std::nullopt);

        private:
            tl::expected<std::vector<std::byte>, std::string> exchange(const protocol::frame &request, const size_t &response_length);
            tl::expected<std::vector<std::byte>, std::string> receive_frame(const std::optional<std::chrono::milliseconds> &timeout = std::nullopt);
    };

    using session_callback = std::function<std::optional<std::string>(session &)>;

    // Boots the dongle over an existing connection, runs the callback, then closes the connection.
    std::optional<std::string> run(serial::connection &comm, const settings &config, const session_callback &callback);

    // Opens the FTDI dongle and hands a booted session to the callback.
    std::optional<std::string> open(const settings &config, const session_callback &callback);
}
