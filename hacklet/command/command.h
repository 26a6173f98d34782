#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "../dongle/dongle.h"
#include "../protocol/responses.h"
#include "../serial/serial.h"

namespace hacklet::command {

    enum class action {
        on,
        off,
        read,
        commission,
        devices
    };

    struct invocation {

        action command = action::devices;
        bool debug = false;
        std::optional<std::filesystem::path> config_path;
        uint16_t network_id = 0;
        uint8_t socket_id = 0;
        bool json = false;
        std::optional<std::filesystem::path> output;
        std::optional<std::chrono::seconds> commission_timeout;
    };

    // Usage errors carry the help text.
    struct usage_error {

        std::string message;
        std::string help;
    };

    tl::expected<uint16_t, std::string> parse_network_id(const std::string_view &text);
    tl::expected<uint8_t, std::string> parse_socket_id(const std::string_view &text);
    tl::expected<std::chrono::seconds, std::string> parse_timeout(const std::string_view &text);

    tl::expected<invocation, usage_error> parse(const std::vector<std::string> &args);

    bool needs_session(const invocation &request);

    // Runs a session command and returns the text to report, possibly empty.
    tl::expected<std::string, std::string> execute(const invocation &request, dongle::session &session);

    tl::expected<std::string, std::string> list_devices(const serial::settings &device);

    std::string format_samples(const protocol::responses::samples &response, const bool &json);

    // Writes to --output when given, stdout otherwise.
    std::optional<std::string> emit(const invocation &request, const std::string &text);
}
