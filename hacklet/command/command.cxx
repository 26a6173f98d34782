#include "command.h"

#include <cctype>
#include <exception>

#include <argparse/argparse.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <pystring.h>
#include <spdlog/spdlog.h>

#include "../file/file.h"
#include "../version/version.h"

namespace hacklet::command {

    static bool all_chars(const std::string &text, int (*predicate)(int)) {
        for (const auto c : text) if (!predicate(static_cast<unsigned char>(c))) return false;
        return true;
    }

    static std::string iso_time(const std::chrono::system_clock::time_point &time) {
        return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(std::chrono::system_clock::to_time_t(time)));
    }

    static void add_socket_arguments(argparse::ArgumentParser &parser) {
        parser.add_argument("-n", "--network").required().help("the network id (ex. 0x1234)");
        parser.add_argument("-s", "--socket").required().help("the socket id (ex. 0)");
    }

    static tl::expected<void, std::string> read_socket_arguments(const argparse::ArgumentParser &parser, invocation &request) {
        const auto network_id = parse_network_id(parser.get<std::string>("--network"));
        if (!network_id.has_value()) return tl::make_unexpected(network_id.error());
        const auto socket_id = parse_socket_id(parser.get<std::string>("--socket"));
        if (!socket_id.has_value()) return tl::make_unexpected(socket_id.error());
        request.network_id = *network_id;
        request.socket_id = *socket_id;
        return { };
    }
}

tl::expected<uint16_t, std::string> hacklet::command::parse_network_id(const std::string_view &text) {
    auto digits = pystring::lower(pystring::strip(std::string(text)));
    if (pystring::startswith(digits, "0x")) digits = digits.substr(2);
    if (digits.empty() || digits.size() > 4 || !all_chars(digits, std::isxdigit)) return tl::make_unexpected(fmt::format("Invalid network id: '{}' (expected hexadecimal, ex. 0x1234)", text));
    return static_cast<uint16_t>(std::stoul(digits, nullptr, 16));
}

tl::expected<uint8_t, std::string> hacklet::command::parse_socket_id(const std::string_view &text) {
    const auto digits = pystring::strip(std::string(text));
    if (digits.empty() || digits.size() > 3 || !all_chars(digits, std::isdigit)) return tl::make_unexpected(fmt::format("Invalid socket id: '{}' (expected a number, ex. 0)", text));
    const auto value = std::stoul(digits);
    if (value > 0xFF) return tl::make_unexpected(fmt::format("Socket id out of range: {}", value));
    return static_cast<uint8_t>(value);
}

tl::expected<std::chrono::seconds, std::string> hacklet::command::parse_timeout(const std::string_view &text) {
    const auto digits = pystring::strip(std::string(text));
    if (digits.empty() || digits.size() > 4 || !all_chars(digits, std::isdigit)) return tl::make_unexpected(fmt::format("Invalid timeout: '{}' (expected seconds)", text));
    const auto value = std::stoul(digits);
    if (value == 0) return tl::make_unexpected("Timeout must be at least one second.");
    return std::chrono::seconds(value);
}

tl::expected<hacklet::command::invocation, hacklet::command::usage_error> hacklet::command::parse(const std::vector<std::string> &args) {
    argparse::ArgumentParser program(version::app_name, version::app_ver);
    program.add_description("Manage Modlet smart sockets through an FTDI dongle.");
    program.add_argument("-d", "--debug").help("enables debug logging").default_value(false).implicit_value(true);
    program.add_argument("-c", "--config").help("path to a YAML configuration file");

    argparse::ArgumentParser on_command("on");
    on_command.add_description("Turn on the specified socket.");
    add_socket_arguments(on_command);

    argparse::ArgumentParser off_command("off");
    off_command.add_description("Turn off the specified socket.");
    add_socket_arguments(off_command);

    argparse::ArgumentParser read_command("read");
    read_command.add_description("Read all available samples from the specified socket.");
    add_socket_arguments(read_command);
    read_command.add_argument("--json").help("print samples as a JSON document").default_value(false).implicit_value(true);
    read_command.add_argument("-o", "--output").help("write samples to a file instead of stdout");

    argparse::ArgumentParser commission_command("commission");
    commission_command.add_description("Add a new device to the network.");
    commission_command.add_argument("-t", "--timeout").help("seconds to listen for a new device");

    argparse::ArgumentParser devices_command("devices");
    devices_command.add_description("List attached dongles.");

    program.add_subparser(on_command);
    program.add_subparser(off_command);
    program.add_subparser(read_command);
    program.add_subparser(commission_command);
    program.add_subparser(devices_command);

    const auto fail = [&program](const std::string &message) {
        return tl::make_unexpected(usage_error { message, program.help().str() });
    };

    invocation request;
    try {
        program.parse_args(args);
        request.debug = program.get<bool>("--debug");
        if (const auto path = program.present<std::string>("--config"); path) request.config_path = *path;
        if (program.is_subcommand_used(on_command)) {
            request.command = action::on;
            if (const auto res = read_socket_arguments(on_command, request); !res) return fail(res.error());
        } else if (program.is_subcommand_used(off_command)) {
            request.command = action::off;
            if (const auto res = read_socket_arguments(off_command, request); !res) return fail(res.error());
        } else if (program.is_subcommand_used(read_command)) {
            request.command = action::read;
            if (const auto res = read_socket_arguments(read_command, request); !res) return fail(res.error());
            request.json = read_command.get<bool>("--json");
            if (const auto path = read_command.present<std::string>("--output"); path) request.output = *path;
        } else if (program.is_subcommand_used(commission_command)) {
            request.command = action::commission;
            if (const auto text = commission_command.present<std::string>("--timeout"); text) {
                const auto timeout = parse_timeout(*text);
                if (!timeout.has_value()) return fail(timeout.error());
                request.commission_timeout = *timeout;
            }
        } else if (program.is_subcommand_used(devices_command)) {
            request.command = action::devices;
        } else return fail("No command given.");
    } catch (const std::exception &err) {
        return fail(err.what());
    }
    return request;
}

bool hacklet::command::needs_session(const invocation &request) {
    return request.command != action::devices;
}

tl::expected<std::string, std::string> hacklet::command::execute(const invocation &request, dongle::session &session) {
    switch (request.command) {
        case action::on:
        case action::off: {
            const bool state = request.command == action::on;
            if (const auto err = session.lock_network(); err) return tl::make_unexpected(*err);
            if (const auto err = session.select_network(request.network_id); err) return tl::make_unexpected(*err);
            if (const auto err = session.switch_socket(request.network_id, request.socket_id, state); err) return tl::make_unexpected(*err);
            spdlog::info("Turned {} network 0x{:x}, socket {}", state ? "on" : "off", request.network_id, request.socket_id);
            return std::string();
        }
        case action::read: {
            if (const auto err = session.lock_network(); err) return tl::make_unexpected(*err);
            if (const auto err = session.select_network(request.network_id); err) return tl::make_unexpected(*err);
            const auto samples = session.request_samples(request.network_id, request.socket_id);
            if (!samples.has_value()) return tl::make_unexpected(samples.error());
            spdlog::info("Read samples from network 0x{:x}, socket {}", request.network_id, request.socket_id);
            return format_samples(*samples, request.json);
        }
        case action::commission: {
            if (request.commission_timeout) session.commission_timeout = *request.commission_timeout;
            spdlog::info("Commissioning new devices...");
            const auto found = session.commission();
            if (!found.has_value()) return tl::make_unexpected(found.error());
            if (!found->has_value()) return std::string("No device found.\n");
            return fmt::format("Found device 0x{:x} on network 0x{:04x}\n", (*found)->device_id, (*found)->network_id);
        }
        case action::devices:
            break;
    }
    return tl::make_unexpected("This command does not use a dongle session.");
}

tl::expected<std::string, std::string> hacklet::command::list_devices(const serial::settings &device) {
    const auto devices = serial::list_devices(device.vendor_id, device.product_id);
    if (!devices.has_value()) return tl::make_unexpected(devices.error());
    if (devices->empty()) return fmt::format("No dongles found ({:04x}:{:04x}).\n", device.vendor_id, device.product_id);
    std::string text;
    for (const auto &info : *devices) text += fmt::format("{} {} (serial {})\n", info.manufacturer, info.description, info.serial.empty() ? "unknown" : info.serial);
    return text;
}

std::string hacklet::command::format_samples(const protocol::responses::samples &response, const bool &json) {
    const auto converted = response.converted();
    if (json) {
        auto document = nlohmann::json {
            { "network_id", fmt::format("0x{:04x}", response.network_id) },
            { "channel_id", response.channel_id },
            { "returned", response.sample_count },
            { "remaining", response.stored_sample_count },
            { "samples", nlohmann::json::array() }
        };
        for (const auto &sample : converted) {
            document["samples"].push_back({
                { "time", iso_time(sample.time) },
                { "raw", sample.raw },
                { "watts", sample.watts }
            });
        }
        return document.dump(2) + "\n";
    }
    std::string text;
    for (const auto &sample : converted) text += fmt::format("{} {:.2f}w\n", iso_time(sample.time), sample.watts);
    return text;
}

std::optional<std::string> hacklet::command::emit(const invocation &request, const std::string &text) {
    if (request.output) {
        if (const auto err = file::save_text(*request.output, text); err) return err;
        spdlog::info("Wrote {} bytes to {}", text.size(), request.output->string());
        return std::nullopt;
    }
    fmt::print("{}", text);
    return std::nullopt;
}
