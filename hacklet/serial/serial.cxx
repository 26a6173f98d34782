#include "serial.h"

#include <array>
#include <thread>

#include <ftdi.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/bin_to_hex.h>

#include "../defer.h"

static std::string ftdi_error(ftdi_context *context) {
    const auto message = ftdi_get_error_string(context);
    return message ? message : "Unknown FTDI error.";
}

hacklet::serial::ftdi_transport::~ftdi_transport() {
    close();
}

std::optional<std::string> hacklet::serial::ftdi_transport::open(const settings &config) {
    close();
    auto candidate = ftdi_new();
    if (!candidate) return "Unable to allocate FTDI context.";
    hacklet::scope_guard release = [&]() { ftdi_free(candidate); };
    const auto serial_filter = config.serial ? config.serial->c_str() : nullptr;
    if (ftdi_usb_open_desc(candidate, config.vendor_id, config.product_id, nullptr, serial_filter) < 0) {
        return fmt::format("Could not open FTDI device {:04x}:{:04x}: {}", config.vendor_id, config.product_id, ftdi_error(candidate));
    }
    hacklet::scope_guard usb_close = [&]() { ftdi_usb_close(candidate); };
    if (ftdi_set_bitmode(candidate, 0x00, BITMODE_RESET) < 0) return fmt::format("Unable to reset bit mode: {}", ftdi_error(candidate));
    if (ftdi_set_baudrate(candidate, config.baud_rate) < 0) return fmt::format("Unable to set baud rate {}: {}", config.baud_rate, ftdi_error(candidate));
    if (ftdi_setflowctrl(candidate, SIO_DISABLE_FLOW_CTRL) < 0) return fmt::format("Unable to disable flow control: {}", ftdi_error(candidate));
    if (ftdi_setdtr(candidate, 1) < 0) return fmt::format("Unable to raise DTR: {}", ftdi_error(candidate));
    if (ftdi_setrts(candidate, 1) < 0) return fmt::format("Unable to raise RTS: {}", ftdi_error(candidate));
    usb_close.dismiss();
    release.dismiss();
    context = candidate;
    spdlog::debug("Opened FTDI device {:04x}:{:04x} at {} baud", config.vendor_id, config.product_id, config.baud_rate);
    return std::nullopt;
}

std::optional<std::string> hacklet::serial::ftdi_transport::write(const std::vector<std::byte> &data) {
    if (!context) return "Not connected.";
    const auto num_bytes_written = ftdi_write_data(context, reinterpret_cast<const unsigned char *>(data.data()), static_cast<int>(data.size()));
    if (num_bytes_written < 0) return fmt::format("Failed to write data: {}", ftdi_error(context));
    if (static_cast<size_t>(num_bytes_written) != data.size()) return "Unable to write entire packet.";
    return std::nullopt;
}

tl::expected<std::vector<std::byte>, std::string> hacklet::serial::ftdi_transport::read() {
    if (!context) return tl::make_unexpected("Not connected.");
    std::array<std::byte, 64> chunk;
    const auto num_bytes_read = ftdi_read_data(context, reinterpret_cast<unsigned char *>(chunk.data()), static_cast<int>(chunk.size()));
    if (num_bytes_read < 0) return tl::make_unexpected(fmt::format("Failed to read data: {}", ftdi_error(context)));
    return std::vector<std::byte>(chunk.begin(), chunk.begin() + num_bytes_read);
}

void hacklet::serial::ftdi_transport::close() {
    if (!context) return;
    if (ftdi_usb_close(context) < 0) spdlog::warn("Unable to close FTDI device: {}", ftdi_error(context));
    ftdi_free(context);
    context = nullptr;
    spdlog::info("Closed FTDI device connection");
}

tl::expected<std::vector<hacklet::serial::device_info>, std::string> hacklet::serial::list_devices(const uint16_t &vendor_id, const uint16_t &product_id) {
    auto context = ftdi_new();
    if (!context) return tl::make_unexpected("Unable to allocate FTDI context.");
    DEFER(ftdi_free(context));
    ftdi_device_list *devices = nullptr;
    const auto num_devices = ftdi_usb_find_all(context, &devices, vendor_id, product_id);
    if (num_devices < 0) return tl::make_unexpected(fmt::format("Unable to enumerate FTDI devices: {}", ftdi_error(context)));
    DEFER(ftdi_list_free(&devices));
    std::vector<device_info> list;
    for (auto cur_dev = devices; cur_dev; cur_dev = cur_dev->next) {
        std::array<char, 128> manufacturer { }, description { }, serial { };
        if (ftdi_usb_get_strings(context, cur_dev->dev, manufacturer.data(), manufacturer.size(), description.data(), description.size(), serial.data(), serial.size()) < 0) {
            spdlog::warn("Unable to read USB strings: {}", ftdi_error(context));
            continue;
        }
        list.push_back({ manufacturer.data(), description.data(), serial.data() });
    }
    return list;
}

hacklet::serial::connection::connection(std::unique_ptr<transport> port, const settings &config) : port(std::move(port)), poll_interval(config.poll_interval), read_timeout(config.read_timeout) {

}

std::optional<std::string> hacklet::serial::connection::transmit(const std::vector<std::byte> &data) {
    spdlog::debug("TX: {:n}", spdlog::to_hex(data));
    return port->write(data);
}

tl::expected<std::vector<std::byte>, std::string> hacklet::serial::connection::receive(const size_t &num_bytes, const std::optional<std::chrono::milliseconds> &timeout) {
    const auto limit = timeout ? *timeout : read_timeout;
    const auto start = std::chrono::steady_clock::now();
    while (buffer.size() < num_bytes) {
        const auto res = port->read();
        if (!res.has_value()) return tl::make_unexpected(res.error());
        if (!res->empty()) {
            buffer.insert(buffer.end(), res->begin(), res->end());
            continue;
        }
        if (std::chrono::steady_clock::now() - start >= limit) return tl::make_unexpected("Timed out waiting for data.");
        std::this_thread::sleep_for(poll_interval);
    }
    std::vector<std::byte> response(buffer.begin(), buffer.begin() + num_bytes);
    buffer.erase(buffer.begin(), buffer.begin() + num_bytes);
    spdlog::debug("RX: {:n}", spdlog::to_hex(response));
    return response;
}

void hacklet::serial::connection::close() {
    port->close();
    buffer.clear();
}
