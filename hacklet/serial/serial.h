#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

struct ftdi_context;

namespace hacklet::serial {

    constexpr uint16_t default_vendor_id = 0x0403;
    constexpr uint16_t default_product_id = 0x8c81;
    constexpr int default_baud_rate = 115200;

    struct settings {

        uint16_t vendor_id = default_vendor_id;
        uint16_t product_id = default_product_id;
        std::optional<std::string> serial;
        int baud_rate = default_baud_rate;
        std::chrono::milliseconds poll_interval { 100 };
        std::chrono::milliseconds read_timeout { 5000 };
    };

    // A raw byte pipe to the dongle. read() returns whatever is pending, possibly nothing.
    struct transport {

        virtual ~transport() = default;

        virtual std::optional<std::string> write(const std::vector<std::byte> &data) = 0;
        virtual tl::expected<std::vector<std::byte>, std::string> read() = 0;
        virtual void close() = 0;
    };

    struct ftdi_transport : transport {

        ftdi_transport() = default;
        ftdi_transport(const ftdi_transport &) = delete;
        ftdi_transport &operator=(const ftdi_transport &) = delete;
        ~ftdi_transport() override;

        std::optional<std::string> open(const settings &config);
        std::optional<std::string> write(const std::vector<std::byte> &data) override;
        tl::expected<std::vector<std::byte>, std::string> read() override;
        void close() override;

        bool connected() const { return context != nullptr; }

        private:
            ftdi_context *context = nullptr;
    };

    struct device_info {

        std::string manufacturer;
        std::string description;
        std::string serial;
    };

    tl::expected<std::vector<device_info>, std::string> list_devices(const uint16_t &vendor_id = default_vendor_id, const uint16_t &product_id = default_product_id);

    // Buffers incoming bytes so callers can ask for exact lengths.
    struct connection {

        std::unique_ptr<transport> port;
        std::vector<std::byte> buffer;
        std::chrono::milliseconds poll_interval;
        std::chrono::milliseconds read_timeout;

        connection(std::unique_ptr<transport> port, const settings &config = { });

        std::optional<std::string> transmit(const std::vector<std::byte> &data);
        tl::expected<std::vector<std::byte>, std::string> receive(const size_t &num_bytes, const std::optional<std::chrono::milliseconds> &timeout = std::nullopt);
        void close();
    };
}
