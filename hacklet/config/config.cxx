#include "config.h"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <pystring.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "../file/file.h"

namespace hacklet::config {

    static tl::expected<unsigned long, std::string> read_unsigned(const YAML::Node &node, const std::string &key, const unsigned long &max) {
        try {
            const auto text = pystring::strip(node.as<std::string>());
            size_t consumed = 0;
            const auto value = std::stoul(text, &consumed, 0);
            if (consumed != text.size() || pystring::startswith(text, "-")) return tl::make_unexpected(fmt::format("Invalid value for {}: {}", key, text));
            if (value > max) return tl::make_unexpected(fmt::format("Value for {} is out of range: {}", key, text));
            return value;
        } catch (const YAML::Exception &exc) {
            return tl::make_unexpected(fmt::format("Invalid value for {}: {}", key, exc.what()));
        } catch (const std::logic_error &) {
            return tl::make_unexpected(fmt::format("Invalid value for {}.", key));
        }
    }

    template<typename T>
    static std::optional<std::string> assign(const YAML::Node &section, const std::string_view &section_name, const std::string_view &name, T &target, const unsigned long &max) {
        const auto node = section[std::string(name)];
        if (!node) return std::nullopt;
        const auto value = read_unsigned(node, fmt::format("{}.{}", section_name, name), max);
        if (!value.has_value()) return value.error();
        target = static_cast<T>(*value);
        return std::nullopt;
    }

    // An empty section is allowed and leaves the defaults alone.
    static tl::expected<bool, std::string> has_section(const YAML::Node &root, const std::string &name) {
        const auto node = root[name];
        if (!node || node.IsNull()) return false;
        if (!node.IsMap()) return tl::make_unexpected(fmt::format("Section {} must be a map.", name));
        return true;
    }

    static std::optional<std::string> assign_milliseconds(const YAML::Node &section, const std::string_view &section_name, const std::string_view &name, std::chrono::milliseconds &target) {
        auto count = static_cast<unsigned long>(target.count());
        if (const auto err = assign(section, section_name, name, count, 3600000ul); err) return err;
        target = std::chrono::milliseconds(count);
        return std::nullopt;
    }
}

std::optional<std::filesystem::path> hacklet::config::default_path() {
    if (const auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return std::filesystem::path(xdg) / "hacklet" / "config.yaml";
    if (const auto home = std::getenv("HOME"); home && *home) return std::filesystem::path(home) / ".config" / "hacklet" / "config.yaml";
    return std::nullopt;
}

tl::expected<hacklet::config::options, std::string> hacklet::config::parse(const std::string_view &document) {
    YAML::Node loaded;
    try {
        loaded = YAML::Load(std::string(document));
    } catch (const YAML::Exception &exc) {
        return tl::make_unexpected(fmt::format("Unable to parse configuration: {}", exc.what()));
    }
    const YAML::Node &root = loaded;
    options result;
    if (!root || root.IsNull()) return result;
    if (!root.IsMap()) return tl::make_unexpected("Configuration root must be a map.");
    try {
        const auto device_section = has_section(root, "device");
        if (!device_section.has_value()) return tl::make_unexpected(device_section.error());
        if (*device_section) {
            const auto device = root["device"];
            auto &target = result.dongle.device;
            if (const auto err = assign(device, "device", "vendor_id", target.vendor_id, 0xFFFFul); err) return tl::make_unexpected(*err);
            if (const auto err = assign(device, "device", "product_id", target.product_id, 0xFFFFul); err) return tl::make_unexpected(*err);
            if (const auto err = assign(device, "device", "baud_rate", target.baud_rate, 3000000ul); err) return tl::make_unexpected(*err);
            if (const auto err = assign_milliseconds(device, "device", "poll_interval_ms", target.poll_interval); err) return tl::make_unexpected(*err);
            if (const auto err = assign_milliseconds(device, "device", "read_timeout_ms", target.read_timeout); err) return tl::make_unexpected(*err);
            if (const auto serial = device["serial"]; serial) {
                if (!serial.IsScalar()) return tl::make_unexpected("Invalid value for device.serial.");
                const auto value = pystring::strip(serial.as<std::string>());
                if (!value.empty()) target.serial = value;
            }
        }
        const auto commission_section = has_section(root, "commission");
        if (!commission_section.has_value()) return tl::make_unexpected(commission_section.error());
        if (*commission_section) {
            auto seconds = static_cast<unsigned long>(std::chrono::duration_cast<std::chrono::seconds>(result.dongle.commission_timeout).count());
            if (const auto err = assign(root["commission"], "commission", "timeout_s", seconds, 3600ul); err) return tl::make_unexpected(*err);
            result.dongle.commission_timeout = std::chrono::seconds(seconds);
        }
        const auto log_section = has_section(root, "log");
        if (!log_section.has_value()) return tl::make_unexpected(log_section.error());
        if (*log_section && root["log"]["level"]) {
            const auto level_node = root["log"]["level"];
            if (!level_node.IsScalar()) return tl::make_unexpected("Invalid value for log.level.");
            const auto name = pystring::lower(pystring::strip(level_node.as<std::string>()));
            const auto level = spdlog::level::from_str(name);
            if (level == spdlog::level::off && name != "off") return tl::make_unexpected(fmt::format("Unknown log level: {}", name));
            result.log_level = level;
        }
    } catch (const YAML::Exception &exc) {
        return tl::make_unexpected(fmt::format("Invalid configuration: {}", exc.what()));
    }
    return result;
}

tl::expected<hacklet::config::options, std::string> hacklet::config::load(const std::optional<std::filesystem::path> &path) {
    if (path) {
        const auto text = file::load_text(*path);
        if (!text.has_value()) return tl::make_unexpected(text.error());
        auto result = parse(*text);
        if (!result.has_value()) return tl::make_unexpected(fmt::format("{}: {}", path->string(), result.error()));
        result->source = *path;
        spdlog::debug("Loaded configuration from {}", path->string());
        return result;
    }
    const auto fallback = default_path();
    std::error_code ec;
    if (!fallback || !std::filesystem::exists(*fallback, ec)) {
        spdlog::debug("No configuration file found, using defaults");
        return options { };
    }
    return load(fallback);
}
