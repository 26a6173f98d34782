#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <tl/expected.hpp>

#include "../dongle/dongle.h"

namespace hacklet::config {

    struct options {

        dongle::settings dongle;
        spdlog::level::level_enum log_level = spdlog::level::info;
        std::optional<std::filesystem::path> source;
    };

    // $XDG_CONFIG_HOME/hacklet/config.yaml, falling back to ~/.config/hacklet/config.yaml.
    std::optional<std::filesystem::path> default_path();

    tl::expected<options, std::string> parse(const std::string_view &document);

    // An explicit path must exist. Without one the default path is tried and defaults are used when it is absent.
    tl::expected<options, std::string> load(const std::optional<std::filesystem::path> &path = std::nullopt);
}
