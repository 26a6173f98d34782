#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace hacklet::file {

    tl::expected<std::vector<std::byte>, std::string> load(const std::filesystem::path &path);
    tl::expected<std::string, std::string> load_text(const std::filesystem::path &path);
    std::optional<std::string> save(const std::filesystem::path &path, const std::vector<std::byte> &data);
    std::optional<std::string> save_text(const std::filesystem::path &path, const std::string_view &text);
}
