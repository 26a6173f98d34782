#include "file.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fmt/format.h>

tl::expected<std::vector<std::byte>, std::string> hacklet::file::load(const std::filesystem::path &path) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs) return tl::make_unexpected(fmt::format("Unable to open file: {}", path.string()));
    const auto end = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    const auto size = end - ifs.tellg();
    if (size < 0) return tl::make_unexpected(fmt::format("Unable to determine size of file: {}", path.string()));
    std::vector<std::byte> buffer(static_cast<size_t>(size));
    if (!ifs.read(reinterpret_cast<char *>(buffer.data()), buffer.size())) return tl::make_unexpected(fmt::format("Unable to read file {}: {}", path.string(), std::strerror(errno)));
    return buffer;
}

tl::expected<std::string, std::string> hacklet::file::load_text(const std::filesystem::path &path) {
    const auto data = load(path);
    if (!data.has_value()) return tl::make_unexpected(data.error());
    return std::string(reinterpret_cast<const char *>(data->data()), data->size());
}

std::optional<std::string> hacklet::file::save(const std::filesystem::path &path, const std::vector<std::byte> &data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) return fmt::format("Unable to open file for writing: {}", path.string());
    ofs.write(reinterpret_cast<const char *>(data.data()), data.size());
    if (!ofs) return fmt::format("Unable to write data to file: {}", path.string());
    return std::nullopt;
}

std::optional<std::string> hacklet::file::save_text(const std::filesystem::path &path, const std::string_view &text) {
    const auto begin = reinterpret_cast<const std::byte *>(text.data());
    return save(path, std::vector<std::byte>(begin, begin + text.size()));
}
