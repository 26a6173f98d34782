#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <pystring.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "../../hacklet/command/command.h"
#include "../../hacklet/config/config.h"
#include "../../hacklet/dongle/dongle.h"
#include "../../hacklet/version/version.h"

static constexpr int exit_runtime_error = 1;
static constexpr int exit_usage_error = 2;

static std::optional<std::string> run(const hacklet::command::invocation &request, const hacklet::config::options &options) {
    if (!hacklet::command::needs_session(request)) {
        const auto text = hacklet::command::list_devices(options.dongle.device);
        if (!text.has_value()) return text.error();
        return hacklet::command::emit(request, *text);
    }
    std::string report;
    const auto err = hacklet::dongle::open(options.dongle, [&](hacklet::dongle::session &session) -> std::optional<std::string> {
        auto res = hacklet::command::execute(request, session);
        if (!res.has_value()) return res.error();
        report = std::move(*res);
        return std::nullopt;
    });
    if (err) return err;
    if (report.empty()) return std::nullopt;
    return hacklet::command::emit(request, report);
}

int main(int arg_c, char **arg_v) {
    spdlog::set_default_logger(spdlog::stdout_color_mt(pystring::lower(hacklet::version::app_name)));
    spdlog::set_level(spdlog::level::info);

    const auto request = hacklet::command::parse(std::vector<std::string>(arg_v, arg_v + arg_c));
    if (!request.has_value()) {
        std::cerr << request.error().message << std::endl << std::endl;
        std::cerr << request.error().help;
        return exit_usage_error;
    }

    auto options = hacklet::config::load(request->config_path);
    if (!options.has_value()) {
        spdlog::error("Unable to load configuration: {}", options.error());
        return exit_runtime_error;
    }
    spdlog::set_level(request->debug ? spdlog::level::debug : options->log_level);
    if (request->debug) spdlog::debug("Debug logging enabled");
    spdlog::debug("Program version: {}", hacklet::version::app_ver);

    if (const auto err = run(*request, *options); err) {
        spdlog::error("An error has occurred: {}", *err);
        return exit_runtime_error;
    }
    return 0;
}
