#include "sendme/app/commands.hpp"
#include "sendme/app/config.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace {

int fail(const sendme::Error& error) {
    fmt::print(stderr, "error: {}\n", error.message);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto logger = spdlog::stderr_color_mt("sendme");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "sendme";

    auto config = sendme::app::parse_args(argc, argv);
    if (config.is_error()) {
        fmt::print(stderr, "{}", sendme::app::usage(program));
        return fail(config.error());
    }
    if (config.value().command == sendme::app::Command::Help) {
        fmt::print("{}", sendme::app::usage(program));
        return 0;
    }

    auto level = sendme::app::resolve_log_level(config.value().verbose, std::getenv("SENDME_LOG"));
    if (level.is_error()) {
        return fail(level.error());
    }
    spdlog::set_level(level.value());

    auto secret = sendme::app::resolve_secret(std::getenv("SENDME_SECRET"));
    if (secret.is_error()) {
        return fail(secret.error());
    }
    if (secret.value().generated) {
        fmt::print(stderr, "using secret key {}\n", secret.value().key.to_hex());
    }

    std::error_code ec;
    const auto working_dir = std::filesystem::current_path(ec);
    if (ec) {
        return fail(sendme::Error{sendme::ErrorKind::Io, "cannot determine working directory: " + ec.message()});
    }

    const auto result = config.value().command == sendme::app::Command::Provide
        ? sendme::app::run_provide(config.value().provide, secret.value().key, working_dir)
        : sendme::app::run_get(config.value().get, secret.value().key, working_dir);
    if (result.is_error()) {
        return fail(result.error());
    }
    return 0;
}
