#pragma once

#include "sendme/core/result.hpp"
#include "sendme/net/secret_key.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace sendme::app {

enum class Command {
    Help,
    Provide,
    Get
};

struct ProvideOptions {
    std::filesystem::path path;
    std::uint16_t port = 0;              ///< 0 = ephemeral
    std::string bind_address = "0.0.0.0";
};

struct GetOptions {
    std::string ticket;
    bool keep_store = false;
};

struct Config {
    Command command = Command::Help;
    ProvideOptions provide;
    GetOptions get;
    bool verbose = false;
};

/**
 * @brief Parse the command line
 *
 * sendme provide <path> [--port N] [--bind ADDR] [-v]
 * sendme get <ticket> [--keep-store] [-v]
 * sendme help | --help | -h
 */
Result<Config> parse_args(int argc, const char* const argv[]);

std::string usage(const std::string& program);

/**
 * Log level from SENDME_LOG when set, otherwise warn (debug with -v).
 * @p env_value may be null.
 */
Result<spdlog::level::level_enum> resolve_log_level(bool verbose, const char* env_value);

struct SecretSource {
    net::SecretKey key;
    bool generated = false;
};

/**
 * Secret key from SENDME_SECRET when set, otherwise a fresh random one.
 * @p env_value may be null.
 */
Result<SecretSource> resolve_secret(const char* env_value);

} // namespace sendme::app
