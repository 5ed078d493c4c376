#include "sendme/app/config.hpp"

#include <charconv>
#include <string_view>

namespace sendme::app {

namespace {

Result<std::uint16_t> parse_port(std::string_view text) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value > 65535) {
        return Err<std::uint16_t>(ErrorKind::InvalidArgument, "invalid port: " + std::string(text));
    }
    return Ok(static_cast<std::uint16_t>(value));
}

} // namespace

std::string usage(const std::string& program) {
    return "Send a file or directory between two machines, verified by SHA-256.\n"
           "\n"
           "Usage:\n"
           "  " + program + " provide <path> [--port N] [--bind ADDR] [-v]\n"
           "  " + program + " get <ticket> [--keep-store] [-v]\n"
           "\n"
           "Options:\n"
           "  --port N        Port to listen on (default: random free port)\n"
           "  --bind ADDR     Address to listen on (default: 0.0.0.0)\n"
           "  --keep-store    Keep ./.sendme-get after a download\n"
           "  -v, --verbose   Debug logging\n"
           "  -h, --help      Show this help\n"
           "\n"
           "Environment:\n"
           "  SENDME_SECRET   64 hex characters; node secret key (random if unset)\n"
           "  SENDME_LOG      trace|debug|info|warn|error|off\n";
}

Result<Config> parse_args(int argc, const char* const argv[]) {
    Config config;
    if (argc < 2) {
        return Err<Config>(ErrorKind::InvalidArgument, "missing command");
    }

    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        config.command = Command::Help;
        return Ok(config);
    }
    if (command == "provide") {
        config.command = Command::Provide;
    } else if (command == "get") {
        config.command = Command::Get;
    } else {
        return Err<Config>(ErrorKind::InvalidArgument, "unknown command '" + command + "'");
    }

    bool have_positional = false;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            config.command = Command::Help;
            return Ok(config);
        } else if (arg == "--port" && config.command == Command::Provide) {
            if (i + 1 >= argc) {
                return Err<Config>(ErrorKind::InvalidArgument, "--port requires a value");
            }
            auto port = parse_port(argv[++i]);
            if (port.is_error()) {
                return Err<Config>(port.error());
            }
            config.provide.port = port.value();
        } else if (arg == "--bind" && config.command == Command::Provide) {
            if (i + 1 >= argc) {
                return Err<Config>(ErrorKind::InvalidArgument, "--bind requires a value");
            }
            config.provide.bind_address = argv[++i];
        } else if (arg == "--keep-store" && config.command == Command::Get) {
            config.get.keep_store = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return Err<Config>(ErrorKind::InvalidArgument, "unknown option '" + arg + "'");
        } else if (have_positional) {
            return Err<Config>(ErrorKind::InvalidArgument, "unexpected argument '" + arg + "'");
        } else {
            have_positional = true;
            if (config.command == Command::Provide) {
                config.provide.path = arg;
            } else {
                config.get.ticket = arg;
            }
        }
    }

    if (!have_positional) {
        return Err<Config>(ErrorKind::InvalidArgument,
                           config.command == Command::Provide ? "provide requires a path"
                                                              : "get requires a ticket");
    }
    return Ok(config);
}

Result<spdlog::level::level_enum> resolve_log_level(bool verbose, const char* env_value) {
    using Level = spdlog::level::level_enum;

    if (env_value == nullptr || *env_value == '\0') {
        return Ok(verbose ? Level::debug : Level::warn);
    }

    const std::string name = env_value;
    const Level level = spdlog::level::from_str(name);
    // from_str maps anything it does not recognise to off
    if (level == Level::off && name != "off") {
        return Err<Level>(ErrorKind::InvalidArgument, "SENDME_LOG: unknown level '" + name + "'");
    }
    return Ok(level);
}

Result<SecretSource> resolve_secret(const char* env_value) {
    if (env_value != nullptr && *env_value != '\0') {
        auto key = net::SecretKey::from_hex(env_value);
        if (key.is_error()) {
            return Err<SecretSource>(ErrorKind::InvalidArgument, "invalid SENDME_SECRET: " + key.error().message);
        }
        return Ok(SecretSource{key.value(), false});
    }

    auto key = net::SecretKey::generate();
    if (key.is_error()) {
        return Err<SecretSource>(key.error());
    }
    return Ok(SecretSource{key.value(), true});
}

} // namespace sendme::app
