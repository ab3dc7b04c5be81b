#include "speedtest/config.hpp"

#include "speedtest/errors.hpp"

#include <limits>
#include <sstream>

namespace speedtest {

namespace {

std::uint16_t parse_port(const std::string &text, const std::string &what) {
    return static_cast<std::uint16_t>(parse_unsigned(text, std::numeric_limits<std::uint16_t>::max(), what));
}

[[noreturn]] void unknown_option(const std::string &arg) {
    std::ostringstream oss;
    oss << "unknown or incomplete option: " << arg;
    throw ConfigError(oss.str());
}

} // namespace

void TestParameters::validate() const {
    if (file_size < 1) {
        throw ConfigError("file size must be a positive number of bytes");
    }
}

std::uint64_t parse_unsigned(const std::string &text, std::uint64_t max_value, const std::string &what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("invalid " + what + ": '" + text + "'");
    }
    std::uint64_t value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range &) {
        throw ConfigError(what + " out of range: " + text);
    }
    if (value > max_value) {
        throw ConfigError(what + " out of range: " + text);
    }
    return value;
}

ServerAddress parse_server_address(const std::string &text) {
    const auto last = text.rfind(':');
    const auto middle = (last == std::string::npos || last == 0) ? std::string::npos : text.rfind(':', last - 1);
    if (middle == std::string::npos || middle == 0) {
        throw ConfigError("server must be host:udp_port:tcp_port, got '" + text + "'");
    }
    ServerAddress address;
    address.host = text.substr(0, middle);
    address.udp_port = parse_port(text.substr(middle + 1, last - middle - 1), "UDP port");
    address.tcp_port = parse_port(text.substr(last + 1), "TCP port");
    return address;
}

ServerConfig parse_server_args(int argc, char **argv) {
    ServerConfig config;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--bind" && i + 1 < argc) {
            config.bind_address = argv[++i];
        } else if (arg == "--tcp-port" && i + 1 < argc) {
            config.tcp_port = parse_port(argv[++i], "TCP port");
        } else if (arg == "--udp-port" && i + 1 < argc) {
            config.udp_port = parse_port(argv[++i], "UDP port");
        } else if (arg == "--discovery-port" && i + 1 < argc) {
            config.discovery.port = parse_port(argv[++i], "discovery port");
        } else if (arg == "--broadcast" && i + 1 < argc) {
            config.discovery.broadcast_address = argv[++i];
        } else if (arg == "--max-sessions" && i + 1 < argc) {
            const auto limit = static_cast<std::size_t>(
                parse_unsigned(argv[++i], std::numeric_limits<std::uint32_t>::max(), "session limit"));
            config.tcp.max_sessions = limit;
            config.udp.max_sessions = limit;
        } else if (arg == "--verbose") {
            config.log_level = LogLevel::Debug;
        } else if (arg == "--quiet") {
            config.log_level = LogLevel::Warn;
        } else {
            unknown_option(arg);
        }
    }
    if (config.discovery.port == 0) {
        throw ConfigError("discovery port must be non-zero");
    }
    return config;
}

ClientConfig parse_client_args(int argc, char **argv) {
    ClientConfig config;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--size" && i + 1 < argc) {
            config.file_size = parse_unsigned(argv[++i], std::numeric_limits<std::uint64_t>::max(), "file size");
            if (*config.file_size < 1) {
                throw ConfigError("file size must be a positive number of bytes");
            }
        } else if (arg == "--tcp" && i + 1 < argc) {
            config.tcp_connections = static_cast<std::size_t>(
                parse_unsigned(argv[++i], std::numeric_limits<std::uint32_t>::max(), "TCP connection count"));
        } else if (arg == "--udp" && i + 1 < argc) {
            config.udp_connections = static_cast<std::size_t>(
                parse_unsigned(argv[++i], std::numeric_limits<std::uint32_t>::max(), "UDP connection count"));
        } else if (arg == "--discovery-port" && i + 1 < argc) {
            config.discovery.port = parse_port(argv[++i], "discovery port");
        } else if (arg == "--server" && i + 1 < argc) {
            config.server = parse_server_address(argv[++i]);
        } else if (arg == "--verbose") {
            config.log_level = LogLevel::Debug;
        } else if (arg == "--quiet") {
            config.log_level = LogLevel::Warn;
        } else {
            unknown_option(arg);
        }
    }
    return config;
}

} // namespace speedtest
