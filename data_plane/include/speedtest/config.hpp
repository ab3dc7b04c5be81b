#pragma once

#include "speedtest/log.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace speedtest {

constexpr std::uint16_t kDefaultDiscoveryPort = 13117;
constexpr std::uint16_t kDefaultUdpPort = 20001;
constexpr std::uint16_t kDefaultTcpPort = 20002;

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds backoff{1000};
};

struct DiscoveryOptions {
    std::uint16_t port = kDefaultDiscoveryPort;
    std::string broadcast_address = "255.255.255.255";
    std::chrono::milliseconds offer_interval{1000};
    std::chrono::milliseconds listen_wait{3000};
};

struct TcpClientOptions {
    std::chrono::milliseconds io_timeout{10000};
    // Upper bound on each blocking wait so a stop request is seen promptly.
    std::chrono::milliseconds poll_interval{1000};
    std::size_t chunk_size = 8192;
    RetryPolicy retry;
};

struct UdpClientOptions {
    std::chrono::milliseconds receive_timeout{1000};
    int max_quiet_timeouts = 5;
    int recv_buffer_bytes = 65536;
    std::size_t datagram_capacity = 2048;
    std::chrono::milliseconds progress_interval{100};
    RetryPolicy retry;
};

struct TcpServeOptions {
    std::chrono::milliseconds io_timeout{10000};
    std::chrono::milliseconds poll_interval{1000};
    std::size_t chunk_size = 8192;
    std::size_t max_request_bytes = 1024;
    // Concurrent connections served; further ones are closed unserved. 0 = no limit.
    std::size_t max_sessions = 256;
};

struct UdpServeOptions {
    std::size_t pacing_every = 50;
    std::chrono::milliseconds pacing_pause{1};
    int socket_buffer_bytes = 1 << 20;
    std::size_t datagram_capacity = 2048;
    // Concurrent requests served; further ones are dropped. 0 = no limit.
    std::size_t max_sessions = 256;
};

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t tcp_port = kDefaultTcpPort;
    std::uint16_t udp_port = kDefaultUdpPort;
    std::chrono::milliseconds poll_interval{1000};
    DiscoveryOptions discovery;
    TcpServeOptions tcp;
    UdpServeOptions udp;
    LogLevel log_level = LogLevel::Info;
};

// Where a server can be reached; a port of 0 means that role is not offered.
struct ServerAddress {
    std::string host;
    std::uint16_t udp_port;
    std::uint16_t tcp_port;
};

struct TestParameters {
    std::uint64_t file_size = 0;
    std::size_t tcp_connections = 0;
    std::size_t udp_connections = 0;

    void validate() const;
};

struct ClientConfig {
    // Unset values are asked for interactively.
    std::optional<std::uint64_t> file_size;
    std::optional<std::size_t> tcp_connections;
    std::optional<std::size_t> udp_connections;
    std::optional<ServerAddress> server;
    std::chrono::milliseconds stagger{100};
    DiscoveryOptions discovery;
    TcpClientOptions tcp;
    UdpClientOptions udp;
    LogLevel log_level = LogLevel::Info;
};

ServerConfig parse_server_args(int argc, char **argv);

ClientConfig parse_client_args(int argc, char **argv);

std::uint64_t parse_unsigned(const std::string &text, std::uint64_t max_value, const std::string &what);

// Parses "host:udp_port:tcp_port".
ServerAddress parse_server_address(const std::string &text);

} // namespace speedtest
