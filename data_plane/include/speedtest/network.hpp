#pragma once

#include "speedtest/stop_token.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct addrinfo;

namespace speedtest {

struct NetworkEndpoint {
    std::string address;
    std::uint16_t port;
};

std::string to_string(const NetworkEndpoint &endpoint);

// Owns one socket descriptor.
class Socket {
  public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    int fd() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    void close();

  private:
    int fd_ = -1;
};

class AddrInfo {
  public:
    AddrInfo(const std::string &host, const std::string &port, int family, int socktype);
    ~AddrInfo();

    AddrInfo(const AddrInfo &) = delete;
    AddrInfo &operator=(const AddrInfo &) = delete;

    struct addrinfo *get() const { return info_; }

  private:
    struct addrinfo *info_ = nullptr;
};

// Connects without blocking past poll_interval at a time, so a stop request
// ends the attempt with Cancelled. Throws ConnectError on refusal or timeout.
// The returned socket is blocking with timeout applied to reads and writes.
Socket connect_tcp(const NetworkEndpoint &endpoint, std::chrono::milliseconds timeout,
                   std::chrono::milliseconds poll_interval, const StopToken &stop);

Socket listen_tcp(const std::string &bind_address, std::uint16_t port, int backlog = 16);

Socket open_udp_socket();

Socket bind_udp(const std::string &bind_address, std::uint16_t port, bool reuse_address);

std::uint16_t local_port(const Socket &socket);

void set_io_timeout(const Socket &socket, std::chrono::milliseconds timeout);

// Buffer sizes are a request; the kernel may clamp them.
void set_buffer_sizes(const Socket &socket, int send_bytes, int recv_bytes);

void enable_broadcast(const Socket &socket);

// Polls for readability; false on timeout or EINTR.
bool wait_readable(const Socket &socket, std::chrono::milliseconds timeout);

void send_all(const Socket &socket, const void *buffer, std::size_t length);

// Returns 0 on orderly shutdown by the peer.
std::size_t recv_some(const Socket &socket, void *buffer, std::size_t length);

Socket accept_connection(const Socket &listener, NetworkEndpoint &peer);

sockaddr_in resolve_ipv4(const NetworkEndpoint &endpoint);

NetworkEndpoint endpoint_of(const sockaddr_in &address);

void send_datagram(const Socket &socket, const std::vector<std::uint8_t> &datagram,
                   const sockaddr_in &to);

// Reads one datagram into buffer (resized to the datagram length).
void receive_datagram(const Socket &socket, std::vector<std::uint8_t> &buffer, std::size_t capacity,
                      sockaddr_in &from);

} // namespace speedtest
