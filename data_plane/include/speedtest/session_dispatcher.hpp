#pragma once

#include "speedtest/config.hpp"
#include "speedtest/handler_group.hpp"
#include "speedtest/network.hpp"
#include "speedtest/stop_token.hpp"
#include "speedtest/wire.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace speedtest {

class TcpSessionListener {
  public:
    // Binds immediately; throws BindError when the port is taken.
    TcpSessionListener(const std::string &bind_address, std::uint16_t port, TcpServeOptions options);

    std::uint16_t port() const noexcept { return port_; }

    // Accepts until stop is requested, then waits for running handlers.
    void run(const StopToken &stop, std::chrono::milliseconds poll_interval);

    std::size_t sessions() const noexcept { return sessions_.load(); }

    // Connections closed unserved because no handler could be started.
    std::size_t rejected() const noexcept { return rejected_.load(); }

    // Failed accepts; each one is followed by a poll_interval pause.
    std::size_t accept_errors() const noexcept { return accept_errors_.load(); }

  private:
    Socket socket_;
    std::uint16_t port_;
    TcpServeOptions options_;
    HandlerGroup handlers_;
    std::atomic<std::size_t> sessions_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> accept_errors_{0};
};

class UdpSessionListener {
  public:
    UdpSessionListener(const std::string &bind_address, std::uint16_t port, UdpServeOptions options);

    std::uint16_t port() const noexcept { return port_; }

    void run(const StopToken &stop, std::chrono::milliseconds poll_interval);

    std::size_t sessions() const noexcept { return sessions_.load(); }

    std::size_t rejected() const noexcept { return rejected_.load(); }

    std::size_t receive_errors() const noexcept { return receive_errors_.load(); }

  private:
    // Shared with handlers for sending; each handler writes to its own peer.
    std::shared_ptr<Socket> socket_;
    std::uint16_t port_;
    UdpServeOptions options_;
    HandlerGroup handlers_;
    std::atomic<std::size_t> sessions_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> receive_errors_{0};
};

// Server side: owns the TCP and UDP listeners. A role that fails to bind is
// disabled and advertised with port 0; the other role keeps working.
class SessionDispatcher {
  public:
    explicit SessionDispatcher(const ServerConfig &config);

    bool tcp_enabled() const noexcept { return tcp_ != nullptr; }
    bool udp_enabled() const noexcept { return udp_ != nullptr; }

    Offer offer() const;

    void run_tcp(const StopToken &stop);

    void run_udp(const StopToken &stop);

  private:
    ServerConfig config_;
    std::unique_ptr<TcpSessionListener> tcp_;
    std::unique_ptr<UdpSessionListener> udp_;
};

} // namespace speedtest
