#include "speedtest/session_dispatcher.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"
#include "speedtest/tcp_transfer.hpp"
#include "speedtest/udp_transfer.hpp"

#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace speedtest {

namespace {

const char *const kTcpTag = "TCP";
const char *const kUdpTag = "UDP";

// Keeps handler failures inside the handler thread.
void run_isolated(const std::string &tag, const std::function<void()> &handler) {
    try {
        handler();
    } catch (const Cancelled &) {
        log_warn(tag, "handler cancelled by shutdown");
    } catch (const std::exception &err) {
        log_error(tag, err.what());
    }
}

} // namespace

TcpSessionListener::TcpSessionListener(const std::string &bind_address, std::uint16_t port, TcpServeOptions options)
    : socket_(listen_tcp(bind_address, port)), port_(local_port(socket_)), options_(std::move(options)),
      handlers_(options_.max_sessions) {}

void TcpSessionListener::run(const StopToken &stop, std::chrono::milliseconds poll_interval) {
    log_info(kTcpTag, "TCP Server started, listening on port " + std::to_string(port_));
    while (!stop.stop_requested()) {
        try {
            if (!wait_readable(socket_, poll_interval)) {
                continue;
            }
            NetworkEndpoint peer;
            auto connection = std::make_shared<Socket>(accept_connection(socket_, peer));
            bool started = handlers_.spawn([this, connection, peer, &stop] {
                run_isolated("TCP " + to_string(peer), [&] {
                    serve_tcp_connection(std::move(*connection), peer, options_, stop);
                });
            });
            if (!started) {
                ++rejected_;
                log_warn(kTcpTag, "Dropping connection from " + to_string(peer) + ": no free handler");
                continue;
            }
            ++sessions_;
        } catch (const NetworkError &err) {
            ++accept_errors_;
            log_warn(kTcpTag, err.what());
            // Pending connections stay readable, so retrying at once would spin.
            stop.wait_for(poll_interval);
        }
    }
    handlers_.join_all();
    log_info(kTcpTag, "TCP Server stopped after " + std::to_string(sessions_.load()) + " connections");
}

UdpSessionListener::UdpSessionListener(const std::string &bind_address, std::uint16_t port, UdpServeOptions options)
    : socket_(std::make_shared<Socket>(bind_udp(bind_address, port, false))), port_(local_port(*socket_)),
      options_(std::move(options)), handlers_(options_.max_sessions) {
    set_buffer_sizes(*socket_, options_.socket_buffer_bytes, options_.socket_buffer_bytes);
}

void UdpSessionListener::run(const StopToken &stop, std::chrono::milliseconds poll_interval) {
    log_info(kUdpTag, "UDP Server started, listening on port " + std::to_string(port_));
    while (!stop.stop_requested()) {
        try {
            if (!wait_readable(*socket_, poll_interval)) {
                continue;
            }
            auto datagram = std::make_shared<std::vector<std::uint8_t>>();
            sockaddr_in sender{};
            receive_datagram(*socket_, *datagram, options_.datagram_capacity, sender);
            auto socket = socket_;
            bool started = handlers_.spawn([this, socket, datagram, sender, &stop] {
                run_isolated("UDP " + to_string(endpoint_of(sender)),
                             [&] { serve_udp_request(*socket, *datagram, sender, options_, stop); });
            });
            if (!started) {
                ++rejected_;
                log_warn(kUdpTag, "Dropping request from " + to_string(endpoint_of(sender)) + ": no free handler");
                continue;
            }
            ++sessions_;
        } catch (const NetworkError &err) {
            ++receive_errors_;
            log_warn(kUdpTag, err.what());
            stop.wait_for(poll_interval);
        }
    }
    handlers_.join_all();
    log_info(kUdpTag, "UDP Server stopped after " + std::to_string(sessions_.load()) + " requests");
}

SessionDispatcher::SessionDispatcher(const ServerConfig &config) : config_(config) {
    try {
        tcp_ = std::make_unique<TcpSessionListener>(config_.bind_address, config_.tcp_port, config_.tcp);
    } catch (const NetworkError &err) {
        log_error(kTcpTag, std::string("Could not bind: ") + err.what());
    }
    try {
        udp_ = std::make_unique<UdpSessionListener>(config_.bind_address, config_.udp_port, config_.udp);
    } catch (const NetworkError &err) {
        log_error(kUdpTag, std::string("Could not bind: ") + err.what());
    }
}

Offer SessionDispatcher::offer() const {
    return Offer{udp_ ? udp_->port() : std::uint16_t{0}, tcp_ ? tcp_->port() : std::uint16_t{0}};
}

void SessionDispatcher::run_tcp(const StopToken &stop) {
    if (tcp_) {
        tcp_->run(stop, config_.poll_interval);
    }
}

void SessionDispatcher::run_udp(const StopToken &stop) {
    if (udp_) {
        udp_->run(stop, config_.poll_interval);
    }
}

} // namespace speedtest
