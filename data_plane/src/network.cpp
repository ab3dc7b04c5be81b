#include "speedtest/network.hpp"

#include "speedtest/errors.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace speedtest {

namespace {

std::string errno_text(const std::string &what, int err) {
    std::ostringstream oss;
    oss << what << ": " << std::strerror(err);
    return oss.str();
}

std::string errno_text(const char *what) { return errno_text(what, errno); }

timeval to_timeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

void set_blocking(const Socket &sock, bool blocking) {
    int flags = ::fcntl(sock.fd(), F_GETFL, 0);
    if (flags < 0) {
        throw NetworkError(errno_text("fcntl"));
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (::fcntl(sock.fd(), F_SETFL, flags) != 0) {
        throw NetworkError(errno_text("fcntl"));
    }
}

// Waits for an in-progress connect. Returns 0 or the errno it failed with.
int wait_connected(const Socket &sock, std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval,
                   const StopToken &stop) {
    const auto slice_cap = std::max(poll_interval, std::chrono::milliseconds{1});
    std::chrono::milliseconds waited{0};
    while (true) {
        if (stop.stop_requested()) {
            throw Cancelled();
        }
        if (waited >= timeout) {
            return ETIMEDOUT;
        }
        const auto slice = std::min(slice_cap, timeout - waited);
        pollfd pfd{};
        pfd.fd = sock.fd();
        pfd.events = POLLOUT;
        int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }
        if (rc == 0) {
            waited += slice;
            continue;
        }
        int error = 0;
        socklen_t length = sizeof(error);
        if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &error, &length) != 0) {
            return errno;
        }
        return error;
    }
}

} // namespace

std::string to_string(const NetworkEndpoint &endpoint) {
    std::ostringstream oss;
    oss << endpoint.address << ':' << endpoint.port;
    return oss.str();
}

Socket::~Socket() { close(); }

Socket::Socket(Socket &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket &Socket::operator=(Socket &&other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

AddrInfo::AddrInfo(const std::string &host, const std::string &port, int family, int socktype) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    hints.ai_flags = (host.empty() ? AI_PASSIVE : 0);

    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &info_);
    if (rc != 0) {
        std::ostringstream oss;
        oss << "getaddrinfo failed for '" << host << "': " << ::gai_strerror(rc);
        throw NetworkError(oss.str());
    }
}

AddrInfo::~AddrInfo() {
    if (info_ != nullptr) {
        ::freeaddrinfo(info_);
    }
}

Socket connect_tcp(const NetworkEndpoint &endpoint, std::chrono::milliseconds timeout,
                   std::chrono::milliseconds poll_interval, const StopToken &stop) {
    AddrInfo info(endpoint.address, std::to_string(endpoint.port), AF_UNSPEC, SOCK_STREAM);
    std::string last_error = "no usable address";
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            last_error = errno_text("socket");
            continue;
        }
        set_blocking(sock, false);
        if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last_error = errno_text("connect");
                continue;
            }
            const int error = wait_connected(sock, timeout, poll_interval, stop);
            if (error != 0) {
                last_error = errno_text("connect", error);
                continue;
            }
        }
        set_blocking(sock, true);
        set_io_timeout(sock, timeout);
        return sock;
    }
    std::ostringstream oss;
    oss << "failed to connect to " << to_string(endpoint) << " (" << last_error << ")";
    throw ConnectError(oss.str());
}

Socket listen_tcp(const std::string &bind_address, std::uint16_t port, int backlog) {
    AddrInfo info(bind_address, std::to_string(port), AF_INET, SOCK_STREAM);
    int last_errno = EADDRNOTAVAIL;
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            last_errno = errno;
            continue;
        }
        int enable = 1;
        ::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
        if (::bind(sock.fd(), ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(sock.fd(), backlog) == 0) {
            return sock;
        }
        last_errno = errno;
    }
    std::ostringstream oss;
    oss << "failed to bind TCP listener on port " << port << ": " << std::strerror(last_errno);
    throw BindError(oss.str());
}

Socket open_udp_socket() {
    Socket sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.valid()) {
        throw NetworkError(errno_text("failed to create UDP socket"));
    }
    return sock;
}

Socket bind_udp(const std::string &bind_address, std::uint16_t port, bool reuse_address) {
    Socket sock = open_udp_socket();
    if (reuse_address) {
        int enable = 1;
        ::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
#ifdef SO_REUSEPORT
        ::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable));
#endif
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (bind_address.empty() || bind_address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else {
        addr = resolve_ipv4(NetworkEndpoint{bind_address, port});
    }
    if (::bind(sock.fd(), reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0) {
        std::ostringstream oss;
        oss << "failed to bind UDP socket on port " << port << ": " << std::strerror(errno);
        throw BindError(oss.str());
    }
    return sock;
}

std::uint16_t local_port(const Socket &socket) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (::getsockname(socket.fd(), reinterpret_cast<struct sockaddr *>(&addr), &len) != 0) {
        throw NetworkError(errno_text("getsockname failed"));
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<struct sockaddr_in *>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<struct sockaddr_in6 *>(&addr)->sin6_port);
    }
    throw NetworkError("unsupported socket family");
}

void set_io_timeout(const Socket &socket, std::chrono::milliseconds timeout) {
    const timeval tv = to_timeval(timeout);
    if (::setsockopt(socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(socket.fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throw NetworkError(errno_text("failed to set socket timeout"));
    }
}

void set_buffer_sizes(const Socket &socket, int send_bytes, int recv_bytes) {
    if (send_bytes > 0 &&
        ::setsockopt(socket.fd(), SOL_SOCKET, SO_SNDBUF, &send_bytes, sizeof(send_bytes)) != 0) {
        throw NetworkError(errno_text("failed to set SO_SNDBUF"));
    }
    if (recv_bytes > 0 &&
        ::setsockopt(socket.fd(), SOL_SOCKET, SO_RCVBUF, &recv_bytes, sizeof(recv_bytes)) != 0) {
        throw NetworkError(errno_text("failed to set SO_RCVBUF"));
    }
}

void enable_broadcast(const Socket &socket) {
    int enable = 1;
    if (::setsockopt(socket.fd(), SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0) {
        throw NetworkError(errno_text("failed to enable broadcast"));
    }
}

bool wait_readable(const Socket &socket, std::chrono::milliseconds timeout) {
    struct pollfd pfd;
    pfd.fd = socket.fd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw RecvError(errno_text("poll failed"));
    }
    return rc > 0;
}

void send_all(const Socket &socket, const void *buffer, std::size_t length) {
    const char *data = static_cast<const char *>(buffer);
    std::size_t sent = 0;
    while (sent < length) {
        ssize_t rc = ::send(socket.fd(), data + sent, length - sent, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw Timeout("socket send timed out");
            }
            throw SendError(errno_text("socket send failed"));
        }
        sent += static_cast<std::size_t>(rc);
    }
}

std::size_t recv_some(const Socket &socket, void *buffer, std::size_t length) {
    while (true) {
        ssize_t rc = ::recv(socket.fd(), buffer, length, 0);
        if (rc >= 0) {
            return static_cast<std::size_t>(rc);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw Timeout("socket recv timed out");
        }
        throw RecvError(errno_text("socket recv failed"));
    }
}

Socket accept_connection(const Socket &listener, NetworkEndpoint &peer) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    Socket conn(::accept(listener.fd(), reinterpret_cast<sockaddr *>(&addr), &len));
    if (!conn.valid()) {
        throw NetworkError(errno_text("accept failed"));
    }
    peer = endpoint_of(addr);
    return conn;
}

sockaddr_in resolve_ipv4(const NetworkEndpoint &endpoint) {
    AddrInfo info(endpoint.address, std::to_string(endpoint.port), AF_INET, SOCK_DGRAM);
    if (info.get() == nullptr) {
        throw NetworkError("no IPv4 address for " + endpoint.address);
    }
    sockaddr_in addr{};
    std::memcpy(&addr, info.get()->ai_addr, sizeof(addr));
    return addr;
}

NetworkEndpoint endpoint_of(const sockaddr_in &address) {
    char text[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &address.sin_addr, text, sizeof(text));
    return NetworkEndpoint{text, ntohs(address.sin_port)};
}

void send_datagram(const Socket &socket, const std::vector<std::uint8_t> &datagram,
                   const sockaddr_in &to) {
    while (true) {
        ssize_t rc = ::sendto(socket.fd(), datagram.data(), datagram.size(), 0,
                              reinterpret_cast<const sockaddr *>(&to), sizeof(to));
        if (rc >= 0) {
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        const int err = errno;
        throw SendError(errno_text("sendto " + to_string(endpoint_of(to)) + " failed", err));
    }
}

void receive_datagram(const Socket &socket, std::vector<std::uint8_t> &buffer, std::size_t capacity,
                      sockaddr_in &from) {
    buffer.resize(capacity);
    while (true) {
        socklen_t len = sizeof(from);
        ssize_t rc = ::recvfrom(socket.fd(), buffer.data(), buffer.size(), 0,
                                reinterpret_cast<sockaddr *>(&from), &len);
        if (rc >= 0) {
            buffer.resize(static_cast<std::size_t>(rc));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw Timeout("recvfrom timed out");
        }
        throw RecvError(errno_text("recvfrom failed"));
    }
}

} // namespace speedtest
