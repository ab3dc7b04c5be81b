#pragma once

#include "speedtest/config.hpp"
#include "speedtest/network.hpp"
#include "speedtest/stop_token.hpp"
#include "speedtest/transfer.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace speedtest {

class TcpConnector {
  public:
    virtual ~TcpConnector() = default;

    // Must give up with Cancelled once stop is requested.
    virtual Socket connect(const NetworkEndpoint &endpoint, const TcpClientOptions &options,
                           const StopToken &stop) = 0;
};

class SocketTcpConnector : public TcpConnector {
  public:
    Socket connect(const NetworkEndpoint &endpoint, const TcpClientOptions &options, const StopToken &stop) override;
};

// Requests requested_size bytes as "<size>\n" and reads until all of them
// arrived. Each retry opens a fresh connection.
TransferRecord run_tcp_transfer(const std::string &id, const NetworkEndpoint &server,
                                std::uint64_t requested_size, const TcpClientOptions &options,
                                const StopToken &stop, const ProgressCallback &progress,
                                TcpConnector &connector);

TransferRecord run_tcp_transfer(const std::string &id, const NetworkEndpoint &server,
                                std::uint64_t requested_size, const TcpClientOptions &options,
                                const StopToken &stop, const ProgressCallback &progress);

// Accepts surrounding whitespace; anything but decimal digits is MalformedMessage.
std::uint64_t parse_requested_size(const std::string &line);

// Reads the size line and streams that many filler bytes. Returns bytes sent.
std::uint64_t serve_tcp_connection(Socket connection, const NetworkEndpoint &peer,
                                   const TcpServeOptions &options, const StopToken &stop);

} // namespace speedtest
