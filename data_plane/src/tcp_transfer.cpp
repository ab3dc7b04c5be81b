#include "speedtest/tcp_transfer.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"
#include "speedtest/wire.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace speedtest {

namespace {

// Waits in poll_interval slices so a stop request interrupts the read.
std::size_t read_with_timeout(const Socket &socket, void *buffer, std::size_t length,
                              std::chrono::milliseconds io_timeout, std::chrono::milliseconds poll_interval,
                              const StopToken &stop) {
    std::chrono::milliseconds idle{0};
    while (true) {
        if (stop.stop_requested()) {
            throw Cancelled();
        }
        const auto slice = std::min(poll_interval, io_timeout - idle);
        if (wait_readable(socket, slice)) {
            return recv_some(socket, buffer, length);
        }
        idle += slice;
        if (idle >= io_timeout) {
            std::ostringstream oss;
            oss << "no data for " << io_timeout.count() << " ms";
            throw Timeout(oss.str());
        }
    }
}

void receive_stream(TransferRecord &record, const NetworkEndpoint &server, const TcpClientOptions &options,
                    const StopToken &stop, const ProgressCallback &progress, TcpConnector &connector) {
    record.delivered = 0;
    Socket socket = connector.connect(server, options, stop);

    const std::string request = std::to_string(record.requested_bytes) + "\n";
    send_all(socket, request.data(), request.size());

    std::vector<char> buffer(std::max<std::size_t>(options.chunk_size, 1));
    while (record.delivered < record.requested_bytes) {
        const auto remaining = record.requested_bytes - record.delivered;
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        const auto got = read_with_timeout(socket, buffer.data(), want, options.io_timeout,
                                           options.poll_interval, stop);
        if (got == 0) {
            std::ostringstream oss;
            oss << "connection closed prematurely after " << record.delivered << " of "
                << record.requested_bytes << " bytes";
            throw PrematureClose(oss.str());
        }
        record.delivered += got;
        if (progress) {
            progress(record.progress());
        }
    }
    record.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - record.start).count();
}

} // namespace

Socket SocketTcpConnector::connect(const NetworkEndpoint &endpoint, const TcpClientOptions &options,
                                   const StopToken &stop) {
    return connect_tcp(endpoint, options.io_timeout, options.poll_interval, stop);
}

TransferRecord run_tcp_transfer(const std::string &id, const NetworkEndpoint &server,
                                std::uint64_t requested_size, const TcpClientOptions &options,
                                const StopToken &stop, const ProgressCallback &progress,
                                TcpConnector &connector) {
    TransferRecord record;
    record.id = id;
    record.protocol = Protocol::Tcp;
    record.requested_bytes = requested_size;
    record.total = requested_size;

    record = run_with_retries(std::move(record), options.retry, stop, [&](TransferRecord &current) {
        receive_stream(current, server, options, stop, progress, connector);
    });

    const std::string tag = transfer_tag(record);
    if (record.outcome == Outcome::Success) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(2);
        oss << "Received " << record.delivered << " bytes in " << record.elapsed_seconds
            << "s, speed=" << record.throughput_bytes_per_second() << " B/s";
        log_debug(tag, oss.str());
    } else {
        log_error(tag, "giving up after " + std::to_string(record.attempts) +
                           " attempt(s): " + record.failure_cause);
    }
    return record;
}

TransferRecord run_tcp_transfer(const std::string &id, const NetworkEndpoint &server,
                                std::uint64_t requested_size, const TcpClientOptions &options,
                                const StopToken &stop, const ProgressCallback &progress) {
    SocketTcpConnector connector;
    return run_tcp_transfer(id, server, requested_size, options, stop, progress, connector);
}

std::uint64_t parse_requested_size(const std::string &line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw MalformedMessage("empty size request");
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    const std::string digits = line.substr(first, last - first + 1);
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        throw MalformedMessage("invalid file size: '" + digits + "'");
    }
    try {
        return std::stoull(digits);
    } catch (const std::out_of_range &) {
        throw MalformedMessage("file size out of range: '" + digits + "'");
    }
}

std::uint64_t serve_tcp_connection(Socket connection, const NetworkEndpoint &peer,
                                   const TcpServeOptions &options, const StopToken &stop) {
    const std::string tag = "TCP " + to_string(peer);
    set_io_timeout(connection, options.io_timeout);

    std::string line;
    std::vector<char> buffer(options.max_request_bytes);
    while (line.find('\n') == std::string::npos && line.size() < options.max_request_bytes) {
        const auto got = read_with_timeout(connection, buffer.data(), options.max_request_bytes - line.size(),
                                           options.io_timeout, options.poll_interval, stop);
        if (got == 0) {
            break;
        }
        line.append(buffer.data(), got);
    }
    if (line.empty()) {
        throw MalformedMessage("received no data");
    }
    const auto file_size = parse_requested_size(line.substr(0, line.find('\n')));
    log_info(tag, "requested " + std::to_string(file_size) + " bytes");

    std::vector<char> filler(std::max<std::size_t>(options.chunk_size, 1), static_cast<char>(kFillerByte));
    std::uint64_t sent = 0;
    while (sent < file_size) {
        if (stop.stop_requested()) {
            throw Cancelled();
        }
        const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(file_size - sent, filler.size()));
        send_all(connection, filler.data(), count);
        sent += count;
    }
    log_info(tag, "finished sending " + std::to_string(sent) + " bytes");
    return sent;
}

} // namespace speedtest
