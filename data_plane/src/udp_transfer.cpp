#include "speedtest/udp_transfer.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"

#include <cmath>
#include <sstream>

namespace speedtest {

bool SegmentTracker::record(const PayloadHeader &header, Clock::time_point arrival) {
    if (!declared_total_) {
        declared_total_ = header.total_segments;
    } else if (*declared_total_ != header.total_segments) {
        return false;
    }
    if (header.sequence >= *declared_total_) {
        return false;
    }
    if (!seen_.insert(header.sequence).second) {
        return false;
    }
    arrivals_.push_back(arrival);
    return true;
}

bool SegmentTracker::complete() const { return declared_total_ && received() >= *declared_total_; }

double SegmentTracker::jitter_seconds() const { return mean_jitter_seconds(arrivals_); }

std::uint64_t expected_segments(std::uint64_t requested_size) { return requested_size / kSegmentSize; }

std::uint64_t lost_segments(std::uint64_t expected, std::uint64_t received) {
    return received >= expected ? 0 : expected - received;
}

double mean_jitter_seconds(const std::vector<Clock::time_point> &arrivals) {
    if (arrivals.size() < 2) {
        return 0.0;
    }
    double sum = 0.0;
    for (std::size_t i = 1; i < arrivals.size(); ++i) {
        sum += std::abs(std::chrono::duration<double>(arrivals[i] - arrivals[i - 1]).count());
    }
    return sum / static_cast<double>(arrivals.size() - 1);
}

namespace {

void receive_segments(TransferRecord &record, const NetworkEndpoint &server, std::uint64_t stream_id,
                      const UdpClientOptions &options, const StopToken &stop, const ProgressCallback &progress) {
    record.delivered = 0;
    Socket socket = open_udp_socket();
    set_buffer_sizes(socket, 0, options.recv_buffer_bytes);

    const auto destination = resolve_ipv4(server);
    send_datagram(socket, encode_request(Request{record.requested_bytes, stream_id}), destination);

    SegmentTracker tracker;
    std::vector<std::uint8_t> buffer;
    int quiet_timeouts = 0;
    auto last_update = Clock::now();
    while (!tracker.complete()) {
        if (stop.stop_requested()) {
            throw Cancelled();
        }
        // End of stream is only signalled by silence.
        if (!wait_readable(socket, options.receive_timeout)) {
            if (++quiet_timeouts > options.max_quiet_timeouts) {
                break;
            }
            continue;
        }
        sockaddr_in from{};
        receive_datagram(socket, buffer, options.datagram_capacity, from);
        PayloadHeader header{};
        try {
            header = decode_payload_header(buffer.data(), buffer.size());
        } catch (const MalformedMessage &) {
            continue;
        } catch (const UnexpectedMessage &) {
            continue;
        }
        const auto now = Clock::now();
        if (tracker.record(header, now)) {
            quiet_timeouts = 0;
            record.delivered = tracker.received();
        }
        if (progress && now - last_update >= options.progress_interval) {
            progress(record.progress());
            last_update = now;
        }
    }

    record.delivered = tracker.received();
    record.lost = lost_segments(record.total, record.delivered);
    record.jitter_seconds = tracker.jitter_seconds();
    record.elapsed_seconds = std::chrono::duration<double>(Clock::now() - record.start).count();
    if (progress) {
        progress(record.progress());
    }
}

} // namespace

TransferRecord run_udp_transfer(const std::string &id, const NetworkEndpoint &server,
                                std::uint64_t requested_size, std::uint64_t stream_id,
                                const UdpClientOptions &options, const StopToken &stop,
                                const ProgressCallback &progress) {
    TransferRecord record;
    record.id = id;
    record.protocol = Protocol::Udp;
    record.requested_bytes = requested_size;
    record.total = expected_segments(requested_size);

    record = run_with_retries(std::move(record), options.retry, stop, [&](TransferRecord &current) {
        receive_segments(current, server, stream_id, options, stop, progress);
    });

    const std::string tag = transfer_tag(record);
    if (record.outcome == Outcome::Success) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(4);
        oss << "Received " << record.delivered << '/' << record.total << " packets (loss=" << record.lost
            << ", jitter=" << record.jitter_seconds << "s)";
        log_debug(tag, oss.str());
    } else {
        log_error(tag, "giving up after " + std::to_string(record.attempts) +
                           " attempt(s): " + record.failure_cause);
    }
    return record;
}

std::optional<UdpServeResult> serve_udp_request(const Socket &socket, const std::vector<std::uint8_t> &datagram,
                                                const sockaddr_in &sender, const UdpServeOptions &options,
                                                const StopToken &stop) {
    const std::string tag = "UDP " + to_string(endpoint_of(sender));
    Request request{};
    try {
        request = decode_request(datagram);
    } catch (const MalformedMessage &err) {
        log_debug(tag, std::string("dropped datagram: ") + err.what());
        return std::nullopt;
    } catch (const UnexpectedMessage &err) {
        log_debug(tag, std::string("dropped datagram: ") + err.what());
        return std::nullopt;
    }

    UdpServeResult result;
    result.total_segments = expected_segments(request.file_size);
    log_info(tag, "requested " + std::to_string(request.file_size) + " bytes (stream " +
                      std::to_string(request.stream_id) + ")");

    std::uint64_t failed = 0;
    for (std::uint64_t sequence = 0; sequence < result.total_segments; ++sequence) {
        try {
            send_datagram(socket, encode_payload(Payload{result.total_segments, sequence, {}}), sender);
            ++result.emitted;
        } catch (const SendError &err) {
            if (failed++ == 0) {
                log_warn(tag, err.what());
            }
        }
        if (options.pacing_every > 0 && (sequence + 1) % options.pacing_every == 0) {
            if (stop.wait_for(options.pacing_pause)) {
                log_warn(tag, "stopped after " + std::to_string(result.emitted) + " segments");
                return result;
            }
        }
    }
    if (failed > 0) {
        log_warn(tag, std::to_string(failed) + " segments could not be sent");
    }
    log_info(tag, "finished sending " + std::to_string(result.emitted) + "/" +
                      std::to_string(result.total_segments) + " UDP segments");
    return result;
}

} // namespace speedtest
