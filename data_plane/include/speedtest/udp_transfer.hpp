#pragma once

#include "speedtest/config.hpp"
#include "speedtest/network.hpp"
#include "speedtest/stop_token.hpp"
#include "speedtest/transfer.hpp"
#include "speedtest/wire.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace speedtest {

using Clock = std::chrono::steady_clock;

// Receiver-side bookkeeping for one UDP transfer. The first accepted payload
// fixes the declared total; sequences outside it and repeats are ignored.
class SegmentTracker {
  public:
    // Returns true when the segment was new and counted.
    bool record(const PayloadHeader &header, Clock::time_point arrival);

    std::uint64_t received() const noexcept { return seen_.size(); }

    std::optional<std::uint64_t> declared_total() const { return declared_total_; }

    bool complete() const;

    const std::vector<Clock::time_point> &arrivals() const { return arrivals_; }

    double jitter_seconds() const;

  private:
    std::unordered_set<std::uint64_t> seen_;
    std::vector<Clock::time_point> arrivals_;
    std::optional<std::uint64_t> declared_total_;
};

std::uint64_t expected_segments(std::uint64_t requested_size);

std::uint64_t lost_segments(std::uint64_t expected, std::uint64_t received);

// Mean of |arrival[i] - arrival[i-1]|; 0 with fewer than two arrivals.
double mean_jitter_seconds(const std::vector<Clock::time_point> &arrivals);

TransferRecord run_udp_transfer(const std::string &id, const NetworkEndpoint &server,
                                std::uint64_t requested_size, std::uint64_t stream_id,
                                const UdpClientOptions &options, const StopToken &stop,
                                const ProgressCallback &progress);

struct UdpServeResult {
    std::uint64_t total_segments = 0;
    std::uint64_t emitted = 0;
};

// Answers one request datagram on the shared server socket. Invalid
// datagrams are dropped and yield std::nullopt.
std::optional<UdpServeResult> serve_udp_request(const Socket &socket, const std::vector<std::uint8_t> &datagram,
                                                const sockaddr_in &sender, const UdpServeOptions &options,
                                                const StopToken &stop);

} // namespace speedtest
