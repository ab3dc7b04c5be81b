#pragma once

#include "speedtest/config.hpp"
#include "speedtest/stop_token.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace speedtest {

enum class Protocol { Tcp, Udp };

enum class Outcome { Pending, Success, Failure };

const char *to_string(Protocol protocol);

const char *to_string(Outcome outcome);

// Bytes for TCP, segments for UDP.
struct TransferProgress {
    std::string id;
    Protocol protocol;
    std::uint64_t delivered;
    std::uint64_t total;
};

struct TransferRecord {
    std::string id;
    Protocol protocol = Protocol::Tcp;
    std::uint64_t requested_bytes = 0;
    std::uint64_t delivered = 0;
    std::uint64_t total = 0;
    std::chrono::steady_clock::time_point start{};
    double elapsed_seconds = 0.0;
    int attempts = 0;
    Outcome outcome = Outcome::Pending;
    std::string failure_cause;
    // UDP only.
    std::uint64_t lost = 0;
    double jitter_seconds = 0.0;

    std::uint64_t delivered_bytes() const;

    double throughput_bytes_per_second() const;

    TransferProgress progress() const;
};

using ProgressCallback = std::function<void(const TransferProgress &)>;

using TransferAttempt = std::function<void(TransferRecord &)>;

// Runs attempt until it returns normally or the retry budget is spent.
// NetworkError and its subclasses are retried after policy.backoff; a stop
// request or any other Error ends the transfer as a failure immediately.
TransferRecord run_with_retries(TransferRecord record, const RetryPolicy &policy, const StopToken &stop,
                                const TransferAttempt &attempt);

std::string transfer_tag(const TransferRecord &record);

} // namespace speedtest
