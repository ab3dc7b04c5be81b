#include "speedtest/transfer.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"
#include "speedtest/wire.hpp"

#include <sstream>

namespace speedtest {

const char *to_string(Protocol protocol) { return protocol == Protocol::Tcp ? "TCP" : "UDP"; }

const char *to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Pending:
        return "pending";
    case Outcome::Success:
        return "success";
    case Outcome::Failure:
        return "failure";
    }
    return "unknown";
}

std::uint64_t TransferRecord::delivered_bytes() const {
    return protocol == Protocol::Tcp ? delivered : delivered * kSegmentSize;
}

double TransferRecord::throughput_bytes_per_second() const {
    if (elapsed_seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(delivered_bytes()) / elapsed_seconds;
}

TransferProgress TransferRecord::progress() const { return TransferProgress{id, protocol, delivered, total}; }

std::string transfer_tag(const TransferRecord &record) {
    return std::string(to_string(record.protocol)) + "-" + record.id;
}

TransferRecord run_with_retries(TransferRecord record, const RetryPolicy &policy, const StopToken &stop,
                                const TransferAttempt &attempt) {
    const std::string tag = transfer_tag(record);
    const int max_attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    while (record.attempts < max_attempts) {
        if (stop.stop_requested()) {
            record.outcome = Outcome::Failure;
            record.failure_cause = Cancelled().what();
            return record;
        }
        ++record.attempts;
        record.start = std::chrono::steady_clock::now();
        try {
            attempt(record);
            record.outcome = Outcome::Success;
            record.failure_cause.clear();
            return record;
        } catch (const Cancelled &err) {
            record.outcome = Outcome::Failure;
            record.failure_cause = err.what();
            return record;
        } catch (const NetworkError &err) {
            record.outcome = Outcome::Failure;
            record.failure_cause = err.what();
            const int retries_left = max_attempts - record.attempts;
            std::ostringstream oss;
            oss << "Error: " << err.what() << ", retries left: " << retries_left;
            log_warn(tag, oss.str());
            if (retries_left > 0 && stop.wait_for(policy.backoff)) {
                record.failure_cause = Cancelled().what();
                return record;
            }
        } catch (const Error &err) {
            record.outcome = Outcome::Failure;
            record.failure_cause = err.what();
            log_error(tag, err.what());
            return record;
        }
    }
    return record;
}

} // namespace speedtest
