#include "speedtest/report.hpp"

#include "speedtest/log.hpp"

#include <iomanip>
#include <sstream>

namespace speedtest {

std::string render_progress_bar(const TransferProgress &progress, std::size_t width) {
    const double fraction =
        progress.total > 0 ? static_cast<double>(progress.delivered) / static_cast<double>(progress.total) : 1.0;
    auto filled = static_cast<std::size_t>(static_cast<double>(width) * fraction);
    if (filled > width) {
        filled = width;
    }
    std::ostringstream oss;
    oss << '[' << to_string(progress.protocol) << '-' << progress.id << "] [" << std::string(filled, '#')
        << std::string(width - filled, '-') << "] " << progress.delivered << '/' << progress.total;
    return oss.str();
}

std::string describe_result(const TransferRecord &record) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << '[' << transfer_tag(record) << "] ";
    if (record.outcome != Outcome::Success) {
        oss << "Failed after " << record.attempts << " attempt(s): " << record.failure_cause;
        return oss.str();
    }
    if (record.protocol == Protocol::Tcp) {
        oss << "Received " << record.delivered << " bytes in " << record.elapsed_seconds
            << "s, speed=" << record.throughput_bytes_per_second() << " B/s";
    } else {
        oss << "Received " << record.delivered << '/' << record.total << " packets (loss=" << record.lost
            << ", jitter=" << std::setprecision(4) << record.jitter_seconds << "s), speed=" << std::setprecision(2)
            << record.throughput_bytes_per_second() << " B/s";
    }
    return oss.str();
}

void ConsoleProgressSink::on_progress(const TransferProgress &progress) {
    write_console("\r" + render_progress_bar(progress));
}

void ConsoleProgressSink::on_complete(const TransferRecord &record) {
    write_console("\n" + describe_result(record) + "\n");
}

std::size_t count_failures(const std::vector<TransferRecord> &records) {
    std::size_t failures = 0;
    for (const auto &record : records) {
        if (record.outcome != Outcome::Success) {
            ++failures;
        }
    }
    return failures;
}

} // namespace speedtest
