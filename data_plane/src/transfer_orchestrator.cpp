#include "speedtest/transfer_orchestrator.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/handler_group.hpp"
#include "speedtest/log.hpp"
#include "speedtest/udp_transfer.hpp"

#include <utility>

namespace speedtest {

namespace {

TransferRecord failed_record(const std::string &id, Protocol protocol, std::uint64_t size, const std::string &cause) {
    TransferRecord record;
    record.id = id;
    record.protocol = protocol;
    record.requested_bytes = size;
    record.total = protocol == Protocol::Tcp ? size : expected_segments(size);
    record.outcome = Outcome::Failure;
    record.failure_cause = cause;
    return record;
}

} // namespace

SocketTransferEngine::SocketTransferEngine(ServerAddress server, TcpClientOptions tcp, UdpClientOptions udp,
                                           const StopToken &stop)
    : server_(std::move(server)), tcp_(std::move(tcp)), udp_(std::move(udp)), stop_(stop) {}

TransferRecord SocketTransferEngine::run_tcp(const std::string &id, std::uint64_t size,
                                             const ProgressCallback &progress) {
    if (server_.tcp_port == 0) {
        return failed_record(id, Protocol::Tcp, size, "server does not offer TCP");
    }
    return run_tcp_transfer(id, NetworkEndpoint{server_.host, server_.tcp_port}, size, tcp_, stop_, progress,
                            connector_);
}

TransferRecord SocketTransferEngine::run_udp(const std::string &id, std::uint64_t size, std::uint64_t stream_id,
                                             const ProgressCallback &progress) {
    if (server_.udp_port == 0) {
        return failed_record(id, Protocol::Udp, size, "server does not offer UDP");
    }
    return run_udp_transfer(id, NetworkEndpoint{server_.host, server_.udp_port}, size, stream_id, udp_, stop_,
                            progress);
}

TransferOrchestrator::TransferOrchestrator(TransferEngine &engine, ProgressSink *sink,
                                           std::chrono::milliseconds stagger, const StopToken &stop,
                                           std::size_t max_threads)
    : engine_(engine), sink_(sink), stagger_(stagger), stop_(stop), max_threads_(max_threads) {}

std::vector<TransferRecord> TransferOrchestrator::run(const TestParameters &params) {
    params.validate();

    struct Launch {
        std::string id;
        Protocol protocol;
        std::uint64_t stream_id;
    };
    std::vector<Launch> launches;
    launches.reserve(params.tcp_connections + params.udp_connections);
    for (std::size_t i = 1; i <= params.tcp_connections; ++i) {
        launches.push_back(Launch{"T" + std::to_string(i), Protocol::Tcp, i});
    }
    for (std::size_t i = 1; i <= params.udp_connections; ++i) {
        launches.push_back(Launch{"U" + std::to_string(i), Protocol::Udp, i});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.clear();
        for (const auto &launch : launches) {
            const auto total = launch.protocol == Protocol::Tcp ? params.file_size : expected_segments(params.file_size);
            progress_[launch.id] = TransferProgress{launch.id, launch.protocol, 0, total};
        }
    }

    if (launches.empty()) {
        log_info("client", "No transfers requested");
        return {};
    }

    // Each thread writes only its own slot.
    std::vector<TransferRecord> results(launches.size());
    HandlerGroup threads(max_threads_);
    for (std::size_t i = 0; i < launches.size(); ++i) {
        const auto &launch = launches[i];
        if (i > 0 && stop_.wait_for(stagger_)) {
            log_warn("client", "stop requested, not launching remaining transfers");
            for (std::size_t j = i; j < launches.size(); ++j) {
                results[j] = failed_record(launches[j].id, launches[j].protocol, params.file_size,
                                           Cancelled().what());
            }
            break;
        }
        auto &slot = results[i];
        const auto size = params.file_size;
        const bool started = threads.spawn(
            [this, launch, size, &slot] { run_one(launch.id, launch.protocol, size, launch.stream_id, slot); });
        if (!started) {
            slot = failed_record(launch.id, launch.protocol, size, "could not start transfer thread");
            log_error(transfer_tag(slot), slot.failure_cause);
            update_progress(slot.progress());
            if (sink_ != nullptr) {
                sink_->on_complete(slot);
            }
        }
    }
    threads.join_all();
    log_info("client", "All transfers completed!");
    return results;
}

std::vector<TransferProgress> TransferOrchestrator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferProgress> snapshot;
    snapshot.reserve(progress_.size());
    for (const auto &entry : progress_) {
        snapshot.push_back(entry.second);
    }
    return snapshot;
}

void TransferOrchestrator::update_progress(const TransferProgress &progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_[progress.id] = progress;
    }
    if (sink_ != nullptr) {
        sink_->on_progress(progress);
    }
}

void TransferOrchestrator::run_one(const std::string &id, Protocol protocol, std::uint64_t size,
                                   std::uint64_t stream_id, TransferRecord &slot) {
    const ProgressCallback progress = [this](const TransferProgress &update) { update_progress(update); };
    try {
        slot = protocol == Protocol::Tcp ? engine_.run_tcp(id, size, progress)
                                         : engine_.run_udp(id, size, stream_id, progress);
    } catch (const std::exception &err) {
        slot = failed_record(id, protocol, size, err.what());
    }
    update_progress(slot.progress());
    if (sink_ != nullptr) {
        sink_->on_complete(slot);
    }
}

} // namespace speedtest
