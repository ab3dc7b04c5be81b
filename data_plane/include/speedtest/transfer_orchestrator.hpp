#pragma once

#include "speedtest/config.hpp"
#include "speedtest/stop_token.hpp"
#include "speedtest/tcp_transfer.hpp"
#include "speedtest/transfer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace speedtest {

class TransferEngine {
  public:
    virtual ~TransferEngine() = default;

    virtual TransferRecord run_tcp(const std::string &id, std::uint64_t size, const ProgressCallback &progress) = 0;

    virtual TransferRecord run_udp(const std::string &id, std::uint64_t size, std::uint64_t stream_id,
                                   const ProgressCallback &progress) = 0;
};

class SocketTransferEngine : public TransferEngine {
  public:
    SocketTransferEngine(ServerAddress server, TcpClientOptions tcp, UdpClientOptions udp, const StopToken &stop);

    TransferRecord run_tcp(const std::string &id, std::uint64_t size, const ProgressCallback &progress) override;

    TransferRecord run_udp(const std::string &id, std::uint64_t size, std::uint64_t stream_id,
                           const ProgressCallback &progress) override;

  private:
    ServerAddress server_;
    TcpClientOptions tcp_;
    UdpClientOptions udp_;
    const StopToken &stop_;
    SocketTcpConnector connector_;
};

class ProgressSink {
  public:
    virtual ~ProgressSink() = default;

    virtual void on_progress(const TransferProgress &progress) = 0;

    virtual void on_complete(const TransferRecord &record) = 0;
};

// Runs every requested transfer on its own thread and waits for all of them.
// A failing transfer never cancels its siblings. A transfer whose thread
// cannot be started (system limit, or more than max_threads running) is
// recorded as a failure and the rest still run.
class TransferOrchestrator {
  public:
    TransferOrchestrator(TransferEngine &engine, ProgressSink *sink, std::chrono::milliseconds stagger,
                         const StopToken &stop, std::size_t max_threads = 0);

    // Records are returned in launch order: T1..Tn, then U1..Um.
    std::vector<TransferRecord> run(const TestParameters &params);

    std::vector<TransferProgress> snapshot() const;

  private:
    void update_progress(const TransferProgress &progress);
    void run_one(const std::string &id, Protocol protocol, std::uint64_t size, std::uint64_t stream_id,
                 TransferRecord &slot);

    TransferEngine &engine_;
    ProgressSink *sink_;
    std::chrono::milliseconds stagger_;
    const StopToken &stop_;
    std::size_t max_threads_;

    mutable std::mutex mutex_;
    std::map<std::string, TransferProgress> progress_;
};

} // namespace speedtest
