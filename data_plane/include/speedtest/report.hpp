#pragma once

#include "speedtest/transfer.hpp"
#include "speedtest/transfer_orchestrator.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace speedtest {

std::string render_progress_bar(const TransferProgress &progress, std::size_t width = 20);

std::string describe_result(const TransferRecord &record);

class ConsoleProgressSink : public ProgressSink {
  public:
    void on_progress(const TransferProgress &progress) override;

    void on_complete(const TransferRecord &record) override;
};

std::size_t count_failures(const std::vector<TransferRecord> &records);

} // namespace speedtest
