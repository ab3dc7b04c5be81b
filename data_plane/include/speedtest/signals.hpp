#pragma once

#include "speedtest/stop_token.hpp"

#include <atomic>
#include <thread>

namespace speedtest {

// Blocks SIGINT/SIGTERM for the calling thread (and threads created after
// it) and turns their delivery into stop.request_stop(). Construct before
// starting any worker thread.
class SignalStopper {
  public:
    explicit SignalStopper(StopToken &stop);
    ~SignalStopper();

    SignalStopper(const SignalStopper &) = delete;
    SignalStopper &operator=(const SignalStopper &) = delete;

  private:
    void watch();

    StopToken &stop_;
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

} // namespace speedtest
