#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace speedtest {

// Cooperative stop signal shared by every blocking loop of a run.
// Loops check stop_requested() after each bounded wait; wait_for() is an
// interruptible sleep used for pacing, offers and retry backoff.
class StopToken {
  public:
    StopToken() = default;

    StopToken(const StopToken &) = delete;
    StopToken &operator=(const StopToken &) = delete;

    void request_stop();

    bool stop_requested() const;

    // Returns true when stop was requested before the duration elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

  private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool stopped_{false};
};

} // namespace speedtest
