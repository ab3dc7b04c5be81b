#include "speedtest/stop_token.hpp"

namespace speedtest {

void StopToken::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool StopToken::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

bool StopToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [&] { return stopped_; });
}

} // namespace speedtest
