#include "speedtest/signals.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"

#include <pthread.h>
#include <signal.h>

#include <cerrno>
#include <cstring>

namespace speedtest {

namespace {

sigset_t stop_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

SignalStopper::SignalStopper(StopToken &stop) : stop_(stop) {
    sigset_t set = stop_signals();
    int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw Error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
    thread_ = std::thread(&SignalStopper::watch, this);
}

SignalStopper::~SignalStopper() {
    finished_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalStopper::watch() {
    const sigset_t set = stop_signals();
    const timespec slice{1, 0};
    while (!finished_.load() && !stop_.stop_requested()) {
        int signo = ::sigtimedwait(&set, nullptr, &slice);
        if (signo == SIGINT || signo == SIGTERM) {
            log_warn("main", "interrupted, stopping...");
            stop_.request_stop();
            return;
        }
    }
}

} // namespace speedtest
