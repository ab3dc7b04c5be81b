#include "speedtest/handler_group.hpp"

#include "speedtest/log.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace speedtest {

HandlerGroup::~HandlerGroup() { join_all(); }

bool HandlerGroup::spawn(std::function<void()> handler) {
    reap_finished();
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_active_ > 0 && workers_.size() >= max_active_) {
        return false;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{std::thread(), done});
    try {
        workers_.back().thread = std::thread([handler = std::move(handler), done] {
            handler();
            done->store(true);
        });
    } catch (const std::system_error &err) {
        workers_.pop_back();
        log_warn("handlers", std::string("could not start handler thread: ") + err.what());
        return false;
    }
    return true;
}

void HandlerGroup::reap_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void HandlerGroup::join_all() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto &worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::size_t HandlerGroup::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t running = 0;
    for (const auto &worker : workers_) {
        if (!worker.done->load()) {
            ++running;
        }
    }
    return running;
}

} // namespace speedtest
