#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace speedtest {

// One thread per handler. Finished threads are reaped on the next spawn;
// join_all() waits for the rest.
class HandlerGroup {
  public:
    // max_active == 0 means no limit.
    explicit HandlerGroup(std::size_t max_active = 0) : max_active_(max_active) {}
    ~HandlerGroup();

    HandlerGroup(const HandlerGroup &) = delete;
    HandlerGroup &operator=(const HandlerGroup &) = delete;

    // Returns false, without running handler, when the group is full or the
    // system refuses to create another thread.
    bool spawn(std::function<void()> handler);

    void join_all();

    std::size_t active() const;

  private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished();

    std::size_t max_active_;
    mutable std::mutex mutex_;
    std::list<Worker> workers_;
};

} // namespace speedtest
