#include "speedtest/handler_group.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

namespace {

using namespace std::chrono_literals;

void test_reaps_finished_handlers() {
    speedtest::HandlerGroup group;
    std::atomic<int> ran{0};
    for (int i = 0; i < 8; ++i) {
        assert(group.spawn([&ran] { ++ran; }));
    }
    group.join_all();
    assert(ran == 8);
    assert(group.active() == 0);

    std::atomic<bool> release{false};
    assert(group.spawn([&release] {
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    }));
    assert(group.active() == 1);
    release = true;
    group.join_all();
    assert(group.active() == 0);
}

void test_full_group_refuses_without_running() {
    speedtest::HandlerGroup group(2);
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};
    const auto blocker = [&release, &ran] {
        ++ran;
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    };
    assert(group.spawn(blocker));
    assert(group.spawn(blocker));
    assert(!group.spawn([&ran] { ran += 100; }));
    assert(group.active() == 2);

    release = true;
    while (group.active() > 0) {
        std::this_thread::sleep_for(1ms);
    }
    // Finished handlers free their slots.
    assert(group.spawn([&ran] { ++ran; }));
    group.join_all();
    assert(ran == 3);
}

} // namespace

int main() {
    test_reaps_finished_handlers();
    test_full_group_refuses_without_running();
    return 0;
}
