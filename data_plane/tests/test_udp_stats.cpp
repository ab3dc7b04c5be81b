#include "speedtest/udp_transfer.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <vector>

int main() {
    using namespace speedtest;
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    const auto t0 = Clock::now();

    SegmentTracker tracker;
    assert(!tracker.complete());
    assert(tracker.record(PayloadHeader{3, 0}, t0));
    assert(!tracker.record(PayloadHeader{3, 0}, t0 + milliseconds(1)));
    assert(tracker.received() == 1);
    assert(tracker.arrivals().size() == 1);
    assert(*tracker.declared_total() == 3);

    // Out of range and conflicting totals never count.
    assert(!tracker.record(PayloadHeader{3, 3}, t0));
    assert(!tracker.record(PayloadHeader{5, 1}, t0));
    assert(tracker.received() == 1);

    assert(tracker.record(PayloadHeader{3, 2}, t0 + milliseconds(2)));
    assert(tracker.record(PayloadHeader{3, 1}, t0 + milliseconds(3)));
    assert(tracker.complete());
    assert(tracker.received() == 3);

    assert(mean_jitter_seconds({}) == 0.0);
    assert(mean_jitter_seconds({t0}) == 0.0);
    const std::vector<Clock::time_point> arrivals{t0, t0 + seconds(1), t0 + seconds(3)};
    assert(std::fabs(mean_jitter_seconds(arrivals) - 1.5) < 1e-9);
    const std::vector<Clock::time_point> steady{t0, t0 + seconds(1), t0 + seconds(2)};
    assert(std::fabs(mean_jitter_seconds(steady) - 1.0) < 1e-9);

    assert(expected_segments(10240) == 10);
    assert(expected_segments(1023) == 0);
    assert(expected_segments(2047) == 1);

    SegmentTracker partial;
    auto at = t0;
    for (std::uint64_t sequence : {0, 1, 2, 4, 5, 7}) {
        at += milliseconds(1);
        assert(partial.record(PayloadHeader{10, sequence}, at));
    }
    assert(partial.received() == 6);
    assert(!partial.complete());
    assert(lost_segments(expected_segments(10240), partial.received()) == 4);
    assert(std::fabs(partial.jitter_seconds() - 0.001) < 1e-9);

    assert(lost_segments(5, 7) == 0);
    return 0;
}
