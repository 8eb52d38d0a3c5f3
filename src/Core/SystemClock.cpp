#include "Core/interfaces/IClock.hpp"
#include <condition_variable>
#include <mutex>

IClock::time_point SystemClock::now() const {
    return clock_type::now();
}

bool SystemClock::sleepFor(duration d, std::stop_token stop) {
    if (d <= duration::zero()) return !stop.stop_requested();
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    // Only a stop request satisfies the predicate.
    cv.wait_for(lock, stop, d, [] { return false; });
    return !stop.stop_requested();
}
