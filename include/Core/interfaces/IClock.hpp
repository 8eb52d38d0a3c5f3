#pragma once
#include <chrono>
#include <stop_token>

/**
 * @brief Time source for polling loops
 *
 * Loops never call std::this_thread::sleep_for directly, so tests can drive
 * them with a fake clock that advances on every sleep.
 */
class IClock {
public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

    virtual ~IClock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    // Returns false if woken early by a stop request.
    virtual bool sleepFor(duration d, std::stop_token stop = {}) = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] time_point now() const override;
    bool sleepFor(duration d, std::stop_token stop = {}) override;
};
