#pragma once
#include <stop_token>
#include "Core/interfaces/IClock.hpp"

// Time only moves when someone sleeps.
class FakeClock : public IClock {
public:
    [[nodiscard]] time_point now() const override { return current; }

    bool sleepFor(duration d, std::stop_token stop = {}) override {
        ++sleeps;
        if (stop.stop_requested()) return false;
        current += d;
        return true;
    }

    void advance(duration d) { current += d; }

    time_point current{};
    int sleeps{0};
};
