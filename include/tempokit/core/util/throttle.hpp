/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include <chrono>

namespace tempo {

/**
 * Rate limiter for periodic work like high rate log lines. update() returns true at most once per interval.
 */
class Throttle {
  public:
    Throttle() = default;

    /**
     * Constructs the throttle with the given interval.
     * @param interval The minimum time between two positive updates.
     */
    explicit Throttle(const std::chrono::milliseconds interval) : interval_(interval) {}

    /**
     * @param interval The minimum time between two positive updates.
     */
    void set_interval(const std::chrono::milliseconds interval) {
        interval_ = interval;
    }

    /**
     * @return True if the interval has passed since the last time this function returned true.
     */
    bool update() {
        const auto now = std::chrono::steady_clock::now();
        if (now > last_update_ + interval_) {
            last_update_ = now;
            return true;
        }
        return false;
    }

  private:
    std::chrono::steady_clock::time_point last_update_ {};
    std::chrono::milliseconds interval_ {100};
};

}  // namespace tempo
