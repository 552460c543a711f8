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

#include "tempokit/core/platform.hpp"

#include <cstdint>
#include <ctime>

namespace tempo {

/**
 * Provides access to the current time with the highest possible resolution.
 */
class HighResolutionClock {
  public:
    /**
     * @returns the current time in nanoseconds since an arbitrary point in time. Never jumps.
     */
    static uint64_t now() {
        return read(CLOCK_MONOTONIC);
    }

    /**
     * @returns the current wall clock time (CLOCK_REALTIME) in nanoseconds since the unix epoch. Jumps when the system
     * clock is stepped.
     */
    static uint64_t now_realtime() {
        return read(CLOCK_REALTIME);
    }

  private:
    static uint64_t read(const clockid_t clock_id) {
        timespec ts {};
        clock_gettime(clock_id, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000 + static_cast<uint64_t>(ts.tv_nsec);
    }
};

}  // namespace tempo
