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

#include "ptp_steerable_clock.hpp"

#include <mutex>
#include <optional>

namespace tempo::ptp {

/**
 * A clock maintained in software on top of the monotonic clock. Steering it never touches the system, which makes it
 * usable without privileges and for following a master without disturbing the host.
 */
class VirtualClock final: public SteerableClock {
  public:
    VirtualClock();

    /**
     * @return The best estimate of 'now' in the timescale of the reference.
     */
    [[nodiscard]] Timestamp now() const override;

    /**
     * Returns the time of this clock at given monotonic time.
     * @param monotonic_nanos Monotonic time in nanoseconds as returned by HighResolutionClock::now().
     */
    [[nodiscard]] Timestamp get_adjusted_time(uint64_t monotonic_nanos) const;

    tl::expected<void, SteeringError> step(std::chrono::nanoseconds delta) override;
    tl::expected<void, SteeringError> set_frequency(double ppb) override;
    tl::expected<void, SteeringError> set_time_properties(const TimeProperties& properties) override;
    [[nodiscard]] std::string name() const override;

    /**
     * @return The current frequency adjustment in ppb.
     */
    [[nodiscard]] double get_frequency() const;

    /**
     * @return The last time properties handed to this clock.
     */
    [[nodiscard]] std::optional<TimeProperties> get_time_properties() const;

  private:
    mutable std::mutex mutex_;
    uint64_t anchor_monotonic_ {};  // Monotonic time of the last adjustment
    int64_t anchor_time_ {};        // Clock time at anchor_monotonic_, in nanoseconds
    double frequency_ppb_ {};
    std::optional<TimeProperties> time_properties_;

    [[nodiscard]] int64_t time_at(uint64_t monotonic_nanos) const;
    void reanchor(uint64_t monotonic_nanos);
};

}  // namespace tempo::ptp
