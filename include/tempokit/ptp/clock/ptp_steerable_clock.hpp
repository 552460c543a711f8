/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "tempokit/core/expected.hpp"
#include "tempokit/ptp/ptp_clock_correction.hpp"
#include "tempokit/ptp/ptp_error.hpp"
#include "tempokit/ptp/types/ptp_timestamp.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tempo::ptp {

/**
 * A clock the daemon can adjust. Implementations are called from a single thread (the steering adapter's strand).
 */
class SteerableClock {
  public:
    virtual ~SteerableClock() = default;

    /**
     * @return The current time of the clock.
     */
    [[nodiscard]] virtual Timestamp now() const = 0;

    /**
     * Steps the clock by given amount.
     * @param delta The amount to add to the clock. May be negative.
     * @return An error if the OS rejected the adjustment.
     */
    virtual tl::expected<void, SteeringError> step(std::chrono::nanoseconds delta) = 0;

    /**
     * Sets the frequency adjustment of the clock, replacing the previous one.
     * @param ppb Frequency adjustment in parts per billion. Positive makes the clock run faster.
     * @return An error if the OS rejected the adjustment.
     */
    virtual tl::expected<void, SteeringError> set_frequency(double ppb) = 0;

    /**
     * Hands the timescale properties of the reference to the clock (leap second announcements, UTC offset).
     * @param properties The properties.
     * @return An error if the OS rejected the adjustment.
     */
    virtual tl::expected<void, SteeringError> set_time_properties(const TimeProperties& properties) = 0;

    /**
     * @return A name for log messages.
     */
    [[nodiscard]] virtual std::string name() const = 0;
};

using ClockFactory = std::function<tl::expected<std::unique_ptr<SteerableClock>, SteeringError>()>;

}  // namespace tempo::ptp
