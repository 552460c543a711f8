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

#include "tempokit/ptp/clock/ptp_steerable_clock.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace tempo::ptp {

/**
 * A clock which records the adjustments made to it instead of applying them.
 */
class RecordingClock final: public SteerableClock {
  public:
    struct Adjustment {
        enum class Kind { step, frequency, time_properties } kind {};
        std::chrono::nanoseconds step {};
        double frequency_ppb {};
        TimeProperties time_properties;
    };

    /**
     * Shared between the clock, which is owned by the adapter, and the test.
     */
    class Control {
      public:
        /**
         * @return All adjustments, in the order they were made.
         */
        [[nodiscard]] std::vector<Adjustment> get_adjustments() const;

        /**
         * @return The number of adjustments of given kind.
         */
        [[nodiscard]] size_t count(Adjustment::Kind kind) const;

        /**
         * Makes every adjustment fail with given error, or succeed again when empty.
         * @param error The error.
         */
        void fail_with(std::optional<SteeringError> error);

        /**
         * @param delay Time every adjustment takes.
         */
        void set_delay(std::chrono::milliseconds delay);

        /**
         * @return True if an adjustment was running on more than one thread at the same time.
         */
        [[nodiscard]] bool overlap_detected() const;

      private:
        friend class RecordingClock;

        mutable std::mutex mutex_;
        std::vector<Adjustment> adjustments_;
        std::optional<SteeringError> error_;
        std::chrono::milliseconds delay_ {};
        int active_ {};
        bool overlap_ {};
    };

    explicit RecordingClock(std::shared_ptr<Control> control);

    /**
     * @param control The control of the clock.
     * @return A factory returning a clock bound to given control.
     */
    static ClockFactory factory(std::shared_ptr<Control> control);

    // SteerableClock overrides
    [[nodiscard]] Timestamp now() const override;
    tl::expected<void, SteeringError> step(std::chrono::nanoseconds delta) override;
    tl::expected<void, SteeringError> set_frequency(double ppb) override;
    tl::expected<void, SteeringError> set_time_properties(const TimeProperties& properties) override;
    [[nodiscard]] std::string name() const override;

  private:
    std::shared_ptr<Control> control_;

    tl::expected<void, SteeringError> record(const Adjustment& adjustment);
};

}  // namespace tempo::ptp
