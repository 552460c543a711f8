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

#include "ptp_steerable_clock.hpp"

#include <ctime>

namespace tempo::ptp {

/**
 * Steers a Linux clock through clock_adjtime(): either the system clock (CLOCK_REALTIME) or the PTP hardware clock of
 * a network interface (/dev/ptpN). Adjusting a clock requires CAP_SYS_TIME.
 */
class LinuxClock final: public SteerableClock {
  public:
    /// The largest frequency adjustment the kernel accepts, in ppb.
    static constexpr double k_max_frequency_ppb = 32'767'999.0;

    ~LinuxClock() override;

    LinuxClock(const LinuxClock&) = delete;
    LinuxClock& operator=(const LinuxClock&) = delete;

    LinuxClock(LinuxClock&&) = delete;
    LinuxClock& operator=(LinuxClock&&) = delete;

    /**
     * @return The system clock.
     */
    static std::unique_ptr<LinuxClock> open_system();

    /**
     * Opens a PTP hardware clock.
     * @param phc_index The index N of /dev/ptpN.
     * @return The clock or an error when the device cannot be opened.
     */
    static tl::expected<std::unique_ptr<LinuxClock>, SteeringError> open_phc(int phc_index);

    [[nodiscard]] Timestamp now() const override;
    tl::expected<void, SteeringError> step(std::chrono::nanoseconds delta) override;
    tl::expected<void, SteeringError> set_frequency(double ppb) override;
    tl::expected<void, SteeringError> set_time_properties(const TimeProperties& properties) override;
    [[nodiscard]] std::string name() const override;

  private:
    clockid_t clock_id_ {CLOCK_REALTIME};
    int fd_ {-1};
    std::string name_;

    LinuxClock(clockid_t clock_id, int fd, std::string name);
};

}  // namespace tempo::ptp
