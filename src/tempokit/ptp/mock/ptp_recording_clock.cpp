/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/mock/ptp_recording_clock.hpp"

#include "tempokit/core/chrono/high_resolution_clock.hpp"

#include <thread>

std::vector<tempo::ptp::RecordingClock::Adjustment> tempo::ptp::RecordingClock::Control::get_adjustments() const {
    std::lock_guard lock(mutex_);
    return adjustments_;
}

size_t tempo::ptp::RecordingClock::Control::count(const Adjustment::Kind kind) const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& adjustment : adjustments_) {
        if (adjustment.kind == kind) {
            n++;
        }
    }
    return n;
}

void tempo::ptp::RecordingClock::Control::fail_with(const std::optional<SteeringError> error) {
    std::lock_guard lock(mutex_);
    error_ = error;
}

void tempo::ptp::RecordingClock::Control::set_delay(const std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    delay_ = delay;
}

bool tempo::ptp::RecordingClock::Control::overlap_detected() const {
    std::lock_guard lock(mutex_);
    return overlap_;
}

tempo::ptp::RecordingClock::RecordingClock(std::shared_ptr<Control> control) : control_(std::move(control)) {}

tempo::ptp::ClockFactory tempo::ptp::RecordingClock::factory(std::shared_ptr<Control> control) {
    return [control = std::move(control)]() -> tl::expected<std::unique_ptr<SteerableClock>, SteeringError> {
        return std::make_unique<RecordingClock>(control);
    };
}

tempo::ptp::Timestamp tempo::ptp::RecordingClock::now() const {
    return Timestamp::from_nanoseconds(HighResolutionClock::now_realtime());
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::RecordingClock::step(const std::chrono::nanoseconds delta) {
    Adjustment adjustment;
    adjustment.kind = Adjustment::Kind::step;
    adjustment.step = delta;
    return record(adjustment);
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::RecordingClock::set_frequency(const double ppb) {
    Adjustment adjustment;
    adjustment.kind = Adjustment::Kind::frequency;
    adjustment.frequency_ppb = ppb;
    return record(adjustment);
}

tl::expected<void, tempo::ptp::SteeringError>
tempo::ptp::RecordingClock::set_time_properties(const TimeProperties& properties) {
    Adjustment adjustment;
    adjustment.kind = Adjustment::Kind::time_properties;
    adjustment.time_properties = properties;
    return record(adjustment);
}

std::string tempo::ptp::RecordingClock::name() const {
    return "recording";
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::RecordingClock::record(const Adjustment& adjustment) {
    std::chrono::milliseconds delay;
    {
        std::lock_guard lock(control_->mutex_);
        if (control_->active_++ > 0) {
            control_->overlap_ = true;
        }
        delay = control_->delay_;
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard lock(control_->mutex_);
    control_->active_--;
    if (control_->error_) {
        return tl::unexpected(*control_->error_);
    }
    control_->adjustments_.push_back(adjustment);
    return {};
}
