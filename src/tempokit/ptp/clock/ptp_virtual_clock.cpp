/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/clock/ptp_virtual_clock.hpp"

#include "tempokit/core/chrono/high_resolution_clock.hpp"
#include "tempokit/core/tracy.hpp"

#include <cmath>

tempo::ptp::VirtualClock::VirtualClock() :
    anchor_monotonic_(HighResolutionClock::now()),
    anchor_time_(static_cast<int64_t>(HighResolutionClock::now_realtime())) {}

tempo::ptp::Timestamp tempo::ptp::VirtualClock::now() const {
    return get_adjusted_time(HighResolutionClock::now());
}

tempo::ptp::Timestamp tempo::ptp::VirtualClock::get_adjusted_time(const uint64_t monotonic_nanos) const {
    TRACY_ZONE_SCOPED;
    std::lock_guard lock(mutex_);
    const auto nanos = time_at(monotonic_nanos);
    return nanos < 0 ? Timestamp() : Timestamp::from_nanoseconds(static_cast<uint64_t>(nanos));
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::VirtualClock::step(const std::chrono::nanoseconds delta) {
    TRACY_ZONE_SCOPED;
    std::lock_guard lock(mutex_);
    reanchor(HighResolutionClock::now());
    anchor_time_ += delta.count();
    return {};
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::VirtualClock::set_frequency(const double ppb) {
    TRACY_ZONE_SCOPED;
    if (!std::isfinite(ppb)) {
        return tl::unexpected(SteeringError::adjustment_rejected);
    }
    std::lock_guard lock(mutex_);
    reanchor(HighResolutionClock::now());
    frequency_ppb_ = ppb;
    return {};
}

tl::expected<void, tempo::ptp::SteeringError>
tempo::ptp::VirtualClock::set_time_properties(const TimeProperties& properties) {
    std::lock_guard lock(mutex_);
    time_properties_ = properties;
    return {};
}

std::string tempo::ptp::VirtualClock::name() const {
    return "virtual";
}

double tempo::ptp::VirtualClock::get_frequency() const {
    std::lock_guard lock(mutex_);
    return frequency_ppb_;
}

std::optional<tempo::ptp::TimeProperties> tempo::ptp::VirtualClock::get_time_properties() const {
    std::lock_guard lock(mutex_);
    return time_properties_;
}

int64_t tempo::ptp::VirtualClock::time_at(const uint64_t monotonic_nanos) const {
    const auto elapsed = static_cast<double>(static_cast<int64_t>(monotonic_nanos - anchor_monotonic_));
    return anchor_time_ + static_cast<int64_t>(std::llround(elapsed * (1.0 + frequency_ppb_ / 1'000'000'000.0)));
}

void tempo::ptp::VirtualClock::reanchor(const uint64_t monotonic_nanos) {
    anchor_time_ = time_at(monotonic_nanos);
    anchor_monotonic_ = monotonic_nanos;
}
