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

#include "types/ptp_port_identity.hpp"
#include "types/ptp_timestamp.hpp"

#include <boost/json/fwd.hpp>

#include <chrono>
#include <optional>

namespace tempo::ptp {

/**
 * Properties of the timescale distributed by the grandmaster, forwarded to the clock along with corrections.
 * IEEE1588-2019: 8.2.4
 */
struct TimeProperties {
    int16_t current_utc_offset {};
    bool current_utc_offset_valid {};
    bool leap59 {};
    bool leap61 {};
    bool ptp_timescale {};

    friend bool operator==(const TimeProperties& lhs, const TimeProperties& rhs) {
        return lhs.current_utc_offset == rhs.current_utc_offset
            && lhs.current_utc_offset_valid == rhs.current_utc_offset_valid && lhs.leap59 == rhs.leap59
            && lhs.leap61 == rhs.leap61 && lhs.ptp_timescale == rhs.ptp_timescale;
    }

    friend bool operator!=(const TimeProperties& lhs, const TimeProperties& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * A request to correct the local clock, produced by the engine of a port.
 */
struct ClockCorrection {
    /// The port whose engine produced the correction.
    PortIdentity source;
    /// Offset of the local clock from the reference. Positive means the local clock is ahead.
    std::chrono::nanoseconds offset {};
    /// Frequency adjustment computed by the engine's own servo, if it has one.
    std::optional<double> frequency_ppb;
    /// Local time of the observation the correction is based on.
    Timestamp observed_at;
    /// Timescale properties of the reference, if known.
    std::optional<TimeProperties> time_properties;
};

/**
 * State of the steered clock. Only the ClockSteeringAdapter writes it; everybody else gets copies.
 */
struct ClockState {
    std::optional<ClockCorrection> last_correction;
    /// The frequency adjustment currently applied to the clock.
    double frequency_ppb {};
    /// True when the last applied correction was within the stability tolerance.
    bool stable {};
    /// True when corrections exceeded the stability tolerance too many times in a row, or the OS rejected one.
    bool degraded {};
    uint32_t consecutive_unstable {};
    uint64_t steps {};
    uint64_t slews {};
    uint64_t rejected {};
    uint64_t discarded {};
    std::optional<PortIdentity> primary;
    uint64_t primary_epoch {};
    /// Local time of the last applied correction.
    Timestamp last_update;
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const PortIdentity& identity);
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const ClockCorrection& correction);
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const ClockState& state);

}  // namespace tempo::ptp
