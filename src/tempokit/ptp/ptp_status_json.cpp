/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/core/json.hpp"
#include "tempokit/ptp/ptp_clock_correction.hpp"
#include "tempokit/ptp/ptp_port_runtime.hpp"

namespace {

boost::json::value to_json(const tempo::ptp::TimeProperties& properties) {
    return {
        {"current_utc_offset", properties.current_utc_offset},
        {"current_utc_offset_valid", properties.current_utc_offset_valid},
        {"leap59", properties.leap59},
        {"leap61", properties.leap61},
        {"ptp_timescale", properties.ptp_timescale},
    };
}

}  // namespace

void tempo::ptp::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const PortIdentity& identity) {
    jv = {
        {"clock_identity", identity.clock_identity.to_string()},
        {"port_number", identity.port_number},
    };
}

void tempo::ptp::tag_invoke(
    const boost::json::value_from_tag&, boost::json::value& jv, const ClockCorrection& correction
) {
    boost::json::object object;
    object["source"] = boost::json::value_from(correction.source);
    object["offset_ns"] = correction.offset.count();
    object["frequency_ppb"] =
        correction.frequency_ppb ? boost::json::value(*correction.frequency_ppb) : boost::json::value(nullptr);
    object["observed_at"] = correction.observed_at.to_string();
    object["time_properties"] =
        correction.time_properties ? to_json(*correction.time_properties) : boost::json::value(nullptr);
    jv = std::move(object);
}

void tempo::ptp::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const ClockState& state) {
    boost::json::object object;
    object["last_correction"] =
        state.last_correction ? boost::json::value_from(*state.last_correction) : boost::json::value(nullptr);
    object["frequency_ppb"] = state.frequency_ppb;
    object["stable"] = state.stable;
    object["degraded"] = state.degraded;
    object["consecutive_unstable"] = state.consecutive_unstable;
    object["steps"] = state.steps;
    object["slews"] = state.slews;
    object["rejected"] = state.rejected;
    object["discarded"] = state.discarded;
    object["primary"] = state.primary ? boost::json::value_from(*state.primary) : boost::json::value(nullptr);
    object["primary_epoch"] = state.primary_epoch;
    object["last_update"] = state.last_update.to_string();
    jv = std::move(object);
}

void tempo::ptp::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const PortState& state) {
    boost::json::object object;
    object["identity"] = boost::json::value_from(state.identity);
    object["interface"] = state.interface_name;
    object["state"] = to_string(state.state);
    object["offset_ns"] = state.offset ? boost::json::value(state.offset->count()) : boost::json::value(nullptr);
    object["last_update"] = state.last_update.to_string();
    object["timestamping"] = to_string(state.timestamping);
    object["transport_failures"] = state.transport_failures;
    object["primary"] = state.primary;
    jv = std::move(object);
}
