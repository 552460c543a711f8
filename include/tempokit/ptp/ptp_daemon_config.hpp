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

#include "ptp_clock_steering_adapter.hpp"
#include "ptp_engine.hpp"
#include "ptp_error.hpp"
#include "ptp_port_runtime.hpp"
#include "ptp_status_endpoint.hpp"
#include "tempokit/core/expected.hpp"
#include "transport/ptp_transport.hpp"

#include <boost/json/fwd.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempo::ptp {

enum class ClockKind {
    /// The system realtime clock.
    system,
    /// A PTP hardware clock (/dev/ptpN).
    phc,
    /// An in-process clock, steered but never touching the OS.
    virtual_clock,
};

inline const char* to_string(const ClockKind kind) {
    switch (kind) {
        case ClockKind::system:
            return "system";
        case ClockKind::phc:
            return "phc";
        case ClockKind::virtual_clock:
            return "virtual";
        default:
            return "unknown";
    }
}

std::optional<ClockKind> clock_kind_from_string(std::string_view str);

enum class TimestampingMode {
    /// Use hardware timestamps where the interface supports them, software timestamps otherwise.
    hardware,
    /// Use software timestamps only.
    software,
};

inline const char* to_string(const TimestampingMode mode) {
    switch (mode) {
        case TimestampingMode::hardware:
            return "hardware";
        case TimestampingMode::software:
            return "software";
        default:
            return "unknown";
    }
}

std::optional<TimestampingMode> timestamping_mode_from_string(std::string_view str);

struct PortConfig {
    std::string interface_name;
    TimestampingMode timestamping {TimestampingMode::hardware};
};

/**
 * Everything the daemon needs to run. Loaded from a JSON file, then overridden from the command line.
 */
struct DaemonConfig {
    std::vector<PortConfig> ports;
    ClockKind clock {ClockKind::system};
    /// The PHC to steer when clock is phc. Taken from the first port's interface when not set.
    std::optional<int> phc_index;
    /// Number of threads running the io context.
    uint32_t threads {2};
    StatusEndpointConfig status;
    EngineConfig engine;
    SteeringConfig steering;
    RecoveryConfig recovery;
    TransportConfig transport;

    /**
     * Checks the configuration for values which cannot work. Does not check the interfaces against the system.
     * @return An error describing the first problem found.
     */
    [[nodiscard]] tl::expected<void, ConfigError> validate() const;

    /**
     * Parses a configuration from JSON. Keys which are not present keep their default value.
     * @param json The JSON text.
     * @return The configuration or an error.
     */
    static tl::expected<DaemonConfig, ConfigError> from_json(std::string_view json);

    /**
     * Reads and parses a configuration file.
     * @param path The path of the file.
     * @return The configuration or an error.
     */
    static tl::expected<DaemonConfig, ConfigError> load_file(const std::string& path);
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DaemonConfig& config);
DaemonConfig tag_invoke(const boost::json::value_to_tag<DaemonConfig>&, const boost::json::value& jv);

}  // namespace tempo::ptp
