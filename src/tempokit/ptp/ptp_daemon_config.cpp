/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_daemon_config.hpp"

#include "tempokit/core/json.hpp"
#include "tempokit/core/log.hpp"
#include "tempokit/core/string.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <stdexcept>

namespace {

/**
 * Assigns the value of key to target when the key is present.
 */
template<class T>
void read_optional(const boost::json::object& object, const std::string_view key, T& target) {
    if (const auto* value = object.if_contains(key)) {
        target = boost::json::value_to<T>(*value);
    }
}

template<class Rep, class Period>
void read_duration(
    const boost::json::object& object, const std::string_view key, std::chrono::duration<Rep, Period>& target
) {
    if (const auto* value = object.if_contains(key)) {
        target = std::chrono::duration<Rep, Period>(boost::json::value_to<Rep>(*value));
    }
}

const boost::json::object* find_object(const boost::json::object& object, const std::string_view key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr) {
        return nullptr;
    }
    if (!value->is_object()) {
        throw std::invalid_argument(fmt::format("'{}' must be an object", key));
    }
    return &value->get_object();
}

tempo::ptp::PortConfig port_config_from_json(const boost::json::value& jv) {
    tempo::ptp::PortConfig port;
    if (jv.is_string()) {
        port.interface_name = jv.get_string();
        return port;
    }

    const auto& object = jv.as_object();
    port.interface_name = object.at("interface").as_string();
    if (const auto* value = object.if_contains("timestamping")) {
        const auto mode = tempo::ptp::timestamping_mode_from_string(value->as_string());
        if (!mode) {
            throw std::invalid_argument(fmt::format("Invalid timestamping mode: {}", value->as_string().c_str()));
        }
        port.timestamping = *mode;
    }
    return port;
}

}  // namespace

std::optional<tempo::ptp::ClockKind> tempo::ptp::clock_kind_from_string(const std::string_view str) {
    if (string_compare_case_insensitive(str, "system")) {
        return ClockKind::system;
    }
    if (string_compare_case_insensitive(str, "phc")) {
        return ClockKind::phc;
    }
    if (string_compare_case_insensitive(str, "virtual")) {
        return ClockKind::virtual_clock;
    }
    return std::nullopt;
}

std::optional<tempo::ptp::TimestampingMode> tempo::ptp::timestamping_mode_from_string(const std::string_view str) {
    if (string_compare_case_insensitive(str, "hardware")) {
        return TimestampingMode::hardware;
    }
    if (string_compare_case_insensitive(str, "software")) {
        return TimestampingMode::software;
    }
    return std::nullopt;
}

tl::expected<void, tempo::ptp::ConfigError> tempo::ptp::DaemonConfig::validate() const {
    if (ports.empty()) {
        return tl::unexpected(ConfigError::no_ports);
    }

    std::set<std::string> interfaces;
    for (const auto& port : ports) {
        if (port.interface_name.empty()) {
            TEMPO_ERROR("Port without interface name");
            return tl::unexpected(ConfigError::invalid_value);
        }
        if (!interfaces.insert(port.interface_name).second) {
            TEMPO_ERROR("Interface {} is configured more than once", port.interface_name);
            return tl::unexpected(ConfigError::duplicate_interface);
        }
    }

    const auto invalid = [](const char* what) {
        TEMPO_ERROR("Invalid configuration value: {}", what);
        return tl::unexpected(ConfigError::invalid_value);
    };

    if (threads == 0) {
        return invalid("threads must be at least 1");
    }
    if (phc_index && *phc_index < 0) {
        return invalid("phc_index must not be negative");
    }
    if (status.socket_path.empty()) {
        return invalid("status socket path is empty");
    }
    if (status.request_timeout.count() <= 0) {
        return invalid("status request timeout must be positive");
    }
    for (const auto log_interval :
         {engine.log_announce_interval, engine.log_sync_interval, engine.log_min_delay_req_interval}) {
        if (log_interval < EngineConfig::k_min_log_interval || log_interval > EngineConfig::k_max_log_interval) {
            return invalid("log message intervals must be within [-7, 7]");
        }
    }
    if (engine.announce_receipt_timeout < 2) {
        return invalid("announce receipt timeout must be at least 2");
    }
    if (steering.step_threshold.count() <= 0) {
        return invalid("step threshold must be positive");
    }
    if (!std::isfinite(steering.kp) || !std::isfinite(steering.ki) || steering.kp < 0.0 || steering.ki < 0.0) {
        return invalid("servo gains must be finite and not negative");
    }
    if (!(steering.max_frequency_ppb > 0.0) || !(steering.max_slew_step_ppb > 0.0)) {
        return invalid("frequency limits must be positive");
    }
    if (steering.unstable_limit == 0) {
        return invalid("unstable limit must be at least 1");
    }
    if (recovery.initial_backoff.count() <= 0 || recovery.max_backoff < recovery.initial_backoff) {
        return invalid("backoff must be positive and max_backoff not smaller than initial_backoff");
    }
    if (transport.dscp < 0 || transport.dscp > 63) {
        return invalid("dscp must be within [0, 63]");
    }
    if (!transport.multicast_address.is_multicast()) {
        return invalid("multicast address is not a multicast address");
    }
    if (transport.tx_timestamp_poll_attempts < 1 || transport.tx_timestamp_poll_interval.count() <= 0) {
        return invalid("transmit timestamp polling must make at least one positive attempt");
    }
    if (transport.tx_timestamp_poll_attempts > TransportConfig::k_max_tx_timestamp_poll_attempts) {
        return invalid("transmit timestamp poll attempts must not exceed 10");
    }

    return {};
}

tl::expected<tempo::ptp::DaemonConfig, tempo::ptp::ConfigError>
tempo::ptp::DaemonConfig::from_json(const std::string_view json) {
    auto config = parse_json<DaemonConfig>(json);
    if (!config) {
        TEMPO_ERROR("Failed to parse configuration: {}", config.error());
        return tl::unexpected(ConfigError::parse_error);
    }
    return std::move(config.value());
}

tl::expected<tempo::ptp::DaemonConfig, tempo::ptp::ConfigError>
tempo::ptp::DaemonConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        TEMPO_ERROR("Failed to open configuration file {}", path);
        return tl::unexpected(ConfigError::parse_error);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

void tempo::ptp::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DaemonConfig& config) {
    boost::json::array ports;
    for (const auto& port : config.ports) {
        ports.push_back({{"interface", port.interface_name}, {"timestamping", to_string(port.timestamping)}});
    }

    boost::json::object object;
    object["ports"] = std::move(ports);
    object["clock"] = to_string(config.clock);
    object["phc_index"] = config.phc_index ? boost::json::value(*config.phc_index) : boost::json::value(nullptr);
    object["threads"] = config.threads;
    object["status"] = {
        {"socket", config.status.socket_path},
        {"request_timeout_ms", config.status.request_timeout.count()},
        {"snapshot_timeout_ms", config.status.snapshot_timeout.count()},
    };
    object["engine"] = {
        {"domain", config.engine.domain_number},
        {"log_announce_interval", config.engine.log_announce_interval},
        {"log_sync_interval", config.engine.log_sync_interval},
        {"log_min_delay_req_interval", config.engine.log_min_delay_req_interval},
        {"announce_receipt_timeout", config.engine.announce_receipt_timeout},
        {"local_clock_is_utc", config.engine.local_clock_is_utc},
    };
    object["steering"] = {
        {"step_threshold_ns", config.steering.step_threshold.count()},
        {"kp", config.steering.kp},
        {"ki", config.steering.ki},
        {"max_frequency_ppb", config.steering.max_frequency_ppb},
        {"max_slew_step_ppb", config.steering.max_slew_step_ppb},
        {"stability_tolerance_ns", config.steering.stability_tolerance.count()},
        {"unstable_limit", config.steering.unstable_limit},
    };
    object["recovery"] = {
        {"max_attempts", config.recovery.max_attempts},
        {"initial_backoff_ms", config.recovery.initial_backoff.count()},
        {"max_backoff_ms", config.recovery.max_backoff.count()},
    };
    object["transport"] = {
        {"require_hardware_timestamping", config.transport.require_hardware_timestamping},
        {"dscp", config.transport.dscp},
        {"multicast_address", config.transport.multicast_address.to_string()},
        {"event_port", config.transport.event_port},
        {"general_port", config.transport.general_port},
        {"tx_timestamp_poll_attempts", config.transport.tx_timestamp_poll_attempts},
        {"tx_timestamp_poll_interval_us", config.transport.tx_timestamp_poll_interval.count()},
    };
    jv = std::move(object);
}

tempo::ptp::DaemonConfig
tempo::ptp::tag_invoke(const boost::json::value_to_tag<DaemonConfig>&, const boost::json::value& jv) {
    DaemonConfig config;
    const auto& object = jv.as_object();

    if (const auto* ports = object.if_contains("ports")) {
        for (const auto& port : ports->as_array()) {
            config.ports.push_back(port_config_from_json(port));
        }
    }

    if (const auto* clock = object.if_contains("clock")) {
        const auto kind = clock_kind_from_string(clock->as_string());
        if (!kind) {
            throw std::invalid_argument(fmt::format("Invalid clock: {}", clock->as_string().c_str()));
        }
        config.clock = *kind;
    }

    if (const auto* phc_index = object.if_contains("phc_index"); phc_index != nullptr && !phc_index->is_null()) {
        config.phc_index = boost::json::value_to<int>(*phc_index);
    }

    read_optional(object, "threads", config.threads);

    if (const auto* status = find_object(object, "status")) {
        if (const auto* socket = status->if_contains("socket")) {
            config.status.socket_path = socket->as_string();
        }
        read_duration(*status, "request_timeout_ms", config.status.request_timeout);
        read_duration(*status, "snapshot_timeout_ms", config.status.snapshot_timeout);
    }

    if (const auto* engine = find_object(object, "engine")) {
        read_optional(*engine, "domain", config.engine.domain_number);
        read_optional(*engine, "log_announce_interval", config.engine.log_announce_interval);
        read_optional(*engine, "log_sync_interval", config.engine.log_sync_interval);
        read_optional(*engine, "log_min_delay_req_interval", config.engine.log_min_delay_req_interval);
        read_optional(*engine, "announce_receipt_timeout", config.engine.announce_receipt_timeout);
        read_optional(*engine, "local_clock_is_utc", config.engine.local_clock_is_utc);
    }

    if (const auto* steering = find_object(object, "steering")) {
        read_duration(*steering, "step_threshold_ns", config.steering.step_threshold);
        read_optional(*steering, "kp", config.steering.kp);
        read_optional(*steering, "ki", config.steering.ki);
        read_optional(*steering, "max_frequency_ppb", config.steering.max_frequency_ppb);
        read_optional(*steering, "max_slew_step_ppb", config.steering.max_slew_step_ppb);
        read_duration(*steering, "stability_tolerance_ns", config.steering.stability_tolerance);
        read_optional(*steering, "unstable_limit", config.steering.unstable_limit);
    }

    if (const auto* recovery = find_object(object, "recovery")) {
        read_optional(*recovery, "max_attempts", config.recovery.max_attempts);
        read_duration(*recovery, "initial_backoff_ms", config.recovery.initial_backoff);
        read_duration(*recovery, "max_backoff_ms", config.recovery.max_backoff);
    }

    if (const auto* transport = find_object(object, "transport")) {
        read_optional(*transport, "require_hardware_timestamping", config.transport.require_hardware_timestamping);
        read_optional(*transport, "dscp", config.transport.dscp);
        if (const auto* address = transport->if_contains("multicast_address")) {
            config.transport.multicast_address = boost::asio::ip::make_address_v4(address->as_string().c_str());
        }
        read_optional(*transport, "event_port", config.transport.event_port);
        read_optional(*transport, "general_port", config.transport.general_port);
        read_optional(*transport, "tx_timestamp_poll_attempts", config.transport.tx_timestamp_poll_attempts);
        read_duration(*transport, "tx_timestamp_poll_interval_us", config.transport.tx_timestamp_poll_interval);
    }

    return config;
}
