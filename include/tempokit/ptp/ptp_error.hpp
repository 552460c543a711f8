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

namespace tempo::ptp {

/**
 * Errors found while parsing a PTP message. The offending message is dropped.
 */
enum class MessageError {
    invalid_data,
    invalid_header_length,
    invalid_message_length,
    unsupported_version,
};

inline const char* to_string(const MessageError error) {
    switch (error) {
        case MessageError::invalid_data:
            return "invalid data";
        case MessageError::invalid_header_length:
            return "invalid header length";
        case MessageError::invalid_message_length:
            return "invalid message length";
        case MessageError::unsupported_version:
            return "unsupported version";
        default:
            return "unknown error";
    }
}

/**
 * Errors reported by a timestamped transport. All of them are recoverable by reopening the transport.
 */
enum class TransportError {
    bind_failed,
    io_error,
    timestamping_unsupported,
    interface_not_found,
    closed,
    timestamp_unavailable,
};

inline const char* to_string(const TransportError error) {
    switch (error) {
        case TransportError::bind_failed:
            return "bind failed";
        case TransportError::io_error:
            return "i/o error";
        case TransportError::timestamping_unsupported:
            return "timestamping unsupported";
        case TransportError::interface_not_found:
            return "interface not found";
        case TransportError::closed:
            return "closed";
        case TransportError::timestamp_unavailable:
            return "timestamp unavailable";
        default:
            return "unknown error";
    }
}

/**
 * Errors reported by the timer service. These indicate programming errors.
 */
enum class TimerError {
    unknown_handle,
};

inline const char* to_string(const TimerError error) {
    switch (error) {
        case TimerError::unknown_handle:
            return "unknown timer handle";
        default:
            return "unknown error";
    }
}

/**
 * Errors reported when the operating system refuses to adjust a clock.
 */
enum class SteeringError {
    adjustment_rejected,
    clock_unavailable,
    permission_denied,
};

inline const char* to_string(const SteeringError error) {
    switch (error) {
        case SteeringError::adjustment_rejected:
            return "adjustment rejected";
        case SteeringError::clock_unavailable:
            return "clock unavailable";
        case SteeringError::permission_denied:
            return "permission denied";
        default:
            return "unknown error";
    }
}

/**
 * Errors in the daemon configuration. These are fatal at startup.
 */
enum class ConfigError {
    no_ports,
    interface_not_found,
    duplicate_interface,
    no_clock_identity,
    invalid_value,
    parse_error,
};

inline const char* to_string(const ConfigError error) {
    switch (error) {
        case ConfigError::no_ports:
            return "no ports configured";
        case ConfigError::interface_not_found:
            return "interface not found";
        case ConfigError::duplicate_interface:
            return "interface configured more than once";
        case ConfigError::no_clock_identity:
            return "no clock identity could be derived";
        case ConfigError::invalid_value:
            return "invalid value";
        case ConfigError::parse_error:
            return "parse error";
        default:
            return "unknown error";
    }
}

/**
 * Errors which prevent the daemon from starting.
 */
enum class SupervisorError {
    invalid_config,
    clock_unavailable,
    no_ports_available,
    already_started,
};

inline const char* to_string(const SupervisorError error) {
    switch (error) {
        case SupervisorError::invalid_config:
            return "invalid configuration";
        case SupervisorError::clock_unavailable:
            return "clock unavailable";
        case SupervisorError::no_ports_available:
            return "no ports could be opened";
        case SupervisorError::already_started:
            return "already started";
        default:
            return "unknown error";
    }
}

}  // namespace tempo::ptp
