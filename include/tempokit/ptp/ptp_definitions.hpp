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

#include <cstddef>
#include <cstdint>

namespace tempo::ptp {

/**
 * The PTP port state.
 * IEEE1588-2019: 8.2.15.3.1, 9.2.5, Table 27
 */
enum class State : uint8_t {
    undefined = 0x0,
    initializing = 0x1,
    faulty = 0x2,
    disabled = 0x3,
    listening = 0x4,
    pre_master = 0x5,
    master = 0x6,
    passive = 0x7,
    uncalibrated = 0x8,
    slave = 0x9,
};

inline const char* to_string(const State state) {
    switch (state) {
        case State::undefined:
            return "UNDEFINED";
        case State::initializing:
            return "INITIALIZING";
        case State::faulty:
            return "FAULTY";
        case State::disabled:
            return "DISABLED";
        case State::listening:
            return "LISTENING";
        case State::pre_master:
            return "PRE_MASTER";
        case State::master:
            return "MASTER";
        case State::passive:
            return "PASSIVE";
        case State::uncalibrated:
            return "UNCALIBRATED";
        case State::slave:
            return "SLAVE";
        default:
            return "UNKNOWN";
    }
}

/**
 * PTP Message types.
 * IEEE1588-2019: Table 36
 */
enum class MessageType : uint8_t {
    sync = 0x0,          // Event
    delay_req = 0x1,     // Event
    p_delay_req = 0x2,   // Event
    p_delay_resp = 0x3,  // Event
    follow_up = 0x8,               // General
    delay_resp = 0x9,              // General
    p_delay_resp_follow_up = 0xa,  // General
    announce = 0xb,                // General
    signaling = 0xc,               // General
    management = 0xd,              // General
};

inline const char* to_string(const MessageType type) {
    switch (type) {
        case MessageType::sync:
            return "Sync";
        case MessageType::delay_req:
            return "Delay_Req";
        case MessageType::p_delay_req:
            return "Pdelay_Req";
        case MessageType::p_delay_resp:
            return "Pdelay_Resp";
        case MessageType::follow_up:
            return "Follow_Up";
        case MessageType::delay_resp:
            return "Delay_Resp";
        case MessageType::p_delay_resp_follow_up:
            return "Pdelay_Resp_Follow_Up";
        case MessageType::announce:
            return "Announce";
        case MessageType::signaling:
            return "Signaling";
        case MessageType::management:
            return "Management";
        default:
            return "Reserved";
    }
}

/**
 * The class of a PTP message, which decides the UDP port it travels on and whether its timestamp matters.
 * IEEE1588-2019: 7.3.2, Annex C
 */
enum class MessageClass : uint8_t {
    /// Time critical messages (Sync, Delay_Req, ...), UDP port 319, timestamped on send and receive.
    event,
    /// All other messages, UDP port 320.
    general,
};

inline const char* to_string(const MessageClass message_class) {
    switch (message_class) {
        case MessageClass::event:
            return "event";
        case MessageClass::general:
            return "general";
        default:
            return "unknown";
    }
}

/**
 * Kinds of per port timers. A port has at most one pending firing per kind.
 */
enum class TimerKind : uint8_t {
    announce,
    sync,
    delay_request,
    announce_receipt_timeout,
    steering_tick,
};

/// Number of timer kinds, for sizing per-kind tables.
constexpr size_t k_num_timer_kinds = 5;

inline const char* to_string(const TimerKind kind) {
    switch (kind) {
        case TimerKind::announce:
            return "announce";
        case TimerKind::sync:
            return "sync";
        case TimerKind::delay_request:
            return "delay_request";
        case TimerKind::announce_receipt_timeout:
            return "announce_receipt_timeout";
        case TimerKind::steering_tick:
            return "steering_tick";
        default:
            return "unknown";
    }
}

/**
 * Explicit commands which can be injected into the event stream of a port.
 */
enum class ControlCommand : uint8_t {
    /// Sent once when the port comes up (and again after a restart).
    initialize,
    /// Force the port into passive state.
    force_passive,
    /// Administratively disable the port.
    disable,
    /// Re-enable an administratively disabled port.
    enable,
};

inline const char* to_string(const ControlCommand command) {
    switch (command) {
        case ControlCommand::initialize:
            return "initialize";
        case ControlCommand::force_passive:
            return "force_passive";
        case ControlCommand::disable:
            return "disable";
        case ControlCommand::enable:
            return "enable";
        default:
            return "unknown";
    }
}

}  // namespace tempo::ptp
