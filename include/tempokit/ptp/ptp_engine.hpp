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

#include "ptp_clock_correction.hpp"
#include "ptp_definitions.hpp"
#include "ptp_error.hpp"
#include "transport/ptp_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace tempo::ptp {

/**
 * Identifies a time critical message whose transmit timestamp the engine wants back.
 */
struct TimestampContext {
    MessageType message_type {};
    uint16_t sequence_id {};

    friend bool operator==(const TimestampContext& lhs, const TimestampContext& rhs) {
        return lhs.message_type == rhs.message_type && lhs.sequence_id == rhs.sequence_id;
    }
};

struct PacketReceivedEvent {
    TimestampedPacket packet;
};

struct TimerExpiredEvent {
    TimerKind kind {};
};

struct TransmitTimestampEvent {
    TimestampContext context;
    CapturedTimestamp timestamp;
};

/**
 * A transmission the engine requested did not happen, or its timestamp could not be recovered.
 */
struct TransmitFailedEvent {
    std::optional<TimestampContext> context;
    MessageClass message_class {};
    TransportError error {};
};

struct ControlEvent {
    ControlCommand command {};
};

using Event = std::variant<PacketReceivedEvent, TimerExpiredEvent, TransmitTimestampEvent, TransmitFailedEvent, ControlEvent>;

struct TransmitAction {
    MessageClass message_class {};
    std::vector<uint8_t> data;
    /// When set, the transmit timestamp is fed back as a TransmitTimestampEvent carrying this context.
    std::optional<TimestampContext> context;
};

struct ArmTimerAction {
    TimerKind kind {};
    std::chrono::nanoseconds duration {};
    bool recurring {};
};

struct CancelTimerAction {
    TimerKind kind {};
};

struct CorrectionAction {
    ClockCorrection correction;
};

struct StateChangedAction {
    State state {};
};

using Action = std::variant<TransmitAction, ArmTimerAction, CancelTimerAction, CorrectionAction, StateChangedAction>;

/**
 * Settings handed to every engine instance.
 */
struct EngineConfig {
    constexpr static int8_t k_min_log_interval = -7;  // Inclusive
    constexpr static int8_t k_max_log_interval = 7;   // Inclusive

    uint8_t domain_number {};
    int8_t log_announce_interval {1};
    int8_t log_sync_interval {0};
    int8_t log_min_delay_req_interval {0};
    uint8_t announce_receipt_timeout {3};
    /// True when the steered clock keeps UTC (CLOCK_REALTIME) while the reference may distribute TAI.
    bool local_clock_is_utc {true};
};

/**
 * The protocol state machine of one port. It is a function of (state, event) to (state, actions): it never performs
 * I/O itself and is only ever called from one thread at a time.
 */
class Engine {
  public:
    virtual ~Engine() = default;

    /**
     * Processes one event.
     * @param event The event.
     * @return The actions the runtime must perform, in order.
     */
    virtual std::vector<Action> handle_event(const Event& event) = 0;

    /**
     * @return True if this port currently provides the corrections for the local clock.
     */
    [[nodiscard]] virtual bool is_primary() const = 0;
};

using EngineFactory = std::function<std::unique_ptr<Engine>(const PortIdentity& port, const EngineConfig& config)>;

}  // namespace tempo::ptp
