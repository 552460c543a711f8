/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_slave_engine.hpp"

#include "tempokit/core/log.hpp"
#include "tempokit/core/tracy.hpp"
#include "tempokit/core/util/overloaded.hpp"

#include <algorithm>
#include <cmath>

namespace {

/**
 * @return count * 2^log_interval seconds.
 */
std::chrono::nanoseconds log_interval_to_duration(const int8_t log_interval, const uint32_t count = 1) {
    const auto exponent = std::clamp(
        log_interval, tempo::ptp::EngineConfig::k_min_log_interval, tempo::ptp::EngineConfig::k_max_log_interval
    );
    return std::chrono::nanoseconds(static_cast<int64_t>(std::ldexp(1'000'000'000.0, exponent) * count));
}

}  // namespace

tempo::ptp::SlaveEngine::SlaveEngine(const PortIdentity& port_identity, const EngineConfig& config) :
    port_identity_(port_identity), config_(config) {}

std::vector<tempo::ptp::Action> tempo::ptp::SlaveEngine::handle_event(const Event& event) {
    TRACY_ZONE_SCOPED;

    std::vector<Action> actions;
    std::visit(
        Overloaded {
            [this, &actions](const ControlEvent& e) {
                handle_control(e.command, actions);
            },
            [this, &actions](const PacketReceivedEvent& e) {
                handle_packet(e.packet, actions);
            },
            [this, &actions](const TimerExpiredEvent& e) {
                handle_timer(e.kind, actions);
            },
            [this](const TransmitTimestampEvent& e) {
                handle_transmit_timestamp(e);
            },
            [this](const TransmitFailedEvent& e) {
                handle_transmit_failed(e);
            },
        },
        event
    );
    return actions;
}

bool tempo::ptp::SlaveEngine::is_primary() const {
    return state_ == State::slave;
}

tempo::ptp::State tempo::ptp::SlaveEngine::get_state() const {
    return state_;
}

std::optional<tempo::ptp::PortIdentity> tempo::ptp::SlaveEngine::get_parent() const {
    return parent_;
}

std::optional<std::chrono::nanoseconds> tempo::ptp::SlaveEngine::get_mean_path_delay() const {
    return mean_path_delay_;
}

tempo::ptp::EngineFactory tempo::ptp::SlaveEngine::factory() {
    return [](const PortIdentity& port_identity, const EngineConfig& config) {
        return std::make_unique<SlaveEngine>(port_identity, config);
    };
}

void tempo::ptp::SlaveEngine::handle_control(const ControlCommand command, std::vector<Action>& actions) {
    switch (command) {
        case ControlCommand::initialize:
            reset();
            set_state(State::listening, actions);
            schedule_announce_receipt_timeout(actions);
            break;
        case ControlCommand::enable:
            if (state_ != State::disabled && state_ != State::passive) {
                TEMPO_TRACE("Port {} is already enabled", port_identity_.to_string());
                return;
            }
            reset();
            set_state(State::listening, actions);
            schedule_announce_receipt_timeout(actions);
            break;
        case ControlCommand::disable:
            reset();
            actions.emplace_back(CancelTimerAction {TimerKind::announce_receipt_timeout});
            actions.emplace_back(CancelTimerAction {TimerKind::delay_request});
            set_state(State::disabled, actions);
            break;
        case ControlCommand::force_passive:
            reset();
            actions.emplace_back(CancelTimerAction {TimerKind::announce_receipt_timeout});
            actions.emplace_back(CancelTimerAction {TimerKind::delay_request});
            set_state(State::passive, actions);
            break;
        default:
            TEMPO_WARNING("Unknown control command");
            break;
    }
}

void tempo::ptp::SlaveEngine::handle_packet(const TimestampedPacket& packet, std::vector<Action>& actions) {
    if (state_ == State::initializing || state_ == State::disabled || state_ == State::faulty
        || state_ == State::passive) {
        TEMPO_TRACE("Discarding message while {}", to_string(state_));
        return;
    }

    const auto header = MessageHeader::from_data(packet.data.data(), packet.data.size());
    if (!header) {
        TEMPO_TRACE("PTP Header error: {}", to_string(header.error()));
        return;
    }

    if (header->domain_number != config_.domain_number) {
        return;
    }

    if (header->source_port_identity.clock_identity == port_identity_.clock_identity) {
        TEMPO_TRACE("Message is not qualified because it comes from the same PTP instance");
        return;
    }

    const auto* body = packet.data.data() + MessageHeader::k_size;
    const auto body_size = header->message_length - MessageHeader::k_size;

    switch (header->message_type) {
        case MessageType::announce: {
            auto announce = AnnounceMessage::from_data(*header, body, body_size);
            if (!announce) {
                TEMPO_ERROR("{} error: {}", header->to_string(), to_string(announce.error()));
                return;
            }
            handle_announce(*announce, actions);
            break;
        }
        case MessageType::sync: {
            if (packet.message_class != MessageClass::event) {
                TEMPO_TRACE("Ignoring Sync received on the general port");
                return;
            }
            auto sync = SyncMessage::from_data(*header, body, body_size);
            if (!sync) {
                TEMPO_ERROR("{} error: {}", header->to_string(), to_string(sync.error()));
                return;
            }
            handle_sync(*sync, packet.timestamp, actions);
            break;
        }
        case MessageType::follow_up: {
            auto follow_up = FollowUpMessage::from_data(*header, body, body_size);
            if (!follow_up) {
                TEMPO_ERROR("{} error: {}", header->to_string(), to_string(follow_up.error()));
                return;
            }
            handle_follow_up(*follow_up, actions);
            break;
        }
        case MessageType::delay_resp: {
            auto delay_resp = DelayRespMessage::from_data(*header, body, body_size);
            if (!delay_resp) {
                TEMPO_ERROR("{} error: {}", header->to_string(), to_string(delay_resp.error()));
                return;
            }
            handle_delay_resp(*delay_resp);
            break;
        }
        case MessageType::delay_req:
        case MessageType::p_delay_req:
        case MessageType::p_delay_resp:
        case MessageType::p_delay_resp_follow_up:
        case MessageType::signaling:
        case MessageType::management:
            // Not used by a slave-only port with the end-to-end delay mechanism.
            break;
        default:
            TEMPO_WARNING("Unknown PTP message received: {}", to_string(header->message_type));
            break;
    }
}

void tempo::ptp::SlaveEngine::handle_timer(const TimerKind kind, std::vector<Action>& actions) {
    switch (kind) {
        case TimerKind::announce_receipt_timeout:
            if (parent_) {
                TEMPO_WARNING(
                    "Port {}: announce receipt timeout, lost master {}", port_identity_.to_string(),
                    parent_->to_string()
                );
                lose_parent(actions);
            }
            if (state_ == State::listening) {
                schedule_announce_receipt_timeout(actions);
            }
            break;
        case TimerKind::delay_request:
            if (is_synchronizing()) {
                send_delay_req(actions);
            }
            break;
        case TimerKind::announce:
        case TimerKind::sync:
        case TimerKind::steering_tick:
        default:
            TEMPO_TRACE("Ignoring {} timer", to_string(kind));
            break;
    }
}

void tempo::ptp::SlaveEngine::handle_transmit_timestamp(const TransmitTimestampEvent& event) {
    if (event.context.message_type != MessageType::delay_req || !pending_delay_req_) {
        return;
    }

    if (pending_delay_req_->sequence_id != event.context.sequence_id) {
        TEMPO_TRACE("Transmit timestamp for an outdated Delay_Req ({})", event.context.sequence_id);
        return;
    }

    pending_delay_req_->t3 = event.timestamp;
    complete_delay_measurement();
}

void tempo::ptp::SlaveEngine::handle_transmit_failed(const TransmitFailedEvent& event) {
    if (!event.context || event.context->message_type != MessageType::delay_req || !pending_delay_req_) {
        return;
    }
    if (pending_delay_req_->sequence_id == event.context->sequence_id) {
        TEMPO_DEBUG("Delay_Req {} failed: {}", event.context->sequence_id, to_string(event.error));
        pending_delay_req_.reset();
    }
}

void tempo::ptp::SlaveEngine::handle_announce(const AnnounceMessage& announce, std::vector<Action>& actions) {
    if (announce.steps_removed >= 255) {
        TEMPO_WARNING("Message is not qualified because steps removed is 255 or greater");
        return;
    }

    if (parent_ && *parent_ != announce.header.source_port_identity) {
        TEMPO_TRACE("Ignoring announce from {}, not the parent", announce.header.source_port_identity.to_string());
        return;
    }

    TimeProperties time_properties;
    time_properties.current_utc_offset = announce.current_utc_offset;
    time_properties.current_utc_offset_valid = announce.header.flags.current_utc_offset_valid;
    time_properties.leap59 = announce.header.flags.leap59;
    time_properties.leap61 = announce.header.flags.leap61;
    time_properties.ptp_timescale = announce.header.flags.ptp_timescale;
    time_properties_ = time_properties;

    schedule_announce_receipt_timeout(actions);

    if (!parent_) {
        parent_ = announce.header.source_port_identity;
        TEMPO_INFO(
            "Port {} selected master {} (grandmaster {})", port_identity_.to_string(), parent_->to_string(),
            announce.grandmaster_identity.to_string()
        );
        set_state(State::uncalibrated, actions);
        actions.emplace_back(
            ArmTimerAction {TimerKind::delay_request, log_interval_to_duration(config_.log_min_delay_req_interval), true}
        );
    }
}

void tempo::ptp::SlaveEngine::handle_sync(
    const SyncMessage& sync, const CapturedTimestamp& receive_time, std::vector<Action>& actions
) {
    if (!is_synchronizing() || !is_from_parent(sync.header)) {
        return;
    }

    SyncMeasurement measurement;
    measurement.sequence_id = sync.header.sequence_id;
    measurement.t2 = receive_time;
    measurement.correction = sync.header.correction();

    if (sync.header.flags.two_step_flag) {
        pending_sync_ = measurement;
        return;
    }

    measurement.t1 = sync.origin_timestamp;
    pending_sync_.reset();
    complete_sync(measurement, actions);
}

void tempo::ptp::SlaveEngine::handle_follow_up(const FollowUpMessage& follow_up, std::vector<Action>& actions) {
    if (!is_synchronizing() || !is_from_parent(follow_up.header)) {
        return;
    }

    if (!pending_sync_ || pending_sync_->sequence_id != follow_up.header.sequence_id) {
        TEMPO_TRACE("Received follow-up message without matching sync message");
        return;
    }

    auto measurement = *pending_sync_;
    pending_sync_.reset();
    measurement.t1 = follow_up.precise_origin_timestamp;
    measurement.correction += follow_up.header.correction();
    complete_sync(measurement, actions);
}

void tempo::ptp::SlaveEngine::handle_delay_resp(const DelayRespMessage& delay_resp) {
    if (!is_synchronizing() || !is_from_parent(delay_resp.header)) {
        return;
    }

    if (delay_resp.requesting_port_identity != port_identity_) {
        return;  // Response to another slave.
    }

    if (!pending_delay_req_ || pending_delay_req_->sequence_id != delay_resp.header.sequence_id) {
        TEMPO_TRACE("Received a delay response message without matching delay request message");
        return;
    }

    pending_delay_req_->t4 = delay_resp.receive_timestamp;
    pending_delay_req_->correction = delay_resp.header.correction();
    complete_delay_measurement();
}

void tempo::ptp::SlaveEngine::complete_sync(const SyncMeasurement& sync, std::vector<Action>& actions) {
    TEMPO_ASSERT_RETURN(sync.t1.has_value(), "Sync measurement is incomplete");
    last_sync_ = sync;

    if (!mean_path_delay_) {
        TEMPO_TRACE("No mean path delay yet, waiting for a delay measurement");
        return;
    }

    auto offset = (sync.t2.time - *sync.t1) - *mean_path_delay_ - sync.correction;

    // The local clock runs on UTC while the master distributes TAI.
    if (config_.local_clock_is_utc && time_properties_ && time_properties_->ptp_timescale
        && time_properties_->current_utc_offset_valid) {
        offset += std::chrono::seconds(time_properties_->current_utc_offset);
    }

    TRACY_PLOT("Offset from master (ms)", static_cast<double>(offset.count()) / 1'000'000.0);

    ClockCorrection correction;
    correction.source = port_identity_;
    correction.offset = offset;
    correction.observed_at = sync.t2.time;
    correction.time_properties = time_properties_;
    actions.emplace_back(CorrectionAction {correction});

    if (state_ == State::uncalibrated) {
        set_state(State::slave, actions);
    }
}

void tempo::ptp::SlaveEngine::complete_delay_measurement() {
    if (!pending_delay_req_ || !pending_delay_req_->t3 || !pending_delay_req_->t4) {
        return;
    }

    const auto delay = *pending_delay_req_;
    pending_delay_req_.reset();

    if (!last_sync_ || !last_sync_->t1) {
        TEMPO_TRACE("No sync measurement yet, discarding delay measurement");
        return;
    }

    // IEEE1588-2019: 11.3.2
    const auto t2_t3 = last_sync_->t2.time - delay.t3->time;
    const auto t4_t1 = *delay.t4 - *last_sync_->t1;
    const auto mean_path_delay = (t2_t3 + t4_t1 - last_sync_->correction - delay.correction) / 2;

    if (mean_path_delay.count() < 0) {
        TEMPO_DEBUG("Ignoring negative mean path delay: {} ns", mean_path_delay.count());
        return;
    }

    TRACY_PLOT("Mean delay (ms)", static_cast<double>(mean_path_delay.count()) / 1'000'000.0);
    mean_path_delay_ = mean_path_delay;
}

void tempo::ptp::SlaveEngine::send_delay_req(std::vector<Action>& actions) {
    DelayReqMessage delay_req;
    delay_req.header.domain_number = config_.domain_number;
    delay_req.header.source_port_identity = port_identity_;
    delay_req.header.sequence_id = ++delay_req_sequence_id_;
    delay_req.header.log_message_interval = 0x7f;

    if (pending_delay_req_) {
        TEMPO_TRACE("Delay_Req {} was not answered in time", pending_delay_req_->sequence_id);
    }

    pending_delay_req_ = DelayMeasurement {delay_req.header.sequence_id, {}, {}, {}};

    actions.emplace_back(TransmitAction {
        MessageClass::event,
        delay_req.to_bytes(),
        TimestampContext {MessageType::delay_req, delay_req.header.sequence_id},
    });
}

void tempo::ptp::SlaveEngine::lose_parent(std::vector<Action>& actions) {
    reset();
    actions.emplace_back(CancelTimerAction {TimerKind::delay_request});
    set_state(State::listening, actions);
}

void tempo::ptp::SlaveEngine::reset() {
    parent_.reset();
    time_properties_.reset();
    pending_sync_.reset();
    last_sync_.reset();
    pending_delay_req_.reset();
    mean_path_delay_.reset();
}

void tempo::ptp::SlaveEngine::set_state(const State new_state, std::vector<Action>& actions) {
    if (state_ == new_state) {
        return;
    }
    TEMPO_INFO("Switching port {} from {} to {}", port_identity_.to_string(), to_string(state_), to_string(new_state));
    state_ = new_state;
    actions.emplace_back(StateChangedAction {new_state});
}

void tempo::ptp::SlaveEngine::schedule_announce_receipt_timeout(std::vector<Action>& actions) const {
    actions.emplace_back(ArmTimerAction {
        TimerKind::announce_receipt_timeout,
        log_interval_to_duration(config_.log_announce_interval, config_.announce_receipt_timeout),
        false,
    });
}

bool tempo::ptp::SlaveEngine::is_from_parent(const MessageHeader& header) const {
    return parent_ && *parent_ == header.source_port_identity;
}

bool tempo::ptp::SlaveEngine::is_synchronizing() const {
    return state_ == State::uncalibrated || state_ == State::slave;
}
