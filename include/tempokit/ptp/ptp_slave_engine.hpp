/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include "ptp_engine.hpp"
#include "messages/ptp_messages.hpp"

#include <optional>

namespace tempo::ptp {

/**
 * A slave-only ordinary clock port using the end-to-end (request-response) delay mechanism.
 * The first qualified Announce received while listening selects the parent. There is no best master clock algorithm
 * and the port never becomes master.
 */
class SlaveEngine final: public Engine {
  public:
    SlaveEngine(const PortIdentity& port_identity, const EngineConfig& config);

    std::vector<Action> handle_event(const Event& event) override;

    [[nodiscard]] bool is_primary() const override;

    /**
     * @return The current port state.
     */
    [[nodiscard]] State get_state() const;

    /**
     * @return The port identity of the master this port synchronizes to, if any.
     */
    [[nodiscard]] std::optional<PortIdentity> get_parent() const;

    /**
     * @return The last measured mean path delay, if any.
     */
    [[nodiscard]] std::optional<std::chrono::nanoseconds> get_mean_path_delay() const;

    /**
     * Creates an EngineFactory producing SlaveEngine instances.
     */
    static EngineFactory factory();

  private:
    struct SyncMeasurement {
        uint16_t sequence_id {};
        std::optional<Timestamp> t1;
        CapturedTimestamp t2;
        std::chrono::nanoseconds correction {};
    };

    struct DelayMeasurement {
        uint16_t sequence_id {};
        std::optional<CapturedTimestamp> t3;
        std::optional<Timestamp> t4;
        std::chrono::nanoseconds correction {};
    };

    PortIdentity port_identity_;
    EngineConfig config_;
    State state_ {State::initializing};
    std::optional<PortIdentity> parent_;
    std::optional<TimeProperties> time_properties_;
    std::optional<SyncMeasurement> pending_sync_;
    std::optional<SyncMeasurement> last_sync_;
    std::optional<DelayMeasurement> pending_delay_req_;
    std::optional<std::chrono::nanoseconds> mean_path_delay_;
    uint16_t delay_req_sequence_id_ {};

    void handle_control(ControlCommand command, std::vector<Action>& actions);
    void handle_packet(const TimestampedPacket& packet, std::vector<Action>& actions);
    void handle_timer(TimerKind kind, std::vector<Action>& actions);
    void handle_transmit_timestamp(const TransmitTimestampEvent& event);
    void handle_transmit_failed(const TransmitFailedEvent& event);

    void handle_announce(const AnnounceMessage& announce, std::vector<Action>& actions);
    void handle_sync(const SyncMessage& sync, const CapturedTimestamp& receive_time, std::vector<Action>& actions);
    void handle_follow_up(const FollowUpMessage& follow_up, std::vector<Action>& actions);
    void handle_delay_resp(const DelayRespMessage& delay_resp);

    void complete_sync(const SyncMeasurement& sync, std::vector<Action>& actions);
    void complete_delay_measurement();
    void send_delay_req(std::vector<Action>& actions);
    void lose_parent(std::vector<Action>& actions);
    void reset();
    void set_state(State new_state, std::vector<Action>& actions);
    void schedule_announce_receipt_timeout(std::vector<Action>& actions) const;
    [[nodiscard]] bool is_from_parent(const MessageHeader& header) const;
    [[nodiscard]] bool is_synchronizing() const;
};

}  // namespace tempo::ptp
