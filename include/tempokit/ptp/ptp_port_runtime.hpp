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
#include "transport/ptp_transport.hpp"

#include <boost/json/fwd.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace tempo::ptp {

/**
 * How a port recovers from transport failures.
 */
struct RecoveryConfig {
    /// Number of reopen attempts before the port is declared FAULTY.
    uint32_t max_attempts {5};
    /// Wait before the first reopen attempt. Doubles on every attempt.
    std::chrono::milliseconds initial_backoff {100};
    std::chrono::milliseconds max_backoff {5000};
};

/**
 * Read-only view of a port, published after every processed event.
 */
struct PortState {
    PortIdentity identity;
    std::string interface_name;
    State state {State::initializing};
    /// Last offset from the reference reported by the engine.
    std::optional<std::chrono::nanoseconds> offset;
    /// Local time of the last processed event.
    Timestamp last_update;
    TimestampSource timestamping {TimestampSource::user_space};
    /// Number of transport failures since the port was started.
    uint32_t transport_failures {};
    bool primary {};
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const PortState& state);

/**
 * Hosts one engine on one network interface. Inbound packets, timer firings, transmit timestamps and control commands
 * are funneled through the port's strand so the engine sees one event at a time.
 */
class PortRuntime {
  public:
    /**
     * Constructs the runtime and registers the port with the adapter. Nothing is opened until start() is called.
     * @param io_context The io context to run the port strand on.
     * @param identity The identity of the port.
     * @param interface_name The network interface, for reporting.
     * @param engine The protocol engine. Must not be null.
     * @param opener Opens the transport, called again on every recovery attempt.
     * @param adapter The adapter receiving the corrections. Must outlive this object.
     * @param recovery Recovery settings.
     */
    PortRuntime(
        boost::asio::io_context& io_context, const PortIdentity& identity, std::string interface_name,
        std::unique_ptr<Engine> engine, TransportOpener opener, ClockSteeringAdapter& adapter, RecoveryConfig recovery
    );

    ~PortRuntime();

    PortRuntime(const PortRuntime&) = delete;
    PortRuntime& operator=(const PortRuntime&) = delete;

    PortRuntime(PortRuntime&&) = delete;
    PortRuntime& operator=(PortRuntime&&) = delete;

    /**
     * Opens the transport and initializes the engine. A failed first open enters the same recovery path as a failure
     * later on.
     * @return A future holding the outcome of the first open attempt.
     */
    std::future<tl::expected<void, TransportError>> start();

    /**
     * Stops the port: timers are cancelled, the transport is closed and the engine is not called anymore.
     * @return A future which becomes ready once the port is stopped.
     */
    std::future<void> stop();

    /**
     * Brings the port back after it went FAULTY (or at any other time): the transport is reopened and the engine
     * initialized again.
     */
    void restart();

    /**
     * Delivers a control command to the engine.
     * @param command The command.
     */
    void post_control(ControlCommand command);

    /**
     * @return The identity of this port.
     */
    [[nodiscard]] const PortIdentity& get_identity() const;

    /**
     * @return A copy of the latest port state.
     */
    [[nodiscard]] PortState get_state() const;

    /**
     * @param timeout Maximum time to wait for a concurrent write to finish.
     * @return A copy of the latest port state, or nothing if it could not be read in time.
     */
    [[nodiscard]] std::optional<PortState> try_get_state(std::chrono::milliseconds timeout) const;

  private:
    class Impl;
    PortIdentity identity_;
    std::shared_ptr<Impl> impl_;
};

}  // namespace tempo::ptp
