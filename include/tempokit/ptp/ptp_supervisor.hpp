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

#include "clock/ptp_steerable_clock.hpp"
#include "ptp_clock_steering_adapter.hpp"
#include "ptp_daemon_config.hpp"
#include "ptp_engine.hpp"
#include "ptp_error.hpp"
#include "ptp_port_runtime.hpp"
#include "ptp_status_endpoint.hpp"
#include "tempokit/core/asio/io_context_runner.hpp"
#include "tempokit/core/expected.hpp"
#include "tempokit/core/net/network_interface.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tempo::ptp {

/**
 * Owns everything the daemon runs: the io context and its threads, the steered clock and its adapter, one runtime per
 * configured port and the status endpoint.
 */
class Supervisor final: public StatusSource {
  public:
    using TransportFactory = std::function<tl::expected<std::unique_ptr<Transport>, TransportError>(
        const Strand& strand, const PortIdentity& port, const PortConfig& config
    )>;

    /**
     * The collaborators the supervisor builds the daemon from. Replaced by fakes in tests.
     */
    struct Dependencies {
        TransportFactory transport_factory;
        EngineFactory engine_factory;
        ClockFactory clock_factory;
        NetworkInterfaceList interfaces;
    };

    /**
     * @param config The configuration.
     * @return UDP transports, the slave engine and the clock selected in the configuration, on the system's network
     * interfaces.
     */
    static Dependencies default_dependencies(const DaemonConfig& config);

    Supervisor(DaemonConfig config, Dependencies dependencies);
    ~Supervisor() override;

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    Supervisor(Supervisor&&) = delete;
    Supervisor& operator=(Supervisor&&) = delete;

    /**
     * Validates the configuration and brings up the clock, the adapter, the ports and the status endpoint. Ports which
     * fail to open keep retrying in the background.
     * @return An error if the daemon cannot run at all.
     */
    tl::expected<void, SupervisorError> start();

    /**
     * Stops all ports, the adapter and the endpoint, then joins the worker threads. Idempotent.
     */
    void shutdown();

    /**
     * Restarts a port, typically one which went FAULTY.
     * @param interface_name The interface of the port.
     * @return False if no port runs on given interface.
     */
    bool restart_port(const std::string& interface_name);

    /**
     * Delivers a control command to the engine of a port.
     * @param interface_name The interface of the port.
     * @param command The command.
     * @return False if no port runs on given interface.
     */
    bool post_control(const std::string& interface_name, ControlCommand command);

    /**
     * @return The adapter, or nullptr when not started.
     */
    [[nodiscard]] ClockSteeringAdapter* get_adapter() const;

    /**
     * @return True between a successful start() and shutdown().
     */
    [[nodiscard]] bool is_running() const;

    // StatusSource overrides
    std::vector<PortState> get_port_states(std::chrono::milliseconds timeout) override;
    ClockState get_clock_state(std::chrono::milliseconds timeout) override;

  private:
    DaemonConfig config_;
    Dependencies dependencies_;
    std::unique_ptr<IoContextRunner> runner_;
    std::unique_ptr<ClockSteeringAdapter> adapter_;
    std::vector<std::unique_ptr<PortRuntime>> ports_;
    std::unique_ptr<StatusEndpoint> endpoint_;
    bool running_ {};

    // Last snapshots served, used when a snapshot cannot be read in time.
    std::mutex cache_mutex_;
    std::vector<PortState> cached_ports_;
    ClockState cached_clock_;

    tl::expected<ClockIdentity, ConfigError> derive_clock_identity() const;
    PortRuntime* find_port(const std::string& interface_name) const;
    void teardown();
};

}  // namespace tempo::ptp
