/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_supervisor.hpp"

#include "tempokit/core/log.hpp"
#include "tempokit/ptp/clock/ptp_linux_clock.hpp"
#include "tempokit/ptp/clock/ptp_virtual_clock.hpp"
#include "tempokit/ptp/ptp_slave_engine.hpp"
#include "tempokit/ptp/transport/ptp_udp_transport.hpp"

namespace {

tempo::ptp::ClockFactory make_clock_factory(
    const tempo::ptp::DaemonConfig& config, const tempo::NetworkInterfaceList& interfaces
) {
    using tempo::ptp::ClockKind;
    using tempo::ptp::SteerableClock;
    using tempo::ptp::SteeringError;

    switch (config.clock) {
        case ClockKind::phc: {
            auto phc_index = config.phc_index;
            if (!phc_index && !config.ports.empty()) {
                if (const auto* iface = interfaces.get_interface(config.ports.front().interface_name)) {
                    phc_index = iface->get_capabilities().phc_index;
                }
            }
            return [phc_index]() -> tl::expected<std::unique_ptr<SteerableClock>, SteeringError> {
                if (!phc_index) {
                    TEMPO_ERROR("No PTP hardware clock configured and none found on the first interface");
                    return tl::unexpected(SteeringError::clock_unavailable);
                }
                auto clock = tempo::ptp::LinuxClock::open_phc(*phc_index);
                if (!clock) {
                    return tl::unexpected(clock.error());
                }
                return std::unique_ptr<SteerableClock>(std::move(clock.value()));
            };
        }
        case ClockKind::virtual_clock:
            return []() -> tl::expected<std::unique_ptr<SteerableClock>, SteeringError> {
                return std::make_unique<tempo::ptp::VirtualClock>();
            };
        case ClockKind::system:
        default:
            return []() -> tl::expected<std::unique_ptr<SteerableClock>, SteeringError> {
                return std::unique_ptr<SteerableClock>(tempo::ptp::LinuxClock::open_system());
            };
    }
}

}  // namespace

tempo::ptp::Supervisor::Dependencies tempo::ptp::Supervisor::default_dependencies(const DaemonConfig& config) {
    Dependencies dependencies;
    dependencies.interfaces = NetworkInterfaceList::get_system_interfaces();
    dependencies.engine_factory = SlaveEngine::factory();
    dependencies.clock_factory = make_clock_factory(config, dependencies.interfaces);
    dependencies.transport_factory =
        [transport_config = config.transport](const Strand& strand, const PortIdentity& port, const PortConfig& port_config)
        -> tl::expected<std::unique_ptr<Transport>, TransportError> {
        auto c = transport_config;
        c.prefer_hardware_timestamping = port_config.timestamping == TimestampingMode::hardware;
        if (!c.prefer_hardware_timestamping) {
            c.require_hardware_timestamping = false;
        }
        auto transport = UdpTransport::open(strand, port, port_config.interface_name, c);
        if (!transport) {
            return tl::unexpected(transport.error());
        }
        return std::unique_ptr<Transport>(std::move(transport.value()));
    };
    return dependencies;
}

tempo::ptp::Supervisor::Supervisor(DaemonConfig config, Dependencies dependencies) :
    config_(std::move(config)), dependencies_(std::move(dependencies)) {}

tempo::ptp::Supervisor::~Supervisor() {
    shutdown();
}

tl::expected<void, tempo::ptp::SupervisorError> tempo::ptp::Supervisor::start() {
    if (running_) {
        return tl::unexpected(SupervisorError::already_started);
    }

    if (const auto valid = config_.validate(); !valid) {
        TEMPO_ERROR("Invalid configuration: {}", to_string(valid.error()));
        return tl::unexpected(SupervisorError::invalid_config);
    }

    for (const auto& port : config_.ports) {
        if (dependencies_.interfaces.get_interface(port.interface_name) == nullptr) {
            TEMPO_ERROR("Invalid configuration: {} ({})", to_string(ConfigError::interface_not_found), port.interface_name);
            return tl::unexpected(SupervisorError::invalid_config);
        }
    }

    const auto clock_identity = derive_clock_identity();
    if (!clock_identity) {
        TEMPO_ERROR("Invalid configuration: {}", to_string(clock_identity.error()));
        return tl::unexpected(SupervisorError::invalid_config);
    }

    auto clock = dependencies_.clock_factory();
    if (!clock) {
        TEMPO_ERROR("Failed to open the {} clock: {}", to_string(config_.clock), to_string(clock.error()));
        return tl::unexpected(SupervisorError::clock_unavailable);
    }

    runner_ = std::make_unique<IoContextRunner>(config_.threads);
    adapter_ = std::make_unique<ClockSteeringAdapter>(runner_->io_context(), std::move(clock.value()), config_.steering);

    uint16_t port_number = PortIdentity::k_port_number_min;
    for (const auto& port_config : config_.ports) {
        const PortIdentity identity {*clock_identity, port_number++};

        TransportOpener opener = [factory = dependencies_.transport_factory,
                                  port_config](const Strand& strand, const PortIdentity& port) {
            return factory(strand, port, port_config);
        };

        ports_.push_back(
            std::make_unique<PortRuntime>(
                runner_->io_context(), identity, port_config.interface_name,
                dependencies_.engine_factory(identity, config_.engine), std::move(opener), *adapter_, config_.recovery
            )
        );
    }

    std::vector<std::future<tl::expected<void, TransportError>>> results;
    results.reserve(ports_.size());
    for (auto& port : ports_) {
        results.push_back(port->start());
    }

    size_t num_opened = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (const auto result = results[i].get(); result) {
            num_opened++;
        } else {
            TEMPO_WARNING(
                "Port on {} could not be opened ({}), retrying in the background", config_.ports[i].interface_name,
                to_string(result.error())
            );
        }
    }

    if (num_opened == 0) {
        TEMPO_ERROR("None of the configured ports could be opened");
        teardown();
        return tl::unexpected(SupervisorError::no_ports_available);
    }

    endpoint_ = std::make_unique<StatusEndpoint>(runner_->io_context(), *this, config_.status);
    if (const auto result = endpoint_->start(); !result) {
        TEMPO_ERROR("Failed to serve status on {}: {}", config_.status.socket_path, result.error().message());
        endpoint_.reset();
    }

    running_ = true;
    TEMPO_INFO(
        "Running {} of {} ports with clock identity {}", num_opened, ports_.size(), clock_identity->to_string()
    );
    return {};
}

void tempo::ptp::Supervisor::shutdown() {
    if (runner_ == nullptr) {
        return;
    }
    TEMPO_INFO("Shutting down");
    teardown();
    running_ = false;
}

bool tempo::ptp::Supervisor::restart_port(const std::string& interface_name) {
    auto* port = find_port(interface_name);
    if (port == nullptr) {
        return false;
    }
    port->restart();
    return true;
}

bool tempo::ptp::Supervisor::post_control(const std::string& interface_name, const ControlCommand command) {
    auto* port = find_port(interface_name);
    if (port == nullptr) {
        return false;
    }
    port->post_control(command);
    return true;
}

tempo::ptp::ClockSteeringAdapter* tempo::ptp::Supervisor::get_adapter() const {
    return adapter_.get();
}

bool tempo::ptp::Supervisor::is_running() const {
    return running_;
}

std::vector<tempo::ptp::PortState> tempo::ptp::Supervisor::get_port_states(const std::chrono::milliseconds timeout) {
    std::lock_guard lock(cache_mutex_);

    if (cached_ports_.size() != ports_.size()) {
        cached_ports_.resize(ports_.size());
        for (size_t i = 0; i < ports_.size(); ++i) {
            cached_ports_[i].identity = ports_[i]->get_identity();
            cached_ports_[i].interface_name = config_.ports[i].interface_name;
        }
    }

    for (size_t i = 0; i < ports_.size(); ++i) {
        if (auto state = ports_[i]->try_get_state(timeout)) {
            cached_ports_[i] = std::move(*state);
        } else {
            TEMPO_DEBUG("Port {} snapshot busy, serving the previous one", ports_[i]->get_identity().to_string());
        }
    }

    return cached_ports_;
}

tempo::ptp::ClockState tempo::ptp::Supervisor::get_clock_state(const std::chrono::milliseconds timeout) {
    std::lock_guard lock(cache_mutex_);

    if (adapter_ != nullptr) {
        if (auto state = adapter_->try_get_state(timeout)) {
            cached_clock_ = std::move(*state);
        } else {
            TEMPO_DEBUG("Clock snapshot busy, serving the previous one");
        }
    }

    return cached_clock_;
}

tl::expected<tempo::ptp::ClockIdentity, tempo::ptp::ConfigError>
tempo::ptp::Supervisor::derive_clock_identity() const {
    for (const auto& port : config_.ports) {
        const auto* iface = dependencies_.interfaces.get_interface(port.interface_name);
        if (iface == nullptr || !iface->get_mac_address()) {
            continue;
        }
        if (auto identity = ClockIdentity::from_mac_address(*iface->get_mac_address())) {
            return *identity;
        }
    }
    return tl::unexpected(ConfigError::no_clock_identity);
}

tempo::ptp::PortRuntime* tempo::ptp::Supervisor::find_port(const std::string& interface_name) const {
    for (size_t i = 0; i < ports_.size(); ++i) {
        if (config_.ports[i].interface_name == interface_name) {
            return ports_[i].get();
        }
    }
    return nullptr;
}

void tempo::ptp::Supervisor::teardown() {
    if (endpoint_ != nullptr) {
        endpoint_->stop();
    }

    std::vector<std::future<void>> stopped;
    stopped.reserve(ports_.size());
    for (auto& port : ports_) {
        stopped.push_back(port->stop());
    }
    for (auto& future : stopped) {
        future.wait();
    }

    if (adapter_ != nullptr) {
        adapter_->stop().wait();
    }

    // Nothing runs on the io context after this, so the objects below can be destroyed safely.
    runner_->stop();

    {
        std::lock_guard lock(cache_mutex_);
        endpoint_.reset();
        ports_.clear();
        adapter_.reset();
    }
    runner_.reset();
}
