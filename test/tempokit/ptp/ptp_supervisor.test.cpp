/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "ptp_test_util.test.hpp"
#include "tempokit/core/json.hpp"
#include "tempokit/ptp/mock/ptp_mock_engine.hpp"
#include "tempokit/ptp/mock/ptp_mock_transport.hpp"
#include "tempokit/ptp/mock/ptp_recording_clock.hpp"
#include "tempokit/ptp/ptp_supervisor.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include <map>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace tempo::ptp;

namespace {

tempo::NetworkInterface make_interface(const std::string& name, const uint8_t mac_suffix) {
    std::optional<tempo::MacAddress> mac;
    if (mac_suffix != 0) {
        mac = tempo::MacAddress(0x00, 0x1d, 0xc1, 0x00, 0x00, mac_suffix);
    }
    tempo::NetworkInterface::Capabilities capabilities;
    capabilities.hw_timestamp = true;
    capabilities.multicast = true;
    return tempo::NetworkInterface(
        name, mac, {boost::asio::ip::make_address("192.168.1." + std::to_string(mac_suffix + 10))}, capabilities
    );
}

/**
 * A supervisor for two ports, eth0 and eth1, each with its own mock transport.
 */
struct Fixture {
    std::map<std::string, std::shared_ptr<MockTransport::Control>> transports {
        {"eth0", std::make_shared<MockTransport::Control>()},
        {"eth1", std::make_shared<MockTransport::Control>()},
    };
    std::shared_ptr<MockEngine::Control> engine_control = std::make_shared<MockEngine::Control>();
    std::shared_ptr<RecordingClock::Control> clock_control = std::make_shared<RecordingClock::Control>();
    DaemonConfig config;
    Supervisor::Dependencies dependencies;

    Fixture() {
        static int counter = 0;
        config.ports = {{"eth0", TimestampingMode::hardware}, {"eth1", TimestampingMode::software}};
        config.clock = ClockKind::virtual_clock;
        config.status.socket_path = fmt::format("/tmp/tempokit-supervisor-test-{}-{}.sock", ::getpid(), counter++);
        config.recovery = {2, 1ms, 2ms};

        dependencies.interfaces = tempo::NetworkInterfaceList({make_interface("eth0", 1), make_interface("eth1", 2)});
        dependencies.engine_factory = MockEngine::factory(engine_control);
        dependencies.clock_factory = RecordingClock::factory(clock_control);
        dependencies.transport_factory = [transports = transports](
                                             const Strand& strand, const PortIdentity& port, const PortConfig& port_config
                                         ) {
            return transports.at(port_config.interface_name)->opener()(strand, port);
        };
    }

    MockTransport::Control& transport(const std::string& interface_name) {
        return *transports.at(interface_name);
    }
};

size_t count_packets_from(const std::vector<Event>& events, const uint16_t port_number) {
    size_t count = 0;
    for (const auto& event : events) {
        if (const auto* packet = std::get_if<PacketReceivedEvent>(&event);
            packet && packet->packet.port.port_number == port_number) {
            count++;
        }
    }
    return count;
}

const PortState* find_port_state(const std::vector<PortState>& states, const std::string& interface_name) {
    for (const auto& state : states) {
        if (state.interface_name == interface_name) {
            return &state;
        }
    }
    return nullptr;
}

}  // namespace

TEST_CASE("tempo::ptp::Supervisor") {
    Fixture f;

    SECTION("Start and shutdown") {
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());
        REQUIRE(supervisor.is_running());
        REQUIRE(supervisor.get_adapter() != nullptr);

        REQUIRE(f.transport("eth0").num_open() == 1);
        REQUIRE(f.transport("eth1").num_open() == 1);
        REQUIRE(test::wait_until([&] {
            return f.engine_control->count_control(ControlCommand::initialize) == 2;
        }));

        const auto states = supervisor.get_port_states(10ms);
        REQUIRE(states.size() == 2);
        REQUIRE(states[0].interface_name == "eth0");
        REQUIRE(states[0].identity.port_number == 1);
        REQUIRE(states[1].interface_name == "eth1");
        REQUIRE(states[1].identity.port_number == 2);

        // Both ports share the clock identity derived from the first interface
        const auto expected_identity = ClockIdentity::from_mac_address(tempo::MacAddress(0x00, 0x1d, 0xc1, 0x00, 0x00, 1)).value();
        REQUIRE(states[0].identity.clock_identity == expected_identity);
        REQUIRE(states[1].identity.clock_identity == expected_identity);

        REQUIRE(supervisor.start().error() == SupervisorError::already_started);

        supervisor.shutdown();
        REQUIRE_FALSE(supervisor.is_running());
        REQUIRE(f.transport("eth0").num_open() == 0);
        REQUIRE(f.transport("eth1").num_open() == 0);
        REQUIRE(supervisor.get_adapter() == nullptr);
        REQUIRE(::access(f.config.status.socket_path.c_str(), F_OK) != 0);

        // Idempotent
        supervisor.shutdown();
    }

    SECTION("Packets reach the engine of their own port") {
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());

        REQUIRE(f.transport("eth1").deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return count_packets_from(f.engine_control->get_events(), 2) == 1;
        }));
        REQUIRE(count_packets_from(f.engine_control->get_events(), 1) == 0);
    }

    SECTION("Status is served over the socket") {
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());

        boost::asio::io_context io_context;
        boost::asio::local::stream_protocol::socket socket(io_context);
        socket.connect(boost::asio::local::stream_protocol::endpoint(f.config.status.socket_path));
        boost::asio::write(socket, boost::asio::buffer(std::string("status\n")));

        std::string response;
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::dynamic_buffer(response), ec);
        REQUIRE(ec == boost::asio::error::eof);

        const auto json = boost::json::parse(response);
        REQUIRE(json.as_object().at("ports").as_array().size() == 2);
        REQUIRE(json.as_object().contains("clock"));
    }

    SECTION("Status reports what the engine of a port decided") {
        f.engine_control->set_script([](const PortIdentity& port, const Event& event) {
            std::vector<Action> actions;
            if (std::holds_alternative<PacketReceivedEvent>(event)) {
                ClockCorrection correction;
                correction.source = port;
                correction.offset = 1500ns;
                actions.emplace_back(CorrectionAction {correction});
                actions.emplace_back(StateChangedAction {State::slave});
            }
            return actions;
        });

        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());
        REQUIRE(f.transport("eth0").deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            const auto states = supervisor.get_port_states(10ms);
            const auto* state = find_port_state(states, "eth0");
            return state != nullptr && state->state == State::slave;
        }));

        boost::asio::io_context io_context;
        boost::asio::local::stream_protocol::socket socket(io_context);
        socket.connect(boost::asio::local::stream_protocol::endpoint(f.config.status.socket_path));
        boost::asio::write(socket, boost::asio::buffer(std::string("status\n")));

        std::string response;
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::dynamic_buffer(response), ec);
        REQUIRE(ec == boost::asio::error::eof);

        const auto json = boost::json::parse(response);
        std::map<std::string, boost::json::object> ports;
        for (const auto& port : json.as_object().at("ports").as_array()) {
            ports[std::string(port.as_object().at("interface").as_string())] = port.as_object();
        }
        REQUIRE(ports.size() == 2);

        REQUIRE(ports["eth0"].at("state").as_string() == "SLAVE");
        REQUIRE(ports["eth0"].at("offset_ns").as_int64() == 1500);
        REQUIRE(ports["eth1"].at("state").as_string() != "SLAVE");
        REQUIRE(ports["eth1"].at("offset_ns").is_null());
    }

    SECTION("An endpoint that cannot bind is not fatal") {
        f.config.status.socket_path = "/nonexistent-directory/tempod.sock";
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());
        REQUIRE(supervisor.get_port_states(10ms).size() == 2);
    }

    SECTION("A faulty port does not affect its sibling") {
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());

        f.transport("eth1").fail_all_opens(true);
        REQUIRE(f.transport("eth1").deliver_error());

        REQUIRE(test::wait_until([&] {
            const auto states = supervisor.get_port_states(10ms);
            const auto* state = find_port_state(states, "eth1");
            return state != nullptr && state->state == State::faulty;
        }));

        REQUIRE(f.transport("eth0").num_open() == 1);
        REQUIRE(f.transport("eth0").deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return count_packets_from(f.engine_control->get_events(), 1) == 1;
        }));

        const auto states = supervisor.get_port_states(10ms);
        REQUIRE(find_port_state(states, "eth0")->state != State::faulty);
        REQUIRE(supervisor.is_running());

        SECTION("Restart recovers the port") {
            f.transport("eth1").fail_all_opens(false);
            REQUIRE(supervisor.restart_port("eth1"));
            REQUIRE(test::wait_until([&] {
                return f.transport("eth1").num_open() == 1;
            }));
            REQUIRE(test::wait_until([&] {
                const auto s = supervisor.get_port_states(10ms);
                return find_port_state(s, "eth1")->state != State::faulty;
            }));
        }
    }

    SECTION("One port failing to open is not fatal") {
        f.transport("eth1").fail_all_opens(true);
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());
        REQUIRE(f.transport("eth0").num_open() == 1);

        REQUIRE(test::wait_until([&] {
            const auto states = supervisor.get_port_states(10ms);
            return find_port_state(states, "eth1")->state == State::faulty;
        }));
    }

    SECTION("No port could be opened") {
        f.transport("eth0").fail_all_opens(true);
        f.transport("eth1").fail_all_opens(true);
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().error() == SupervisorError::no_ports_available);
        REQUIRE_FALSE(supervisor.is_running());
        REQUIRE(supervisor.get_adapter() == nullptr);
        REQUIRE(f.transport("eth0").num_open() == 0);
        REQUIRE(f.transport("eth1").num_open() == 0);
    }

    SECTION("No ports configured") {
        f.config.ports.clear();
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().error() == SupervisorError::invalid_config);
    }

    SECTION("Unknown interface") {
        f.config.ports.push_back({"eth7", TimestampingMode::hardware});
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().error() == SupervisorError::invalid_config);
        REQUIRE(f.transport("eth0").num_open_attempts() == 0);
    }

    SECTION("No interface has a MAC address") {
        f.dependencies.interfaces = tempo::NetworkInterfaceList({make_interface("eth0", 0), make_interface("eth1", 0)});
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().error() == SupervisorError::invalid_config);
    }

    SECTION("Clock identity falls back to the next interface with a MAC address") {
        f.dependencies.interfaces = tempo::NetworkInterfaceList({make_interface("eth0", 0), make_interface("eth1", 2)});
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());
        const auto expected_identity = ClockIdentity::from_mac_address(tempo::MacAddress(0x00, 0x1d, 0xc1, 0x00, 0x00, 2)).value();
        REQUIRE(supervisor.get_port_states(10ms)[0].identity.clock_identity == expected_identity);
    }

    SECTION("The clock cannot be opened") {
        f.dependencies.clock_factory = []() -> tl::expected<std::unique_ptr<SteerableClock>, SteeringError> {
            return tl::unexpected(SteeringError::permission_denied);
        };
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().error() == SupervisorError::clock_unavailable);
    }

    SECTION("Commands for unknown interfaces") {
        Supervisor supervisor(f.config, f.dependencies);
        REQUIRE(supervisor.start().has_value());
        REQUIRE_FALSE(supervisor.restart_port("eth9"));
        REQUIRE_FALSE(supervisor.post_control("eth9", ControlCommand::disable));
        REQUIRE(supervisor.post_control("eth0", ControlCommand::disable));
        REQUIRE(test::wait_until([&] {
            return f.engine_control->count_control(ControlCommand::disable) == 1;
        }));
    }

    SECTION("Clock state before start") {
        Supervisor supervisor(f.config, f.dependencies);
        const auto state = supervisor.get_clock_state(10ms);
        REQUIRE(state.steps == 0);
        REQUIRE(supervisor.get_port_states(10ms).empty());
    }
}
