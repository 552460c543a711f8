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
#include "tempokit/core/asio/io_context_runner.hpp"
#include "tempokit/ptp/mock/ptp_mock_engine.hpp"
#include "tempokit/ptp/mock/ptp_mock_transport.hpp"
#include "tempokit/ptp/mock/ptp_recording_clock.hpp"
#include "tempokit/ptp/ptp_port_runtime.hpp"

#include <catch2/catch_all.hpp>

using namespace std::chrono_literals;
using namespace tempo::ptp;

namespace {

const PortIdentity k_port = test::make_port_identity(0x01, 1);

template<class T>
std::vector<T> find_events(const std::vector<Event>& events) {
    std::vector<T> result;
    for (const auto& event : events) {
        if (const auto* e = std::get_if<T>(&event)) {
            result.push_back(*e);
        }
    }
    return result;
}

/**
 * Everything a single port needs, wired to test doubles.
 */
struct Fixture {
    tempo::IoContextRunner runner {2};
    std::shared_ptr<RecordingClock::Control> clock_control = std::make_shared<RecordingClock::Control>();
    std::shared_ptr<MockTransport::Control> transport_control = std::make_shared<MockTransport::Control>();
    std::shared_ptr<MockEngine::Control> engine_control = std::make_shared<MockEngine::Control>();
    std::unique_ptr<ClockSteeringAdapter> adapter;
    std::unique_ptr<PortRuntime> port;

    explicit Fixture(const RecoveryConfig& recovery = {3, 1ms, 4ms}) {
        adapter = std::make_unique<ClockSteeringAdapter>(
            runner.io_context(), std::make_unique<RecordingClock>(clock_control), SteeringConfig {}
        );
        port = std::make_unique<PortRuntime>(
            runner.io_context(), k_port, "eth0", std::make_unique<MockEngine>(k_port, engine_control),
            transport_control->opener(), *adapter, recovery
        );
    }

    ~Fixture() {
        port->stop().wait();
        adapter->stop().wait();
        runner.stop();
    }

    bool wait_for_state(const State state) const {
        return test::wait_until([&] {
            return port->get_state().state == state;
        });
    }
};

}  // namespace

TEST_CASE("tempo::ptp::PortRuntime") {
    SECTION("Start opens the transport and initializes the engine") {
        Fixture f;
        const auto result = f.port->start().get();
        REQUIRE(result.has_value());
        REQUIRE(f.transport_control->num_open() == 1);

        REQUIRE(test::wait_until([&] {
            return f.engine_control->count_control(ControlCommand::initialize) == 1;
        }));

        const auto state = f.port->get_state();
        REQUIRE(state.identity == k_port);
        REQUIRE(state.interface_name == "eth0");
        REQUIRE(state.timestamping == TimestampSource::hardware);
        REQUIRE(state.transport_failures == 0);
        REQUIRE(f.port->get_identity() == k_port);
    }

    SECTION("Received packets are handed to the engine") {
        Fixture f;
        REQUIRE(f.port->start().get().has_value());

        const CapturedTimestamp timestamp {Timestamp(10, 20), TimestampSource::hardware};
        REQUIRE(f.transport_control->deliver(MessageClass::event, {1, 2, 3}, timestamp));

        REQUIRE(test::wait_until([&] {
            return find_events<PacketReceivedEvent>(f.engine_control->get_events()).size() == 1;
        }));

        const auto packets = find_events<PacketReceivedEvent>(f.engine_control->get_events());
        REQUIRE(packets[0].packet.port == k_port);
        REQUIRE(packets[0].packet.message_class == MessageClass::event);
        REQUIRE(packets[0].packet.data == std::vector<uint8_t> {1, 2, 3});
        REQUIRE(packets[0].packet.timestamp.time == Timestamp(10, 20));
    }

    SECTION("Engine actions are applied") {
        Fixture f;
        f.engine_control->set_script([](const PortIdentity& port, const Event& event) {
            std::vector<Action> actions;
            if (std::holds_alternative<PacketReceivedEvent>(event)) {
                actions.emplace_back(TransmitAction {
                    MessageClass::event,
                    {0xaa},
                    TimestampContext {MessageType::delay_req, 7},
                });
                actions.emplace_back(StateChangedAction {State::slave});
                ClockCorrection correction;
                correction.source = port;
                correction.offset = 1us;
                actions.emplace_back(CorrectionAction {correction});
            }
            return actions;
        });
        f.engine_control->set_primary(true);

        REQUIRE(f.port->start().get().has_value());
        REQUIRE(f.transport_control->deliver(MessageClass::general, {0x01}, {}));

        // The transmit timestamp comes back as a separate event
        REQUIRE(test::wait_until([&] {
            return find_events<TransmitTimestampEvent>(f.engine_control->get_events()).size() == 1;
        }));
        const auto timestamps = find_events<TransmitTimestampEvent>(f.engine_control->get_events());
        REQUIRE(timestamps[0].context == TimestampContext {MessageType::delay_req, 7});
        REQUIRE(timestamps[0].timestamp.source == TimestampSource::hardware);

        const auto sent = f.transport_control->get_sent();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].message_class == MessageClass::event);
        REQUIRE(sent[0].data == std::vector<uint8_t> {0xaa});
        REQUIRE(sent[0].port == k_port);

        const auto state = f.port->get_state();
        REQUIRE(state.state == State::slave);
        REQUIRE(state.offset == 1us);
        REQUIRE(state.primary);

        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().slews == 1;
        }));
        REQUIRE(f.adapter->get_state().primary == k_port);
    }

    SECTION("A failed send is reported to the engine") {
        Fixture f;
        f.transport_control->fail_sends(TransportError::io_error);
        f.engine_control->set_script([](const PortIdentity&, const Event& event) {
            std::vector<Action> actions;
            if (const auto* control = std::get_if<ControlEvent>(&event);
                control && control->command == ControlCommand::initialize) {
                actions.emplace_back(TransmitAction {
                    MessageClass::event,
                    {0xbb},
                    TimestampContext {MessageType::delay_req, 1},
                });
            }
            return actions;
        });

        REQUIRE(f.port->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return find_events<TransmitFailedEvent>(f.engine_control->get_events()).size() == 1;
        }));

        const auto failures = find_events<TransmitFailedEvent>(f.engine_control->get_events());
        REQUIRE(failures[0].error == TransportError::io_error);
        REQUIRE(failures[0].context == TimestampContext {MessageType::delay_req, 1});
        REQUIRE(failures[0].message_class == MessageClass::event);
        REQUIRE(find_events<TransmitTimestampEvent>(f.engine_control->get_events()).empty());

        // Not retried
        std::this_thread::sleep_for(20ms);
        REQUIRE(f.transport_control->get_sent().size() == 1);
    }

    SECTION("Timers armed by the engine fire into the engine") {
        Fixture f;
        f.engine_control->set_script([](const PortIdentity&, const Event& event) {
            std::vector<Action> actions;
            if (std::holds_alternative<ControlEvent>(event)) {
                actions.emplace_back(ArmTimerAction {TimerKind::announce_receipt_timeout, 1ms, false});
                actions.emplace_back(ArmTimerAction {TimerKind::delay_request, 1h, true});
                actions.emplace_back(CancelTimerAction {TimerKind::delay_request});
            }
            return actions;
        });

        REQUIRE(f.port->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return !find_events<TimerExpiredEvent>(f.engine_control->get_events()).empty();
        }));

        std::this_thread::sleep_for(20ms);
        const auto timers = find_events<TimerExpiredEvent>(f.engine_control->get_events());
        REQUIRE(timers.size() == 1);
        REQUIRE(timers[0].kind == TimerKind::announce_receipt_timeout);
    }

    SECTION("Control commands are passed through") {
        Fixture f;
        REQUIRE(f.port->start().get().has_value());
        f.port->post_control(ControlCommand::disable);
        REQUIRE(test::wait_until([&] {
            return f.engine_control->count_control(ControlCommand::disable) == 1;
        }));
    }

    SECTION("A receive error reopens the transport") {
        Fixture f;
        REQUIRE(f.port->start().get().has_value());
        REQUIRE(f.transport_control->deliver_error(TransportError::io_error));

        REQUIRE(test::wait_until([&] {
            return f.transport_control->num_opened() == 2;
        }));
        REQUIRE(f.transport_control->num_open() == 1);
        REQUIRE(f.port->get_state().transport_failures == 1);
        REQUIRE(f.port->get_state().state != State::faulty);

        // The new transport delivers to the engine
        REQUIRE(f.transport_control->deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return find_events<PacketReceivedEvent>(f.engine_control->get_events()).size() == 1;
        }));

        // The engine is not initialized again
        REQUIRE(f.engine_control->count_control(ControlCommand::initialize) == 1);
    }

    SECTION("A failed first open is retried and initializes the engine once it succeeds") {
        Fixture f;
        f.transport_control->fail_opens(1);
        const auto result = f.port->start().get();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == TransportError::bind_failed);

        REQUIRE(test::wait_until([&] {
            return f.engine_control->count_control(ControlCommand::initialize) == 1;
        }));
        REQUIRE(f.transport_control->num_open() == 1);
        REQUIRE(f.port->get_state().transport_failures == 1);
    }

    SECTION("Exhausting the retry budget makes the port faulty") {
        Fixture f;
        f.engine_control->set_primary(true);
        REQUIRE(f.port->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.port->get_state().primary;
        }));

        f.transport_control->fail_all_opens(true);
        REQUIRE(f.transport_control->deliver_error());

        REQUIRE(f.wait_for_state(State::faulty));

        const auto state = f.port->get_state();
        // The receive error plus three failed reopen attempts
        REQUIRE(state.transport_failures == 4);
        REQUIRE(f.transport_control->num_open_attempts() == 4);
        REQUIRE_FALSE(state.primary);
        REQUIRE_FALSE(state.offset.has_value());
        REQUIRE(f.transport_control->num_open() == 0);
        REQUIRE_FALSE(f.adapter->get_state().primary.has_value());

        // No more attempts are made
        std::this_thread::sleep_for(30ms);
        REQUIRE(f.transport_control->num_open_attempts() == 4);

        // The engine is no longer called
        const auto num_events = f.engine_control->num_events();
        f.port->post_control(ControlCommand::enable);
        std::this_thread::sleep_for(10ms);
        REQUIRE(f.engine_control->num_events() == num_events);

        SECTION("Restart brings the port back") {
            f.transport_control->fail_all_opens(false);
            f.port->restart();

            REQUIRE(f.wait_for_state(State::initializing));
            REQUIRE(test::wait_until([&] {
                return f.engine_control->count_control(ControlCommand::initialize) == 2;
            }));
            REQUIRE(f.transport_control->num_open() == 1);
            REQUIRE(test::wait_until([&] {
                return f.port->get_state().primary;
            }));
        }
    }

    SECTION("A successful reopen restores the retry budget") {
        Fixture f;
        REQUIRE(f.port->start().get().has_value());

        // More isolated failures than the budget allows, each followed by a successful reopen
        for (size_t i = 1; i <= 4; ++i) {
            REQUIRE(f.transport_control->deliver_error());
            REQUIRE(test::wait_until([&] {
                return f.transport_control->num_opened() == i + 1;
            }));
        }

        const auto state = f.port->get_state();
        REQUIRE(state.state != State::faulty);
        REQUIRE(state.transport_failures == 4);
        REQUIRE(f.transport_control->num_open() == 1);

        REQUIRE(f.transport_control->deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return find_events<PacketReceivedEvent>(f.engine_control->get_events()).size() == 1;
        }));
    }

    SECTION("Stop releases the transport and the primary designation") {
        Fixture f;
        f.engine_control->set_primary(true);
        REQUIRE(f.port->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_port;
        }));

        f.port->stop().wait();
        REQUIRE(f.transport_control->num_open() == 0);
        REQUIRE_FALSE(f.port->get_state().primary);
        REQUIRE_FALSE(f.adapter->get_state().primary.has_value());

        // Packets for a closed transport go nowhere
        REQUIRE_FALSE(f.transport_control->deliver(MessageClass::general, {0x01}, {}));

        // Starting a stopped port fails
        REQUIRE(f.port->start().get().error() == TransportError::closed);
    }

    SECTION("Bounded state read") {
        Fixture f;
        const auto state = f.port->try_get_state(10ms);
        REQUIRE(state.has_value());
        REQUIRE(state->state == State::initializing);
    }
}

TEST_CASE("tempo::ptp::PortRuntime needs an engine and an opener") {
    boost::asio::io_context io_context;
    ClockSteeringAdapter adapter(
        io_context, std::make_unique<RecordingClock>(std::make_shared<RecordingClock::Control>()), SteeringConfig {}
    );
    const auto transport_control = std::make_shared<MockTransport::Control>();

    REQUIRE_THROWS(PortRuntime(io_context, k_port, "eth0", nullptr, transport_control->opener(), adapter, {}));
    REQUIRE_THROWS(PortRuntime(
        io_context, k_port, "eth0", std::make_unique<MockEngine>(k_port, std::make_shared<MockEngine::Control>()),
        nullptr, adapter, {}
    ));
}

namespace {

const PortIdentity k_other_port = test::make_port_identity(0x02, 1);

/**
 * Two ports steering the same clock, each with its own transport and engine.
 */
struct TwoPortFixture {
    tempo::IoContextRunner runner {2};
    std::shared_ptr<RecordingClock::Control> clock_control = std::make_shared<RecordingClock::Control>();
    std::shared_ptr<MockTransport::Control> transport_a = std::make_shared<MockTransport::Control>();
    std::shared_ptr<MockTransport::Control> transport_b = std::make_shared<MockTransport::Control>();
    std::shared_ptr<MockEngine::Control> engine_a = std::make_shared<MockEngine::Control>();
    std::shared_ptr<MockEngine::Control> engine_b = std::make_shared<MockEngine::Control>();
    std::unique_ptr<ClockSteeringAdapter> adapter;
    std::unique_ptr<PortRuntime> port_a;
    std::unique_ptr<PortRuntime> port_b;

    TwoPortFixture() {
        adapter = std::make_unique<ClockSteeringAdapter>(
            runner.io_context(), std::make_unique<RecordingClock>(clock_control), SteeringConfig {}
        );
        port_a = std::make_unique<PortRuntime>(
            runner.io_context(), k_port, "eth0", std::make_unique<MockEngine>(k_port, engine_a),
            transport_a->opener(), *adapter, RecoveryConfig {3, 1ms, 4ms}
        );
        port_b = std::make_unique<PortRuntime>(
            runner.io_context(), k_other_port, "eth1", std::make_unique<MockEngine>(k_other_port, engine_b),
            transport_b->opener(), *adapter, RecoveryConfig {3, 1ms, 4ms}
        );
    }

    ~TwoPortFixture() {
        port_a->stop().wait();
        port_b->stop().wait();
        adapter->stop().wait();
        runner.stop();
    }
};

/**
 * @return A script answering every received packet with a correction of given offset.
 */
MockEngine::Script correct_on_packet(const std::chrono::nanoseconds offset) {
    return [offset](const PortIdentity& port, const Event& event) {
        std::vector<Action> actions;
        if (std::holds_alternative<PacketReceivedEvent>(event)) {
            ClockCorrection correction;
            correction.source = port;
            correction.offset = offset;
            actions.emplace_back(CorrectionAction {correction});
        }
        return actions;
    };
}

}  // namespace

TEST_CASE("tempo::ptp::PortRuntime primary arbitration") {
    SECTION("Only the primary port steers the clock") {
        TwoPortFixture f;
        f.engine_a->set_script(correct_on_packet(1us));
        f.engine_b->set_script(correct_on_packet(2us));
        f.engine_a->set_primary(true);

        REQUIRE(f.port_a->start().get().has_value());
        REQUIRE(f.port_b->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_port;
        }));

        REQUIRE(f.transport_b->deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().discarded == 1;
        }));

        REQUIRE(f.transport_a->deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().slews == 1;
        }));
        REQUIRE(f.adapter->get_state().last_correction->offset == 1us);
        REQUIRE(f.port_a->get_state().primary);
        REQUIRE_FALSE(f.port_b->get_state().primary);
    }

    SECTION("A port still claiming primary takes over when the primary drops") {
        TwoPortFixture f;
        f.engine_a->set_script(correct_on_packet(1us));
        f.engine_a->set_primary(true);
        f.engine_b->set_primary(true);

        REQUIRE(f.port_a->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_port;
        }));

        REQUIRE(f.port_b->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_other_port;
        }));

        // The engine of port b gives up its claim, which the runtime reports on the next event
        f.engine_b->set_primary(false);
        f.port_b->post_control(ControlCommand::disable);
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_port;
        }));
        REQUIRE(f.port_a->get_state().primary);

        REQUIRE(f.transport_a->deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().slews == 1;
        }));
        REQUIRE(f.adapter->get_state().discarded == 0);
    }

    SECTION("A stopped primary hands over to the other claiming port") {
        TwoPortFixture f;
        f.engine_a->set_primary(true);
        f.engine_b->set_primary(true);

        REQUIRE(f.port_a->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_port;
        }));
        REQUIRE(f.port_b->start().get().has_value());
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().primary == k_other_port;
        }));

        f.port_b->stop().wait();
        REQUIRE(f.adapter->get_state().primary == k_port);
    }

    SECTION("A correction from the event which makes a port primary is applied") {
        TwoPortFixture f;
        auto* engine_a = f.engine_a.get();
        f.engine_a->set_script([engine_a](const PortIdentity& port, const Event& event) {
            std::vector<Action> actions;
            if (std::holds_alternative<PacketReceivedEvent>(event)) {
                engine_a->set_primary(true);
                ClockCorrection correction;
                correction.source = port;
                correction.offset = 3us;
                actions.emplace_back(CorrectionAction {correction});
                actions.emplace_back(StateChangedAction {State::slave});
            }
            return actions;
        });

        REQUIRE(f.port_a->start().get().has_value());
        REQUIRE(f.port_b->start().get().has_value());
        REQUIRE_FALSE(f.adapter->get_state().primary.has_value());

        REQUIRE(f.transport_a->deliver(MessageClass::general, {0x01}, {}));
        REQUIRE(test::wait_until([&] {
            return f.adapter->get_state().slews == 1;
        }));

        const auto state = f.adapter->get_state();
        REQUIRE(state.discarded == 0);
        REQUIRE(state.primary == k_port);
        REQUIRE(state.last_correction->offset == 3us);
        REQUIRE(test::wait_until([&] {
            return f.port_a->get_state().state == State::slave;
        }));
    }
}
