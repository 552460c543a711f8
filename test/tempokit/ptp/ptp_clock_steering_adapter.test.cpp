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
#include "tempokit/ptp/mock/ptp_recording_clock.hpp"
#include "tempokit/ptp/ptp_clock_steering_adapter.hpp"

#include <catch2/catch_all.hpp>

#include <mutex>
#include <thread>

using namespace std::chrono_literals;
using namespace tempo::ptp;

namespace {

const PortIdentity k_port_a = test::make_port_identity(0x0a);
const PortIdentity k_port_b = test::make_port_identity(0x0b);

class RecordingSubscriber final: public ClockSteeringAdapter::Subscriber {
  public:
    struct Outcome {
        uint64_t sequence {};
        std::optional<SteeringAction> action;
        std::optional<DiscardReason> discard_reason;
        std::optional<SteeringError> error;
    };

    void on_correction_applied(const ClockCorrection&, const SteeringAction action, const uint64_t sequence) override {
        std::lock_guard lock(mutex_);
        outcomes_.push_back({sequence, action, {}, {}});
    }

    void on_correction_discarded(const ClockCorrection&, const DiscardReason reason, const uint64_t sequence) override {
        std::lock_guard lock(mutex_);
        outcomes_.push_back({sequence, {}, reason, {}});
    }

    void on_correction_rejected(const ClockCorrection&, const SteeringError error, const uint64_t sequence) override {
        std::lock_guard lock(mutex_);
        outcomes_.push_back({sequence, {}, {}, error});
    }

    std::vector<Outcome> get_outcomes() const {
        std::lock_guard lock(mutex_);
        return outcomes_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return outcomes_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<Outcome> outcomes_;
};

ClockCorrection make_correction(const PortIdentity& source, const std::chrono::nanoseconds offset) {
    ClockCorrection correction;
    correction.source = source;
    correction.offset = offset;
    return correction;
}

std::unique_ptr<SteerableClock> make_clock(const std::shared_ptr<RecordingClock::Control>& control) {
    return std::make_unique<RecordingClock>(control);
}

}  // namespace

TEST_CASE("tempo::ptp::ClockSteeringAdapter") {
    RecordingSubscriber subscriber;
    tempo::IoContextRunner runner(4);
    auto control = std::make_shared<RecordingClock::Control>();
    SteeringConfig config;
    config.unstable_limit = 3;

    auto adapter = std::make_unique<ClockSteeringAdapter>(runner.io_context(), make_clock(control), config);
    REQUIRE(adapter->subscribe(&subscriber));

    SECTION("Concurrent submissions are applied one at a time in submission order") {
        control->set_delay(1ms);
        constexpr size_t k_num_threads = 4;
        constexpr size_t k_per_thread = 25;

        std::vector<std::thread> threads;
        for (size_t t = 0; t < k_num_threads; t++) {
            threads.emplace_back([&adapter] {
                for (size_t i = 0; i < k_per_thread; i++) {
                    adapter->submit(make_correction(k_port_a, 100ns));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(test::wait_until([&] {
            return subscriber.size() == k_num_threads * k_per_thread;
        }));

        const auto outcomes = subscriber.get_outcomes();
        for (size_t i = 0; i < outcomes.size(); i++) {
            REQUIRE(outcomes[i].sequence == i + 1);
            REQUIRE(outcomes[i].action == SteeringAction::slew);
        }
        REQUIRE_FALSE(control->overlap_detected());
        REQUIRE(adapter->get_state().slews == k_num_threads * k_per_thread);
    }

    SECTION("A single port is always accepted") {
        adapter->register_port(k_port_a);
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));
        REQUIRE(subscriber.get_outcomes()[0].action == SteeringAction::slew);
    }

    SECTION("Large offsets step the clock") {
        adapter->submit(make_correction(k_port_a, 5ms));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));

        REQUIRE(subscriber.get_outcomes()[0].action == SteeringAction::step);
        const auto adjustments = control->get_adjustments();
        REQUIRE(adjustments.size() == 1);
        REQUIRE(adjustments[0].kind == RecordingClock::Adjustment::Kind::step);
        REQUIRE(adjustments[0].step == -5ms);

        const auto state = adapter->get_state();
        REQUIRE(state.steps == 1);
        REQUIRE(state.slews == 0);
        REQUIRE(state.last_correction.has_value());
        REQUIRE(state.last_correction->offset == 5ms);
        REQUIRE_FALSE(state.stable);
    }

    SECTION("Small offsets slew the clock") {
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));

        const auto adjustments = control->get_adjustments();
        REQUIRE(adjustments.size() == 1);
        REQUIRE(adjustments[0].kind == RecordingClock::Adjustment::Kind::frequency);
        // kp * 100 + ki * 100
        REQUIRE(adjustments[0].frequency_ppb == Catch::Approx(-100.0));

        const auto state = adapter->get_state();
        REQUIRE(state.slews == 1);
        REQUIRE(state.stable);
        REQUIRE(state.frequency_ppb == Catch::Approx(-100.0));
    }

    SECTION("Frequency changes are rate limited") {
        auto correction = make_correction(k_port_a, 0ns);
        correction.frequency_ppb = 200'000.0;
        adapter->submit(correction);
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));
        REQUIRE(adapter->get_state().frequency_ppb == Catch::Approx(config.max_slew_step_ppb));
    }

    SECTION("Time properties are forwarded when they change") {
        auto correction = make_correction(k_port_a, 100ns);
        correction.time_properties = TimeProperties {37, true, false, false, true};
        adapter->submit(correction);
        adapter->submit(correction);
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 2;
        }));
        REQUIRE(control->count(RecordingClock::Adjustment::Kind::time_properties) == 1);
        REQUIRE(control->count(RecordingClock::Adjustment::Kind::frequency) == 2);
    }

    SECTION("Corrections of non-primary ports are discarded") {
        adapter->register_port(k_port_a);
        adapter->register_port(k_port_b);
        adapter->set_primary(k_port_a, true);

        adapter->submit(make_correction(k_port_b, 100ns));
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 2;
        }));

        const auto outcomes = subscriber.get_outcomes();
        REQUIRE(outcomes[0].discard_reason == DiscardReason::not_primary);
        REQUIRE(outcomes[1].action == SteeringAction::slew);

        const auto state = adapter->get_state();
        REQUIRE(state.discarded == 1);
        REQUIRE(state.primary == k_port_a);
        REQUIRE(control->count(RecordingClock::Adjustment::Kind::frequency) == 1);
    }

    SECTION("Without a primary, nothing is applied from multiple ports") {
        adapter->register_port(k_port_a);
        adapter->register_port(k_port_b);
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));
        REQUIRE(subscriber.get_outcomes()[0].discard_reason == DiscardReason::not_primary);
    }

    SECTION("A primary change invalidates queued corrections") {
        adapter->register_port(k_port_a);
        adapter->register_port(k_port_b);
        adapter->set_primary(k_port_a, true);
        const auto epoch = adapter->get_state().primary_epoch;

        control->set_delay(100ms);
        adapter->submit(make_correction(k_port_a, 100ns));
        adapter->submit(make_correction(k_port_a, 100ns));
        adapter->set_primary(k_port_b, true);

        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 2;
        }));

        const auto outcomes = subscriber.get_outcomes();
        REQUIRE(outcomes[1].discard_reason == DiscardReason::stale_epoch);
        REQUIRE(adapter->get_state().primary_epoch == epoch + 1);
        REQUIRE(adapter->get_state().primary == k_port_b);
    }

    SECTION("A withdrawn primary hands over to a port still claiming it") {
        adapter->register_port(k_port_a);
        adapter->register_port(k_port_b);
        adapter->set_primary(k_port_a, true);
        adapter->set_primary(k_port_b, true);
        REQUIRE(adapter->get_state().primary == k_port_b);

        adapter->set_primary(k_port_b, false);
        REQUIRE(adapter->get_state().primary == k_port_a);

        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));
        REQUIRE(subscriber.get_outcomes()[0].action == SteeringAction::slew);

        // Withdrawing a claim of a port which is not primary changes nothing
        const auto epoch = adapter->get_state().primary_epoch;
        adapter->set_primary(k_port_b, false);
        REQUIRE(adapter->get_state().primary_epoch == epoch);

        adapter->set_primary(k_port_a, false);
        REQUIRE_FALSE(adapter->get_state().primary.has_value());
    }

    SECTION("Unregistering the primary clears it") {
        adapter->register_port(k_port_a);
        adapter->register_port(k_port_b);
        adapter->set_primary(k_port_a, true);
        adapter->unregister_port(k_port_a);
        REQUIRE_FALSE(adapter->get_state().primary.has_value());

        // Only one port left
        adapter->submit(make_correction(k_port_b, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));
        REQUIRE(subscriber.get_outcomes()[0].action == SteeringAction::slew);
    }

    SECTION("Repeated unstable corrections degrade the sync state") {
        for (int i = 0; i < 3; i++) {
            adapter->submit(make_correction(k_port_a, 50us));
        }
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 3;
        }));
        auto state = adapter->get_state();
        REQUIRE(state.degraded);
        REQUIRE(state.consecutive_unstable == 3);

        adapter->submit(make_correction(k_port_a, 1us));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 4;
        }));
        state = adapter->get_state();
        REQUIRE_FALSE(state.degraded);
        REQUIRE(state.stable);
        REQUIRE(state.consecutive_unstable == 0);
    }

    SECTION("Rejected adjustments are reported") {
        control->fail_with(SteeringError::permission_denied);
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));

        REQUIRE(subscriber.get_outcomes()[0].error == SteeringError::permission_denied);
        const auto state = adapter->get_state();
        REQUIRE(state.rejected == 1);
        REQUIRE(state.degraded);
        REQUIRE(state.slews == 0);

        control->fail_with(std::nullopt);
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 2;
        }));
        REQUIRE(adapter->get_state().slews == 1);
    }

    SECTION("Nothing is applied after stop") {
        adapter->stop().wait();
        adapter->submit(make_correction(k_port_a, 100ns));
        REQUIRE(test::wait_until([&] {
            return subscriber.size() == 1;
        }));
        REQUIRE(subscriber.get_outcomes()[0].discard_reason == DiscardReason::stopped);
        REQUIRE(control->get_adjustments().empty());
    }

    SECTION("Bounded read of the state") {
        const auto state = adapter->try_get_state(10ms);
        REQUIRE(state.has_value());
        REQUIRE(state->steps == 0);
    }

    adapter->stop().wait();
    REQUIRE(adapter->unsubscribe(&subscriber));
    adapter.reset();
    runner.stop();
}

TEST_CASE("tempo::ptp::ClockSteeringAdapter needs a clock") {
    boost::asio::io_context io_context;
    REQUIRE_THROWS(ClockSteeringAdapter(io_context, nullptr, SteeringConfig {}));
}
