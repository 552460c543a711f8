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
#include "ptp_clock_correction.hpp"
#include "ptp_error.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <tuple>

namespace tempo::ptp {

/**
 * Settings of the clock servo.
 */
struct SteeringConfig {
    /// Offsets larger than this are corrected by stepping the clock.
    std::chrono::nanoseconds step_threshold {std::chrono::milliseconds(1)};
    /// Proportional gain, in ppb per ns of offset.
    double kp {0.7};
    /// Integral gain, in ppb per accumulated ns of offset.
    double ki {0.3};
    /// Largest total frequency adjustment.
    double max_frequency_ppb {500'000.0};
    /// Largest frequency change per applied correction.
    double max_slew_step_ppb {50'000.0};
    /// Offsets within this tolerance count as stable.
    std::chrono::nanoseconds stability_tolerance {std::chrono::microseconds(10)};
    /// Number of consecutive unstable corrections before sync is reported as degraded.
    uint32_t unstable_limit {8};
};

enum class SteeringAction { step, slew };

inline const char* to_string(const SteeringAction action) {
    switch (action) {
        case SteeringAction::step:
            return "step";
        case SteeringAction::slew:
            return "slew";
        default:
            return "unknown";
    }
}

enum class DiscardReason {
    /// More than one port is active and the correction does not come from the primary port.
    not_primary,
    /// The primary port changed between submission and application.
    stale_epoch,
    /// The adapter was stopped.
    stopped,
};

inline const char* to_string(const DiscardReason reason) {
    switch (reason) {
        case DiscardReason::not_primary:
            return "not primary";
        case DiscardReason::stale_epoch:
            return "stale epoch";
        case DiscardReason::stopped:
            return "stopped";
        default:
            return "unknown";
    }
}

/**
 * The single owner of the steered clock. Corrections can be submitted from any thread and are applied one at a time, in
 * the order they were submitted, on the adapter's own strand.
 */
class ClockSteeringAdapter {
  public:
    /**
     * Observes the outcome of every submitted correction. Called on the adapter's strand.
     */
    class Subscriber {
      public:
        virtual ~Subscriber() = default;

        /**
         * Called after a correction was applied to the clock.
         * @param correction The correction.
         * @param action How the correction was applied.
         * @param sequence The submission sequence number returned by submit().
         */
        virtual void on_correction_applied(const ClockCorrection& correction, SteeringAction action, uint64_t sequence) {
            std::ignore = correction;
            std::ignore = action;
            std::ignore = sequence;
        }

        /**
         * Called when a correction was not applied.
         * @param correction The correction.
         * @param reason The reason.
         * @param sequence The submission sequence number returned by submit().
         */
        virtual void
        on_correction_discarded(const ClockCorrection& correction, DiscardReason reason, uint64_t sequence) {
            std::ignore = correction;
            std::ignore = reason;
            std::ignore = sequence;
        }

        /**
         * Called when the clock refused a correction.
         * @param correction The correction.
         * @param error The error reported by the clock.
         * @param sequence The submission sequence number returned by submit().
         */
        virtual void on_correction_rejected(const ClockCorrection& correction, SteeringError error, uint64_t sequence) {
            std::ignore = correction;
            std::ignore = error;
            std::ignore = sequence;
        }
    };

    /**
     * Constructs the adapter.
     * @param io_context The io context to run the adapter strand on.
     * @param clock The clock to steer. Must not be null.
     * @param config The servo configuration.
     */
    ClockSteeringAdapter(boost::asio::io_context& io_context, std::unique_ptr<SteerableClock> clock, SteeringConfig config);

    ~ClockSteeringAdapter();

    ClockSteeringAdapter(const ClockSteeringAdapter&) = delete;
    ClockSteeringAdapter& operator=(const ClockSteeringAdapter&) = delete;

    ClockSteeringAdapter(ClockSteeringAdapter&&) = delete;
    ClockSteeringAdapter& operator=(ClockSteeringAdapter&&) = delete;

    /**
     * Submits a correction. Thread safe, never waits for the correction to be applied.
     * @param correction The correction.
     * @return The submission sequence number. Corrections are applied in ascending sequence number order.
     */
    uint64_t submit(const ClockCorrection& correction);

    /**
     * Registers a port which may submit corrections. With more than one registered port only corrections of the
     * primary port are applied. Thread safe.
     * @param port The port.
     */
    void register_port(const PortIdentity& port);

    /**
     * Unregisters a port. Thread safe.
     * @param port The port.
     */
    void unregister_port(const PortIdentity& port);

    /**
     * Updates the primary designation of a port, as decided by its engine. The most recent claim wins; when the primary
     * withdraws, the most recent claim still standing takes over. Thread safe.
     * @param port The port.
     * @param primary Whether the port is primary.
     */
    void set_primary(const PortIdentity& port, bool primary);

    /**
     * @return A copy of the clock state.
     */
    [[nodiscard]] ClockState get_state() const;

    /**
     * @param timeout Maximum time to wait for a concurrent write to finish.
     * @return A copy of the clock state, or nothing if it could not be read in time.
     */
    [[nodiscard]] std::optional<ClockState> try_get_state(std::chrono::milliseconds timeout) const;

    /**
     * Adds a subscriber. Thread safe.
     * @param subscriber The subscriber, which must outlive its subscription.
     * @return True if added, false if it was already subscribed.
     */
    [[nodiscard]] bool subscribe(Subscriber* subscriber);

    /**
     * Removes a subscriber. Thread safe.
     * @param subscriber The subscriber.
     * @return True if removed, false if it was not subscribed.
     */
    [[nodiscard]] bool unsubscribe(const Subscriber* subscriber);

    /**
     * Stops the adapter. No correction is started after this call; a correction being applied completes.
     * @return A future which becomes ready once no correction is in progress anymore.
     */
    std::future<void> stop();

  private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace tempo::ptp
