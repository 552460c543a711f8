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

#include "ptp_definitions.hpp"
#include "ptp_error.hpp"
#include "tempokit/core/expected.hpp"
#include "transport/ptp_transport.hpp"

#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <memory>

namespace tempo::ptp {

/**
 * Identifies one arming of a timer. Becomes stale as soon as the same kind is armed again.
 */
struct TimerHandle {
    TimerKind kind {};
    uint64_t generation {};
};

/**
 * The timers of one port: one re-armable one-shot or recurring timer per TimerKind. Firings are delivered through the
 * handler on the port's strand. Arming a kind that is pending replaces the pending firing; a firing of a previous
 * arming is never delivered, even if its completion was already queued on the strand.
 * All functions must be called from the strand.
 */
class TimerService {
  public:
    using FireHandler = std::function<void(TimerKind kind)>;

    TimerService(const Strand& strand, FireHandler handler);
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    TimerService(TimerService&&) = delete;
    TimerService& operator=(TimerService&&) = delete;

    /**
     * Arms the timer of given kind, replacing any pending firing of that kind.
     * @param kind The kind of timer.
     * @param duration Time until the (first) firing. Also the period for recurring timers.
     * @param recurring When true the timer keeps firing every duration until cancelled or re-armed.
     * @return A handle identifying this arming.
     */
    TimerHandle arm(TimerKind kind, std::chrono::nanoseconds duration, bool recurring);

    /**
     * Cancels the arming identified by handle. Cancelling a handle which has been superseded by a later arm, or which
     * already fired, is a no-op.
     * @param handle The handle returned by arm().
     * @return An error if the handle was never issued by this service.
     */
    tl::expected<void, TimerError> cancel(const TimerHandle& handle);

    /**
     * Cancels whatever is pending for given kind.
     * @param kind The kind of timer.
     */
    void cancel(TimerKind kind);

    /**
     * Cancels all timers.
     */
    void cancel_all();

    /**
     * @param kind The kind of timer.
     * @return True if a firing of given kind is pending.
     */
    [[nodiscard]] bool is_pending(TimerKind kind) const;

    /**
     * @param kind The kind of timer.
     * @return The duration of the latest arming of given kind, or zero if never armed.
     */
    [[nodiscard]] std::chrono::nanoseconds get_duration(TimerKind kind) const;

  private:
    struct Slot {
        explicit Slot(const Strand& strand) : timer(strand) {}

        boost::asio::steady_timer timer;
        uint64_t generation {};
        bool pending {};
        bool recurring {};
        std::chrono::nanoseconds duration {};
    };

    struct Shared {
        explicit Shared(const Strand& strand, FireHandler fire_handler);

        std::array<std::unique_ptr<Slot>, k_num_timer_kinds> slots;
        FireHandler handler;
    };

    std::shared_ptr<Shared> shared_;

    static void wait(const std::shared_ptr<Shared>& shared, TimerKind kind, uint64_t generation);
};

}  // namespace tempo::ptp
