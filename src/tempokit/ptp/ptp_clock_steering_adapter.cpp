/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_clock_steering_adapter.hpp"

#include "tempokit/core/exception.hpp"
#include "tempokit/core/log.hpp"
#include "tempokit/core/subscriber_list.hpp"
#include "tempokit/core/sync/snapshot_cell.hpp"
#include "tempokit/core/tracy.hpp"
#include "tempokit/core/util/throttle.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>
#include <vector>

class tempo::ptp::ClockSteeringAdapter::Impl: public std::enable_shared_from_this<Impl> {
  public:
    Impl(boost::asio::io_context& io_context, std::unique_ptr<SteerableClock> clock, const SteeringConfig& config);

    uint64_t submit(const ClockCorrection& correction);
    void register_port(const PortIdentity& port);
    void unregister_port(const PortIdentity& port);
    void set_primary(const PortIdentity& port, bool primary);
    void mark_stopped();
    std::future<void> stop();

    SnapshotCell<ClockState> state;
    SubscriberList<Subscriber> subscribers;

  private:
    struct Submission {
        ClockCorrection correction;
        uint64_t sequence {};
        uint64_t epoch {};
        bool requires_primary {};
        bool from_primary {};
    };

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::unique_ptr<SteerableClock> clock_;
    SteeringConfig config_;

    // Guards the submission hand-off and the primary designation.
    std::mutex mutex_;
    uint64_t next_sequence_ {1};
    uint64_t epoch_ {};
    std::optional<PortIdentity> primary_;
    std::set<PortIdentity> ports_;
    // Ports whose engine currently claims primary, oldest claim first.
    std::vector<PortIdentity> claimants_;
    bool stopped_ {};

    // Only accessed on the strand.
    double frequency_ppb_ {};
    double integral_ {};
    std::optional<TimeProperties> time_properties_;
    Throttle log_throttle_ {std::chrono::seconds(1)};

    void apply(const Submission& submission);
    [[nodiscard]] std::optional<DiscardReason> check_discard(const Submission& submission);
    tl::expected<SteeringAction, SteeringError> steer(const ClockCorrection& correction);
    void apply_time_properties(const ClockCorrection& correction);
    void update_stability(const ClockCorrection& correction, SteeringAction action);
    void publish_primary();
    void withdraw_claim(const PortIdentity& port);
    void notify(const std::function<void(Subscriber*)>& f);
};

tempo::ptp::ClockSteeringAdapter::Impl::Impl(
    boost::asio::io_context& io_context, std::unique_ptr<SteerableClock> clock, const SteeringConfig& config
) :
    strand_(boost::asio::make_strand(io_context)), clock_(std::move(clock)), config_(config) {}

uint64_t tempo::ptp::ClockSteeringAdapter::Impl::submit(const ClockCorrection& correction) {
    std::lock_guard lock(mutex_);

    Submission submission;
    submission.correction = correction;
    submission.sequence = next_sequence_++;
    submission.epoch = epoch_;
    submission.requires_primary = ports_.size() > 1;
    submission.from_primary = primary_ == correction.source;

    // Posting inside the critical section keeps the strand order equal to the sequence order.
    boost::asio::post(strand_, [self = shared_from_this(), submission] {
        self->apply(submission);
    });

    return submission.sequence;
}

void tempo::ptp::ClockSteeringAdapter::Impl::register_port(const PortIdentity& port) {
    std::lock_guard lock(mutex_);
    ports_.insert(port);
}

void tempo::ptp::ClockSteeringAdapter::Impl::unregister_port(const PortIdentity& port) {
    std::lock_guard lock(mutex_);
    ports_.erase(port);
    withdraw_claim(port);
}

void tempo::ptp::ClockSteeringAdapter::Impl::set_primary(const PortIdentity& port, const bool primary) {
    std::lock_guard lock(mutex_);

    if (!primary) {
        withdraw_claim(port);
        return;
    }

    if (std::find(claimants_.begin(), claimants_.end(), port) == claimants_.end()) {
        claimants_.push_back(port);
    }
    if (primary_ == port) {
        return;
    }

    // The latest claim takes over.
    primary_ = port;
    epoch_++;
    TEMPO_INFO("Primary port is now {} (epoch {})", primary_->to_string(), epoch_);
    publish_primary();
}

void tempo::ptp::ClockSteeringAdapter::Impl::withdraw_claim(const PortIdentity& port) {
    claimants_.erase(std::remove(claimants_.begin(), claimants_.end(), port), claimants_.end());
    if (primary_ != port) {
        return;
    }

    // Hand over to the most recent claim still standing, if any.
    if (claimants_.empty()) {
        primary_.reset();
    } else {
        primary_ = claimants_.back();
    }

    epoch_++;
    TEMPO_INFO(
        "Primary port is now {} (epoch {})", primary_ ? primary_->to_string() : std::string("none"), epoch_
    );
    publish_primary();
}

void tempo::ptp::ClockSteeringAdapter::Impl::mark_stopped() {
    std::lock_guard lock(mutex_);
    stopped_ = true;
}

std::future<void> tempo::ptp::ClockSteeringAdapter::Impl::stop() {
    mark_stopped();

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    boost::asio::post(strand_, [promise] {
        promise->set_value();
    });
    return future;
}

void tempo::ptp::ClockSteeringAdapter::Impl::apply(const Submission& submission) {
    TRACY_ZONE_SCOPED;

    const auto& correction = submission.correction;

    if (const auto reason = check_discard(submission)) {
        TEMPO_TRACE(
            "Discarding correction {} from {}: {}", submission.sequence, correction.source.to_string(),
            to_string(*reason)
        );
        state.update([](ClockState& s) {
            s.discarded++;
        });
        notify([&](Subscriber* subscriber) {
            subscriber->on_correction_discarded(correction, *reason, submission.sequence);
        });
        return;
    }

    const auto result = steer(correction);
    if (!result) {
        TEMPO_WARNING(
            "Clock {} rejected correction of {} ns: {}", clock_->name(), correction.offset.count(),
            to_string(result.error())
        );
        state.update([](ClockState& s) {
            s.rejected++;
            if (!s.degraded) {
                TEMPO_WARNING("Clock synchronization degraded");
            }
            s.degraded = true;
            s.stable = false;
        });
        notify([&](Subscriber* subscriber) {
            subscriber->on_correction_rejected(correction, result.error(), submission.sequence);
        });
        return;
    }

    apply_time_properties(correction);
    update_stability(correction, *result);

    notify([&](Subscriber* subscriber) {
        subscriber->on_correction_applied(correction, *result, submission.sequence);
    });
}

std::optional<tempo::ptp::DiscardReason>
tempo::ptp::ClockSteeringAdapter::Impl::check_discard(const Submission& submission) {
    std::lock_guard lock(mutex_);

    if (stopped_) {
        return DiscardReason::stopped;
    }

    if (!submission.requires_primary) {
        return std::nullopt;
    }

    if (!submission.from_primary) {
        return DiscardReason::not_primary;
    }

    if (submission.epoch != epoch_) {
        return DiscardReason::stale_epoch;
    }

    return std::nullopt;
}

tl::expected<tempo::ptp::SteeringAction, tempo::ptp::SteeringError>
tempo::ptp::ClockSteeringAdapter::Impl::steer(const ClockCorrection& correction) {
    const auto offset = correction.offset;

    if (std::chrono::abs(offset) > config_.step_threshold) {
        auto result = clock_->step(-offset);
        if (!result) {
            return tl::unexpected(result.error());
        }
        integral_ = 0.0;
        TEMPO_INFO("Stepped clock {} by {} ns", clock_->name(), -offset.count());
        return SteeringAction::step;
    }

    const auto offset_ns = static_cast<double>(offset.count());
    double target_ppb {};
    if (correction.frequency_ppb) {
        target_ppb = *correction.frequency_ppb;
    } else {
        integral_ += offset_ns;
        // Anti windup: the integral term alone never exceeds the frequency range.
        if (config_.ki > 0.0) {
            const auto max_integral = config_.max_frequency_ppb / config_.ki;
            integral_ = std::clamp(integral_, -max_integral, max_integral);
        }
        target_ppb = -(config_.kp * offset_ns + config_.ki * integral_);
    }

    const auto change = std::clamp(target_ppb - frequency_ppb_, -config_.max_slew_step_ppb, config_.max_slew_step_ppb);
    const auto new_frequency =
        std::clamp(frequency_ppb_ + change, -config_.max_frequency_ppb, config_.max_frequency_ppb);

    auto result = clock_->set_frequency(new_frequency);
    if (!result) {
        return tl::unexpected(result.error());
    }

    frequency_ppb_ = new_frequency;
    TRACY_PLOT("Clock frequency (ppb)", frequency_ppb_);

    if (log_throttle_.update()) {
        TEMPO_DEBUG(
            "Clock {}: offset={} ns frequency={:.3f} ppb", clock_->name(), offset.count(), frequency_ppb_
        );
    }

    return SteeringAction::slew;
}

void tempo::ptp::ClockSteeringAdapter::Impl::apply_time_properties(const ClockCorrection& correction) {
    if (!correction.time_properties || correction.time_properties == time_properties_) {
        return;
    }

    if (auto result = clock_->set_time_properties(*correction.time_properties); !result) {
        TEMPO_WARNING("Failed to set time properties on {}: {}", clock_->name(), to_string(result.error()));
        return;
    }

    time_properties_ = correction.time_properties;
    TEMPO_DEBUG(
        "Time properties updated: utc_offset={} valid={} leap59={} leap61={}", time_properties_->current_utc_offset,
        time_properties_->current_utc_offset_valid, time_properties_->leap59, time_properties_->leap61
    );
}

void tempo::ptp::ClockSteeringAdapter::Impl::update_stability(
    const ClockCorrection& correction, const SteeringAction action
) {
    const auto stable = std::chrono::abs(correction.offset) <= config_.stability_tolerance;
    const auto now = clock_->now();

    state.update([&](ClockState& s) {
        s.last_correction = correction;
        s.frequency_ppb = frequency_ppb_;
        s.stable = stable;
        s.last_update = now;
        if (action == SteeringAction::step) {
            s.steps++;
        } else {
            s.slews++;
        }

        if (stable) {
            s.consecutive_unstable = 0;
            if (s.degraded) {
                TEMPO_INFO("Clock synchronization recovered");
            }
            s.degraded = false;
            return;
        }

        s.consecutive_unstable++;
        if (s.consecutive_unstable >= config_.unstable_limit && !s.degraded) {
            TEMPO_WARNING(
                "Clock synchronization degraded: {} consecutive corrections outside {} ns", s.consecutive_unstable,
                config_.stability_tolerance.count()
            );
            s.degraded = true;
        }
    });
}

void tempo::ptp::ClockSteeringAdapter::Impl::publish_primary() {
    state.update([this](ClockState& s) {
        s.primary = primary_;
        s.primary_epoch = epoch_;
    });
}

void tempo::ptp::ClockSteeringAdapter::Impl::notify(const std::function<void(Subscriber*)>& f) {
    subscribers.foreach(f);
}

tempo::ptp::ClockSteeringAdapter::ClockSteeringAdapter(
    boost::asio::io_context& io_context, std::unique_ptr<SteerableClock> clock, SteeringConfig config
) {
    if (clock == nullptr) {
        TEMPO_THROW_EXCEPTION("Clock steering adapter needs a clock");
    }
    TEMPO_INFO("Steering clock {}", clock->name());
    impl_ = std::make_shared<Impl>(io_context, std::move(clock), config);
}

tempo::ptp::ClockSteeringAdapter::~ClockSteeringAdapter() {
    impl_->mark_stopped();
}

uint64_t tempo::ptp::ClockSteeringAdapter::submit(const ClockCorrection& correction) {
    return impl_->submit(correction);
}

void tempo::ptp::ClockSteeringAdapter::register_port(const PortIdentity& port) {
    impl_->register_port(port);
}

void tempo::ptp::ClockSteeringAdapter::unregister_port(const PortIdentity& port) {
    impl_->unregister_port(port);
}

void tempo::ptp::ClockSteeringAdapter::set_primary(const PortIdentity& port, const bool primary) {
    impl_->set_primary(port, primary);
}

tempo::ptp::ClockState tempo::ptp::ClockSteeringAdapter::get_state() const {
    return impl_->state.load();
}

std::optional<tempo::ptp::ClockState>
tempo::ptp::ClockSteeringAdapter::try_get_state(const std::chrono::milliseconds timeout) const {
    return impl_->state.try_load_for(timeout);
}

bool tempo::ptp::ClockSteeringAdapter::subscribe(Subscriber* subscriber) {
    return impl_->subscribers.add(subscriber);
}

bool tempo::ptp::ClockSteeringAdapter::unsubscribe(const Subscriber* subscriber) {
    return impl_->subscribers.remove(subscriber);
}

std::future<void> tempo::ptp::ClockSteeringAdapter::stop() {
    return impl_->stop();
}
