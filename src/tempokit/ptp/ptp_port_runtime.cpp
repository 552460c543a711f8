/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_port_runtime.hpp"

#include "tempokit/core/chrono/high_resolution_clock.hpp"
#include "tempokit/core/exception.hpp"
#include "tempokit/core/log.hpp"
#include "tempokit/core/sync/snapshot_cell.hpp"
#include "tempokit/core/tracy.hpp"
#include "tempokit/core/util/overloaded.hpp"
#include "tempokit/ptp/ptp_timer_service.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>

class tempo::ptp::PortRuntime::Impl: public std::enable_shared_from_this<Impl> {
  public:
    Impl(
        boost::asio::io_context& io_context, const PortIdentity& identity, std::string interface_name,
        std::unique_ptr<Engine> engine, TransportOpener opener, ClockSteeringAdapter& adapter,
        const RecoveryConfig& recovery
    );

    std::future<tl::expected<void, TransportError>> start();
    std::future<void> stop();
    void restart();
    void post_control(ControlCommand command);

    SnapshotCell<PortState> state;

  private:
    Strand strand_;
    PortIdentity identity_;
    std::string interface_name_;
    std::unique_ptr<Engine> engine_;
    TransportOpener opener_;
    ClockSteeringAdapter& adapter_;
    RecoveryConfig recovery_;
    TimerService timers_;
    boost::asio::steady_timer reopen_timer_;

    std::unique_ptr<Transport> transport_;
    uint64_t transport_generation_ {};
    uint32_t consecutive_failures_ {};
    bool primary_ {};
    bool initialized_ {};
    bool faulty_ {};
    bool stopped_ {};

    tl::expected<void, TransportError> open_transport();
    void close_transport();
    void on_receive(uint64_t generation, Transport::ReceiveResult result);
    void handle_transport_failure(TransportError error);
    void schedule_reopen();
    void enter_faulty();
    void initialize_engine();
    void process(const Event& event);
    void apply(Action& action);
    void transmit(TransmitAction& action);
    void report_primary();
};

tempo::ptp::PortRuntime::Impl::Impl(
    boost::asio::io_context& io_context, const PortIdentity& identity, std::string interface_name,
    std::unique_ptr<Engine> engine, TransportOpener opener, ClockSteeringAdapter& adapter,
    const RecoveryConfig& recovery
) :
    strand_(boost::asio::make_strand(io_context)),
    identity_(identity),
    interface_name_(std::move(interface_name)),
    engine_(std::move(engine)),
    opener_(std::move(opener)),
    adapter_(adapter),
    recovery_(recovery),
    // The timer service lives as long as this object and never calls back after its destruction.
    timers_(
        strand_,
        [this](const TimerKind kind) {
            process(TimerExpiredEvent {kind});
        }
    ),
    reopen_timer_(strand_) {
    state.update([this](PortState& s) {
        s.identity = identity_;
        s.interface_name = interface_name_;
    });
}

std::future<tl::expected<void, tempo::ptp::TransportError>> tempo::ptp::PortRuntime::Impl::start() {
    auto promise = std::make_shared<std::promise<tl::expected<void, TransportError>>>();
    auto future = promise->get_future();

    boost::asio::post(strand_, [self = shared_from_this(), promise] {
        if (self->stopped_) {
            promise->set_value(tl::unexpected(TransportError::closed));
            return;
        }

        auto result = self->open_transport();
        if (result) {
            self->initialize_engine();
        } else {
            self->handle_transport_failure(result.error());
        }
        promise->set_value(result);
    });

    return future;
}

std::future<void> tempo::ptp::PortRuntime::Impl::stop() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    boost::asio::post(strand_, [self = shared_from_this(), promise] {
        if (!self->stopped_) {
            self->stopped_ = true;
            self->reopen_timer_.cancel();
            self->timers_.cancel_all();
            self->close_transport();
            self->report_primary();
            self->adapter_.unregister_port(self->identity_);
            TEMPO_DEBUG("Port {} stopped", self->identity_.to_string());
        }
        promise->set_value();
    });

    return future;
}

void tempo::ptp::PortRuntime::Impl::restart() {
    boost::asio::post(strand_, [self = shared_from_this()] {
        if (self->stopped_) {
            return;
        }

        TEMPO_INFO("Restarting port {}", self->identity_.to_string());

        self->faulty_ = false;
        self->consecutive_failures_ = 0;
        self->reopen_timer_.cancel();
        self->timers_.cancel_all();
        self->close_transport();
        self->state.update([](PortState& s) {
            s.state = State::initializing;
            s.offset.reset();
        });

        self->initialized_ = false;

        auto result = self->open_transport();
        if (result) {
            self->initialize_engine();
        } else {
            self->handle_transport_failure(result.error());
        }
    });
}

void tempo::ptp::PortRuntime::Impl::post_control(const ControlCommand command) {
    boost::asio::post(strand_, [weak = weak_from_this(), command] {
        if (auto self = weak.lock()) {
            self->process(ControlEvent {command});
        }
    });
}

tl::expected<void, tempo::ptp::TransportError> tempo::ptp::PortRuntime::Impl::open_transport() {
    auto transport = opener_(strand_, identity_);
    if (!transport) {
        TEMPO_ERROR(
            "Failed to open transport for port {} on {}: {}", identity_.to_string(), interface_name_,
            to_string(transport.error())
        );
        return tl::unexpected(transport.error());
    }

    transport_ = std::move(transport.value());
    const auto generation = ++transport_generation_;

    state.update([source = transport_->timestamp_source()](PortState& s) {
        s.timestamping = source;
    });

    transport_->start([weak = weak_from_this(), generation](Transport::ReceiveResult result) {
        if (auto self = weak.lock()) {
            self->on_receive(generation, std::move(result));
        }
    });

    return {};
}

void tempo::ptp::PortRuntime::Impl::close_transport() {
    if (transport_ == nullptr) {
        return;
    }
    transport_->close();
    transport_.reset();
}

void tempo::ptp::PortRuntime::Impl::on_receive(const uint64_t generation, Transport::ReceiveResult result) {
    if (generation != transport_generation_ || transport_ == nullptr) {
        return;  // Belongs to a transport which has been replaced.
    }

    if (stopped_ || faulty_) {
        return;
    }

    if (!result) {
        handle_transport_failure(result.error());
        return;
    }

    consecutive_failures_ = 0;
    process(PacketReceivedEvent {std::move(result.value())});
}

void tempo::ptp::PortRuntime::Impl::handle_transport_failure(const TransportError error) {
    close_transport();
    consecutive_failures_++;
    state.update([](PortState& s) {
        s.transport_failures++;
    });

    if (consecutive_failures_ > recovery_.max_attempts) {
        enter_faulty();
        return;
    }

    TEMPO_WARNING(
        "Transport of port {} failed: {} (attempt {} of {})", identity_.to_string(), to_string(error),
        consecutive_failures_, recovery_.max_attempts
    );
    schedule_reopen();
}

void tempo::ptp::PortRuntime::Impl::schedule_reopen() {
    auto backoff = recovery_.initial_backoff;
    for (uint32_t i = 1; i < consecutive_failures_ && backoff < recovery_.max_backoff; ++i) {
        backoff *= 2;
    }
    backoff = std::min(backoff, recovery_.max_backoff);

    TEMPO_DEBUG("Reopening transport of port {} in {} ms", identity_.to_string(), backoff.count());

    reopen_timer_.expires_after(backoff);
    reopen_timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        auto self = weak.lock();
        if (self == nullptr || self->stopped_ || self->faulty_) {
            return;
        }

        if (auto result = self->open_transport(); !result) {
            self->handle_transport_failure(result.error());
            return;
        }

        TEMPO_INFO("Transport of port {} reopened", self->identity_.to_string());
        self->consecutive_failures_ = 0;

        // The first open of the port failed.
        if (!self->initialized_) {
            self->initialize_engine();
        }
    });
}

void tempo::ptp::PortRuntime::Impl::enter_faulty() {
    TEMPO_ERROR(
        "Port {} on {} is FAULTY after {} consecutive transport failures", identity_.to_string(), interface_name_,
        consecutive_failures_
    );

    faulty_ = true;
    reopen_timer_.cancel();
    timers_.cancel_all();
    close_transport();

    state.update([](PortState& s) {
        s.state = State::faulty;
        s.offset.reset();
        s.last_update = Timestamp::from_nanoseconds(HighResolutionClock::now_realtime());
    });

    report_primary();
}

void tempo::ptp::PortRuntime::Impl::initialize_engine() {
    initialized_ = true;
    process(ControlEvent {ControlCommand::initialize});
}

void tempo::ptp::PortRuntime::Impl::process(const Event& event) {
    TRACY_ZONE_SCOPED;

    if (stopped_ || faulty_) {
        return;
    }

    auto actions = engine_->handle_event(event);
    for (auto& action : actions) {
        apply(action);
    }

    state.update([](PortState& s) {
        s.last_update = Timestamp::from_nanoseconds(HighResolutionClock::now_realtime());
    });

    report_primary();
}

void tempo::ptp::PortRuntime::Impl::apply(Action& action) {
    std::visit(
        Overloaded {
            [this](TransmitAction& a) {
                transmit(a);
            },
            [this](const ArmTimerAction& a) {
                timers_.arm(a.kind, a.duration, a.recurring);
            },
            [this](const CancelTimerAction& a) {
                timers_.cancel(a.kind);
            },
            [this](const CorrectionAction& a) {
                // A claim made by this same event must reach the adapter before the correction does.
                report_primary();
                adapter_.submit(a.correction);
                state.update([&a](PortState& s) {
                    s.offset = a.correction.offset;
                });
            },
            [this](const StateChangedAction& a) {
                state.update([&a](PortState& s) {
                    s.state = a.state;
                });
                report_primary();
            },
        },
        action
    );
}

void tempo::ptp::PortRuntime::Impl::transmit(TransmitAction& action) {
    const auto message_class = action.message_class;
    const auto context = action.context;

    if (transport_ == nullptr) {
        // Completion is delivered as a separate event, never from inside the current one.
        boost::asio::post(strand_, [weak = weak_from_this(), context, message_class] {
            if (auto self = weak.lock()) {
                self->process(TransmitFailedEvent {context, message_class, TransportError::closed});
            }
        });
        return;
    }

    transport_->async_send(
        message_class, std::move(action.data),
        [weak = weak_from_this(), context, message_class](Transport::SendResult result) {
            auto self = weak.lock();
            if (self == nullptr) {
                return;
            }

            if (!result) {
                TEMPO_DEBUG(
                    "Transmit of {} message on port {} failed: {}", to_string(message_class),
                    self->identity_.to_string(), to_string(result.error())
                );
                self->process(TransmitFailedEvent {context, message_class, result.error()});
                return;
            }

            if (context) {
                self->process(TransmitTimestampEvent {*context, *result});
            }
        }
    );
}

void tempo::ptp::PortRuntime::Impl::report_primary() {
    const bool primary = !stopped_ && !faulty_ && engine_->is_primary();
    if (primary == primary_) {
        return;
    }

    primary_ = primary;
    adapter_.set_primary(identity_, primary);
    state.update([primary](PortState& s) {
        s.primary = primary;
    });
}

tempo::ptp::PortRuntime::PortRuntime(
    boost::asio::io_context& io_context, const PortIdentity& identity, std::string interface_name,
    std::unique_ptr<Engine> engine, TransportOpener opener, ClockSteeringAdapter& adapter, RecoveryConfig recovery
) :
    identity_(identity) {
    if (engine == nullptr) {
        TEMPO_THROW_EXCEPTION("Port runtime needs an engine");
    }
    if (opener == nullptr) {
        TEMPO_THROW_EXCEPTION("Port runtime needs a transport opener");
    }

    impl_ = std::make_shared<Impl>(
        io_context, identity, std::move(interface_name), std::move(engine), std::move(opener), adapter, recovery
    );
    adapter.register_port(identity);
}

tempo::ptp::PortRuntime::~PortRuntime() = default;

std::future<tl::expected<void, tempo::ptp::TransportError>> tempo::ptp::PortRuntime::start() {
    return impl_->start();
}

std::future<void> tempo::ptp::PortRuntime::stop() {
    return impl_->stop();
}

void tempo::ptp::PortRuntime::restart() {
    impl_->restart();
}

void tempo::ptp::PortRuntime::post_control(const ControlCommand command) {
    impl_->post_control(command);
}

const tempo::ptp::PortIdentity& tempo::ptp::PortRuntime::get_identity() const {
    return identity_;
}

tempo::ptp::PortState tempo::ptp::PortRuntime::get_state() const {
    return impl_->state.load();
}

std::optional<tempo::ptp::PortState>
tempo::ptp::PortRuntime::try_get_state(const std::chrono::milliseconds timeout) const {
    return impl_->state.try_load_for(timeout);
}
