/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/mock/ptp_mock_transport.hpp"

#include "tempokit/core/chrono/high_resolution_clock.hpp"

#include <boost/asio/post.hpp>

/**
 * The receiving side of one transport. Only touched on the transport's strand, except for the strand itself.
 */
struct tempo::ptp::MockTransport::Control::Endpoint {
    explicit Endpoint(const Strand& s) : strand(s) {}

    Strand strand;
    PortIdentity port;
    ReceiveHandler handler;
    bool open {true};
};

tempo::ptp::TransportOpener tempo::ptp::MockTransport::Control::opener() {
    return [control = shared_from_this()](const Strand& strand, const PortIdentity& port)
               -> tl::expected<std::unique_ptr<Transport>, TransportError> {
        {
            std::lock_guard lock(control->mutex_);
            control->num_open_attempts_++;
            if (control->fail_all_opens_) {
                return tl::unexpected(TransportError::bind_failed);
            }
            if (!control->open_failures_.empty()) {
                const auto error = control->open_failures_.front();
                control->open_failures_.pop_front();
                return tl::unexpected(error);
            }
        }
        return std::make_unique<MockTransport>(control, strand, port);
    };
}

void tempo::ptp::MockTransport::Control::fail_opens(const size_t count, const TransportError error) {
    std::lock_guard lock(mutex_);
    for (size_t i = 0; i < count; ++i) {
        open_failures_.push_back(error);
    }
}

void tempo::ptp::MockTransport::Control::fail_all_opens(const bool fail) {
    std::lock_guard lock(mutex_);
    fail_all_opens_ = fail;
}

void tempo::ptp::MockTransport::Control::fail_sends(const std::optional<TransportError> error) {
    std::lock_guard lock(mutex_);
    send_error_ = error;
}

bool tempo::ptp::MockTransport::Control::deliver(
    const MessageClass message_class, std::vector<uint8_t> data, const CapturedTimestamp timestamp
) {
    std::shared_ptr<Endpoint> endpoint;
    {
        std::lock_guard lock(mutex_);
        endpoint = active_.lock();
    }
    if (endpoint == nullptr) {
        return false;
    }

    TimestampedPacket packet;
    packet.message_class = message_class;
    packet.data = std::move(data);
    packet.timestamp = timestamp;
    packet.direction = Direction::inbound;

    boost::asio::post(endpoint->strand, [endpoint, packet = std::move(packet)]() mutable {
        if (!endpoint->open || endpoint->handler == nullptr) {
            return;
        }
        packet.port = endpoint->port;
        endpoint->handler(std::move(packet));
    });
    return true;
}

bool tempo::ptp::MockTransport::Control::deliver_error(const TransportError error) {
    std::shared_ptr<Endpoint> endpoint;
    {
        std::lock_guard lock(mutex_);
        endpoint = active_.lock();
    }
    if (endpoint == nullptr) {
        return false;
    }

    boost::asio::post(endpoint->strand, [endpoint, error] {
        if (!endpoint->open || endpoint->handler == nullptr) {
            return;
        }
        auto handler = std::move(endpoint->handler);
        endpoint->handler = nullptr;
        handler(tl::unexpected(error));
    });
    return true;
}

std::vector<tempo::ptp::MockTransport::SentPacket> tempo::ptp::MockTransport::Control::get_sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
}

size_t tempo::ptp::MockTransport::Control::num_open() const {
    std::lock_guard lock(mutex_);
    return num_open_;
}

size_t tempo::ptp::MockTransport::Control::num_opened() const {
    std::lock_guard lock(mutex_);
    return num_opened_;
}

size_t tempo::ptp::MockTransport::Control::num_open_attempts() const {
    std::lock_guard lock(mutex_);
    return num_open_attempts_;
}

void tempo::ptp::MockTransport::Control::set_timestamp_source(const TimestampSource source) {
    std::lock_guard lock(mutex_);
    timestamp_source_ = source;
}

tempo::ptp::MockTransport::MockTransport(
    std::shared_ptr<Control> control, const Strand& strand, const PortIdentity& port
) :
    control_(std::move(control)), endpoint_(std::make_shared<Control::Endpoint>(strand)) {
    endpoint_->port = port;

    std::lock_guard lock(control_->mutex_);
    control_->active_ = endpoint_;
    control_->num_open_++;
    control_->num_opened_++;
    timestamp_source_ = control_->timestamp_source_;
}

tempo::ptp::MockTransport::~MockTransport() {
    close();
}

void tempo::ptp::MockTransport::start(ReceiveHandler handler) {
    endpoint_->handler = std::move(handler);
}

void tempo::ptp::MockTransport::async_send(
    const MessageClass message_class, std::vector<uint8_t> data, SendHandler handler
) {
    std::optional<TransportError> error;
    {
        std::lock_guard lock(control_->mutex_);
        if (!endpoint_->open) {
            error = TransportError::closed;
        } else {
            error = control_->send_error_;
            control_->sent_.push_back({endpoint_->port, message_class, std::move(data)});
        }
    }

    SendResult result = error ? SendResult(tl::unexpected(*error))
                              : SendResult(CapturedTimestamp {
                                    Timestamp::from_nanoseconds(HighResolutionClock::now_realtime()), timestamp_source_
                                });

    boost::asio::post(endpoint_->strand, [handler = std::move(handler), result] {
        handler(result);
    });
}

void tempo::ptp::MockTransport::close() {
    std::lock_guard lock(control_->mutex_);
    if (!endpoint_->open) {
        return;
    }
    endpoint_->open = false;
    endpoint_->handler = nullptr;
    control_->num_open_--;
}

tempo::ptp::TimestampSource tempo::ptp::MockTransport::timestamp_source() const {
    return timestamp_source_;
}
