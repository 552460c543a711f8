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

#include "tempokit/core/expected.hpp"
#include "tempokit/ptp/ptp_definitions.hpp"
#include "tempokit/ptp/ptp_error.hpp"
#include "tempokit/ptp/types/ptp_port_identity.hpp"
#include "tempokit/ptp/types/ptp_timestamp.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace tempo::ptp {

/// The executor every per-port component runs on.
using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

enum class Direction : uint8_t { inbound, outbound };

/**
 * A datagram together with the moment it passed the network interface. Belongs to exactly one port.
 */
struct TimestampedPacket {
    PortIdentity port;
    MessageClass message_class {MessageClass::general};
    std::vector<uint8_t> data;
    CapturedTimestamp timestamp;
    Direction direction {Direction::inbound};
};

/**
 * Settings for opening a transport.
 */
struct TransportConfig {
    constexpr static int k_max_tx_timestamp_poll_attempts = 10;

    /// Try to enable hardware timestamping on the interface, falling back to software timestamps.
    bool prefer_hardware_timestamping {true};
    /// Fail opening when hardware timestamping cannot be enabled.
    bool require_hardware_timestamping {false};
    /// DSCP value for outgoing packets. 46 (EF) is the AES67 default.
    int dscp {46};
    boost::asio::ip::address_v4 multicast_address {boost::asio::ip::make_address_v4("224.0.1.129")};
    uint16_t event_port {319};
    uint16_t general_port {320};
    /// Number of times the error queue is polled for a transmit timestamp before giving up.
    int tx_timestamp_poll_attempts {6};
    /// Wait before the first poll. Doubles on every attempt.
    std::chrono::microseconds tx_timestamp_poll_interval {1000};
};

/**
 * Timestamped PTP packet I/O for one port. Handlers are invoked on the executor the transport was opened with, never
 * from within the calling function. Not thread safe, use from that executor only.
 */
class Transport {
  public:
    using ReceiveResult = tl::expected<TimestampedPacket, TransportError>;
    using ReceiveHandler = std::function<void(ReceiveResult)>;
    using SendResult = tl::expected<CapturedTimestamp, TransportError>;
    using SendHandler = std::function<void(SendResult)>;

    virtual ~Transport() = default;

    /**
     * Starts receiving. The handler is called for every datagram. After the handler received an error, receiving has
     * stopped and the transport should be closed.
     * @param handler The handler to call.
     */
    virtual void start(ReceiveHandler handler) = 0;

    /**
     * Sends a message. For event messages the handler receives the transmit timestamp recovered from the OS, for
     * general messages the time at which the send call returned.
     * @param message_class Decides the destination port.
     * @param data The message.
     * @param handler Called exactly once with the outcome.
     */
    virtual void async_send(MessageClass message_class, std::vector<uint8_t> data, SendHandler handler) = 0;

    /**
     * Closes the sockets. Pending and later sends complete with TransportError::closed. Idempotent.
     */
    virtual void close() = 0;

    /**
     * @return The best timestamp source this transport can offer.
     */
    [[nodiscard]] virtual TimestampSource timestamp_source() const = 0;
};

/**
 * Opens a transport for a port. Called on the port's executor, for the initial open and for every reopen.
 */
using TransportOpener =
    std::function<tl::expected<std::unique_ptr<Transport>, TransportError>(const Strand& strand, const PortIdentity& port)>;

}  // namespace tempo::ptp
