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

#include "ptp_transport.hpp"

#include <boost/asio/ip/udp.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tempo::ptp {

/**
 * A UDP socket joined to a multicast group which captures a timestamp for every datagram it receives, and optionally
 * recovers the transmit timestamp of every datagram it sends from the socket error queue.
 */
class TimestampedSocket {
  public:
    struct Config {
        std::string interface_name;
        boost::asio::ip::address_v4 interface_address;
        boost::asio::ip::address_v4 multicast_address;
        uint16_t port {};
        /// The best source to try. Falls back to lesser sources unless require_requested_source is set.
        TimestampSource requested_source {TimestampSource::software};
        bool require_requested_source {};
        /// Recover transmit timestamps for sent datagrams.
        bool transmit_timestamps {};
        int dscp {46};
        int tx_timestamp_poll_attempts {6};
        std::chrono::microseconds tx_timestamp_poll_interval {1000};
    };

    struct Datagram {
        std::vector<uint8_t> data;
        CapturedTimestamp timestamp;
    };

    using ReceiveHandler = std::function<void(tl::expected<Datagram, TransportError> result)>;
    using SendHandler = std::function<void(tl::expected<CapturedTimestamp, TransportError> result)>;

    ~TimestampedSocket();

    TimestampedSocket(const TimestampedSocket&) = delete;
    TimestampedSocket& operator=(const TimestampedSocket&) = delete;

    TimestampedSocket(TimestampedSocket&&) = delete;
    TimestampedSocket& operator=(TimestampedSocket&&) = delete;

    /**
     * Opens, binds and configures the socket.
     * @param strand The executor for all handlers.
     * @param config The configuration.
     * @return The socket, or an error if it could not be set up.
     */
    static tl::expected<std::unique_ptr<TimestampedSocket>, TransportError>
    open(const Strand& strand, const Config& config);

    /**
     * Starts receiving. Delivers every datagram to the handler until an error is delivered or the socket is closed.
     * @param handler The handler.
     */
    void start(ReceiveHandler handler);

    /**
     * Sends a datagram to the multicast group.
     * @param data The datagram.
     * @param handler Receives the transmit timestamp, or the send time when transmit timestamps are not enabled.
     */
    void async_send(std::vector<uint8_t> data, SendHandler handler);

    /**
     * Closes the socket. Pending sends complete with TransportError::closed.
     */
    void close();

    /**
     * @return The timestamp source which could be enabled on the socket.
     */
    [[nodiscard]] TimestampSource timestamp_source() const;

    /**
     * @param msg_flags The flags recvmsg returned for a received datagram.
     * @return True if the payload or the control data of the datagram was cut off. Such datagrams are dropped.
     */
    [[nodiscard]] static bool is_truncated(int msg_flags);

  private:
    class Impl;
    std::shared_ptr<Impl> impl_;

    explicit TimestampedSocket(std::shared_ptr<Impl> impl);
};

}  // namespace tempo::ptp
