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

#include "ptp_timestamped_socket.hpp"
#include "ptp_transport.hpp"

#include <memory>
#include <string>

namespace tempo::ptp {

/**
 * PTP over UDP/IPv4 (IEEE1588-2019 Annex C) on one network interface: an event socket on port 319 and a general socket
 * on port 320, both joined to the PTP primary multicast group.
 */
class UdpTransport final: public Transport {
  public:
    ~UdpTransport() override;

    /**
     * Opens both sockets on the given interface.
     * @param strand The executor of the port.
     * @param port The port this transport belongs to. Stamped on every received packet.
     * @param interface_name The name of the network interface.
     * @param config The transport configuration.
     * @return The transport or an error.
     */
    static tl::expected<std::unique_ptr<UdpTransport>, TransportError> open(
        const Strand& strand, const PortIdentity& port, const std::string& interface_name, const TransportConfig& config
    );

    void start(ReceiveHandler handler) override;
    void async_send(MessageClass message_class, std::vector<uint8_t> data, SendHandler handler) override;
    void close() override;
    [[nodiscard]] TimestampSource timestamp_source() const override;

  private:
    struct Receiver;

    PortIdentity port_;
    std::unique_ptr<TimestampedSocket> event_socket_;
    std::unique_ptr<TimestampedSocket> general_socket_;
    std::shared_ptr<Receiver> receiver_;

    UdpTransport(
        const PortIdentity& port, std::unique_ptr<TimestampedSocket> event_socket,
        std::unique_ptr<TimestampedSocket> general_socket
    );
};

}  // namespace tempo::ptp
