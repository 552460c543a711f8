/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/transport/ptp_udp_transport.hpp"

#include "tempokit/core/log.hpp"
#include "tempokit/core/net/network_interface.hpp"

#include <algorithm>

/**
 * Shared by the receive handlers of both sockets, so that only the first error reaches the user handler.
 */
struct tempo::ptp::UdpTransport::Receiver {
    PortIdentity port;
    ReceiveHandler handler;

    void deliver(const MessageClass message_class, tl::expected<TimestampedSocket::Datagram, TransportError> result) {
        if (handler == nullptr) {
            return;
        }

        if (!result) {
            auto h = std::move(handler);
            handler = nullptr;
            h(tl::unexpected(result.error()));
            return;
        }

        TimestampedPacket packet;
        packet.port = port;
        packet.message_class = message_class;
        packet.data = std::move(result->data);
        packet.timestamp = result->timestamp;
        packet.direction = Direction::inbound;
        handler(std::move(packet));
    }
};

tempo::ptp::UdpTransport::UdpTransport(
    const PortIdentity& port, std::unique_ptr<TimestampedSocket> event_socket,
    std::unique_ptr<TimestampedSocket> general_socket
) :
    port_(port),
    event_socket_(std::move(event_socket)),
    general_socket_(std::move(general_socket)),
    receiver_(std::make_shared<Receiver>()) {
    receiver_->port = port_;
}

tempo::ptp::UdpTransport::~UdpTransport() {
    close();
}

tl::expected<std::unique_ptr<tempo::ptp::UdpTransport>, tempo::ptp::TransportError> tempo::ptp::UdpTransport::open(
    const Strand& strand, const PortIdentity& port, const std::string& interface_name, const TransportConfig& config
) {
    const auto interfaces = NetworkInterfaceList::get_system_interfaces();
    const auto* network_interface = interfaces.get_interface(interface_name);
    if (network_interface == nullptr) {
        TEMPO_ERROR("Interface {} not found", interface_name);
        return tl::unexpected(TransportError::interface_not_found);
    }

    const auto& capabilities = network_interface->get_capabilities();
    const auto interface_address = network_interface->get_first_ipv4_address();
    if (interface_address.is_unspecified()) {
        TEMPO_ERROR("Interface {} has no IPv4 address", interface_name);
        return tl::unexpected(TransportError::bind_failed);
    }

    if (!capabilities.multicast) {
        TEMPO_WARNING("Interface {} does not report multicast support", interface_name);
    }

    auto requested = TimestampSource::software;
    if (config.prefer_hardware_timestamping || config.require_hardware_timestamping) {
        if (capabilities.hw_timestamp) {
            requested = TimestampSource::hardware;
        } else if (config.require_hardware_timestamping) {
            TEMPO_ERROR("Interface {} does not support hardware timestamping", interface_name);
            return tl::unexpected(TransportError::timestamping_unsupported);
        }
    }

    TimestampedSocket::Config socket_config;
    socket_config.interface_name = interface_name;
    socket_config.interface_address = interface_address;
    socket_config.multicast_address = config.multicast_address;
    socket_config.dscp = config.dscp;
    socket_config.tx_timestamp_poll_attempts =
        std::clamp(config.tx_timestamp_poll_attempts, 1, TransportConfig::k_max_tx_timestamp_poll_attempts);
    socket_config.tx_timestamp_poll_interval = config.tx_timestamp_poll_interval;

    socket_config.port = config.event_port;
    socket_config.requested_source = requested;
    socket_config.require_requested_source = config.require_hardware_timestamping;
    socket_config.transmit_timestamps = true;
    auto event_socket = TimestampedSocket::open(strand, socket_config);
    if (!event_socket) {
        return tl::unexpected(event_socket.error());
    }

    // Timestamps of general messages carry no timing information.
    socket_config.port = config.general_port;
    socket_config.requested_source = TimestampSource::software;
    socket_config.require_requested_source = false;
    socket_config.transmit_timestamps = false;
    auto general_socket = TimestampedSocket::open(strand, socket_config);
    if (!general_socket) {
        return tl::unexpected(general_socket.error());
    }

    TEMPO_INFO(
        "Opened PTP transport on {} ({}) with {} timestamping", interface_name, interface_address.to_string(),
        to_string((*event_socket)->timestamp_source())
    );

    return std::unique_ptr<UdpTransport>(
        new UdpTransport(port, std::move(event_socket.value()), std::move(general_socket.value()))
    );
}

void tempo::ptp::UdpTransport::start(ReceiveHandler handler) {
    TEMPO_ASSERT_RETURN(receiver_->handler == nullptr, "Transport is already started");
    receiver_->handler = std::move(handler);

    event_socket_->start([receiver = receiver_](tl::expected<TimestampedSocket::Datagram, TransportError> result) {
        receiver->deliver(MessageClass::event, std::move(result));
    });
    general_socket_->start([receiver = receiver_](tl::expected<TimestampedSocket::Datagram, TransportError> result) {
        receiver->deliver(MessageClass::general, std::move(result));
    });
}

void tempo::ptp::UdpTransport::async_send(
    const MessageClass message_class, std::vector<uint8_t> data, SendHandler handler
) {
    auto& socket = message_class == MessageClass::event ? event_socket_ : general_socket_;
    socket->async_send(std::move(data), std::move(handler));
}

void tempo::ptp::UdpTransport::close() {
    receiver_->handler = nullptr;
    event_socket_->close();
    general_socket_->close();
}

tempo::ptp::TimestampSource tempo::ptp::UdpTransport::timestamp_source() const {
    return event_socket_->timestamp_source();
}
