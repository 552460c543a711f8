/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/transport/ptp_timestamped_socket.hpp"

#include "tempokit/core/chrono/high_resolution_clock.hpp"
#include "tempokit/core/log.hpp"
#include "tempokit/core/tracy.hpp"

#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <map>
#include <optional>

#include <linux/errqueue.h>
#include <linux/net_tstamp.h>
#include <linux/sockios.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>

namespace {

constexpr size_t k_max_datagram_size = 1500;
constexpr size_t k_max_stored_tx_timestamps = 64;
constexpr int k_max_reads_per_wakeup = 10;
constexpr int k_max_error_queue_reads = 32;

constexpr int k_hardware_flags =
    SOF_TIMESTAMPING_RX_HARDWARE | SOF_TIMESTAMPING_TX_HARDWARE | SOF_TIMESTAMPING_RAW_HARDWARE;
constexpr int k_software_flags =
    SOF_TIMESTAMPING_RX_SOFTWARE | SOF_TIMESTAMPING_TX_SOFTWARE | SOF_TIMESTAMPING_SOFTWARE;
constexpr int k_transmit_flags = SOF_TIMESTAMPING_OPT_ID | SOF_TIMESTAMPING_OPT_TSONLY;

struct ControlData {
    std::optional<tempo::ptp::CapturedTimestamp> timestamp;
    std::optional<uint32_t> tx_id;
};

bool is_set(const timespec& ts) {
    return ts.tv_sec != 0 || ts.tv_nsec != 0;
}

/**
 * Extracts the kernel timestamp and, for messages from the error queue, the transmit id from the control messages.
 */
ControlData parse_control_messages(msghdr& msg) {
    ControlData result;

    for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr; cmsg = CMSG_NXTHDR(&msg, cmsg)) {
        if (cmsg->cmsg_level == SOL_SOCKET && cmsg->cmsg_type == SCM_TIMESTAMPING) {
            scm_timestamping timestamps {};
            std::memcpy(&timestamps, CMSG_DATA(cmsg), sizeof(timestamps));
            // ts[0] holds the software timestamp, ts[2] the raw hardware timestamp.
            if (is_set(timestamps.ts[2])) {
                result.timestamp = tempo::ptp::CapturedTimestamp {
                    tempo::ptp::Timestamp::from_timespec(timestamps.ts[2]), tempo::ptp::TimestampSource::hardware
                };
            } else if (is_set(timestamps.ts[0])) {
                result.timestamp = tempo::ptp::CapturedTimestamp {
                    tempo::ptp::Timestamp::from_timespec(timestamps.ts[0]), tempo::ptp::TimestampSource::software
                };
            }
        } else if (cmsg->cmsg_level == SOL_IP && cmsg->cmsg_type == IP_RECVERR) {
            sock_extended_err error {};
            std::memcpy(&error, CMSG_DATA(cmsg), sizeof(error));
            if (error.ee_errno == ENOMSG && error.ee_origin == SO_EE_ORIGIN_TIMESTAMPING) {
                result.tx_id = error.ee_data;
            }
        }
    }

    return result;
}

tempo::ptp::CapturedTimestamp user_space_now() {
    return {
        tempo::ptp::Timestamp::from_nanoseconds(tempo::HighResolutionClock::now_realtime()),
        tempo::ptp::TimestampSource::user_space,
    };
}

bool enable_hardware_timestamping_on_interface(const int fd, const std::string& interface_name) {
    hwtstamp_config hw_config {};
    hw_config.tx_type = HWTSTAMP_TX_ON;
    hw_config.rx_filter = HWTSTAMP_FILTER_PTP_V2_L4_EVENT;

    ifreq ifr {};
    std::strncpy(ifr.ifr_name, interface_name.c_str(), IFNAMSIZ - 1);
    ifr.ifr_data = reinterpret_cast<char*>(&hw_config);

    if (ioctl(fd, SIOCSHWTSTAMP, &ifr) == 0) {
        return true;
    }

    // Some drivers only support timestamping all packets.
    hw_config.rx_filter = HWTSTAMP_FILTER_ALL;
    if (ioctl(fd, SIOCSHWTSTAMP, &ifr) == 0) {
        return true;
    }

    TEMPO_WARNING("Failed to enable hardware timestamping on {}: {}", interface_name, std::strerror(errno));
    return false;
}

}  // namespace

class tempo::ptp::TimestampedSocket::Impl: public std::enable_shared_from_this<Impl> {
  public:
    Impl(const Strand& strand, Config config);

    tl::expected<void, TransportError> setup();
    void start(ReceiveHandler handler);
    void async_send(std::vector<uint8_t> data, SendHandler handler);
    void close();

    [[nodiscard]] TimestampSource timestamp_source() const {
        return source_;
    }

  private:
    struct PendingTransmit {
        SendHandler handler;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    Strand strand_;
    Config config_;
    boost::asio::ip::udp::socket socket_;
    TimestampSource source_ {TimestampSource::user_space};
    ReceiveHandler receive_handler_;
    std::array<uint8_t, k_max_datagram_size> recv_data_ {};
    uint32_t next_tx_id_ {};
    std::map<uint32_t, PendingTransmit> pending_transmits_;
    std::map<uint32_t, CapturedTimestamp> tx_timestamps_;
    bool closed_ {};

    tl::expected<void, TransportError> enable_timestamping();
    bool set_timestamping_flags(int flags);
    void async_receive();
    void deliver_receive_error(TransportError error);
    void drain_error_queue();
    void poll_transmit_timestamp(uint32_t id, int attempt);
};

tempo::ptp::TimestampedSocket::Impl::Impl(const Strand& strand, Config config) :
    strand_(strand), config_(std::move(config)), socket_(strand) {}

tl::expected<void, tempo::ptp::TransportError> tempo::ptp::TimestampedSocket::Impl::setup() {
    boost::system::error_code ec;

    socket_.open(boost::asio::ip::udp::v4(), ec);
    if (ec) {
        TEMPO_ERROR("Failed to open socket: {}", ec.message());
        return tl::unexpected(TransportError::bind_failed);
    }

    socket_.set_option(boost::asio::ip::udp::socket::reuse_address(true), ec);
    if (ec) {
        TEMPO_ERROR("Failed to set reuse address: {}", ec.message());
        return tl::unexpected(TransportError::bind_failed);
    }

    // Keeps the sockets of ports on different interfaces from seeing each other's traffic. Needs CAP_NET_RAW.
    if (setsockopt(
            socket_.native_handle(), SOL_SOCKET, SO_BINDTODEVICE, config_.interface_name.c_str(),
            static_cast<socklen_t>(config_.interface_name.size())
        )
        != 0) {
        TEMPO_WARNING("Failed to bind socket to device {}: {}", config_.interface_name, std::strerror(errno));
    }

    socket_.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::address_v4::any(), config_.port), ec);
    if (ec) {
        TEMPO_ERROR("Failed to bind to port {}: {}", config_.port, ec.message());
        return tl::unexpected(TransportError::bind_failed);
    }

    socket_.non_blocking(true, ec);
    if (ec) {
        TEMPO_ERROR("Failed to set non-blocking mode: {}", ec.message());
        return tl::unexpected(TransportError::bind_failed);
    }

    socket_.set_option(
        boost::asio::ip::multicast::join_group(config_.multicast_address, config_.interface_address), ec
    );
    if (ec) {
        TEMPO_ERROR(
            "Failed to join multicast group {} on {}: {}", config_.multicast_address.to_string(),
            config_.interface_address.to_string(), ec.message()
        );
        return tl::unexpected(TransportError::bind_failed);
    }

    socket_.set_option(boost::asio::ip::multicast::enable_loopback(false), ec);
    if (ec) {
        TEMPO_WARNING("Failed to set multicast loopback: {}", ec.message());
    }

    socket_.set_option(boost::asio::ip::multicast::outbound_interface(config_.interface_address), ec);
    if (ec) {
        TEMPO_ERROR("Failed to set multicast outbound interface: {}", ec.message());
        return tl::unexpected(TransportError::bind_failed);
    }

    socket_.set_option(boost::asio::detail::socket_option::integer<IPPROTO_IP, IP_TOS>(config_.dscp << 2), ec);
    if (ec) {
        TEMPO_WARNING("Failed to set DSCP value {}: {}", config_.dscp, ec.message());
    }

    return enable_timestamping();
}

tl::expected<void, tempo::ptp::TransportError> tempo::ptp::TimestampedSocket::Impl::enable_timestamping() {
    const auto extra_flags = config_.transmit_timestamps ? k_transmit_flags : 0;

    if (config_.requested_source == TimestampSource::hardware) {
        if (enable_hardware_timestamping_on_interface(socket_.native_handle(), config_.interface_name)
            && set_timestamping_flags(k_hardware_flags | extra_flags)) {
            source_ = TimestampSource::hardware;
            return {};
        }
        if (config_.require_requested_source) {
            return tl::unexpected(TransportError::timestamping_unsupported);
        }
        TEMPO_WARNING("Hardware timestamping unavailable on {}, falling back to software", config_.interface_name);
    }

    if (config_.requested_source != TimestampSource::user_space) {
        if (set_timestamping_flags(k_software_flags | extra_flags)) {
            source_ = TimestampSource::software;
            return {};
        }
        if (config_.require_requested_source) {
            return tl::unexpected(TransportError::timestamping_unsupported);
        }
        TEMPO_WARNING("Software timestamping unavailable on {}, using user space timestamps", config_.interface_name);
    }

    source_ = TimestampSource::user_space;
    return {};
}

bool tempo::ptp::TimestampedSocket::Impl::set_timestamping_flags(const int flags) {
    boost::system::error_code ec;
    socket_.set_option(boost::asio::detail::socket_option::integer<SOL_SOCKET, SO_TIMESTAMPING>(flags), ec);
    if (ec) {
        TEMPO_WARNING("Failed to set timestamping flags {:#x}: {}", flags, ec.message());
        return false;
    }
    return true;
}

void tempo::ptp::TimestampedSocket::Impl::start(ReceiveHandler handler) {
    if (receive_handler_) {
        TEMPO_WARNING("Timestamped socket is already running");
        return;
    }

    if (closed_) {
        boost::asio::post(strand_, [h = std::move(handler)] {
            h(tl::unexpected(TransportError::closed));
        });
        return;
    }

    receive_handler_ = std::move(handler);
    async_receive();

    TEMPO_TRACE("Started timestamped socket on {}:{}", config_.interface_name, config_.port);
}

void tempo::ptp::TimestampedSocket::Impl::async_send(std::vector<uint8_t> data, SendHandler handler) {
    TEMPO_ASSERT(handler != nullptr, "Send handler must not be null");

    if (closed_) {
        boost::asio::post(strand_, [h = std::move(handler)] {
            h(tl::unexpected(TransportError::closed));
        });
        return;
    }

    boost::system::error_code ec;
    const auto sent = socket_.send_to(
        boost::asio::buffer(data), boost::asio::ip::udp::endpoint(config_.multicast_address, config_.port), 0, ec
    );
    const auto send_time = user_space_now();

    if (ec || sent != data.size()) {
        TEMPO_ERROR("Failed to send data: {}", ec ? ec.message() : "incomplete send");
        boost::asio::post(strand_, [h = std::move(handler)] {
            h(tl::unexpected(TransportError::io_error));
        });
        return;
    }

    if (!config_.transmit_timestamps || source_ == TimestampSource::user_space) {
        boost::asio::post(strand_, [h = std::move(handler), send_time] {
            h(send_time);
        });
        return;
    }

    // The kernel numbers timestamped datagrams in the order they were sent, starting at zero.
    const auto id = next_tx_id_++;
    pending_transmits_[id] = PendingTransmit {std::move(handler), std::make_unique<boost::asio::steady_timer>(strand_)};
    poll_transmit_timestamp(id, 0);
}

void tempo::ptp::TimestampedSocket::Impl::close() {
    if (closed_) {
        return;
    }

    closed_ = true;
    receive_handler_ = nullptr;

    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        TEMPO_ERROR("Failed to close socket: {}", ec.message());
    }

    for (auto& [id, pending] : pending_transmits_) {
        pending.timer->cancel();
        boost::asio::post(strand_, [h = std::move(pending.handler)] {
            h(tl::unexpected(TransportError::closed));
        });
    }
    pending_transmits_.clear();
    tx_timestamps_.clear();

    TEMPO_TRACE("Closed timestamped socket on {}:{}", config_.interface_name, config_.port);
}

void tempo::ptp::TimestampedSocket::Impl::async_receive() {
    auto self = shared_from_this();
    socket_.async_wait(boost::asio::socket_base::wait_read, [self](const boost::system::error_code& ec) {
        TRACY_ZONE_SCOPED;
        if (ec == boost::asio::error::operation_aborted) {
            TEMPO_TRACE("Operation aborted");
            return;
        }

        if (self->closed_ || self->receive_handler_ == nullptr) {
            return;
        }

        if (ec) {
            TEMPO_ERROR("Read error: {}", ec.message());
            self->deliver_receive_error(TransportError::io_error);
            return;
        }

        for (int i = 0; i < k_max_reads_per_wakeup; ++i) {
            iovec iov {self->recv_data_.data(), self->recv_data_.size()};
            std::array<char, 512> control {};
            msghdr msg {};
            msg.msg_iov = &iov;
            msg.msg_iovlen = 1;
            msg.msg_control = control.data();
            msg.msg_controllen = control.size();

            const auto received = recvmsg(self->socket_.native_handle(), &msg, MSG_DONTWAIT);
            if (received < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    break;
                }
                TEMPO_ERROR("Read error: {}", std::strerror(errno));
                self->deliver_receive_error(TransportError::io_error);
                return;
            }

            if (TimestampedSocket::is_truncated(msg.msg_flags)) {
                TEMPO_TRACE(
                    "Dropping truncated datagram of {} bytes (flags {:#x})", received,
                    static_cast<unsigned>(msg.msg_flags)
                );
                continue;
            }

            const auto control_data = parse_control_messages(msg);

            Datagram datagram;
            datagram.data.assign(self->recv_data_.begin(), self->recv_data_.begin() + received);
            datagram.timestamp = control_data.timestamp.value_or(user_space_now());

            self->receive_handler_(std::move(datagram));

            // The handler might have closed the socket.
            if (self->closed_ || self->receive_handler_ == nullptr) {
                return;
            }
        }

        self->drain_error_queue();
        self->async_receive();  // Schedule another round.
    });
}

void tempo::ptp::TimestampedSocket::Impl::deliver_receive_error(const TransportError error) {
    auto handler = std::move(receive_handler_);
    receive_handler_ = nullptr;
    if (handler) {
        handler(tl::unexpected(error));
    }
}

void tempo::ptp::TimestampedSocket::Impl::drain_error_queue() {
    if (!config_.transmit_timestamps || closed_) {
        return;
    }

    for (int i = 0; i < k_max_error_queue_reads; ++i) {
        std::array<uint8_t, 64> data {};
        iovec iov {data.data(), data.size()};
        std::array<char, 512> control {};
        msghdr msg {};
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = control.data();
        msg.msg_controllen = control.size();

        if (recvmsg(socket_.native_handle(), &msg, MSG_ERRQUEUE | MSG_DONTWAIT) < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                TEMPO_DEBUG("Failed to read error queue: {}", std::strerror(errno));
            }
            return;
        }

        const auto control_data = parse_control_messages(msg);
        if (!control_data.tx_id || !control_data.timestamp) {
            continue;
        }

        if (pending_transmits_.find(*control_data.tx_id) == pending_transmits_.end()) {
            TEMPO_TRACE("Transmit timestamp {} arrived too late", *control_data.tx_id);
            continue;
        }

        tx_timestamps_[*control_data.tx_id] = *control_data.timestamp;
        while (tx_timestamps_.size() > k_max_stored_tx_timestamps) {
            tx_timestamps_.erase(tx_timestamps_.begin());
        }
    }
}

void tempo::ptp::TimestampedSocket::Impl::poll_transmit_timestamp(const uint32_t id, const int attempt) {
    const auto it = pending_transmits_.find(id);
    if (it == pending_transmits_.end()) {
        return;
    }

    const auto shift = std::min(attempt, TransportConfig::k_max_tx_timestamp_poll_attempts);
    it->second.timer->expires_after(config_.tx_timestamp_poll_interval * (1 << shift));
    it->second.timer->async_wait([weak = weak_from_this(), id, attempt](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        auto self = weak.lock();
        if (self == nullptr || self->closed_) {
            return;
        }

        self->drain_error_queue();

        const auto pending = self->pending_transmits_.find(id);
        if (pending == self->pending_transmits_.end()) {
            return;
        }

        if (const auto timestamp = self->tx_timestamps_.find(id); timestamp != self->tx_timestamps_.end()) {
            auto handler = std::move(pending->second.handler);
            const auto result = timestamp->second;
            self->tx_timestamps_.erase(timestamp);
            self->pending_transmits_.erase(pending);
            handler(result);
            return;
        }

        if (attempt + 1 >= self->config_.tx_timestamp_poll_attempts) {
            TEMPO_DEBUG("No transmit timestamp for datagram {} after {} attempts", id, attempt + 1);
            auto handler = std::move(pending->second.handler);
            self->pending_transmits_.erase(pending);
            handler(tl::unexpected(TransportError::timestamp_unavailable));
            return;
        }

        self->poll_transmit_timestamp(id, attempt + 1);
    });
}

tempo::ptp::TimestampedSocket::TimestampedSocket(std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}

tempo::ptp::TimestampedSocket::~TimestampedSocket() {
    if (impl_) {
        impl_->close();
    }
}

tl::expected<std::unique_ptr<tempo::ptp::TimestampedSocket>, tempo::ptp::TransportError>
tempo::ptp::TimestampedSocket::open(const Strand& strand, const Config& config) {
    auto impl = std::make_shared<Impl>(strand, config);
    if (auto result = impl->setup(); !result) {
        impl->close();
        return tl::unexpected(result.error());
    }
    TEMPO_DEBUG(
        "Opened socket on {} port {} with {} timestamps", config.interface_name, config.port,
        to_string(impl->timestamp_source())
    );
    return std::unique_ptr<TimestampedSocket>(new TimestampedSocket(std::move(impl)));
}

void tempo::ptp::TimestampedSocket::start(ReceiveHandler handler) {
    impl_->start(std::move(handler));
}

void tempo::ptp::TimestampedSocket::async_send(std::vector<uint8_t> data, SendHandler handler) {
    impl_->async_send(std::move(data), std::move(handler));
}

void tempo::ptp::TimestampedSocket::close() {
    impl_->close();
}

tempo::ptp::TimestampSource tempo::ptp::TimestampedSocket::timestamp_source() const {
    return impl_->timestamp_source();
}

bool tempo::ptp::TimestampedSocket::is_truncated(const int msg_flags) {
    return (msg_flags & (MSG_TRUNC | MSG_CTRUNC)) != 0;
}
