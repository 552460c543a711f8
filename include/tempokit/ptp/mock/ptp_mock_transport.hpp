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

#include "tempokit/ptp/transport/ptp_transport.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace tempo::ptp {

/**
 * A transport which never touches the network. Packets and failures are injected through a Control object which
 * outlives the transports it opens.
 */
class MockTransport final: public Transport {
  public:
    struct SentPacket {
        PortIdentity port;
        MessageClass message_class {};
        std::vector<uint8_t> data;
    };

    class Control: public std::enable_shared_from_this<Control> {
      public:
        /**
         * @return An opener which creates transports bound to this control.
         */
        TransportOpener opener();

        /**
         * Makes the next open attempts fail.
         * @param count Number of attempts to fail.
         * @param error The error to report.
         */
        void fail_opens(size_t count, TransportError error = TransportError::bind_failed);

        /**
         * Makes every open attempt fail from now on, or succeed again.
         * @param fail True to fail all attempts.
         */
        void fail_all_opens(bool fail);

        /**
         * Makes sends fail with given error, or succeed again when empty.
         * @param error The error.
         */
        void fail_sends(std::optional<TransportError> error);

        /**
         * Delivers a packet to the most recently opened transport, on its strand.
         * @param message_class The message class.
         * @param data The packet data.
         * @param timestamp The receive timestamp.
         * @return False if no transport is open.
         */
        bool deliver(MessageClass message_class, std::vector<uint8_t> data, CapturedTimestamp timestamp);

        /**
         * Delivers a receive error to the most recently opened transport, on its strand.
         * @param error The error.
         * @return False if no transport is open.
         */
        bool deliver_error(TransportError error = TransportError::io_error);

        /**
         * @return All packets sent through transports of this control.
         */
        [[nodiscard]] std::vector<SentPacket> get_sent() const;

        /**
         * @return The number of transports which are open right now.
         */
        [[nodiscard]] size_t num_open() const;

        /**
         * @return The number of successful open attempts.
         */
        [[nodiscard]] size_t num_opened() const;

        /**
         * @return The number of open attempts, successful or not.
         */
        [[nodiscard]] size_t num_open_attempts() const;

        /**
         * @param source The timestamp source reported by transports opened from now on.
         */
        void set_timestamp_source(TimestampSource source);

      private:
        friend class MockTransport;
        struct Endpoint;

        mutable std::mutex mutex_;
        std::deque<TransportError> open_failures_;
        bool fail_all_opens_ {};
        std::optional<TransportError> send_error_;
        std::vector<SentPacket> sent_;
        std::weak_ptr<Endpoint> active_;
        TimestampSource timestamp_source_ {TimestampSource::hardware};
        size_t num_open_ {};
        size_t num_opened_ {};
        size_t num_open_attempts_ {};
    };

    MockTransport(std::shared_ptr<Control> control, const Strand& strand, const PortIdentity& port);
    ~MockTransport() override;

    // Transport overrides
    void start(ReceiveHandler handler) override;
    void async_send(MessageClass message_class, std::vector<uint8_t> data, SendHandler handler) override;
    void close() override;
    [[nodiscard]] TimestampSource timestamp_source() const override;

  private:
    std::shared_ptr<Control> control_;
    std::shared_ptr<Control::Endpoint> endpoint_;
    TimestampSource timestamp_source_;
};

}  // namespace tempo::ptp
