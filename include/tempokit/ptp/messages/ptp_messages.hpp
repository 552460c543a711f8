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

#include "ptp_message_header.hpp"
#include "tempokit/ptp/types/ptp_timestamp.hpp"

#include <vector>

namespace tempo::ptp {

/**
 * IEEE1588-2019: 7.6.2.5
 */
struct ClockQuality {
    uint8_t clock_class {248};
    uint8_t clock_accuracy {0xfe};
    uint16_t offset_scaled_log_variance {0xffff};
};

/**
 * IEEE1588-2019: 13.5
 */
struct AnnounceMessage {
    static constexpr size_t k_size = 30;  // Excluding header size

    MessageHeader header;
    Timestamp origin_timestamp;
    int16_t current_utc_offset {};  // Seconds
    uint8_t grandmaster_priority1 {};
    ClockQuality grandmaster_clock_quality;
    uint8_t grandmaster_priority2 {};
    ClockIdentity grandmaster_identity;
    uint16_t steps_removed {};
    uint8_t time_source {};

    /**
     * Parses an Announce message.
     * @param header The already parsed header.
     * @param data The message body, which starts directly after the header.
     * @param size The size of the body.
     * @return The message if the data is valid, otherwise an error.
     */
    static tl::expected<AnnounceMessage, MessageError>
    from_data(const MessageHeader& header, const uint8_t* data, size_t size);

    /**
     * @return The complete message in wire format, with the message length and type filled in.
     */
    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    [[nodiscard]] std::string to_string() const;
};

/**
 * IEEE1588-2019: 13.6
 */
struct SyncMessage {
    static constexpr size_t k_size = 10;

    MessageHeader header;
    Timestamp origin_timestamp;

    static tl::expected<SyncMessage, MessageError>
    from_data(const MessageHeader& header, const uint8_t* data, size_t size);

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;
};

/**
 * IEEE1588-2019: 13.6
 */
struct DelayReqMessage {
    static constexpr size_t k_size = 10;

    MessageHeader header;
    Timestamp origin_timestamp;

    static tl::expected<DelayReqMessage, MessageError>
    from_data(const MessageHeader& header, const uint8_t* data, size_t size);

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;
};

/**
 * IEEE1588-2019: 13.7
 */
struct FollowUpMessage {
    static constexpr size_t k_size = 10;

    MessageHeader header;
    Timestamp precise_origin_timestamp;

    static tl::expected<FollowUpMessage, MessageError>
    from_data(const MessageHeader& header, const uint8_t* data, size_t size);

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;
};

/**
 * IEEE1588-2019: 13.8
 */
struct DelayRespMessage {
    static constexpr size_t k_size = 20;

    MessageHeader header;
    Timestamp receive_timestamp;
    PortIdentity requesting_port_identity;

    static tl::expected<DelayRespMessage, MessageError>
    from_data(const MessageHeader& header, const uint8_t* data, size_t size);

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    [[nodiscard]] std::string to_string() const;
};

}  // namespace tempo::ptp
