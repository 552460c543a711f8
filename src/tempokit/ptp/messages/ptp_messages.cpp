/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/messages/ptp_messages.hpp"

#include "tempokit/core/byte_order.hpp"

#include <fmt/format.h>

namespace {

/**
 * Allocates a message of given body size and writes the header into it.
 */
std::vector<uint8_t>
make_message(tempo::ptp::MessageHeader header, const tempo::ptp::MessageType type, const size_t body_size) {
    std::vector<uint8_t> data(tempo::ptp::MessageHeader::k_size + body_size, 0);
    header.message_type = type;
    header.message_length = static_cast<uint16_t>(data.size());
    header.write_to(data.data());
    return data;
}

/**
 * Parses a message which consists of a single timestamp.
 */
template<class Message, tempo::ptp::Timestamp Message::* Member>
tl::expected<Message, tempo::ptp::MessageError>
timestamp_message_from_data(const tempo::ptp::MessageHeader& header, const uint8_t* data, const size_t size) {
    if (size < Message::k_size) {
        return tl::unexpected(tempo::ptp::MessageError::invalid_message_length);
    }
    Message msg;
    msg.header = header;
    msg.*Member = tempo::ptp::Timestamp::from_data(data);
    return msg;
}

}  // namespace

tl::expected<tempo::ptp::AnnounceMessage, tempo::ptp::MessageError>
tempo::ptp::AnnounceMessage::from_data(const MessageHeader& header, const uint8_t* data, const size_t size) {
    if (size < k_size) {
        return tl::unexpected(MessageError::invalid_message_length);
    }

    AnnounceMessage msg;
    msg.header = header;
    msg.origin_timestamp = Timestamp::from_data(data);
    msg.current_utc_offset = read_be<int16_t>(data + 10);
    // Byte 12 is reserved
    msg.grandmaster_priority1 = data[13];
    msg.grandmaster_clock_quality.clock_class = data[14];
    msg.grandmaster_clock_quality.clock_accuracy = data[15];
    msg.grandmaster_clock_quality.offset_scaled_log_variance = read_be<uint16_t>(data + 16);
    msg.grandmaster_priority2 = data[18];
    msg.grandmaster_identity = ClockIdentity::from_data(data + 19);
    msg.steps_removed = read_be<uint16_t>(data + 27);
    msg.time_source = data[29];
    return msg;
}

std::vector<uint8_t> tempo::ptp::AnnounceMessage::to_bytes() const {
    auto data = make_message(header, MessageType::announce, k_size);
    auto* body = data.data() + MessageHeader::k_size;
    origin_timestamp.write_to(body);
    write_be<int16_t>(body + 10, current_utc_offset);
    body[13] = grandmaster_priority1;
    body[14] = grandmaster_clock_quality.clock_class;
    body[15] = grandmaster_clock_quality.clock_accuracy;
    write_be<uint16_t>(body + 16, grandmaster_clock_quality.offset_scaled_log_variance);
    body[18] = grandmaster_priority2;
    grandmaster_identity.write_to(body + 19);
    write_be<uint16_t>(body + 27, steps_removed);
    body[29] = time_source;
    return data;
}

std::string tempo::ptp::AnnounceMessage::to_string() const {
    return fmt::format(
        "{} origin_timestamp={} current_utc_offset={} gm_priority1={} gm_clock_class={} gm_identity={} steps_removed={}",
        header.to_string(), origin_timestamp.to_string(), current_utc_offset, grandmaster_priority1,
        grandmaster_clock_quality.clock_class, grandmaster_identity.to_string(), steps_removed
    );
}

tl::expected<tempo::ptp::SyncMessage, tempo::ptp::MessageError>
tempo::ptp::SyncMessage::from_data(const MessageHeader& header, const uint8_t* data, const size_t size) {
    return timestamp_message_from_data<SyncMessage, &SyncMessage::origin_timestamp>(header, data, size);
}

std::vector<uint8_t> tempo::ptp::SyncMessage::to_bytes() const {
    auto data = make_message(header, MessageType::sync, k_size);
    origin_timestamp.write_to(data.data() + MessageHeader::k_size);
    return data;
}

tl::expected<tempo::ptp::DelayReqMessage, tempo::ptp::MessageError>
tempo::ptp::DelayReqMessage::from_data(const MessageHeader& header, const uint8_t* data, const size_t size) {
    return timestamp_message_from_data<DelayReqMessage, &DelayReqMessage::origin_timestamp>(header, data, size);
}

std::vector<uint8_t> tempo::ptp::DelayReqMessage::to_bytes() const {
    auto data = make_message(header, MessageType::delay_req, k_size);
    origin_timestamp.write_to(data.data() + MessageHeader::k_size);
    return data;
}

tl::expected<tempo::ptp::FollowUpMessage, tempo::ptp::MessageError>
tempo::ptp::FollowUpMessage::from_data(const MessageHeader& header, const uint8_t* data, const size_t size) {
    return timestamp_message_from_data<FollowUpMessage, &FollowUpMessage::precise_origin_timestamp>(header, data, size);
}

std::vector<uint8_t> tempo::ptp::FollowUpMessage::to_bytes() const {
    auto data = make_message(header, MessageType::follow_up, k_size);
    precise_origin_timestamp.write_to(data.data() + MessageHeader::k_size);
    return data;
}

tl::expected<tempo::ptp::DelayRespMessage, tempo::ptp::MessageError>
tempo::ptp::DelayRespMessage::from_data(const MessageHeader& header, const uint8_t* data, const size_t size) {
    if (size < k_size) {
        return tl::unexpected(MessageError::invalid_message_length);
    }
    DelayRespMessage msg;
    msg.header = header;
    msg.receive_timestamp = Timestamp::from_data(data);
    msg.requesting_port_identity = PortIdentity::from_data(data + Timestamp::k_size);
    return msg;
}

std::vector<uint8_t> tempo::ptp::DelayRespMessage::to_bytes() const {
    auto data = make_message(header, MessageType::delay_resp, k_size);
    receive_timestamp.write_to(data.data() + MessageHeader::k_size);
    requesting_port_identity.write_to(data.data() + MessageHeader::k_size + Timestamp::k_size);
    return data;
}

std::string tempo::ptp::DelayRespMessage::to_string() const {
    return fmt::format(
        "receive_timestamp={} requesting_port_identity={}", receive_timestamp.to_string(),
        requesting_port_identity.to_string()
    );
}
