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

#include <catch2/catch_all.hpp>

TEST_CASE("tempo::ptp::AnnounceMessage") {
    SECTION("Unpack from data") {
        constexpr std::array<uint8_t, tempo::ptp::AnnounceMessage::k_size> data {
            0x00, 0x00, 0x00, 0x00, 0x12, 0x34,              // originTimestamp.seconds
            0x00, 0x00, 0x00, 0x07,                          // originTimestamp.nanoseconds
            0x00, 0x25,                                      // currentUtcOffset
            0x00,                                            // reserved
            0x80,                                            // grandmasterPriority1
            0x06,                                            // grandmasterClockQuality.clockClass
            0x21,                                            // grandmasterClockQuality.clockAccuracy
            0x43, 0x60,                                      // grandmasterClockQuality.offsetScaledLogVariance
            0x7f,                                            // grandmasterPriority2
            0x00, 0x1d, 0xc1, 0xff, 0xfe, 0x12, 0x34, 0x56,  // grandmasterIdentity
            0x00, 0x01,                                      // stepsRemoved
            0xa0,                                            // timeSource
        };

        const tempo::ptp::MessageHeader header;
        const auto msg = tempo::ptp::AnnounceMessage::from_data(header, data.data(), data.size());
        REQUIRE(msg.has_value());
        REQUIRE(msg->origin_timestamp == tempo::ptp::Timestamp(0x1234, 7));
        REQUIRE(msg->current_utc_offset == 37);
        REQUIRE(msg->grandmaster_priority1 == 0x80);
        REQUIRE(msg->grandmaster_clock_quality.clock_class == 6);
        REQUIRE(msg->grandmaster_clock_quality.clock_accuracy == 0x21);
        REQUIRE(msg->grandmaster_clock_quality.offset_scaled_log_variance == 0x4360);
        REQUIRE(msg->grandmaster_priority2 == 0x7f);
        REQUIRE(msg->grandmaster_identity.data[0] == 0x00);
        REQUIRE(msg->grandmaster_identity.data[7] == 0x56);
        REQUIRE(msg->steps_removed == 1);
        REQUIRE(msg->time_source == 0xa0);
    }

    SECTION("Truncated body") {
        std::array<uint8_t, tempo::ptp::AnnounceMessage::k_size - 1> data {};
        const auto msg = tempo::ptp::AnnounceMessage::from_data({}, data.data(), data.size());
        REQUIRE(msg.error() == tempo::ptp::MessageError::invalid_message_length);
    }

    SECTION("Pack fills in the header") {
        tempo::ptp::AnnounceMessage msg;
        msg.header.sequence_id = 3;
        msg.current_utc_offset = 37;
        msg.grandmaster_priority1 = 128;

        const auto bytes = msg.to_bytes();
        REQUIRE(bytes.size() == tempo::ptp::MessageHeader::k_size + tempo::ptp::AnnounceMessage::k_size);

        const auto header = tempo::ptp::MessageHeader::from_data(bytes.data(), bytes.size());
        REQUIRE(header.has_value());
        REQUIRE(header->message_type == tempo::ptp::MessageType::announce);
        REQUIRE(header->message_length == bytes.size());
        REQUIRE(header->sequence_id == 3);

        const auto body = tempo::ptp::AnnounceMessage::from_data(
            *header, bytes.data() + tempo::ptp::MessageHeader::k_size, bytes.size() - tempo::ptp::MessageHeader::k_size
        );
        REQUIRE(body.has_value());
        REQUIRE(body->current_utc_offset == 37);
        REQUIRE(body->grandmaster_priority1 == 128);
    }
}

TEST_CASE("tempo::ptp::SyncMessage") {
    constexpr std::array<uint8_t, tempo::ptp::SyncMessage::k_size> data {
        0x00, 0x00, 0x00, 0x00, 0x03, 0xe8,  // originTimestamp.seconds (1000)
        0x00, 0x00, 0x01, 0x00,              // originTimestamp.nanoseconds (256)
    };

    const auto msg = tempo::ptp::SyncMessage::from_data({}, data.data(), data.size());
    REQUIRE(msg.has_value());
    REQUIRE(msg->origin_timestamp == tempo::ptp::Timestamp(1000, 256));

    REQUIRE_FALSE(tempo::ptp::SyncMessage::from_data({}, data.data(), data.size() - 1).has_value());
}

TEST_CASE("tempo::ptp::FollowUpMessage") {
    tempo::ptp::FollowUpMessage msg;
    msg.precise_origin_timestamp = tempo::ptp::Timestamp(5, 500);

    const auto bytes = msg.to_bytes();
    REQUIRE(bytes[0] == static_cast<uint8_t>(tempo::ptp::MessageType::follow_up));

    const auto parsed = tempo::ptp::FollowUpMessage::from_data(
        {}, bytes.data() + tempo::ptp::MessageHeader::k_size, bytes.size() - tempo::ptp::MessageHeader::k_size
    );
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->precise_origin_timestamp == tempo::ptp::Timestamp(5, 500));
}

TEST_CASE("tempo::ptp::DelayRespMessage") {
    constexpr std::array<uint8_t, tempo::ptp::DelayRespMessage::k_size> data {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x01,              // receiveTimestamp.seconds
        0x00, 0x00, 0x00, 0x02,                          // receiveTimestamp.nanoseconds
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,  // requestingPortIdentity.clockIdentity
        0x00, 0x03,                                      // requestingPortIdentity.portNumber
    };

    const auto msg = tempo::ptp::DelayRespMessage::from_data({}, data.data(), data.size());
    REQUIRE(msg.has_value());
    REQUIRE(msg->receive_timestamp == tempo::ptp::Timestamp(1, 2));
    REQUIRE(msg->requesting_port_identity.clock_identity.data[0] == 0x01);
    REQUIRE(msg->requesting_port_identity.clock_identity.data[7] == 0x08);
    REQUIRE(msg->requesting_port_identity.port_number == 3);

    REQUIRE(
        tempo::ptp::DelayRespMessage::from_data({}, data.data(), data.size() - 1).error()
        == tempo::ptp::MessageError::invalid_message_length
    );
}
