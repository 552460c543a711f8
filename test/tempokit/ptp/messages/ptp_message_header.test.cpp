/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/core/byte_order.hpp"
#include "tempokit/ptp/messages/ptp_message_header.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("tempo::ptp::MessageHeader") {
    SECTION("Unpack from data") {
        std::array<uint8_t, 300> data {
            0xfd,                                            // majorSdoId & messageType
            0x12,                                            // minorVersionPTP & versionPTP
            0x01, 0x2c,                                      // messageLength (300)
            0x01,                                            // domainNumber
            0x22,                                            // minorSdoId
            0x00, 0x3f,                                      // flags
            0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x80, 0x00,  // correctionField
            0x12, 0x34, 0x56, 0x78,                          // message type specific (ignored)
            0x12, 0x34, 0x56, 0x78, 0x00, 0x02, 0x80, 0x00,  // sourcePortIdentity.clockIdentity
            0xab, 0xcd,                                      // sourcePortIdentity.portNumber
            0x11, 0x22,                                      // sequenceId
            0xff,                                            // controlField (ignored)
            0x81,                                            // logMessageInterval
        };

        auto header = tempo::ptp::MessageHeader::from_data(data.data(), data.size());

        REQUIRE(header.has_value());
        REQUIRE(header->sdo_id_major == 0xf);
        REQUIRE(header->message_type == tempo::ptp::MessageType::management);
        REQUIRE(header->version_major == 0x2);
        REQUIRE(header->version_minor == 0x1);
        REQUIRE(header->message_length == 300);
        REQUIRE(header->domain_number == 1);

        REQUIRE(header->flags.alternate_master_flag == false);
        REQUIRE(header->flags.two_step_flag == false);
        REQUIRE(header->flags.unicast_flag == false);
        REQUIRE(header->flags.leap61 == true);
        REQUIRE(header->flags.leap59 == true);
        REQUIRE(header->flags.current_utc_offset_valid == true);
        REQUIRE(header->flags.ptp_timescale == true);
        REQUIRE(header->flags.time_traceable == true);
        REQUIRE(header->flags.frequency_traceable == true);

        REQUIRE(header->correction_field == 0x28000);
        REQUIRE(header->correction() == std::chrono::nanoseconds(2));
        REQUIRE(header->source_port_identity.clock_identity.data[0] == 0x12);
        REQUIRE(header->source_port_identity.clock_identity.data[6] == 0x80);
        REQUIRE(header->source_port_identity.port_number == 0xabcd);
        REQUIRE(header->sequence_id == 0x1122);
        REQUIRE(header->log_message_interval == -127);
    }

    SECTION("Reject invalid data") {
        std::array<uint8_t, tempo::ptp::MessageHeader::k_size> data {};
        data[1] = 0x02;
        data[3] = tempo::ptp::MessageHeader::k_size;

        REQUIRE(tempo::ptp::MessageHeader::from_data(nullptr, 0).error() == tempo::ptp::MessageError::invalid_data);
        REQUIRE(
            tempo::ptp::MessageHeader::from_data(data.data(), data.size() - 1).error()
            == tempo::ptp::MessageError::invalid_header_length
        );
        REQUIRE(tempo::ptp::MessageHeader::from_data(data.data(), data.size()).has_value());

        data[3] = tempo::ptp::MessageHeader::k_size + 1;
        REQUIRE(
            tempo::ptp::MessageHeader::from_data(data.data(), data.size()).error()
            == tempo::ptp::MessageError::invalid_message_length
        );

        data[3] = tempo::ptp::MessageHeader::k_size;
        data[1] = 0x01;
        REQUIRE(
            tempo::ptp::MessageHeader::from_data(data.data(), data.size()).error()
            == tempo::ptp::MessageError::unsupported_version
        );
    }

    SECTION("Pack to data") {
        tempo::ptp::MessageHeader header;
        header.sdo_id_major = 0xf;
        header.message_type = tempo::ptp::MessageType::management;
        header.message_length = 300;
        header.domain_number = 1;
        header.correction_field = 0x28000;
        header.source_port_identity.clock_identity.data = {0x12, 0x34, 0x56, 0x78, 0x00, 0x02, 0x80, 0x00};
        header.source_port_identity.port_number = 0xabcd;
        header.sequence_id = 0x1122;
        header.log_message_interval = -127;

        std::array<uint8_t, tempo::ptp::MessageHeader::k_size> data {};
        header.write_to(data.data());

        REQUIRE(data[0] == 0xfd);
        REQUIRE(data[1] == 0x12);
        REQUIRE(tempo::read_be<uint16_t>(data.data() + 2) == 300);
        REQUIRE(data[4] == 1);
        REQUIRE(tempo::read_be<uint16_t>(data.data() + 6) == 0);
        REQUIRE(tempo::read_be<int64_t>(data.data() + 8) == 0x28000);
        REQUIRE(tempo::read_be<uint64_t>(data.data() + 20) == 0x1234567800028000);
        REQUIRE(tempo::read_be<uint16_t>(data.data() + 28) == 0xabcd);
        REQUIRE(tempo::read_be<uint16_t>(data.data() + 30) == 0x1122);
        REQUIRE(static_cast<int8_t>(data[33]) == -127);
    }
}

TEST_CASE("tempo::ptp::MessageHeader::FlagField") {
    SECTION("Unpack from octets") {
        auto flags = tempo::ptp::MessageHeader::FlagField::from_octets(0, 0);
        REQUIRE_FALSE(flags.two_step_flag);
        REQUIRE_FALSE(flags.leap61);

        flags = tempo::ptp::MessageHeader::FlagField::from_octets(1 << 1, 0);
        REQUIRE(flags.two_step_flag);

        flags = tempo::ptp::MessageHeader::FlagField::from_octets(1 << 2, 0);
        REQUIRE(flags.unicast_flag);

        flags = tempo::ptp::MessageHeader::FlagField::from_octets(0, 1 << 2);
        REQUIRE(flags.current_utc_offset_valid);

        flags = tempo::ptp::MessageHeader::FlagField::from_octets(0, 1 << 3);
        REQUIRE(flags.ptp_timescale);
    }

    SECTION("Pack to octets") {
        tempo::ptp::MessageHeader::FlagField flags;

        SECTION("Leap 61") {
            flags.leap61 = true;
            REQUIRE(flags.to_octets() == 0b00000000'00000001);
        }

        SECTION("PTP timescale") {
            flags.ptp_timescale = true;
            REQUIRE(flags.to_octets() == 0b00000000'00001000);
        }

        SECTION("Two step") {
            flags.two_step_flag = true;
            REQUIRE(flags.to_octets() == 0b00000010'00000000);
        }
    }
}
