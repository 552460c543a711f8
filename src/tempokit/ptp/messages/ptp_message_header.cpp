/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/messages/ptp_message_header.hpp"

#include "tempokit/core/byte_order.hpp"

#include <fmt/format.h>

#include <bitset>

tempo::ptp::MessageHeader::FlagField
tempo::ptp::MessageHeader::FlagField::from_octets(const uint8_t octet1, const uint8_t octet2) {
    FlagField flags_field;

    const std::bitset<8> octet1_bits(octet1);
    flags_field.alternate_master_flag = octet1_bits[0];
    flags_field.two_step_flag = octet1_bits[1];
    flags_field.unicast_flag = octet1_bits[2];

    const std::bitset<8> octet2_bits(octet2);
    flags_field.leap61 = octet2_bits[0];
    flags_field.leap59 = octet2_bits[1];
    flags_field.current_utc_offset_valid = octet2_bits[2];
    flags_field.ptp_timescale = octet2_bits[3];
    flags_field.time_traceable = octet2_bits[4];
    flags_field.frequency_traceable = octet2_bits[5];

    return flags_field;
}

uint16_t tempo::ptp::MessageHeader::FlagField::to_octets() const {
    uint16_t octets = 0;
    octets |= unicast_flag << 10;
    octets |= two_step_flag << 9;
    octets |= alternate_master_flag << 8;
    octets |= frequency_traceable << 5;
    octets |= time_traceable << 4;
    octets |= ptp_timescale << 3;
    octets |= current_utc_offset_valid << 2;
    octets |= leap59 << 1;
    octets |= leap61 << 0;
    return octets;
}

tl::expected<tempo::ptp::MessageHeader, tempo::ptp::MessageError>
tempo::ptp::MessageHeader::from_data(const uint8_t* data, const size_t size) {
    if (data == nullptr || size == 0) {
        return tl::unexpected(MessageError::invalid_data);
    }

    if (size < k_size) {
        return tl::unexpected(MessageError::invalid_header_length);
    }

    MessageHeader header;
    header.message_length = read_be<uint16_t>(data + 2);
    if (header.message_length < k_size || size < header.message_length) {
        return tl::unexpected(MessageError::invalid_message_length);
    }

    header.version_major = data[1] & 0b00001111;
    header.version_minor = (data[1] & 0b11110000) >> 4;
    if (header.version_major != k_version_major) {
        return tl::unexpected(MessageError::unsupported_version);
    }

    header.sdo_id_major = (data[0] & 0b11110000) >> 4;
    header.message_type = static_cast<MessageType>(data[0] & 0b00001111);
    header.domain_number = data[4];
    header.flags = FlagField::from_octets(data[6], data[7]);
    header.correction_field = read_be<int64_t>(data + 8);
    // Type specific octets are ignored (4 octets)
    header.source_port_identity = PortIdentity::from_data(data + 20);
    header.sequence_id = read_be<uint16_t>(data + 30);
    // Control field is ignored (1 byte)
    header.log_message_interval = static_cast<int8_t>(data[33]);

    return header;
}

void tempo::ptp::MessageHeader::write_to(uint8_t* dst) const {
    // Left shift by multiplication to avoid type promotion
    dst[0] = static_cast<uint8_t>(((sdo_id_major & 0b00001111) * 16) | (static_cast<uint8_t>(message_type) & 0b00001111));
    dst[1] = static_cast<uint8_t>(((version_minor & 0b00001111) * 16) | (version_major & 0b00001111));
    write_be<uint16_t>(dst + 2, message_length);
    dst[4] = domain_number;
    dst[5] = 0;  // Minor sdo id
    write_be<uint16_t>(dst + 6, flags.to_octets());
    write_be<int64_t>(dst + 8, correction_field);
    write_be<uint32_t>(dst + 16, 0);  // Type specific
    source_port_identity.write_to(dst + 20);
    write_be<uint16_t>(dst + 30, sequence_id);
    dst[32] = 0;  // Control field
    dst[33] = static_cast<uint8_t>(log_message_interval);
}

std::chrono::nanoseconds tempo::ptp::MessageHeader::correction() const {
    return std::chrono::nanoseconds(correction_field / 65536);
}

std::string tempo::ptp::MessageHeader::to_string() const {
    return fmt::format(
        "PTP {}: version={}.{} domain_number={} sequence_id={} source_port_identity={}", ptp::to_string(message_type),
        version_major, version_minor, domain_number, sequence_id, source_port_identity.to_string()
    );
}
