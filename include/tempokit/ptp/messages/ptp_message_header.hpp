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

#include "tempokit/core/expected.hpp"
#include "tempokit/ptp/ptp_definitions.hpp"
#include "tempokit/ptp/ptp_error.hpp"
#include "tempokit/ptp/types/ptp_port_identity.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tempo::ptp {

/**
 * The common header of all PTP messages.
 * IEEE1588-2019: 13.3
 */
struct MessageHeader {
    static constexpr size_t k_size = 34;
    static constexpr uint8_t k_version_major = 2;

    struct FlagField {
        bool alternate_master_flag {};      // Announce, Sync, Follow_Up, Delay_Resp
        bool two_step_flag {};              // Sync, Pdelay_resp
        bool unicast_flag {};               // All
        bool leap61 {};                     // Announce
        bool leap59 {};                     // Announce
        bool current_utc_offset_valid {};   // Announce
        bool ptp_timescale {};              // Announce
        bool time_traceable {};             // Announce
        bool frequency_traceable {};        // Announce

        static FlagField from_octets(uint8_t octet1, uint8_t octet2);
        [[nodiscard]] uint16_t to_octets() const;
    };

    uint8_t sdo_id_major {};
    MessageType message_type {};
    uint8_t version_major {k_version_major};
    uint8_t version_minor {1};
    uint16_t message_length {};
    uint8_t domain_number {};
    FlagField flags;
    /// Nanoseconds multiplied by 2^16.
    int64_t correction_field {};
    PortIdentity source_port_identity;
    uint16_t sequence_id {};
    int8_t log_message_interval {};

    /**
     * Parses a PTP message header.
     * @param data The start of the message.
     * @param size The number of bytes available, which must cover the message length given in the header.
     * @return A header if the data is valid, otherwise an error.
     */
    static tl::expected<MessageHeader, MessageError> from_data(const uint8_t* data, size_t size);

    /**
     * Writes the header in wire format.
     * @param dst Destination of at least k_size bytes.
     */
    void write_to(uint8_t* dst) const;

    /**
     * @return The correction field in whole nanoseconds.
     */
    [[nodiscard]] std::chrono::nanoseconds correction() const;

    /**
     * @return A human-readable representation of the header.
     */
    [[nodiscard]] std::string to_string() const;
};

}  // namespace tempo::ptp
