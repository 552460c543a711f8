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

#include "ptp_clock_identity.hpp"
#include "tempokit/core/byte_order.hpp"

#include <tuple>

namespace tempo::ptp {

/**
 * Represents a PTP port identity.
 * IEEE1588-2019: 5.3.5
 */
struct PortIdentity {
    static constexpr size_t k_size = 10;
    constexpr static uint16_t k_port_number_min = 0x1;     // Inclusive
    constexpr static uint16_t k_port_number_max = 0xfffe;  // Inclusive

    ClockIdentity clock_identity;
    uint16_t port_number {};  // Valid range: [k_port_number_min, k_port_number_max]

    /**
     * Construct a PTP port identity from wire data. No bounds checking is performed.
     * @param data Pointer to at least 10 bytes.
     */
    static PortIdentity from_data(const uint8_t* data) {
        PortIdentity port_identity;
        port_identity.clock_identity = ClockIdentity::from_data(data);
        port_identity.port_number = read_be<uint16_t>(data + ClockIdentity::k_size);
        return port_identity;
    }

    /**
     * Writes the port identity in wire format.
     * @param dst Destination of at least 10 bytes.
     */
    void write_to(uint8_t* dst) const {
        clock_identity.write_to(dst);
        write_be<uint16_t>(dst + ClockIdentity::k_size, port_number);
    }

    /**
     * @return A string representation of the port identity, in the form clock_identity/port_number.
     */
    [[nodiscard]] std::string to_string() const {
        return fmt::format("{}/{}", clock_identity.to_string(), port_number);
    }

    friend bool operator==(const PortIdentity& lhs, const PortIdentity& rhs) {
        return std::tie(lhs.clock_identity, lhs.port_number) == std::tie(rhs.clock_identity, rhs.port_number);
    }

    friend bool operator!=(const PortIdentity& lhs, const PortIdentity& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator<(const PortIdentity& lhs, const PortIdentity& rhs) {
        return std::tie(lhs.clock_identity, lhs.port_number) < std::tie(rhs.clock_identity, rhs.port_number);
    }
};

}  // namespace tempo::ptp
