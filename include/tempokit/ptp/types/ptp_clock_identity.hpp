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

#include "tempokit/core/net/mac_address.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace tempo::ptp {

/**
 * Represents a PTP clock identity.
 * IEEE1588-2019: 5.3.4
 */
struct ClockIdentity {
    static constexpr size_t k_size = 8;

    std::array<uint8_t, k_size> data {};

    /// Octet 6 & 7 of a ClockIdentity for when constructing from an EUI-48 based on IEEE1588-2019 7.5.2.2.2.2
    static constexpr uint8_t k_implementer_specific_octets[] = {0x7e, 0x90};

    /**
     * Construct a PTP clock identity from a mac address based on IEEE1588-2019 7.5.2.2.2.2
     * @param mac_address The MAC address to construct the clock identity from.
     * @return A ClockIdentity or a std::nullopt when the MAC address is all zeros or a group address.
     */
    static std::optional<ClockIdentity> from_mac_address(const MacAddress& mac_address) {
        if (!mac_address.is_valid() || !mac_address.is_unicast()) {
            return std::nullopt;
        }
        const auto& mac_bytes = mac_address.bytes();
        return ClockIdentity {{
            mac_bytes[0],
            mac_bytes[1],
            mac_bytes[2],
            mac_bytes[3],
            mac_bytes[4],
            mac_bytes[5],
            k_implementer_specific_octets[0],
            k_implementer_specific_octets[1],
        }};
    }

    /**
     * Construct a PTP clock identity from wire data. No bounds checking is performed.
     * @param data Pointer to at least 8 bytes.
     */
    static ClockIdentity from_data(const uint8_t* data) {
        ClockIdentity clock_identity;
        std::memcpy(clock_identity.data.data(), data, k_size);
        return clock_identity;
    }

    /**
     * Writes the clock identity in wire format.
     * @param dst Destination of at least 8 bytes.
     */
    void write_to(uint8_t* dst) const {
        std::memcpy(dst, data.data(), k_size);
    }

    /**
     * @return A string representation of the clock identity.
     */
    [[nodiscard]] std::string to_string() const {
        return fmt::format(
            "{:02x}-{:02x}-{:02x}-{:02x}-{:02x}-{:02x}-{:02x}-{:02x}", data[0], data[1], data[2], data[3], data[4],
            data[5], data[6], data[7]
        );
    }

    /**
     * @return True if all bytes are zero, false otherwise.
     */
    [[nodiscard]] bool all_zero() const {
        return std::all_of(data.begin(), data.end(), [](const uint8_t byte) {
            return byte == 0;
        });
    }

    friend bool operator==(const ClockIdentity& lhs, const ClockIdentity& rhs) {
        return lhs.data == rhs.data;
    }

    friend bool operator!=(const ClockIdentity& lhs, const ClockIdentity& rhs) {
        return lhs.data != rhs.data;
    }

    friend bool operator<(const ClockIdentity& lhs, const ClockIdentity& rhs) {
        return lhs.data < rhs.data;
    }
};

}  // namespace tempo::ptp
