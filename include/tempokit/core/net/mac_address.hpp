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

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

namespace tempo {

/**
 * An EUI-48 hardware address of a network interface.
 */
class MacAddress {
  public:
    static constexpr size_t k_size = 6;

    MacAddress() = default;

    /**
     * @param bytes Pointer to at least 6 bytes, as found in a sockaddr_ll or ifreq.
     */
    explicit MacAddress(const uint8_t* bytes) {
        std::copy_n(bytes, k_size, octets_.data());
    }

    MacAddress(
        const uint8_t byte0, const uint8_t byte1, const uint8_t byte2, const uint8_t byte3, const uint8_t byte4,
        const uint8_t byte5
    ) :
        octets_ {byte0, byte1, byte2, byte3, byte4, byte5} {}

    [[nodiscard]] const std::array<uint8_t, k_size>& bytes() const {
        return octets_;
    }

    /**
     * @returns False for the all-zero address reported by interfaces without hardware address (loopback, tunnels).
     */
    [[nodiscard]] bool is_valid() const {
        return std::any_of(octets_.begin(), octets_.end(), [](const uint8_t octet) {
            return octet != 0;
        });
    }

    /**
     * @returns True when the group bit is clear. Only unicast addresses identify a single interface.
     */
    [[nodiscard]] bool is_unicast() const {
        return (octets_[0] & 0x01) == 0;
    }

    /**
     * @return The address in the usual colon separated lower case notation.
     */
    [[nodiscard]] std::string to_string() const {
        return fmt::format("{:02x}", fmt::join(octets_, ":"));
    }

    friend bool operator==(const MacAddress& lhs, const MacAddress& rhs) {
        return lhs.octets_ == rhs.octets_;
    }

    friend bool operator!=(const MacAddress& lhs, const MacAddress& rhs) {
        return !(lhs == rhs);
    }

  private:
    std::array<uint8_t, k_size> octets_ {};
};

}  // namespace tempo
