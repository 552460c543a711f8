/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/types/ptp_clock_identity.hpp"
#include "tempokit/ptp/types/ptp_port_identity.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("tempo::ptp::ClockIdentity") {
    SECTION("Construct from MAC address") {
        const tempo::MacAddress mac_address(0xa0, 0xb2, 0xc3, 0xd4, 0xe5, 0xf6);
        const auto clock_identity = tempo::ptp::ClockIdentity::from_mac_address(mac_address);

        REQUIRE(clock_identity.has_value());
        REQUIRE(clock_identity->data[0] == 0xa0);
        REQUIRE(clock_identity->data[1] == 0xb2);
        REQUIRE(clock_identity->data[2] == 0xc3);
        REQUIRE(clock_identity->data[3] == 0xd4);
        REQUIRE(clock_identity->data[4] == 0xe5);
        REQUIRE(clock_identity->data[5] == 0xf6);
        REQUIRE(clock_identity->data[6] == tempo::ptp::ClockIdentity::k_implementer_specific_octets[0]);
        REQUIRE(clock_identity->data[7] == tempo::ptp::ClockIdentity::k_implementer_specific_octets[1]);
        REQUIRE(clock_identity->to_string() == "a0-b2-c3-d4-e5-f6-7e-90");
    }

    SECTION("All zero MAC address gives no identity") {
        REQUIRE_FALSE(tempo::ptp::ClockIdentity::from_mac_address(tempo::MacAddress()).has_value());
    }

    SECTION("Group MAC address gives no identity") {
        const tempo::MacAddress multicast(0x01, 0x1b, 0x19, 0x00, 0x00, 0x00);
        REQUIRE_FALSE(multicast.is_unicast());
        REQUIRE_FALSE(tempo::ptp::ClockIdentity::from_mac_address(multicast).has_value());
        REQUIRE(multicast.to_string() == "01:1b:19:00:00:00");
    }

    SECTION("Empty") {
        tempo::ptp::ClockIdentity clock_identity;
        REQUIRE(clock_identity.all_zero());

        for (unsigned char& i : clock_identity.data) {
            SECTION("Test every byte") {
                i = 1;
                REQUIRE_FALSE(clock_identity.all_zero());
            }
        }
    }

    SECTION("Comparison") {
        tempo::ptp::ClockIdentity a;
        tempo::ptp::ClockIdentity b;
        REQUIRE(a == b);
        REQUIRE_FALSE(a < b);

        b.data[7] = 1;
        REQUIRE(a < b);
        REQUIRE(a != b);
    }
}

TEST_CASE("tempo::ptp::PortIdentity") {
    SECTION("Wire format") {
        constexpr std::array<uint8_t, 10> data {0x12, 0x34, 0x56, 0x78, 0x00, 0x02, 0x80, 0x00, 0xab, 0xcd};
        const auto port = tempo::ptp::PortIdentity::from_data(data.data());
        REQUIRE(port.clock_identity.data[0] == 0x12);
        REQUIRE(port.clock_identity.data[7] == 0x00);
        REQUIRE(port.port_number == 0xabcd);
        REQUIRE(port.to_string() == "12-34-56-78-00-02-80-00/43981");

        std::array<uint8_t, 10> out {};
        port.write_to(out.data());
        REQUIRE(out == data);
    }

    SECTION("Ordering by clock identity then port number") {
        tempo::ptp::PortIdentity a;
        tempo::ptp::PortIdentity b;
        a.port_number = 2;
        b.port_number = 1;
        b.clock_identity.data[0] = 1;
        REQUIRE(a < b);
        b.clock_identity.data[0] = 0;
        REQUIRE(b < a);
    }
}
