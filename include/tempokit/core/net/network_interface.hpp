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

#include "mac_address.hpp"
#include "tempokit/core/expected.hpp"

#include <boost/asio/ip/address.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tempo {

/**
 * Represents a network interface of the host together with its timestamping capabilities.
 */
class NetworkInterface {
  public:
    /// The identifier of a network interface (e.g. "eth0").
    using Identifier = std::string;

    /// The timestamping related capabilities of the network interface.
    struct Capabilities {
        bool hw_timestamp {false};
        bool sw_timestamp {false};
        bool multicast {false};
        /// Index of the PTP hardware clock (/dev/ptpN) backing the hardware timestamps, if any.
        std::optional<int> phc_index;

        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const Capabilities& lhs, const Capabilities& rhs) {
            return lhs.hw_timestamp == rhs.hw_timestamp && lhs.sw_timestamp == rhs.sw_timestamp
                && lhs.multicast == rhs.multicast && lhs.phc_index == rhs.phc_index;
        }

        friend bool operator!=(const Capabilities& lhs, const Capabilities& rhs) {
            return !(lhs == rhs);
        }
    };

    explicit NetworkInterface(Identifier identifier);

    /**
     * Constructs an interface from known properties, without querying the system.
     * @param identifier The identifier of the interface.
     * @param mac_address The MAC address.
     * @param addresses The assigned addresses.
     * @param capabilities The timestamping capabilities.
     */
    NetworkInterface(
        Identifier identifier, std::optional<MacAddress> mac_address, std::vector<boost::asio::ip::address> addresses,
        Capabilities capabilities
    );

    /**
     * @return The identifier of the interface (e.g. "eth0").
     */
    [[nodiscard]] const Identifier& get_identifier() const;

    /**
     * @return The MAC address of the interface, if it has one.
     */
    [[nodiscard]] const std::optional<MacAddress>& get_mac_address() const;

    /**
     * @return The addresses assigned to the interface.
     */
    [[nodiscard]] const std::vector<boost::asio::ip::address>& get_addresses() const;

    /**
     * @return The first IPv4 address of the interface, or an unspecified address if the interface has none.
     */
    [[nodiscard]] boost::asio::ip::address_v4 get_first_ipv4_address() const;

    /**
     * @return The capabilities of the interface.
     */
    [[nodiscard]] const Capabilities& get_capabilities() const;

    /**
     * @return The OS index of the interface, or an empty optional if the interface is gone.
     */
    [[nodiscard]] std::optional<uint32_t> interface_index() const;

    /**
     * @return A human readable, multi-line description of the interface.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * Queries the timestamping capabilities of given interface using the ethtool interface.
     * @param identifier The interface name.
     * @return The capabilities, or an errno value if the query failed.
     */
    static tl::expected<Capabilities, int> query_capabilities(const Identifier& identifier);

    /**
     * Retrieves all network interfaces of the host.
     * @return The list of interfaces, or an errno value if the interfaces could not be enumerated.
     */
    static tl::expected<std::vector<NetworkInterface>, int> get_all();

  private:
    Identifier identifier_;
    std::optional<MacAddress> mac_address_;
    std::vector<boost::asio::ip::address> addresses_;
    Capabilities capabilities_;
};

/**
 * A snapshot of the network interfaces of the host.
 */
class NetworkInterfaceList {
  public:
    NetworkInterfaceList() = default;
    explicit NetworkInterfaceList(std::vector<NetworkInterface> interfaces);

    /**
     * @return A list populated with the interfaces of the host. Empty when enumeration failed.
     */
    static NetworkInterfaceList get_system_interfaces();

    /**
     * @param identifier The identifier of the interface.
     * @return The interface with given identifier, or nullptr if not found.
     */
    [[nodiscard]] const NetworkInterface* get_interface(const NetworkInterface::Identifier& identifier) const;

    /**
     * Finds an interface by identifier, MAC address or assigned address, case-insensitive.
     * @param search_string The string to match.
     * @return The first matching interface, or nullptr if none matched.
     */
    [[nodiscard]] const NetworkInterface* find_by_string(const std::string& search_string) const;

    /**
     * @return The interfaces in this list.
     */
    [[nodiscard]] const std::vector<NetworkInterface>& get_interfaces() const;

  private:
    std::vector<NetworkInterface> interfaces_;
};

}  // namespace tempo
