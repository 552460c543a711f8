/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/core/net/network_interface.hpp"

#include "tempokit/core/log.hpp"
#include "tempokit/core/string.hpp"
#include "tempokit/core/subscription.hpp"

#include <ifaddrs.h>
#include <linux/ethtool.h>
#include <linux/if_packet.h>
#include <linux/net_tstamp.h>
#include <linux/sockios.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

tempo::NetworkInterface::NetworkInterface(Identifier identifier) : identifier_(std::move(identifier)) {
    TEMPO_ASSERT(!identifier_.empty(), "Identifier cannot be empty");
}

tempo::NetworkInterface::NetworkInterface(
    Identifier identifier, std::optional<MacAddress> mac_address, std::vector<boost::asio::ip::address> addresses,
    Capabilities capabilities
) :
    identifier_(std::move(identifier)),
    mac_address_(std::move(mac_address)),
    addresses_(std::move(addresses)),
    capabilities_(capabilities) {
    TEMPO_ASSERT(!identifier_.empty(), "Identifier cannot be empty");
}

const tempo::NetworkInterface::Identifier& tempo::NetworkInterface::get_identifier() const {
    return identifier_;
}

const std::optional<tempo::MacAddress>& tempo::NetworkInterface::get_mac_address() const {
    return mac_address_;
}

const std::vector<boost::asio::ip::address>& tempo::NetworkInterface::get_addresses() const {
    return addresses_;
}

boost::asio::ip::address_v4 tempo::NetworkInterface::get_first_ipv4_address() const {
    for (const auto& addr : addresses_) {
        if (addr.is_v4()) {
            return addr.to_v4();
        }
    }
    return {};
}

const tempo::NetworkInterface::Capabilities& tempo::NetworkInterface::get_capabilities() const {
    return capabilities_;
}

std::optional<uint32_t> tempo::NetworkInterface::interface_index() const {
    const auto index = if_nametoindex(identifier_.c_str());
    if (index == 0) {
        return std::nullopt;
    }
    return index;
}

std::string tempo::NetworkInterface::to_string() const {
    std::string output = fmt::format("{}\n", identifier_);

    if (mac_address_.has_value()) {
        fmt::format_to(std::back_inserter(output), "  mac:\n    {}\n", mac_address_->to_string());
    }

    const auto caps = capabilities_.to_string();
    if (!caps.empty()) {
        fmt::format_to(std::back_inserter(output), "  capabilities:\n   {}\n", caps);
    }

    fmt::format_to(std::back_inserter(output), "  index:\n    {}\n", interface_index().value_or(0));

    if (!addresses_.empty()) {
        fmt::format_to(std::back_inserter(output), "  addresses:\n");
        for (const auto& addr : addresses_) {
            fmt::format_to(std::back_inserter(output), "    {}\n", addr.to_string());
        }
    }

    return output;
}

tl::expected<tempo::NetworkInterface::Capabilities, int>
tempo::NetworkInterface::query_capabilities(const Identifier& identifier) {
    const int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        return tl::unexpected(errno);
    }

    Defer close_fd([fd] {
        close(fd);
    });

    ifreq ifr {};
    std::strncpy(ifr.ifr_name, identifier.c_str(), IFNAMSIZ - 1);

    Capabilities caps;

    if (ioctl(fd, SIOCGIFFLAGS, &ifr) < 0) {
        return tl::unexpected(errno);
    }
    caps.multicast = (ifr.ifr_flags & IFF_MULTICAST) != 0;

    ethtool_ts_info info {};
    info.cmd = ETHTOOL_GET_TS_INFO;
    ifr.ifr_data = reinterpret_cast<char*>(&info);
    if (ioctl(fd, SIOCETHTOOL, &ifr) < 0) {
        // Drivers without ethtool support still get kernel software timestamps.
        TEMPO_DEBUG("ETHTOOL_GET_TS_INFO failed for {}: {}", identifier, std::strerror(errno));
        caps.sw_timestamp = true;
        return caps;
    }

    constexpr auto k_hw_flags =
        SOF_TIMESTAMPING_TX_HARDWARE | SOF_TIMESTAMPING_RX_HARDWARE | SOF_TIMESTAMPING_RAW_HARDWARE;
    constexpr auto k_sw_flags = SOF_TIMESTAMPING_TX_SOFTWARE | SOF_TIMESTAMPING_RX_SOFTWARE | SOF_TIMESTAMPING_SOFTWARE;

    caps.hw_timestamp = (info.so_timestamping & k_hw_flags) == k_hw_flags;
    caps.sw_timestamp = (info.so_timestamping & k_sw_flags) == k_sw_flags;
    if (info.phc_index >= 0) {
        caps.phc_index = info.phc_index;
    }

    return caps;
}

tl::expected<std::vector<tempo::NetworkInterface>, int> tempo::NetworkInterface::get_all() {
    std::vector<NetworkInterface> network_interfaces;

    ifaddrs* ifap = nullptr;
    if (getifaddrs(&ifap) != 0) {
        return tl::unexpected(errno);
    }

    Defer cleanup([&ifap] {
        freeifaddrs(ifap);
    });

    for (const ifaddrs* ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr) {
            TEMPO_WARNING("Network interface name is null");
            continue;
        }

        auto it = std::find_if(network_interfaces.begin(), network_interfaces.end(), [&ifa](const auto& iface) {
            return iface.identifier_ == ifa->ifa_name;
        });

        if (it == network_interfaces.end()) {
            it = network_interfaces.emplace(network_interfaces.end(), ifa->ifa_name);
        }

        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        if (ifa->ifa_addr->sa_family == AF_INET) {
            const auto* sa = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
            it->addresses_.emplace_back(boost::asio::ip::address_v4(ntohl(sa->sin_addr.s_addr)));
        } else if (ifa->ifa_addr->sa_family == AF_INET6) {
            const auto* sa = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
            boost::asio::ip::address_v6::bytes_type bytes;
            std::memcpy(bytes.data(), &sa->sin6_addr, sizeof(bytes));
            it->addresses_.emplace_back(boost::asio::ip::address_v6(bytes, sa->sin6_scope_id));
        } else if (ifa->ifa_addr->sa_family == AF_PACKET) {
            const auto* sll = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);
            if (sll->sll_halen == 6) {
                it->mac_address_ = MacAddress(sll->sll_addr);
            }
        }
    }

    for (auto& iface : network_interfaces) {
        if (auto caps = query_capabilities(iface.identifier_)) {
            iface.capabilities_ = *caps;
        } else {
            TEMPO_DEBUG("Failed to query capabilities of {}: {}", iface.identifier_, std::strerror(caps.error()));
        }
    }

    return network_interfaces;
}

std::string tempo::NetworkInterface::Capabilities::to_string() const {
    std::string output;
    if (hw_timestamp) {
        fmt::format_to(std::back_inserter(output), " HW_TIMESTAMP");
    }
    if (sw_timestamp) {
        fmt::format_to(std::back_inserter(output), " SW_TIMESTAMP");
    }
    if (multicast) {
        fmt::format_to(std::back_inserter(output), " MULTICAST");
    }
    if (phc_index) {
        fmt::format_to(std::back_inserter(output), " PHC={}", *phc_index);
    }
    return output;
}

tempo::NetworkInterfaceList::NetworkInterfaceList(std::vector<NetworkInterface> interfaces) :
    interfaces_(std::move(interfaces)) {}

tempo::NetworkInterfaceList tempo::NetworkInterfaceList::get_system_interfaces() {
    auto interfaces = NetworkInterface::get_all();
    if (!interfaces) {
        TEMPO_ERROR("Failed to enumerate network interfaces: {}", std::strerror(interfaces.error()));
        return {};
    }
    return NetworkInterfaceList(std::move(*interfaces));
}

const tempo::NetworkInterface*
tempo::NetworkInterfaceList::get_interface(const NetworkInterface::Identifier& identifier) const {
    for (auto& iface : interfaces_) {
        if (iface.get_identifier() == identifier) {
            return &iface;
        }
    }
    return nullptr;
}

const tempo::NetworkInterface* tempo::NetworkInterfaceList::find_by_string(const std::string& search_string) const {
    if (search_string.empty()) {
        return nullptr;
    }

    for (auto& iface : interfaces_) {
        if (string_compare_case_insensitive(iface.get_identifier(), search_string)) {
            return &iface;
        }
    }

    for (auto& iface : interfaces_) {
        const auto& mac = iface.get_mac_address();
        if (mac && string_compare_case_insensitive(mac->to_string(), search_string)) {
            return &iface;
        }
    }

    for (auto& iface : interfaces_) {
        for (const auto& address : iface.get_addresses()) {
            if (string_compare_case_insensitive(address.to_string(), search_string)) {
                return &iface;
            }
        }
    }

    return nullptr;
}

const std::vector<tempo::NetworkInterface>& tempo::NetworkInterfaceList::get_interfaces() const {
    return interfaces_;
}
