#include "mdns_browser/network_interfaces.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_utils.hpp"

#include <cstring>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <fmt/core.h>

namespace mdns_browser
{

bool operator==(const NetworkInterface& lhs, const NetworkInterface& rhs)
{
    return lhs.name == rhs.name
        && lhs.address == rhs.address;
}

InterfaceSelector InterfaceSelector::All()
{
    return InterfaceSelector();
}

InterfaceSelector InterfaceSelector::Single(NetworkInterface networkInterface)
{
    InterfaceSelector selector;
    selector.m_interface = std::move(networkInterface);
    return selector;
}

std::string InterfaceSelector::ToString() const
{
    if (IsAll()) {
        return "all interfaces";
    }
    return fmt::format("{} ({})", m_interface->name, m_interface->address);
}

std::vector<NetworkInterface> EnumerateNetworkInterfaces()
{
    std::vector<NetworkInterface> interfaces;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) < 0) {
        Log(LogLevel::Warn, fmt::format("Unable to get interface addresses: {}", std::strerror(errno)));
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr)
            continue;
        if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
            continue;
        if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
            continue;

        if (ifa->ifa_addr->sa_family == AF_INET) {
            const auto* saddr = reinterpret_cast<const struct sockaddr_in*>(ifa->ifa_addr);
            if (saddr->sin_addr.s_addr == htonl(INADDR_LOOPBACK))
                continue;
            interfaces.push_back({ifa->ifa_name, IPV4AddressToString(saddr, sizeof(struct sockaddr_in))});
        } else if (ifa->ifa_addr->sa_family == AF_INET6) {
            const auto* saddr = reinterpret_cast<const struct sockaddr_in6*>(ifa->ifa_addr);
            // Ignore link-local addresses
            if (saddr->sin6_scope_id)
                continue;
            const unsigned char localhost[] = {0, 0, 0, 0, 0, 0, 0, 0,
                                               0, 0, 0, 0, 0, 0, 0, 1};
            const unsigned char localhost_mapped[] = {0, 0, 0, 0, 0, 0, 0, 0,
                                                      0, 0, 0xff, 0xff, 0x7f, 0, 0, 1};
            if (!std::memcmp(saddr->sin6_addr.s6_addr, localhost, 16) ||
                !std::memcmp(saddr->sin6_addr.s6_addr, localhost_mapped, 16))
                continue;
            interfaces.push_back({ifa->ifa_name, IPV6AddressToString(saddr, sizeof(struct sockaddr_in6))});
        }
    }

    freeifaddrs(ifaddr);

    Log(LogLevel::Debug, fmt::format("Found {} candidate interface address{}", interfaces.size(), interfaces.size() == 1 ? "" : "es"));
    return interfaces;
}

std::optional<NetworkInterface> FindNetworkInterface(const std::vector<NetworkInterface>& interfaces, std::string_view nameOrAddress)
{
    for (const auto& networkInterface : interfaces) {
        if (networkInterface.name == nameOrAddress || networkInterface.address == nameOrAddress) {
            return networkInterface;
        }
    }
    return std::nullopt;
}

}
