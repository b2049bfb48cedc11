#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdns_browser
{

struct NetworkInterface
{
    std::string name; // Display name, example: "eth0"
    std::string address; // Bind address, IPv4 or IPv6 literal
};
bool operator==(const NetworkInterface& lhs, const NetworkInterface& rhs);

// Either every multicast capable interface or one concrete interface.
// Fixed for the lifetime of a scan session.
class InterfaceSelector
{
public:
    static InterfaceSelector All();
    static InterfaceSelector Single(NetworkInterface networkInterface);

    [[nodiscard]] bool IsAll() const { return !m_interface.has_value(); }
    // Only valid when !IsAll()
    [[nodiscard]] const NetworkInterface& Interface() const { return *m_interface; }
    [[nodiscard]] std::string ToString() const;

private:
    std::optional<NetworkInterface> m_interface;
};

// Up, multicast capable, non loopback and non point-to-point interfaces with
// their IPv4 and non link-local IPv6 addresses, one entry per address.
std::vector<NetworkInterface> EnumerateNetworkInterfaces();

// Looks up an entry by interface name or by address
std::optional<NetworkInterface> FindNetworkInterface(const std::vector<NetworkInterface>& interfaces, std::string_view nameOrAddress);

}
