#pragma once

#include "mdns_browser/types.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace mdns_browser
{

enum class ResolutionStatus {
    Unresolved,
    Resolved,
    Removed
};
std::string ToString(ResolutionStatus status);

struct InstanceKey {
    std::string service_type; // "_http._tcp.local."
    std::string name; // Full instance name, "My Printer._http._tcp.local."
};
bool operator==(const InstanceKey& lhs, const InstanceKey& rhs);
bool operator<(const InstanceKey& lhs, const InstanceKey& rhs);
std::ostream& operator<<(std::ostream& os, const InstanceKey& key);

struct ServiceInstance {
    std::string service_type;
    std::string name;
    ResolutionStatus status{ResolutionStatus::Unresolved};

    std::string host; // SRV target
    std::vector<std::string> addresses; // IPv4 first, then IPv6
    std::uint16_t port{0};
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    TxtProperties txt;

    bool has_service{false}; // SRV seen
    bool has_txt{false}; // TXT seen, possibly empty

    std::chrono::system_clock::time_point last_updated;

    [[nodiscard]] InstanceKey Key() const;
    // Name without the service type, "My Printer"
    [[nodiscard]] std::string Label() const;
    // "192.168.1.10:631", "[fe80::1]:631"
    [[nodiscard]] std::vector<std::string> Endpoints() const;
    // SRV, TXT and at least one address are known
    [[nodiscard]] bool IsComplete() const;
};
// Compares everything except last_updated
bool operator==(const ServiceInstance& lhs, const ServiceInstance& rhs);
bool operator!=(const ServiceInstance& lhs, const ServiceInstance& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceInstance& instance);

struct TypeAdded {
    std::string service_type;
};
struct TypeRemoved {
    std::string service_type;
};
using TypeEvent = std::variant<TypeAdded, TypeRemoved>;
std::ostream& operator<<(std::ostream& os, const TypeEvent& event);

// Added and Updated carry a full snapshot of the instance
struct InstanceAdded {
    ServiceInstance instance;
};
struct InstanceUpdated {
    ServiceInstance instance;
};
struct InstanceRemoved {
    InstanceKey key;
    ServiceInstance instance; // last snapshot, status Removed
};
using InstanceEvent = std::variant<InstanceAdded, InstanceUpdated, InstanceRemoved>;
std::ostream& operator<<(std::ostream& os, const InstanceEvent& event);

}
