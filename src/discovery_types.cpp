#include "mdns_browser/discovery_types.hpp"
#include "mdns_browser/normalize.hpp"

#include <tuple>

#include <fmt/core.h>

namespace mdns_browser
{

std::string ToString(ResolutionStatus status)
{
    switch (status) {
        case ResolutionStatus::Unresolved: return "unresolved";
        case ResolutionStatus::Resolved: return "resolved";
        case ResolutionStatus::Removed: return "removed";
    }
    return "";
}

bool operator==(const InstanceKey& lhs, const InstanceKey& rhs)
{
    return lhs.service_type == rhs.service_type
        && lhs.name == rhs.name;
}

bool operator<(const InstanceKey& lhs, const InstanceKey& rhs)
{
    return std::tie(lhs.service_type, lhs.name) < std::tie(rhs.service_type, rhs.name);
}

std::ostream& operator<<(std::ostream& os, const InstanceKey& key)
{
    os << key.name;
    return os;
}

InstanceKey ServiceInstance::Key() const
{
    return InstanceKey{service_type, name};
}

std::string ServiceInstance::Label() const
{
    const auto suffixLength = service_type.size() + 1;
    if (name.size() > suffixLength && NameEndsWith(name, "." + service_type)) {
        return name.substr(0, name.size() - suffixLength);
    }
    return name;
}

std::vector<std::string> ServiceInstance::Endpoints() const
{
    std::vector<std::string> endpoints;
    endpoints.reserve(addresses.size());
    for (const auto& address : addresses) {
        if (address.find(':') != std::string::npos) {
            endpoints.push_back(fmt::format("[{}]:{}", address, port));
        } else {
            endpoints.push_back(fmt::format("{}:{}", address, port));
        }
    }
    return endpoints;
}

bool ServiceInstance::IsComplete() const
{
    return has_service && has_txt && !addresses.empty();
}

bool operator==(const ServiceInstance& lhs, const ServiceInstance& rhs)
{
    return lhs.service_type == rhs.service_type
        && lhs.name == rhs.name
        && lhs.status == rhs.status
        && lhs.host == rhs.host
        && lhs.addresses == rhs.addresses
        && lhs.port == rhs.port
        && lhs.priority == rhs.priority
        && lhs.weight == rhs.weight
        && lhs.txt == rhs.txt
        && lhs.has_service == rhs.has_service
        && lhs.has_txt == rhs.has_txt;
}

bool operator!=(const ServiceInstance& lhs, const ServiceInstance& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ServiceInstance& instance)
{
    os << fmt::format("{} [{}] host {} port {} priority {} weight {} addresses {} txt {}",
        instance.name, ToString(instance.status), instance.host.empty() ? "-" : instance.host,
        instance.port, instance.priority, instance.weight, instance.addresses.size(), instance.txt.size());
    return os;
}

std::ostream& operator<<(std::ostream& os, const TypeEvent& event)
{
    std::visit(Overloaded{
        [&os](const TypeAdded& added) { os << "TypeAdded " << added.service_type; },
        [&os](const TypeRemoved& removed) { os << "TypeRemoved " << removed.service_type; },
    }, event);
    return os;
}

std::ostream& operator<<(std::ostream& os, const InstanceEvent& event)
{
    std::visit(Overloaded{
        [&os](const InstanceAdded& added) { os << "InstanceAdded " << added.instance; },
        [&os](const InstanceUpdated& updated) { os << "InstanceUpdated " << updated.instance; },
        [&os](const InstanceRemoved& removed) { os << "InstanceRemoved " << removed.key; },
    }, event);
    return os;
}

}
