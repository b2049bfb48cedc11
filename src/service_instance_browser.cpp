#include "mdns_browser/service_instance_browser.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/normalize.hpp"

#include <fmt/core.h>

namespace mdns_browser
{

ServiceInstanceBrowser::ServiceInstanceBrowser(std::string serviceType, EventLoop& loop, Transport& transport, const RecordStore& store, QuerySchedule schedule, EventSink sink)
: m_serviceType(std::move(serviceType))
, m_store(store)
, m_scheduler(loop, transport, m_serviceType, RecordType::PTR, schedule)
, m_sink(std::move(sink))
{}

void ServiceInstanceBrowser::Start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    Log(LogLevel::Debug, fmt::format("Browsing {}", m_serviceType));
    m_scheduler.Start();

    // Instances may already be known from additional records of other answers
    for (const auto& name : m_store.Pointers(m_serviceType)) {
        Refresh(name, true);
    }
}

void ServiceInstanceBrowser::Stop()
{
    m_running = false;
    m_scheduler.Stop();
}

void ServiceInstanceBrowser::HandleRecord(const Record& record)
{
    if (!m_running) {
        return;
    }

    const auto& header = HeaderOf(record);
    const bool goodbye = header.ttl == 0;
    const auto& owner = header.entry_string;

    std::visit(Overloaded{
        [&](const DomainNamePointerRecord& ptr) {
            if (!NamesEqual(owner, m_serviceType)) {
                return;
            }
            if (!goodbye) {
                Refresh(ptr.name_string, true);
            } else {
                Remove(ptr.name_string);
            }
        },
        [&](const ServiceRecord&) {
            if (!BelongsToType(owner) && !IsTracked(owner)) {
                return;
            }
            if (!goodbye) {
                Refresh(owner, true);
            } else {
                Remove(owner);
            }
        },
        [&](const TXTRecord&) {
            if (!BelongsToType(owner) && !IsTracked(owner)) {
                return;
            }
            Refresh(owner, !goodbye);
        },
        [&](const ARecord&) {
            for (const auto& key : Instances()) {
                if (const auto tracked = m_instances.find(ToLowerName(key.name)); tracked != m_instances.end() &&
                    NamesEqual(tracked->second.snapshot.host, owner)) {
                    Refresh(key.name, false);
                }
            }
        },
        [&](const AAAARecord&) {
            for (const auto& key : Instances()) {
                if (const auto tracked = m_instances.find(ToLowerName(key.name)); tracked != m_instances.end() &&
                    NamesEqual(tracked->second.snapshot.host, owner)) {
                    Refresh(key.name, false);
                }
            }
        },
        [](const AnyRecord&) {},
    }, record);
}

std::optional<ServiceInstance> ServiceInstanceBrowser::MarkResolved(const std::string& name)
{
    const auto it = m_instances.find(ToLowerName(name));
    if (it == m_instances.end()) {
        return std::nullopt;
    }
    auto& tracked = it->second;
    tracked.resolved = true;
    tracked.snapshot = m_store.Compose(tracked.snapshot.Key());
    tracked.snapshot.status = tracked.snapshot.IsComplete() ? ResolutionStatus::Resolved : ResolutionStatus::Unresolved;
    return tracked.snapshot;
}

std::vector<InstanceKey> ServiceInstanceBrowser::Instances() const
{
    std::vector<InstanceKey> keys;
    keys.reserve(m_instances.size());
    for (const auto& [lowerName, tracked] : m_instances) {
        keys.push_back(tracked.snapshot.Key());
    }
    return keys;
}

std::optional<ServiceInstance> ServiceInstanceBrowser::Find(const std::string& name) const
{
    const auto it = m_instances.find(ToLowerName(name));
    if (it == m_instances.end()) {
        return std::nullopt;
    }
    return it->second.snapshot;
}

bool ServiceInstanceBrowser::BelongsToType(const std::string& name) const
{
    return name.size() > m_serviceType.size() + 1 && NameEndsWith(name, "." + m_serviceType);
}

bool ServiceInstanceBrowser::IsTracked(const std::string& name) const
{
    return m_instances.count(ToLowerName(name)) > 0;
}

void ServiceInstanceBrowser::Refresh(const std::string& name, bool createIfMissing)
{
    const auto key = ToLowerName(name);
    auto it = m_instances.find(key);

    if (it == m_instances.end()) {
        if (!createIfMissing) {
            return;
        }
        auto snapshot = m_store.Compose(InstanceKey{m_serviceType, name});
        snapshot.status = ResolutionStatus::Unresolved;
        m_instances.emplace(key, Tracked{snapshot, false});
        Log(LogLevel::Info, fmt::format("Service added: {}", name));
        m_sink(InstanceAdded{std::move(snapshot)});
        return;
    }

    auto& tracked = it->second;
    auto snapshot = m_store.Compose(tracked.snapshot.Key());
    snapshot.status = (tracked.resolved && snapshot.IsComplete()) ? ResolutionStatus::Resolved : ResolutionStatus::Unresolved;
    if (snapshot == tracked.snapshot) {
        return;
    }
    tracked.snapshot = snapshot;
    Log(LogLevel::Debug, fmt::format("Service updated: {}", tracked.snapshot.name));
    m_sink(InstanceUpdated{std::move(snapshot)});
}

void ServiceInstanceBrowser::Remove(const std::string& name)
{
    const auto it = m_instances.find(ToLowerName(name));
    if (it == m_instances.end()) {
        return;
    }
    auto last = std::move(it->second.snapshot);
    m_instances.erase(it);
    last.status = ResolutionStatus::Removed;
    Log(LogLevel::Info, fmt::format("Service removed: {}", last.name));
    m_sink(InstanceRemoved{last.Key(), std::move(last)});
}

}
