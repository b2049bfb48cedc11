#include "mdns_browser/discovery_cache.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/normalize.hpp"

#include <algorithm>
#include <mutex>

#include <fmt/core.h>

namespace mdns_browser
{

std::string ToString(ChangeKind kind)
{
    switch (kind) {
        case ChangeKind::TypeAdded: return "TypeAdded";
        case ChangeKind::TypeRemoved: return "TypeRemoved";
        case ChangeKind::InstanceAdded: return "InstanceAdded";
        case ChangeKind::InstanceUpdated: return "InstanceUpdated";
        case ChangeKind::InstanceRemoved: return "InstanceRemoved";
        case ChangeKind::InstanceResolved: return "InstanceResolved";
        case ChangeKind::Cleared: return "Cleared";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const CacheChange& change)
{
    os << ToString(change.kind) << " (generation " << change.generation << ")";
    if (!change.service_type.empty()) {
        os << " " << change.service_type;
    }
    if (!change.instance_name.empty()) {
        os << " " << change.instance_name;
    }
    return os;
}

DiscoveryCache::DiscoveryCache(ChangeListener listener)
: m_listener(std::move(listener))
{}

bool DiscoveryCache::ApplyTypeEvent(std::uint64_t generation, const TypeEvent& event)
{
    std::optional<CacheChange> change;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (generation != m_generation) {
            Log(LogLevel::Debug, fmt::format("Dropping type event of generation {}, current is {}", generation, m_generation));
            return false;
        }
        change = std::visit(Overloaded{
            [this](const TypeAdded& added) { return AddType(added.service_type); },
            [this](const TypeRemoved& removed) { return RemoveType(removed.service_type); },
        }, event);
    }
    Notify(change);
    return change.has_value();
}

bool DiscoveryCache::ApplyInstanceEvent(std::uint64_t generation, const InstanceEvent& event)
{
    std::optional<CacheChange> change;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (generation != m_generation) {
            Log(LogLevel::Debug, fmt::format("Dropping instance event of generation {}, current is {}", generation, m_generation));
            return false;
        }
        change = std::visit(Overloaded{
            [this](const InstanceAdded& added) { return StoreInstance(added.instance, false); },
            [this](const InstanceUpdated& updated) { return StoreInstance(updated.instance, false); },
            [this](const InstanceRemoved& removed) { return RemoveInstance(removed.key); },
        }, event);
    }
    Notify(change);
    return change.has_value();
}

bool DiscoveryCache::ApplyResolution(std::uint64_t generation, const ServiceInstance& instance)
{
    std::optional<CacheChange> change;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (generation != m_generation) {
            return false;
        }
        change = StoreInstance(instance, true);
    }
    Notify(change);
    return change.has_value();
}

bool DiscoveryCache::Reset(std::uint64_t generation)
{
    CacheChange change{ChangeKind::Cleared, "", "", generation};
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (generation < m_generation) {
            return false;
        }
        m_generation = generation;
        m_types.clear();
    }
    Notify(change);
    return true;
}

std::vector<std::string> DiscoveryCache::GetTypes() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> types;
    types.reserve(m_types.size());
    for (const auto& [key, entry] : m_types) {
        types.push_back(entry.service_type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::vector<ServiceInstance> DiscoveryCache::GetInstances(std::string_view serviceType) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ServiceInstance> instances;
    const auto entry = m_types.find(ToLowerName(serviceType));
    if (entry == m_types.end()) {
        return instances;
    }
    instances.reserve(entry->second.instances.size());
    for (const auto& [name, instance] : entry->second.instances) {
        instances.push_back(instance);
    }
    return instances;
}

std::optional<ServiceInstance> DiscoveryCache::GetInstance(std::string_view serviceType, std::string_view name) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto entry = m_types.find(ToLowerName(serviceType));
    if (entry == m_types.end()) {
        return std::nullopt;
    }
    const auto instance = entry->second.instances.find(ToLowerName(name));
    if (instance == entry->second.instances.end()) {
        return std::nullopt;
    }
    return instance->second;
}

std::vector<ServiceInstance> DiscoveryCache::FindInstances(std::string_view typeFilter) const
{
    const auto filter = ToLowerName(typeFilter);
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ServiceInstance> instances;
    for (const auto& [key, entry] : m_types) {
        if (!filter.empty() && key.find(filter) == std::string::npos) {
            continue;
        }
        for (const auto& [name, instance] : entry.instances) {
            instances.push_back(instance);
        }
    }
    return instances;
}

CacheSnapshot DiscoveryCache::Snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    CacheSnapshot snapshot;
    for (const auto& [key, entry] : m_types) {
        auto& instances = snapshot[entry.service_type];
        for (const auto& [name, instance] : entry.instances) {
            instances.push_back(instance);
        }
    }
    return snapshot;
}

bool DiscoveryCache::HasType(std::string_view serviceType) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_types.count(ToLowerName(serviceType)) > 0;
}

std::size_t DiscoveryCache::TypeCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_types.size();
}

std::size_t DiscoveryCache::InstanceCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::size_t count = 0;
    for (const auto& [key, entry] : m_types) {
        count += entry.instances.size();
    }
    return count;
}

std::uint64_t DiscoveryCache::Generation() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_generation;
}

std::optional<CacheChange> DiscoveryCache::AddType(const std::string& serviceType)
{
    const auto inserted = m_types.emplace(ToLowerName(serviceType), TypeEntry{serviceType, {}}).second;
    if (!inserted) {
        return std::nullopt;
    }
    return CacheChange{ChangeKind::TypeAdded, serviceType, "", m_generation};
}

std::optional<CacheChange> DiscoveryCache::RemoveType(const std::string& serviceType)
{
    const auto entry = m_types.find(ToLowerName(serviceType));
    if (entry == m_types.end()) {
        return std::nullopt;
    }
    CacheChange change{ChangeKind::TypeRemoved, entry->second.service_type, "", m_generation};
    // Takes its instances along
    m_types.erase(entry);
    return change;
}

std::optional<CacheChange> DiscoveryCache::StoreInstance(const ServiceInstance& instance, bool resolution)
{
    const auto entry = m_types.find(ToLowerName(instance.service_type));
    if (entry == m_types.end()) {
        Log(LogLevel::Debug, fmt::format("Ignoring {}, its type {} is not known", instance.name, instance.service_type));
        return std::nullopt;
    }

    auto& instances = entry->second.instances;
    const auto key = ToLowerName(instance.name);
    const auto existing = instances.find(key);
    if (existing != instances.end() && existing->second == instance) {
        return std::nullopt;
    }

    ChangeKind kind = ChangeKind::InstanceAdded;
    if (resolution) {
        kind = ChangeKind::InstanceResolved;
    } else if (existing != instances.end()) {
        kind = ChangeKind::InstanceUpdated;
    }

    auto stored = instance;
    stored.last_updated = std::chrono::system_clock::now();
    instances.insert_or_assign(key, std::move(stored));
    return CacheChange{kind, entry->second.service_type, instance.name, m_generation};
}

std::optional<CacheChange> DiscoveryCache::RemoveInstance(const InstanceKey& key)
{
    const auto entry = m_types.find(ToLowerName(key.service_type));
    if (entry == m_types.end()) {
        return std::nullopt;
    }
    auto& instances = entry->second.instances;
    const auto existing = instances.find(ToLowerName(key.name));
    if (existing == instances.end()) {
        return std::nullopt;
    }
    CacheChange change{ChangeKind::InstanceRemoved, entry->second.service_type, existing->second.name, m_generation};
    instances.erase(existing);
    return change;
}

void DiscoveryCache::Notify(const std::optional<CacheChange>& change) const
{
    if (!change || !m_listener) {
        return;
    }
    try {
        m_listener(*change);
    } catch (const std::exception& e) {
        Log(LogLevel::Error, fmt::format("Cache change listener failed: {}", e.what()));
    }
}

}
