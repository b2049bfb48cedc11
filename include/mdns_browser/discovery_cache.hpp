#pragma once

#include "mdns_browser/discovery_types.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mdns_browser
{

enum class ChangeKind {
    TypeAdded,
    TypeRemoved,
    InstanceAdded,
    InstanceUpdated,
    InstanceRemoved,
    InstanceResolved,
    Cleared
};
std::string ToString(ChangeKind kind);

struct CacheChange {
    ChangeKind kind;
    std::string service_type; // empty for Cleared
    std::string instance_name; // empty for type changes
    std::uint64_t generation{0};
};
std::ostream& operator<<(std::ostream& os, const CacheChange& change);

// Service type -> its instances, ordered by type and instance name
using CacheSnapshot = std::map<std::string, std::vector<ServiceInstance>>;

// Service types and their instances found by the current scan.
// Written from the worker thread only, read from anywhere. Reads return copies.
class DiscoveryCache
{
public:
    using ChangeListener = std::function<void(const CacheChange&)>;

    explicit DiscoveryCache(ChangeListener listener = nullptr);

    // Writes return true when they changed anything. Writes stamped with a
    // generation other than the current one are discarded.
    bool ApplyTypeEvent(std::uint64_t generation, const TypeEvent& event);
    bool ApplyInstanceEvent(std::uint64_t generation, const InstanceEvent& event);
    bool ApplyResolution(std::uint64_t generation, const ServiceInstance& instance);
    // Clears everything and adopts the generation, older generations are refused
    bool Reset(std::uint64_t generation);

    [[nodiscard]] std::vector<std::string> GetTypes() const;
    [[nodiscard]] std::vector<ServiceInstance> GetInstances(std::string_view serviceType) const;
    [[nodiscard]] std::optional<ServiceInstance> GetInstance(std::string_view serviceType, std::string_view name) const;
    // Instances of every type containing the filter, an empty filter matches all
    [[nodiscard]] std::vector<ServiceInstance> FindInstances(std::string_view typeFilter) const;
    [[nodiscard]] CacheSnapshot Snapshot() const;

    [[nodiscard]] bool HasType(std::string_view serviceType) const;
    [[nodiscard]] std::size_t TypeCount() const;
    [[nodiscard]] std::size_t InstanceCount() const;
    [[nodiscard]] std::uint64_t Generation() const;

private:
    struct TypeEntry {
        std::string service_type; // as announced
        std::map<std::string, ServiceInstance> instances; // lowercase name
    };

    // Called with the write lock held
    std::optional<CacheChange> AddType(const std::string& serviceType);
    std::optional<CacheChange> RemoveType(const std::string& serviceType);
    std::optional<CacheChange> StoreInstance(const ServiceInstance& instance, bool resolution);
    std::optional<CacheChange> RemoveInstance(const InstanceKey& key);

    void Notify(const std::optional<CacheChange>& change) const;

    ChangeListener m_listener;

    mutable std::shared_mutex m_mutex;
    std::uint64_t m_generation{0};
    std::map<std::string, TypeEntry> m_types; // lowercase type
};

}
