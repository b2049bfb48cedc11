#pragma once

#include "mdns_browser/discovery_types.hpp"
#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/query_scheduler.hpp"
#include "mdns_browser/record_store.hpp"
#include "mdns_browser/transport.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mdns_browser
{

// Tracks the instances of one service type.
// PTR, SRV, TXT and address records are turned into InstanceAdded/Updated/Removed
// events carrying a full snapshot. Announcements that change nothing produce no
// event and SRV/TXT arriving ahead of the PTR create the instance.
class ServiceInstanceBrowser
{
public:
    using EventSink = std::function<void(const InstanceEvent&)>;

    ServiceInstanceBrowser(std::string serviceType, EventLoop& loop, Transport& transport, const RecordStore& store, QuerySchedule schedule, EventSink sink);

    void Start();
    // No events are emitted after Stop()
    void Stop();

    // Expects the record to be applied to the store already
    void HandleRecord(const Record& record);

    // Called once the resolver completed the instance, returns the snapshot
    // with its new status or nothing if the instance is no longer tracked
    std::optional<ServiceInstance> MarkResolved(const std::string& name);

    [[nodiscard]] const std::string& ServiceType() const { return m_serviceType; }
    [[nodiscard]] std::vector<InstanceKey> Instances() const;
    [[nodiscard]] std::optional<ServiceInstance> Find(const std::string& name) const;

private:
    struct Tracked {
        ServiceInstance snapshot;
        bool resolved{false};
    };

    [[nodiscard]] bool BelongsToType(const std::string& name) const;
    [[nodiscard]] bool IsTracked(const std::string& name) const;
    void Refresh(const std::string& name, bool createIfMissing);
    void Remove(const std::string& name);

    const std::string m_serviceType;
    const RecordStore& m_store;
    QueryScheduler m_scheduler;
    EventSink m_sink;
    bool m_running{false};

    std::map<std::string, Tracked> m_instances; // lowercase name
};

}
