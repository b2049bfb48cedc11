#pragma once

#include "mdns_browser/discovery_types.hpp"
#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/query_scheduler.hpp"
#include "mdns_browser/record_store.hpp"
#include "mdns_browser/transport.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace mdns_browser
{

// Browses "_services._dns-sd._udp.local." and reports service types as they
// come and go. Repeated announcements of a known type are ignored.
class ServiceTypeBrowser
{
public:
    using EventSink = std::function<void(const TypeEvent&)>;

    ServiceTypeBrowser(EventLoop& loop, Transport& transport, const RecordStore& store, QuerySchedule schedule, EventSink sink);

    void Start();
    // No events are emitted after Stop()
    void Stop();
    [[nodiscard]] bool Running() const { return m_running; }

    // Expects the record to be applied to the store already
    void HandleRecord(const Record& record);

    [[nodiscard]] std::vector<std::string> Types() const;
    [[nodiscard]] bool Knows(std::string_view serviceType) const;

private:
    // Another announced name may still fold to the same type
    [[nodiscard]] bool StillAnnounced(const std::string& serviceType) const;

    const RecordStore& m_store;
    QueryScheduler m_scheduler;
    EventSink m_sink;
    bool m_running{false};

    std::map<std::string, std::string> m_types; // lowercase -> as announced
};

}
