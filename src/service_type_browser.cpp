#include "mdns_browser/service_type_browser.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/normalize.hpp"

#include <fmt/core.h>

namespace mdns_browser
{

ServiceTypeBrowser::ServiceTypeBrowser(EventLoop& loop, Transport& transport, const RecordStore& store, QuerySchedule schedule, EventSink sink)
: m_store(store)
, m_scheduler(loop, transport, std::string(kMetaQueryName), RecordType::PTR, schedule)
, m_sink(std::move(sink))
{}

void ServiceTypeBrowser::Start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    Log(LogLevel::Info, "Sending DNS-SD discovery.");
    m_scheduler.Start();
}

void ServiceTypeBrowser::Stop()
{
    m_running = false;
    m_scheduler.Stop();
}

void ServiceTypeBrowser::HandleRecord(const Record& record)
{
    if (!m_running) {
        return;
    }
    const auto* ptr = std::get_if<DomainNamePointerRecord>(&record);
    if (!ptr || !IsMetaQueryName(ptr->header.entry_string)) {
        return;
    }

    const auto serviceType = ServiceTypeFromName(ptr->name_string);
    const auto key = ToLowerName(serviceType);
    const auto known = m_types.find(key);

    if (ptr->header.ttl > 0) {
        if (known != m_types.end()) {
            return;
        }
        m_types.emplace(key, serviceType);
        Log(LogLevel::Info, fmt::format("Service type found: {}", serviceType));
        m_sink(TypeAdded{serviceType});
        return;
    }

    if (known == m_types.end() || StillAnnounced(key)) {
        return;
    }
    const auto announced = known->second;
    m_types.erase(known);
    Log(LogLevel::Info, fmt::format("Service type gone: {}", announced));
    m_sink(TypeRemoved{announced});
}

std::vector<std::string> ServiceTypeBrowser::Types() const
{
    std::vector<std::string> types;
    types.reserve(m_types.size());
    for (const auto& [key, serviceType] : m_types) {
        types.push_back(serviceType);
    }
    return types;
}

bool ServiceTypeBrowser::Knows(std::string_view serviceType) const
{
    return m_types.count(ToLowerName(serviceType)) > 0;
}

bool ServiceTypeBrowser::StillAnnounced(const std::string& serviceType) const
{
    for (const auto& name : m_store.Pointers(kMetaQueryName)) {
        if (ToLowerName(ServiceTypeFromName(name)) == serviceType) {
            return true;
        }
    }
    return false;
}

}
