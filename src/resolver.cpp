#include "mdns_browser/resolver.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/normalize.hpp"

#include <vector>

#include <fmt/core.h>

namespace mdns_browser
{

Resolver::Resolver(EventLoop& loop, Transport& transport, const RecordStore& store)
: m_loop(loop)
, m_transport(transport)
, m_store(store)
{}

Resolver::~Resolver()
{
    Stop();
}

void Resolver::Resolve(const InstanceKey& key, ResolveCallback callback, std::chrono::milliseconds timeout)
{
    Cancel(key);

    const auto name = ToLowerName(key.name);
    Pending pending{key, std::move(callback)};
    pending.deadline = m_loop.ScheduleAfter(timeout, [this, name](){
        const auto it = m_pending.find(name);
        if (it != m_pending.end()) {
            Log(LogLevel::Info, fmt::format("Resolve of {} timed out", it->second.key.name));
            Finish(name, ResolveError::Timeout);
        }
    });
    auto& stored = m_pending.emplace(name, std::move(pending)).first->second;

    const auto known = m_store.Compose(key);
    if (known.IsComplete()) {
        m_loop.Post([this, name](){
            TryComplete(name);
        });
        return;
    }

    Log(LogLevel::Debug, fmt::format("Resolving {}", key.name));
    if (!known.has_service) {
        m_transport.SendQuery(key.name, RecordType::SRV);
    }
    if (!known.has_txt) {
        m_transport.SendQuery(key.name, RecordType::TXT);
    }
    if (known.has_service) {
        QueryAddresses(stored, known.host);
    }
}

void Resolver::HandleRecord(const Record& record)
{
    if (m_pending.empty()) {
        return;
    }

    const auto& header = HeaderOf(record);
    const auto owner = ToLowerName(header.entry_string);
    std::vector<std::string> candidates;

    std::visit(Overloaded{
        [&](const ServiceRecord& srv) {
            const auto it = m_pending.find(owner);
            if (it == m_pending.end()) {
                return;
            }
            if (header.ttl > 0 && ToLowerName(srv.target) != it->second.host) {
                QueryAddresses(it->second, srv.target);
            }
            candidates.push_back(owner);
        },
        [&](const TXTRecord&) {
            if (m_pending.count(owner) > 0) {
                candidates.push_back(owner);
            }
        },
        [&](const ARecord&) {
            for (const auto& [name, pending] : m_pending) {
                if (pending.host == owner) {
                    candidates.push_back(name);
                }
            }
        },
        [&](const AAAARecord&) {
            for (const auto& [name, pending] : m_pending) {
                if (pending.host == owner) {
                    candidates.push_back(name);
                }
            }
        },
        [](const DomainNamePointerRecord&) {},
        [](const AnyRecord&) {},
    }, record);

    for (const auto& name : candidates) {
        TryComplete(name);
    }
}

bool Resolver::Cancel(const InstanceKey& key)
{
    const auto name = ToLowerName(key.name);
    if (m_pending.count(name) == 0) {
        return false;
    }
    Log(LogLevel::Debug, fmt::format("Resolve of {} cancelled", key.name));
    Finish(name, ResolveError::Cancelled);
    return true;
}

std::size_t Resolver::CancelAll()
{
    std::vector<InstanceKey> keys;
    keys.reserve(m_pending.size());
    for (const auto& [name, pending] : m_pending) {
        keys.push_back(pending.key);
    }
    std::size_t cancelled = 0;
    for (const auto& key : keys) {
        if (Cancel(key)) {
            ++cancelled;
        }
    }
    return cancelled;
}

void Resolver::Stop()
{
    for (const auto& [name, pending] : m_pending) {
        m_loop.CancelTimer(pending.deadline);
    }
    m_pending.clear();
}

bool Resolver::IsPending(const InstanceKey& key) const
{
    return m_pending.count(ToLowerName(key.name)) > 0;
}

void Resolver::QueryAddresses(Pending& pending, const std::string& host)
{
    pending.host = ToLowerName(host);
    if (m_store.Addresses(host).empty()) {
        m_transport.SendQuery(host, RecordType::A);
        m_transport.SendQuery(host, RecordType::AAAA);
    }
}

void Resolver::TryComplete(const std::string& name)
{
    const auto it = m_pending.find(name);
    if (it == m_pending.end()) {
        return;
    }
    auto instance = m_store.Compose(it->second.key);
    if (!instance.IsComplete()) {
        return;
    }
    instance.status = ResolutionStatus::Resolved;
    Log(LogLevel::Debug, fmt::format("Resolved {}", instance.name));
    Finish(name, instance);
}

void Resolver::Finish(const std::string& name, const ResolveOutcome& outcome)
{
    const auto it = m_pending.find(name);
    if (it == m_pending.end()) {
        return;
    }
    // The callback may start another resolution for the same key
    auto pending = std::move(it->second);
    m_pending.erase(it);
    m_loop.CancelTimer(pending.deadline);
    if (pending.callback) {
        pending.callback(pending.key, outcome);
    }
}

}
