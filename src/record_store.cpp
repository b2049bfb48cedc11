#include "mdns_browser/record_store.hpp"
#include "mdns_browser/normalize.hpp"

#include <algorithm>
#include <array>

#include <arpa/inet.h>

namespace mdns_browser
{

namespace
{

// RFC 6762 section 10.2
constexpr auto kCacheFlushGrace = std::chrono::seconds(1);

template <typename Map>
void EraseEmpty(Map& map)
{
    for (auto it = map.begin(); it != map.end();) {
        if (it->second.empty()) {
            it = map.erase(it);
        } else {
            ++it;
        }
    }
}

// Unparsable addresses sort last
template <std::size_t N>
std::array<std::uint8_t, N> AddressBytes(int family, const std::string& address)
{
    std::array<std::uint8_t, N> bytes{};
    const auto host = address.substr(0, address.find('%'));
    if (inet_pton(family, host.c_str(), bytes.data()) != 1) {
        bytes.fill(0xff);
    }
    return bytes;
}

template <std::size_t N, typename Stored>
std::vector<std::string> SortedAddresses(int family, const Stored& stored)
{
    std::vector<std::pair<std::array<std::uint8_t, N>, std::string>> keyed;
    for (const auto& entry : stored) {
        keyed.emplace_back(AddressBytes<N>(family, entry.first), entry.first);
    }
    std::sort(keyed.begin(), keyed.end());
    std::vector<std::string> addresses;
    for (auto& [bytes, address] : keyed) {
        addresses.push_back(std::move(address));
    }
    return addresses;
}

}

template <typename RecordT, typename SameData>
bool RecordStore::Upsert(ByName<RecordT>& records, const std::string& key, const RecordT& record, Clock::time_point now, SameData sameData)
{
    const auto expires = now + std::chrono::seconds(record.header.ttl);
    auto it = records.find(key);
    if (it == records.end()) {
        records.emplace(key, Stored<RecordT>{record, now, expires});
        return true;
    }
    const bool changed = !sameData(it->second.record, record);
    it->second = Stored<RecordT>{record, now, expires};
    return changed;
}

template <typename RecordT>
bool RecordStore::FlushStale(ByName<RecordT>& addresses, const std::string& keep, Clock::time_point now)
{
    bool flushed = false;
    for (auto it = addresses.begin(); it != addresses.end();) {
        if (it->first != keep && it->second.received + kCacheFlushGrace < now) {
            it = addresses.erase(it);
            flushed = true;
        } else {
            ++it;
        }
    }
    return flushed;
}

template <typename RecordT>
void RecordStore::ExpireFrom(ByName<RecordT>& records, Clock::time_point now, std::vector<Record>& expired)
{
    for (auto it = records.begin(); it != records.end();) {
        if (it->second.expires <= now) {
            RecordT goodbye = std::move(it->second.record);
            goodbye.header.ttl = 0;
            expired.emplace_back(std::move(goodbye));
            it = records.erase(it);
        } else {
            ++it;
        }
    }
}

bool RecordStore::Apply(const Record& record, Clock::time_point now)
{
    const auto& header = HeaderOf(record);
    const auto owner = ToLowerName(header.entry_string);
    const bool goodbye = header.ttl == 0;

    return std::visit(Overloaded{
        [&](const DomainNamePointerRecord& ptr) {
            auto& targets = m_pointers[owner];
            const auto target = ToLowerName(ptr.name_string);
            bool changed = false;
            if (goodbye) {
                changed = targets.erase(target) > 0;
            } else {
                changed = Upsert(targets, target, ptr, now, [](const auto&, const auto&) { return true; });
            }
            if (targets.empty()) {
                m_pointers.erase(owner);
            }
            return changed;
        },
        [&](const ServiceRecord& srv) {
            if (goodbye) {
                return m_services.erase(owner) > 0;
            }
            return Upsert(m_services, owner, srv, now, [](const ServiceRecord& lhs, const ServiceRecord& rhs) {
                return NamesEqual(lhs.target, rhs.target)
                    && lhs.port == rhs.port
                    && lhs.priority == rhs.priority
                    && lhs.weight == rhs.weight;
            });
        },
        [&](const TXTRecord& txt) {
            if (goodbye) {
                return m_texts.erase(owner) > 0;
            }
            return Upsert(m_texts, owner, txt, now, [](const TXTRecord& lhs, const TXTRecord& rhs) {
                return lhs.txt == rhs.txt;
            });
        },
        [&](const ARecord& a) {
            auto& addresses = m_ipv4[owner];
            bool changed = false;
            if (goodbye) {
                changed = addresses.erase(a.address_string) > 0;
            } else {
                changed = Upsert(addresses, a.address_string, a, now, [](const auto&, const auto&) { return true; });
                if (a.header.cache_flush) {
                    changed = FlushStale(addresses, a.address_string, now) || changed;
                }
            }
            if (addresses.empty()) {
                m_ipv4.erase(owner);
            }
            return changed;
        },
        [&](const AAAARecord& aaaa) {
            auto& addresses = m_ipv6[owner];
            bool changed = false;
            if (goodbye) {
                changed = addresses.erase(aaaa.address_string) > 0;
            } else {
                changed = Upsert(addresses, aaaa.address_string, aaaa, now, [](const auto&, const auto&) { return true; });
                if (aaaa.header.cache_flush) {
                    changed = FlushStale(addresses, aaaa.address_string, now) || changed;
                }
            }
            if (addresses.empty()) {
                m_ipv6.erase(owner);
            }
            return changed;
        },
        [](const AnyRecord&) {
            return false;
        },
    }, record);
}

std::vector<Record> RecordStore::Expire(Clock::time_point now)
{
    std::vector<Record> expired;
    for (auto& [owner, targets] : m_pointers) {
        ExpireFrom(targets, now, expired);
    }
    EraseEmpty(m_pointers);
    ExpireFrom(m_services, now, expired);
    ExpireFrom(m_texts, now, expired);
    for (auto& [host, addresses] : m_ipv4) {
        ExpireFrom(addresses, now, expired);
    }
    EraseEmpty(m_ipv4);
    for (auto& [host, addresses] : m_ipv6) {
        ExpireFrom(addresses, now, expired);
    }
    EraseEmpty(m_ipv6);
    return expired;
}

std::vector<std::string> RecordStore::Pointers(std::string_view owner) const
{
    std::vector<std::string> targets;
    const auto it = m_pointers.find(ToLowerName(owner));
    if (it != m_pointers.end()) {
        for (const auto& [key, stored] : it->second) {
            targets.push_back(stored.record.name_string);
        }
    }
    return targets;
}

std::optional<ServiceRecord> RecordStore::Service(std::string_view instance) const
{
    const auto it = m_services.find(ToLowerName(instance));
    if (it == m_services.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::optional<TXTRecord> RecordStore::Text(std::string_view instance) const
{
    const auto it = m_texts.find(ToLowerName(instance));
    if (it == m_texts.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<std::string> RecordStore::Addresses(std::string_view host) const
{
    std::vector<std::string> addresses;
    const auto lowerHost = ToLowerName(host);
    if (const auto it = m_ipv4.find(lowerHost); it != m_ipv4.end()) {
        addresses = SortedAddresses<4>(AF_INET, it->second);
    }
    if (const auto it = m_ipv6.find(lowerHost); it != m_ipv6.end()) {
        const auto ipv6 = SortedAddresses<16>(AF_INET6, it->second);
        addresses.insert(addresses.end(), ipv6.begin(), ipv6.end());
    }
    return addresses;
}

ServiceInstance RecordStore::Compose(const InstanceKey& key) const
{
    ServiceInstance instance;
    instance.service_type = key.service_type;
    instance.name = key.name;

    if (const auto srv = Service(key.name)) {
        instance.has_service = true;
        instance.host = srv->target;
        instance.port = srv->port;
        instance.priority = srv->priority;
        instance.weight = srv->weight;
        instance.addresses = Addresses(srv->target);
    }
    if (const auto txt = Text(key.name)) {
        instance.has_txt = true;
        instance.txt = txt->txt;
    }
    instance.last_updated = std::chrono::system_clock::now();
    return instance;
}

std::size_t RecordStore::Size() const
{
    std::size_t size = m_services.size() + m_texts.size();
    for (const auto& [owner, targets] : m_pointers) {
        size += targets.size();
    }
    for (const auto& [host, addresses] : m_ipv4) {
        size += addresses.size();
    }
    for (const auto& [host, addresses] : m_ipv6) {
        size += addresses.size();
    }
    return size;
}

}
