#pragma once

#include "mdns_browser/discovery_types.hpp"
#include "mdns_browser/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdns_browser
{

// Records heard on the network, keyed case-insensitively by owner name and
// kept until their TTL runs out or a goodbye arrives. Worker thread only.
class RecordStore
{
public:
    using Clock = std::chrono::steady_clock;

    // Stores or refreshes the record, a TTL of 0 removes it.
    // Returns true when the stored data changed, a plain refresh returns false.
    bool Apply(const Record& record, Clock::time_point now = Clock::now());

    // Drops expired records and returns them as goodbyes (TTL 0)
    std::vector<Record> Expire(Clock::time_point now = Clock::now());

    // PTR targets for an owner name, example: instances of "_http._tcp.local."
    [[nodiscard]] std::vector<std::string> Pointers(std::string_view owner) const;
    [[nodiscard]] std::optional<ServiceRecord> Service(std::string_view instance) const;
    [[nodiscard]] std::optional<TXTRecord> Text(std::string_view instance) const;
    // IPv4 addresses first, then IPv6
    [[nodiscard]] std::vector<std::string> Addresses(std::string_view host) const;

    // Builds the instance as far as the stored records allow. The status is left
    // Unresolved, that is for the caller to decide.
    [[nodiscard]] ServiceInstance Compose(const InstanceKey& key) const;

    [[nodiscard]] std::size_t Size() const;

private:
    template <typename RecordT>
    struct Stored {
        RecordT record;
        Clock::time_point received;
        Clock::time_point expires;
    };

    template <typename RecordT>
    using ByName = std::map<std::string, Stored<RecordT>>;

    template <typename RecordT, typename SameData>
    static bool Upsert(ByName<RecordT>& records, const std::string& key, const RecordT& record, Clock::time_point now, SameData sameData);

    // Cache-flush: drops the other addresses of a family that were not refreshed within the last second
    template <typename RecordT>
    static bool FlushStale(ByName<RecordT>& addresses, const std::string& keep, Clock::time_point now);

    template <typename RecordT>
    static void ExpireFrom(ByName<RecordT>& records, Clock::time_point now, std::vector<Record>& expired);

    std::map<std::string, ByName<DomainNamePointerRecord>> m_pointers;
    ByName<ServiceRecord> m_services;
    ByName<TXTRecord> m_texts;
    std::map<std::string, ByName<ARecord>> m_ipv4;
    std::map<std::string, ByName<AAAARecord>> m_ipv6;
};

}
