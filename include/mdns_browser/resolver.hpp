#pragma once

#include "mdns_browser/discovery_types.hpp"
#include "mdns_browser/errors.hpp"
#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/record_store.hpp"
#include "mdns_browser/transport.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <variant>

namespace mdns_browser
{

using ResolveOutcome = std::variant<ServiceInstance, ResolveError>;
using ResolveCallback = std::function<void(const InstanceKey&, const ResolveOutcome&)>;

// Actively queries the SRV, TXT and address records of an instance until it is
// complete or the deadline passes. One query round per Resolve(), retries are
// left to the caller.
class Resolver
{
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{3000};

    Resolver(EventLoop& loop, Transport& transport, const RecordStore& store);
    ~Resolver();

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    // A resolution already pending for the key is cancelled first
    void Resolve(const InstanceKey& key, ResolveCallback callback, std::chrono::milliseconds timeout = kDefaultTimeout);

    // Expects the record to be applied to the store already
    void HandleRecord(const Record& record);

    // Completes the pending resolution with ResolveError::Cancelled
    bool Cancel(const InstanceKey& key);
    // Cancel() for every pending resolution, returns how many were cancelled
    std::size_t CancelAll();
    // Drops pending resolutions without calling back
    void Stop();

    [[nodiscard]] bool IsPending(const InstanceKey& key) const;
    [[nodiscard]] std::size_t PendingCount() const { return m_pending.size(); }

private:
    struct Pending {
        InstanceKey key;
        ResolveCallback callback;
        EventLoop::TimerId deadline{0};
        std::string host; // lowercase, empty until the SRV is known
    };

    void QueryAddresses(Pending& pending, const std::string& host);
    void TryComplete(const std::string& name);
    void Finish(const std::string& name, const ResolveOutcome& outcome);

    EventLoop& m_loop;
    Transport& m_transport;
    const RecordStore& m_store;

    std::map<std::string, Pending> m_pending; // lowercase instance name
};

}
