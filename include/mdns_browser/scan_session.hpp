#pragma once

#include "mdns_browser/discovery_cache.hpp"
#include "mdns_browser/network_interfaces.hpp"
#include "mdns_browser/query_scheduler.hpp"
#include "mdns_browser/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mdns_browser
{

enum class SessionState {
    Idle,
    Starting,
    Running,
    Stopping
};
std::string ToString(SessionState state);

enum class BackoffMode {
    Exponential,
    Fixed
};

// What happens when a resolution times out
struct ResolvePolicy
{
    std::chrono::milliseconds timeout{3000}; // per attempt
    unsigned retry_limit{2}; // retries after the first attempt
    BackoffMode backoff{BackoffMode::Exponential};
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{8000};

    // Delay before retry number `retry`, starting at 1
    [[nodiscard]] std::chrono::milliseconds BackoffFor(unsigned retry) const;
};

struct SessionSettings
{
    // Browse "_services._dns-sd._udp.local.", otherwise only queried types are browsed
    bool browse_all_types{true};
    QuerySchedule query_schedule;
    ResolvePolicy resolve_policy;
    // How often expired records are dropped
    std::chrono::milliseconds sweep_interval{1000};
    std::chrono::milliseconds poll_interval{50};
    // Empty means MulticastTransport
    TransportFactory transport_factory;
};

struct StateChanged {
    SessionState state;
    std::uint64_t generation{0};
};
struct CacheChanged {
    CacheChange change;
};
struct SessionWarning {
    std::string message;
};
struct SessionError {
    std::string message;
};
using SessionEvent = std::variant<StateChanged, CacheChanged, SessionWarning, SessionError>;
std::ostream& operator<<(std::ostream& os, const SessionEvent& event);

using SessionEventHandler = std::function<void(const SessionEvent&)>;
using SubscriptionId = std::uint64_t;

// One active scan: owns the transport, the worker, the browsers, the resolver
// and the cache. Every Start() begins a new generation with an empty cache.
//
// Control methods are meant for a single control thread. They must not be called
// from event handlers, which run on the worker or inside the control method.
class ScanSession
{
public:
    explicit ScanSession(SessionSettings settings = SessionSettings());
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    // Only while Idle
    bool SetSettings(SessionSettings settings);
    [[nodiscard]] const SessionSettings& Settings() const;

    // Valid from Idle. Returns false if no interface could be bound.
    bool Start(const InterfaceSelector& selector = InterfaceSelector::All());
    // Always ends Idle, teardown problems are reported as one SessionError
    void Stop();
    // Stop() then Start() with the same interfaces, valid while Running
    bool Rescan();

    // Browses one service type. Throws InvalidQueryError for a malformed type,
    // returns false if the session is not running.
    bool ManualQuery(std::string_view serviceType);
    // All types are validated before anything is queried. Returns the number of
    // types that were not browsed yet.
    std::size_t QueryPresets(const std::vector<std::string>& serviceTypes);

    [[nodiscard]] SessionState State() const;
    [[nodiscard]] std::uint64_t Generation() const;
    // Interfaces the current run has sockets on
    [[nodiscard]] std::vector<NetworkInterface> Interfaces() const;
    [[nodiscard]] const DiscoveryCache& Cache() const;

    SubscriptionId Subscribe(SessionEventHandler handler);
    void Unsubscribe(SubscriptionId id);

private:
    class SessionImpl;
    std::unique_ptr<SessionImpl> m_impl;
};

}
