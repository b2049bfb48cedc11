#pragma once

#include "mdns_browser/errors.hpp"
#include "mdns_browser/network_interfaces.hpp"
#include "mdns_browser/types.hpp"

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

namespace mdns_browser
{

using RecordHandler = std::function<void(const Record&)>;

struct OpenResult
{
    std::vector<NetworkInterface> opened;
    // Interfaces that failed while others succeeded
    std::vector<BindError> bind_errors;
};

struct TransportStats
{
    std::size_t packets_received{0};
    std::size_t packets_ignored{0};
    std::size_t records_delivered{0};
    std::size_t malformed_dropped{0};
    std::size_t queries_sent{0};
    std::size_t send_failures{0};
};
std::ostream& operator<<(std::ostream& os, const TransportStats& stats);

// Multicast DNS socket layer.
// Open() is called from the control thread before the worker starts and Close()
// after it has stopped, everything in between happens on the worker thread.
class Transport
{
public:
    virtual ~Transport() = default;

    // Throws BindError when not a single socket could be bound
    virtual OpenResult Open(const InterfaceSelector& selector) = 0;
    // Returns true if the query went out on at least one socket
    virtual bool SendQuery(std::string_view name, RecordType type) = 0;
    virtual void Subscribe(RecordHandler handler) = 0;
    // Waits up to maxWait for packets and hands their records to the handler
    virtual void Poll(std::chrono::milliseconds maxWait) = 0;
    virtual void Close() = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

}
