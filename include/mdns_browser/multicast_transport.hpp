#pragma once

#include "mdns_browser/transport.hpp"

#include <memory>

namespace mdns_browser
{

// Transport on top of mdns.h, one socket on port 5353 per interface address
class MulticastTransport : public Transport
{
public:
    MulticastTransport();
    ~MulticastTransport() override;

    OpenResult Open(const InterfaceSelector& selector) override;
    bool SendQuery(std::string_view name, RecordType type) override;
    void Subscribe(RecordHandler handler) override;
    void Poll(std::chrono::milliseconds maxWait) override;
    void Close() override;
    [[nodiscard]] bool IsOpen() const override;

private:
    class TransportImpl;
    std::unique_ptr<TransportImpl> m_impl;
};

}
