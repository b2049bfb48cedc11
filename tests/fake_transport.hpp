#pragma once

#include "mdns_browser/normalize.hpp"
#include "mdns_browser/transport.hpp"
#include "mdns_browser/types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mdns_browser::test
{

inline RecordHeader MakeHeader(const std::string& owner, RecordType type, std::uint32_t ttl)
{
    RecordHeader header;
    header.ip_address = "192.0.2.10:5353";
    header.entry_type = EntryType::ANSWER;
    header.entry_string = owner;
    header.record_type = static_cast<std::uint16_t>(type);
    header.rclass = 1;
    header.ttl = ttl;
    return header;
}

inline Record MakePtr(const std::string& owner, const std::string& target, std::uint32_t ttl = 4500)
{
    return DomainNamePointerRecord{MakeHeader(owner, RecordType::PTR, ttl), target};
}

inline Record MakeSrv(const std::string& instance, const std::string& host, std::uint16_t port, std::uint32_t ttl = 120)
{
    ServiceRecord srv{MakeHeader(instance, RecordType::SRV, ttl), host};
    srv.port = port;
    return srv;
}

inline Record MakeTxt(const std::string& instance, TxtProperties txt, std::uint32_t ttl = 4500)
{
    return TXTRecord{MakeHeader(instance, RecordType::TXT, ttl), std::move(txt)};
}

inline Record MakeA(const std::string& host, const std::string& address, std::uint32_t ttl = 120)
{
    return ARecord{MakeHeader(host, RecordType::A, ttl), address};
}

inline Record MakeAAAA(const std::string& host, const std::string& address, std::uint32_t ttl = 120)
{
    return AAAARecord{MakeHeader(host, RecordType::AAAA, ttl), address};
}

// Transport without sockets. Queries go to a responder whose answers are
// delivered by Poll() after an optional delay, Inject() delivers unsolicited records.
class FakeTransport : public Transport
{
public:
    using Clock = std::chrono::steady_clock;
    using Responder = std::function<std::vector<Record>(const std::string& name, RecordType type)>;

    struct SentQuery {
        std::string name;
        RecordType type;
    };

    OpenResult Open(const InterfaceSelector& selector) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failBind) {
            throw BindError(selector.ToString(), "fake bind failure");
        }
        m_open = true;
        m_closed = false;
        OpenResult result;
        result.opened.push_back(NetworkInterface{"fake0", "192.0.2.1"});
        for (const auto& name : m_failingInterfaces) {
            result.bind_errors.emplace_back(name, "fake bind failure");
        }
        return result;
    }

    bool SendQuery(std::string_view name, RecordType type) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) {
            return false;
        }
        m_sent.push_back(SentQuery{std::string(name), type});
        if (m_responder) {
            const auto delay = m_delays.count(type) > 0 ? m_delays.at(type) : std::chrono::milliseconds(0);
            for (auto& record : m_responder(std::string(name), type)) {
                m_inbox.emplace(Clock::now() + delay, std::move(record));
            }
            m_cv.notify_all();
        }
        return true;
    }

    void Subscribe(RecordHandler handler) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    void Poll(std::chrono::milliseconds maxWait) override
    {
        std::vector<Record> due;
        RecordHandler handler;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            const auto deadline = Clock::now() + maxWait;
            while (true) {
                const auto now = Clock::now();
                if ((!m_inbox.empty() && m_inbox.begin()->first <= now) || now >= deadline) {
                    break;
                }
                auto wake = deadline;
                if (!m_inbox.empty() && m_inbox.begin()->first < wake) {
                    wake = m_inbox.begin()->first;
                }
                m_cv.wait_until(lock, wake);
            }
            const auto now = Clock::now();
            while (!m_inbox.empty() && m_inbox.begin()->first <= now) {
                due.push_back(std::move(m_inbox.begin()->second));
                m_inbox.erase(m_inbox.begin());
            }
            handler = m_handler;
            m_delivered += due.size();
        }
        if (!handler) {
            return;
        }
        for (const auto& record : due) {
            handler(record);
        }
    }

    void Close() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = false;
        m_closed = true;
        m_inbox.clear();
    }

    bool IsOpen() const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_open;
    }

    void Inject(Record record, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inbox.emplace(Clock::now() + delay, std::move(record));
        m_cv.notify_all();
    }

    void SetResponder(Responder responder)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responder = std::move(responder);
    }

    void SetResponseDelay(RecordType type, std::chrono::milliseconds delay)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_delays[type] = delay;
    }

    void SetFailBind(bool fail)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failBind = fail;
    }

    // Open() still succeeds on fake0 but reports these interfaces as failed
    void SetFailingInterfaces(std::vector<std::string> names)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failingInterfaces = std::move(names);
    }

    std::vector<SentQuery> Sent() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sent;
    }

    std::size_t CountSent(const std::string& name, RecordType type) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t count = 0;
        for (const auto& query : m_sent) {
            if (NamesEqual(query.name, name) && query.type == type) {
                ++count;
            }
        }
        return count;
    }

    bool WasClosed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    std::size_t Delivered() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_delivered;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open{false};
    bool m_closed{false};
    bool m_failBind{false};
    std::vector<std::string> m_failingInterfaces;
    RecordHandler m_handler;
    Responder m_responder;
    std::map<RecordType, std::chrono::milliseconds> m_delays;
    std::multimap<Clock::time_point, Record> m_inbox;
    std::vector<SentQuery> m_sent;
    std::size_t m_delivered{0};
};

// Hands a FakeTransport owned by the test to a session, which destroys its
// transport on Stop()
class SharedTransport : public Transport
{
public:
    explicit SharedTransport(std::shared_ptr<FakeTransport> fake)
    : m_fake(std::move(fake))
    {}

    OpenResult Open(const InterfaceSelector& selector) override { return m_fake->Open(selector); }
    bool SendQuery(std::string_view name, RecordType type) override { return m_fake->SendQuery(name, type); }
    void Subscribe(RecordHandler handler) override { m_fake->Subscribe(std::move(handler)); }
    void Poll(std::chrono::milliseconds maxWait) override { m_fake->Poll(maxWait); }
    void Close() override { m_fake->Close(); }
    bool IsOpen() const override { return m_fake->IsOpen(); }

private:
    std::shared_ptr<FakeTransport> m_fake;
};

// Answers like a single host announcing one instance of one service type
struct SeededService {
    std::string service_type{"_http._tcp.local."};
    std::string instance{"Kitchen Speaker._http._tcp.local."};
    std::string host{"speaker.local."};
    std::uint16_t port{8080};
    std::string address{"192.0.2.20"};
    TxtProperties txt{{"path", std::string("/api")}, {"secure", std::nullopt}};

    FakeTransport::Responder Responder() const
    {
        const SeededService seed = *this;
        return [seed](const std::string& name, RecordType type) -> std::vector<Record> {
            if (type == RecordType::PTR && IsMetaQueryName(name)) {
                return {MakePtr(std::string(kMetaQueryName), seed.service_type)};
            }
            if (type == RecordType::PTR && NamesEqual(name, seed.service_type)) {
                return {MakePtr(seed.service_type, seed.instance)};
            }
            if (type == RecordType::SRV && NamesEqual(name, seed.instance)) {
                return {MakeSrv(seed.instance, seed.host, seed.port)};
            }
            if (type == RecordType::TXT && NamesEqual(name, seed.instance)) {
                return {MakeTxt(seed.instance, seed.txt)};
            }
            if (type == RecordType::A && NamesEqual(name, seed.host)) {
                return {MakeA(seed.host, seed.address)};
            }
            return {};
        };
    }
};

// Polls the predicate until it holds or the timeout passes
template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

}
