#pragma once

#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/transport.hpp"
#include "mdns_browser/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mdns_browser
{

struct QuerySchedule
{
    std::chrono::milliseconds initial_interval{1000};
    std::chrono::milliseconds max_interval{60000};
};

// Continuous querying (RFC 6762 section 5.2): a query right away, then again
// after initial_interval, doubling up to max_interval.
class QueryScheduler
{
public:
    QueryScheduler(EventLoop& loop, Transport& transport, std::string name, RecordType type, QuerySchedule schedule = QuerySchedule());
    ~QueryScheduler();

    QueryScheduler(const QueryScheduler&) = delete;
    QueryScheduler& operator=(const QueryScheduler&) = delete;

    void Start();
    void Stop();

    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] std::size_t QueriesSent() const { return m_queriesSent; }

private:
    void SendAndReschedule();

    EventLoop& m_loop;
    Transport& m_transport;
    const std::string m_name;
    const RecordType m_type;
    const QuerySchedule m_schedule;

    std::chrono::milliseconds m_nextInterval;
    std::optional<EventLoop::TimerId> m_timer;
    std::size_t m_queriesSent{0};
};

}
