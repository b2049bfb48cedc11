#include "mdns_browser/query_scheduler.hpp"
#include "mdns_browser/log.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace mdns_browser
{

QueryScheduler::QueryScheduler(EventLoop& loop, Transport& transport, std::string name, RecordType type, QuerySchedule schedule)
: m_loop(loop)
, m_transport(transport)
, m_name(std::move(name))
, m_type(type)
, m_schedule(schedule)
, m_nextInterval(schedule.initial_interval)
{}

QueryScheduler::~QueryScheduler()
{
    Stop();
}

void QueryScheduler::Start()
{
    if (m_timer) {
        return;
    }
    m_nextInterval = m_schedule.initial_interval;
    SendAndReschedule();
}

void QueryScheduler::Stop()
{
    if (m_timer) {
        m_loop.CancelTimer(*m_timer);
        m_timer.reset();
    }
}

void QueryScheduler::SendAndReschedule()
{
    if (m_transport.SendQuery(m_name, m_type)) {
        ++m_queriesSent;
    } else {
        Log(LogLevel::Debug, fmt::format("{} query for {} was not sent, retrying in {} ms", ToString(m_type), m_name, m_nextInterval.count()));
    }

    m_timer = m_loop.ScheduleAfter(m_nextInterval, [this](){
        SendAndReschedule();
    });
    m_nextInterval = std::min(m_nextInterval * 2, m_schedule.max_interval);
}

}
