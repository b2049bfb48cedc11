#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/query_scheduler.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

using namespace mdns_browser;
using namespace mdns_browser::test;
using namespace std::chrono_literals;

namespace
{

constexpr auto kType = "_ipp._tcp.local.";

template <typename Predicate>
void RunUntil(EventLoop& loop, Predicate predicate, std::chrono::milliseconds timeout = 2000ms)
{
    const auto deadline = EventLoop::Clock::now() + timeout;
    while (!predicate() && EventLoop::Clock::now() < deadline) {
        loop.RunOnce(5ms);
    }
}

}

TEST(QueryScheduler, QueriesRightAwayThenKeepsQuerying)
{
    FakeTransport transport;
    transport.Open(InterfaceSelector::All());
    EventLoop loop(transport);
    QueryScheduler scheduler(loop, transport, kType, RecordType::PTR, QuerySchedule{20ms, 40ms});

    scheduler.Start();
    EXPECT_EQ(scheduler.QueriesSent(), 1u);
    EXPECT_EQ(transport.CountSent(kType, RecordType::PTR), 1u);

    RunUntil(loop, [&scheduler](){ return scheduler.QueriesSent() >= 4; });
    EXPECT_GE(scheduler.QueriesSent(), 4u);
    EXPECT_EQ(transport.CountSent(kType, RecordType::PTR), scheduler.QueriesSent());
}

TEST(QueryScheduler, IntervalsDoubleUpToTheMaximum)
{
    FakeTransport transport;
    transport.Open(InterfaceSelector::All());
    EventLoop loop(transport);
    QueryScheduler scheduler(loop, transport, kType, RecordType::PTR, QuerySchedule{50ms, 100ms});

    const auto started = EventLoop::Clock::now();
    scheduler.Start();
    // Sends at 0, 50, 150 and 250 ms
    RunUntil(loop, [&scheduler](){ return scheduler.QueriesSent() >= 4; });
    EXPECT_GE(EventLoop::Clock::now() - started, 250ms);
}

TEST(QueryScheduler, StopCancelsTheNextQuery)
{
    FakeTransport transport;
    transport.Open(InterfaceSelector::All());
    EventLoop loop(transport);
    QueryScheduler scheduler(loop, transport, kType, RecordType::PTR, QuerySchedule{10ms, 10ms});

    scheduler.Start();
    scheduler.Stop();
    EXPECT_EQ(loop.PendingTimers(), 0u);
    for (int i = 0; i < 5; ++i) {
        loop.RunOnce(10ms);
    }
    EXPECT_EQ(scheduler.QueriesSent(), 1u);
}

TEST(QueryScheduler, UnsentQueriesAreNotCounted)
{
    FakeTransport transport;
    EventLoop loop(transport);
    QueryScheduler scheduler(loop, transport, kType, RecordType::PTR, QuerySchedule{10ms, 10ms});

    scheduler.Start();
    EXPECT_EQ(scheduler.QueriesSent(), 0u);
    // Still rescheduled, the query goes out once the transport is up
    EXPECT_EQ(loop.PendingTimers(), 1u);

    transport.Open(InterfaceSelector::All());
    RunUntil(loop, [&scheduler](){ return scheduler.QueriesSent() >= 1; });
    EXPECT_EQ(scheduler.QueriesSent(), 1u);
}
