#include "mdns_browser/event_loop.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace mdns_browser;
using namespace mdns_browser::test;
using namespace std::chrono_literals;

TEST(EventLoop, RunOnceRunsPostedTasksInOrder)
{
    FakeTransport transport;
    EventLoop loop(transport);
    std::vector<int> order;

    loop.Post([&order](){ order.push_back(1); });
    loop.Post([&order](){ order.push_back(2); });
    loop.RunOnce(0ms);

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoop, TimersFireAfterTheirDelay)
{
    FakeTransport transport;
    EventLoop loop(transport);
    int fired = 0;

    loop.ScheduleAfter(30ms, [&fired](){ ++fired; });
    loop.RunOnce(0ms);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.PendingTimers(), 1u);

    const auto deadline = EventLoop::Clock::now() + 1s;
    while (fired == 0 && EventLoop::Clock::now() < deadline) {
        loop.RunOnce(10ms);
    }
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST(EventLoop, CancelledTimerNeverFires)
{
    FakeTransport transport;
    EventLoop loop(transport);
    bool fired = false;

    const auto id = loop.ScheduleAfter(10ms, [&fired](){ fired = true; });
    loop.CancelTimer(id);
    for (int i = 0; i < 5; ++i) {
        loop.RunOnce(10ms);
    }
    EXPECT_FALSE(fired);
}

TEST(EventLoop, FailingTaskDoesNotStopTheLoop)
{
    FakeTransport transport;
    EventLoop loop(transport);
    bool ran = false;

    loop.Post([](){ throw std::runtime_error("boom"); });
    loop.Post([&ran](){ ran = true; });
    loop.RunOnce(0ms);
    EXPECT_TRUE(ran);
}

TEST(EventLoop, WorkerDeliversTransportRecords)
{
    FakeTransport transport;
    transport.Open(InterfaceSelector::All());
    std::atomic<int> received{0};
    transport.Subscribe([&received](const Record&){ ++received; });

    EventLoop loop(transport, 10ms);
    loop.Start();
    transport.Inject(MakeA("host.local.", "192.0.2.1"));
    transport.Inject(MakeA("host.local.", "192.0.2.2"), 20ms);

    EXPECT_TRUE(WaitFor([&received](){ return received.load() == 2; }));
    loop.Stop();
    EXPECT_FALSE(loop.Running());
}

TEST(EventLoop, InvokeRunsOnTheWorkerAndRethrows)
{
    FakeTransport transport;
    EventLoop loop(transport, 10ms);
    loop.Start();

    bool onWorker = false;
    loop.Invoke([&](){ onWorker = loop.InLoopThread(); });
    EXPECT_TRUE(onWorker);
    EXPECT_FALSE(loop.InLoopThread());

    EXPECT_THROW(loop.Invoke([](){ throw std::logic_error("failed"); }), std::logic_error);
    loop.Stop();
}

TEST(EventLoop, StopDropsPendingTimers)
{
    FakeTransport transport;
    EventLoop loop(transport, 10ms);
    std::atomic<bool> fired{false};

    loop.Start();
    loop.ScheduleAfter(10s, [&fired](){ fired = true; });
    loop.Stop();
    EXPECT_EQ(loop.PendingTimers(), 0u);
    EXPECT_FALSE(fired.load());
}
