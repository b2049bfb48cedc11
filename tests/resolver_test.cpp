#include "mdns_browser/resolver.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <future>
#include <optional>

using namespace mdns_browser;
using namespace mdns_browser::test;
using namespace std::chrono_literals;

namespace
{

class ResolverTest : public ::testing::Test
{
protected:
    ResolverTest()
    : loop(transport, 10ms)
    , resolver(loop, transport, store)
    {
        transport.Open(InterfaceSelector::All());
        transport.Subscribe([this](const Record& record){
            if (store.Apply(record)) {
                resolver.HandleRecord(record);
            }
        });
    }

    ~ResolverTest() override
    {
        loop.Stop();
    }

    InstanceKey Key() const
    {
        return InstanceKey{seed.service_type, seed.instance};
    }

    void Seed()
    {
        store.Apply(MakeSrv(seed.instance, seed.host, seed.port));
        store.Apply(MakeTxt(seed.instance, seed.txt));
        store.Apply(MakeA(seed.host, seed.address));
    }

    SeededService seed;
    FakeTransport transport;
    EventLoop loop;
    RecordStore store;
    Resolver resolver;
};

}

TEST_F(ResolverTest, TimesOutWhenNobodyAnswers)
{
    constexpr auto timeout = 150ms;
    std::promise<ResolveOutcome> done;
    auto outcome = done.get_future();

    loop.Start();
    const auto started = std::chrono::steady_clock::now();
    loop.Invoke([&](){
        resolver.Resolve(Key(), [&done](const InstanceKey&, const ResolveOutcome& result){ done.set_value(result); }, timeout);
    });

    ASSERT_EQ(outcome.wait_for(timeout + 1s), std::future_status::ready);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    const auto result = outcome.get();
    ASSERT_TRUE(std::holds_alternative<ResolveError>(result));
    EXPECT_EQ(std::get<ResolveError>(result), ResolveError::Timeout);
    EXPECT_GE(elapsed, timeout);
    EXPECT_LT(elapsed, timeout + 300ms);

    EXPECT_EQ(transport.CountSent(seed.instance, RecordType::SRV), 1u);
    EXPECT_EQ(transport.CountSent(seed.instance, RecordType::TXT), 1u);
    loop.Invoke([&](){ EXPECT_EQ(resolver.PendingCount(), 0u); });
}

TEST_F(ResolverTest, QueriesMissingRecordsUntilComplete)
{
    transport.SetResponder(seed.Responder());
    std::promise<ResolveOutcome> done;
    auto outcome = done.get_future();

    loop.Start();
    loop.Invoke([&](){
        resolver.Resolve(Key(), [&done](const InstanceKey&, const ResolveOutcome& result){ done.set_value(result); });
    });

    ASSERT_EQ(outcome.wait_for(2s), std::future_status::ready);
    const auto result = outcome.get();
    ASSERT_TRUE(std::holds_alternative<ServiceInstance>(result));
    const auto& instance = std::get<ServiceInstance>(result);
    EXPECT_EQ(instance.status, ResolutionStatus::Resolved);
    EXPECT_EQ(instance.host, seed.host);
    EXPECT_EQ(instance.port, seed.port);
    EXPECT_EQ(instance.addresses, std::vector<std::string>{seed.address});
    EXPECT_EQ(instance.txt, seed.txt);
    EXPECT_EQ(transport.CountSent(seed.host, RecordType::A), 1u);
}

TEST_F(ResolverTest, CompleteInstanceIsAnsweredOnTheNextIteration)
{
    Seed();
    std::optional<ResolveOutcome> result;

    resolver.Resolve(Key(), [&result](const InstanceKey&, const ResolveOutcome& outcome){ result = outcome; });
    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(resolver.IsPending(Key()));

    loop.RunOnce(0ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<ServiceInstance>(*result));
    EXPECT_TRUE(transport.Sent().empty());
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST_F(ResolverTest, CancelCompletesWithCancelled)
{
    std::optional<ResolveOutcome> result;
    resolver.Resolve(Key(), [&result](const InstanceKey&, const ResolveOutcome& outcome){ result = outcome; });

    EXPECT_TRUE(resolver.Cancel(Key()));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<ResolveError>(*result), ResolveError::Cancelled);
    EXPECT_FALSE(resolver.IsPending(Key()));
    EXPECT_FALSE(resolver.Cancel(Key()));
}

TEST_F(ResolverTest, ResolvingAgainCancelsThePreviousRequest)
{
    std::vector<ResolveOutcome> results;
    const auto record = [&results](const InstanceKey&, const ResolveOutcome& outcome){ results.push_back(outcome); };

    resolver.Resolve(Key(), record);
    resolver.Resolve(Key(), record);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(std::get<ResolveError>(results.front()), ResolveError::Cancelled);
    EXPECT_EQ(resolver.PendingCount(), 1u);
}

TEST_F(ResolverTest, StopDropsPendingWithoutCallback)
{
    bool called = false;
    resolver.Resolve(Key(), [&called](const InstanceKey&, const ResolveOutcome&){ called = true; });
    resolver.Resolve(InstanceKey{seed.service_type, "Other._http._tcp.local."}, [&called](const InstanceKey&, const ResolveOutcome&){ called = true; });

    resolver.Stop();
    EXPECT_FALSE(called);
    EXPECT_EQ(resolver.PendingCount(), 0u);
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST_F(ResolverTest, CancelAllReportsEveryPendingRequest)
{
    int cancelled = 0;
    const auto count = [&cancelled](const InstanceKey&, const ResolveOutcome& outcome){
        if (std::holds_alternative<ResolveError>(outcome)) {
            ++cancelled;
        }
    };
    resolver.Resolve(Key(), count);
    resolver.Resolve(InstanceKey{seed.service_type, "Other._http._tcp.local."}, count);

    EXPECT_EQ(resolver.CancelAll(), 2u);
    EXPECT_EQ(cancelled, 2);
}
