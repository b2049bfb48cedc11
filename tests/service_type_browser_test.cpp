#include "mdns_browser/service_type_browser.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace mdns_browser;
using namespace mdns_browser::test;

namespace
{

class ServiceTypeBrowserTest : public ::testing::Test
{
protected:
    ServiceTypeBrowserTest()
    : loop(transport)
    , browser(loop, transport, store, QuerySchedule(), [this](const TypeEvent& event){ events.push_back(event); })
    {
        transport.Open(InterfaceSelector::All());
        browser.Start();
    }

    void Receive(const Record& record)
    {
        if (store.Apply(record)) {
            browser.HandleRecord(record);
        }
    }

    const std::string meta{kMetaQueryName};
    FakeTransport transport;
    EventLoop loop;
    RecordStore store;
    std::vector<TypeEvent> events;
    ServiceTypeBrowser browser;
};

}

TEST_F(ServiceTypeBrowserTest, QueriesTheEnumerationNameOnStart)
{
    EXPECT_EQ(transport.CountSent(meta, RecordType::PTR), 1u);
}

TEST_F(ServiceTypeBrowserTest, ReportsEachTypeOnce)
{
    Receive(MakePtr(meta, "_http._tcp.local."));
    Receive(MakePtr(meta, "_http._tcp.local."));
    Receive(MakePtr(meta, "_HTTP._tcp.local."));
    Receive(MakePtr(meta, "_ipp._tcp.local."));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<TypeAdded>(events[0]).service_type, "_http._tcp.local.");
    EXPECT_EQ(std::get<TypeAdded>(events[1]).service_type, "_ipp._tcp.local.");
    EXPECT_TRUE(browser.Knows("_IPP._TCP.local."));
}

TEST_F(ServiceTypeBrowserTest, FoldsSubtypesIntoTheirType)
{
    Receive(MakePtr(meta, "_printer._sub._http._tcp.local."));
    Receive(MakePtr(meta, "_http._tcp.local."));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<TypeAdded>(events[0]).service_type, "_http._tcp.local.");
}

TEST_F(ServiceTypeBrowserTest, GoodbyeRemovesType)
{
    Receive(MakePtr(meta, "_http._tcp.local."));
    Receive(MakePtr(meta, "_http._tcp.local.", 0));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<TypeRemoved>(events[1]).service_type, "_http._tcp.local.");
    EXPECT_TRUE(browser.Types().empty());
}

TEST_F(ServiceTypeBrowserTest, TypeStaysWhileAnotherNameStillAnnouncesIt)
{
    Receive(MakePtr(meta, "_http._tcp.local."));
    Receive(MakePtr(meta, "_printer._sub._http._tcp.local."));
    Receive(MakePtr(meta, "_http._tcp.local.", 0));

    EXPECT_EQ(events.size(), 1u);
    EXPECT_TRUE(browser.Knows("_http._tcp.local."));
}

TEST_F(ServiceTypeBrowserTest, IgnoresOtherRecordsAndStopsReporting)
{
    Receive(MakePtr("_http._tcp.local.", "Web._http._tcp.local."));
    Receive(MakeA("host.local.", "192.0.2.1"));
    EXPECT_TRUE(events.empty());

    browser.Stop();
    Receive(MakePtr(meta, "_ssh._tcp.local."));
    EXPECT_TRUE(events.empty());
}
