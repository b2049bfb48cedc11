#include "mdns_browser/record_store.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

using namespace mdns_browser;
using namespace mdns_browser::test;
using namespace std::chrono_literals;

namespace
{

const std::string kType = "_ipp._tcp.local.";
const std::string kInstance = "Office Printer._ipp._tcp.local.";
const std::string kHost = "printer.local.";

}

TEST(RecordStore, ApplyReportsOnlyChanges)
{
    RecordStore store;
    const auto now = RecordStore::Clock::now();

    EXPECT_TRUE(store.Apply(MakeSrv(kInstance, kHost, 631), now));
    EXPECT_FALSE(store.Apply(MakeSrv(kInstance, kHost, 631), now + 1s));
    EXPECT_TRUE(store.Apply(MakeSrv(kInstance, kHost, 632), now + 2s));

    EXPECT_TRUE(store.Apply(MakePtr(kType, kInstance), now));
    EXPECT_FALSE(store.Apply(MakePtr(kType, kInstance), now + 1s));
    EXPECT_FALSE(store.Apply(AnyRecord{MakeHeader(kHost, RecordType::ANY, 120)}, now));
}

TEST(RecordStore, OwnerNamesAreCaseInsensitive)
{
    RecordStore store;
    store.Apply(MakePtr("_IPP._tcp.local.", kInstance));
    store.Apply(MakeA("PRINTER.local.", "192.0.2.5"));

    EXPECT_EQ(store.Pointers(kType), std::vector<std::string>{kInstance});
    EXPECT_EQ(store.Addresses(kHost), std::vector<std::string>{"192.0.2.5"});
}

TEST(RecordStore, GoodbyeRemovesRecord)
{
    RecordStore store;
    store.Apply(MakeTxt(kInstance, {{"rp", std::string("ipp/print")}}));
    ASSERT_TRUE(store.Text(kInstance).has_value());

    EXPECT_TRUE(store.Apply(MakeTxt(kInstance, {}, 0)));
    EXPECT_FALSE(store.Text(kInstance).has_value());
    EXPECT_FALSE(store.Apply(MakeTxt(kInstance, {}, 0)));
    EXPECT_EQ(store.Size(), 0u);
}

TEST(RecordStore, ExpiredRecordsComeBackAsGoodbyes)
{
    RecordStore store;
    const auto now = RecordStore::Clock::now();
    store.Apply(MakePtr(kType, kInstance, 10), now);
    store.Apply(MakeSrv(kInstance, kHost, 631, 120), now);

    EXPECT_TRUE(store.Expire(now + 5s).empty());

    const auto expired = store.Expire(now + 10s);
    ASSERT_EQ(expired.size(), 1u);
    const auto* ptr = std::get_if<DomainNamePointerRecord>(&expired.front());
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(ptr->header.ttl, 0u);
    EXPECT_EQ(ptr->name_string, kInstance);
    EXPECT_TRUE(store.Pointers(kType).empty());
    EXPECT_TRUE(store.Service(kInstance).has_value());
}

TEST(RecordStore, CacheFlushDropsOlderAddresses)
{
    RecordStore store;
    const auto now = RecordStore::Clock::now();
    store.Apply(MakeA(kHost, "192.0.2.5"), now);

    auto flushing = MakeA(kHost, "192.0.2.6");
    HeaderOf(flushing).cache_flush = true;

    // Records received within the last second survive the flush
    store.Apply(flushing, now + 500ms);
    EXPECT_EQ(store.Addresses(kHost).size(), 2u);

    EXPECT_TRUE(store.Apply(flushing, now + 3s));
    EXPECT_EQ(store.Addresses(kHost), std::vector<std::string>{"192.0.2.6"});
}

TEST(RecordStore, AddressesSortNumericallyIpv4First)
{
    RecordStore store;
    store.Apply(MakeAAAA(kHost, "fe80::10"));
    store.Apply(MakeAAAA(kHost, "fe80::9"));
    store.Apply(MakeA(kHost, "10.0.0.10"));
    store.Apply(MakeA(kHost, "10.0.0.2"));
    store.Apply(MakeA(kHost, "9.255.0.1"));

    EXPECT_EQ(store.Addresses(kHost), (std::vector<std::string>{"9.255.0.1", "10.0.0.2", "10.0.0.10", "fe80::9", "fe80::10"}));
}

TEST(RecordStore, ComposeBuildsInstanceFromRecords)
{
    RecordStore store;
    store.Apply(MakeSrv(kInstance, kHost, 631));
    store.Apply(MakeTxt(kInstance, {{"note", std::string("2nd floor")}}));
    store.Apply(MakeAAAA(kHost, "fe80::1"));
    store.Apply(MakeA(kHost, "192.0.2.5"));

    const auto instance = store.Compose(InstanceKey{kType, kInstance});
    EXPECT_EQ(instance.host, kHost);
    EXPECT_EQ(instance.port, 631);
    EXPECT_EQ(instance.addresses, (std::vector<std::string>{"192.0.2.5", "fe80::1"}));
    EXPECT_EQ(instance.Endpoints(), (std::vector<std::string>{"192.0.2.5:631", "[fe80::1]:631"}));
    EXPECT_EQ(instance.Label(), "Office Printer");
    EXPECT_TRUE(instance.IsComplete());
    EXPECT_EQ(instance.status, ResolutionStatus::Unresolved);
}

TEST(RecordStore, ComposeOfUnknownInstanceIsIncomplete)
{
    RecordStore store;
    const auto instance = store.Compose(InstanceKey{kType, kInstance});
    EXPECT_FALSE(instance.has_service);
    EXPECT_FALSE(instance.has_txt);
    EXPECT_FALSE(instance.IsComplete());
}
