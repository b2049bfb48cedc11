#include "mdns_browser/errors.hpp"
#include "mdns_browser/normalize.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace mdns_browser;

TEST(NormalizeServiceType, AppendsLocalDomain)
{
    EXPECT_EQ(NormalizeServiceType("_http._tcp"), "_http._tcp.local.");
}

TEST(NormalizeServiceType, KeepsFullyQualifiedName)
{
    EXPECT_EQ(NormalizeServiceType("_http._tcp.local."), "_http._tcp.local.");
}

TEST(NormalizeServiceType, TrimsAndAddsTrailingDot)
{
    EXPECT_EQ(NormalizeServiceType("  _http._tcp.local  "), "_http._tcp.local.");
    EXPECT_EQ(NormalizeServiceType("_ipp._tcp."), "_ipp._tcp.local.");
}

TEST(NormalizeServiceType, BlankInputIsEmpty)
{
    EXPECT_EQ(NormalizeServiceType(""), "");
    EXPECT_EQ(NormalizeServiceType(" \t "), "");
}

TEST(ValidateServiceType, AcceptsNormalizedTypes)
{
    EXPECT_NO_THROW(ValidateServiceType("_http._tcp.local."));
    EXPECT_NO_THROW(ValidateServiceType("_dante-ddm-c._tcp.local."));
}

TEST(ValidateServiceType, RejectsMalformedTypes)
{
    EXPECT_THROW(ValidateServiceType(""), InvalidQueryError);
    EXPECT_THROW(ValidateServiceType("_http.._tcp.local."), InvalidQueryError);
    EXPECT_THROW(ValidateServiceType("_my service._tcp.local."), InvalidQueryError);
    EXPECT_THROW(ValidateServiceType(std::string(64, 'a') + "._tcp.local."), InvalidQueryError);
    EXPECT_THROW(ValidateServiceType(std::string(kMetaQueryName)), InvalidQueryError);
}

TEST(ValidateServiceType, ErrorCarriesTheQuery)
{
    try {
        ValidateServiceType("_bad..local.");
        FAIL() << "expected InvalidQueryError";
    } catch (const InvalidQueryError& e) {
        EXPECT_EQ(e.Query(), "_bad..local.");
    }
}

TEST(ServiceTypeFromName, FoldsSubtypesAndInstances)
{
    EXPECT_EQ(ServiceTypeFromName("_http._tcp.local."), "_http._tcp.local.");
    EXPECT_EQ(ServiceTypeFromName("_printer._sub._http._tcp.local."), "_http._tcp.local.");
}

TEST(Names, CompareCaseInsensitively)
{
    EXPECT_TRUE(NamesEqual("_HTTP._tcp.Local.", "_http._tcp.local."));
    EXPECT_FALSE(NamesEqual("_http._tcp.local.", "_http._udp.local."));
    EXPECT_TRUE(NameEndsWith("Printer._IPP._tcp.local.", "._ipp._tcp.local."));
    EXPECT_TRUE(IsMetaQueryName("_Services._DNS-SD._udp.local."));
    EXPECT_EQ(ToLowerName("My Printer.LOCAL."), "my printer.local.");
}
