// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPUtils.hpp"
#include "SoapySSDPError.hpp"
#include "SoapyHTTPUtils.hpp"
#include <gtest/gtest.h>

TEST(MSearchRequest, ContainsRequiredHeaders)
{
    const auto request = formatMSearchRequest("ssdp:all", 3);
    const SoapyHTTPHeader header(request.data(), request.size());

    EXPECT_EQ(0u, request.find("M-SEARCH * HTTP/1.1\r\n"));
    EXPECT_EQ("239.255.255.250:1900", header.getField("HOST"));
    EXPECT_EQ("\"ssdp:discover\"", header.getField("MAN"));
    EXPECT_EQ("3", header.getField("MX"));
    EXPECT_EQ("ssdp:all", header.getField("ST"));
    EXPECT_NE(std::string::npos, header.getField("USER-AGENT").find("UPnP/1.1"));

    //terminated by an empty line
    ASSERT_GE(request.size(), 4u);
    EXPECT_EQ("\r\n\r\n", request.substr(request.size()-4));
}

TEST(MSearchRequest, SearchTargetIsVerbatim)
{
    const std::string st("urn:schemas-upnp-org:device:MediaRenderer:1");
    const auto request = formatMSearchRequest(st, 1);
    EXPECT_NE(std::string::npos, request.find("\r\nST: " + st + "\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nMX: 1\r\n"));
}

TEST(MSearchRequest, IPv6Host)
{
    const auto request = formatMSearchRequest("upnp:rootdevice", 2, SOAPY_SSDP_IPVER_INET6);
    EXPECT_NE(std::string::npos, request.find("\r\nHOST: [ff02::c]:1900\r\n"));
}

TEST(MSearchRequest, RejectsBadArguments)
{
    EXPECT_THROW(formatMSearchRequest("", 3), SoapySSDPInvalidConfig);
    EXPECT_THROW(formatMSearchRequest("ssdp:all", 0), SoapySSDPInvalidConfig);
    EXPECT_THROW(formatMSearchRequest("ssdp:all", 6), SoapySSDPInvalidConfig);
    EXPECT_THROW(formatMSearchRequest("ssdp:all", 3, 5), SoapySSDPInvalidConfig);
}

TEST(MSearchRequest, WiderMaxWaitLimit)
{
    EXPECT_NO_THROW(formatMSearchRequest("ssdp:all", 120, SOAPY_SSDP_IPVER_INET, 120));
}

TEST(MSearchRequest, GroupURL)
{
    EXPECT_EQ("239.255.255.250:1900", getSSDPGroupURL());
    EXPECT_EQ("[ff02::c]:1900", getSSDPGroupURL(SOAPY_SSDP_IPVER_INET6));
    EXPECT_THROW(getSSDPGroupURL(5), SoapySSDPInvalidConfig);
}
