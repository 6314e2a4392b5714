// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapyHTTPUtils.hpp"
#include <gtest/gtest.h>
#include <string>

static SoapyHTTPHeader parse(const std::string &datagram)
{
    return SoapyHTTPHeader(datagram.data(), datagram.size());
}

TEST(HTTPHeader, BuildsCRLFTerminatedHeader)
{
    SoapyHTTPHeader header("M-SEARCH * HTTP/1.1");
    header.addField("HOST", "239.255.255.250:1900");
    header.addField("MX", "3");
    header.finalize();

    const std::string text((const char *)header.data(), header.size());
    EXPECT_EQ("M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\nMX: 3\r\n\r\n", text);
    EXPECT_EQ("3", header.getField("mx"));
}

TEST(HTTPHeader, FieldLookupIgnoresCase)
{
    const auto header = parse("HTTP/1.1 200 OK\r\nLocation: http://10.0.0.5/\r\ncache-control: max-age=60\r\n\r\n");
    EXPECT_EQ("HTTP/1.1 200 OK", header.getLine0());
    EXPECT_EQ("http://10.0.0.5/", header.getField("LOCATION"));
    EXPECT_EQ("max-age=60", header.getField("Cache-Control"));
    EXPECT_TRUE(header.hasField("location"));
    EXPECT_FALSE(header.hasField("USN"));
    EXPECT_EQ("", header.getField("USN"));
    EXPECT_TRUE(header.getDiagnostics().empty());
}

TEST(HTTPHeader, AcceptsBareLineFeeds)
{
    const auto header = parse("HTTP/1.1 200 OK\nST: upnp:rootdevice\nUSN: uuid:1234\n\n");
    EXPECT_EQ("HTTP/1.1 200 OK", header.getLine0());
    EXPECT_EQ("upnp:rootdevice", header.getField("ST"));
    EXPECT_EQ("uuid:1234", header.getField("USN"));
}

TEST(HTTPHeader, TrimsValuesAndKeepsEmptyOnes)
{
    const auto header = parse("HTTP/1.1 200 OK\r\nEXT:\r\nSERVER:   Linux/5.0 UPnP/1.0   \r\n\r\n");
    EXPECT_TRUE(header.hasField("EXT"));
    EXPECT_EQ("", header.getField("EXT"));
    EXPECT_EQ("Linux/5.0 UPnP/1.0", header.getField("SERVER"));
}

TEST(HTTPHeader, ValueMayContainColons)
{
    const auto header = parse("HTTP/1.1 200 OK\r\nLOCATION: http://[fe80::1]:49152/desc.xml\r\n\r\n");
    EXPECT_EQ("http://[fe80::1]:49152/desc.xml", header.getField("LOCATION"));
}

TEST(HTTPHeader, SkipsMalformedLinesWithDiagnostics)
{
    const auto header = parse("HTTP/1.1 200 OK\r\ngarbage line\r\nBAD KEY: x\r\n: novalue\r\nST: urn:x\r\n\r\n");
    EXPECT_EQ("urn:x", header.getField("ST"));
    ASSERT_EQ(1u, header.getFields().size());
    ASSERT_EQ(3u, header.getDiagnostics().size());
    EXPECT_NE(std::string::npos, header.getDiagnostics()[0].find("line 2"));
    EXPECT_NE(std::string::npos, header.getDiagnostics()[1].find("line 3"));
    EXPECT_NE(std::string::npos, header.getDiagnostics()[2].find("line 4"));
}

TEST(HTTPHeader, StopsAtBlankLine)
{
    const auto header = parse("HTTP/1.1 200 OK\r\nST: urn:x\r\n\r\nUSN: uuid:body\r\n");
    EXPECT_TRUE(header.hasField("ST"));
    EXPECT_FALSE(header.hasField("USN"));
}

TEST(HTTPHeader, FirstOfRepeatedFieldsWins)
{
    const auto header = parse("HTTP/1.1 200 OK\r\nST: first\r\nst: second\r\n\r\n");
    EXPECT_EQ("first", header.getField("ST"));
    EXPECT_EQ(2u, header.getFields().size());
}

TEST(HTTPHeader, EmptyDatagram)
{
    const auto header = parse("");
    EXPECT_EQ("", header.getLine0());
    EXPECT_TRUE(header.getFields().empty());
}

TEST(HTTPUtils, EqualsIgnoreCase)
{
    EXPECT_TRUE(equalsIgnoreCase("Max-Age", "max-age"));
    EXPECT_FALSE(equalsIgnoreCase("max-age", "max-ages"));
    EXPECT_TRUE(equalsIgnoreCase("", ""));
}

TEST(HTTPUtils, TrimWhitespace)
{
    EXPECT_EQ("a b", trimWhitespace(" \ta b\r\n"));
    EXPECT_EQ("", trimWhitespace("   "));
    EXPECT_EQ("x", trimWhitespace("x"));
}
