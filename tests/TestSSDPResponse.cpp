// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPUtils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

static std::unique_ptr<SoapySSDPRecord> parse(const std::string &datagram, std::vector<std::string> &diagnostics)
{
    return parseMSearchResponse(datagram.data(), datagram.size(), "10.0.0.5:1900", diagnostics);
}

static std::unique_ptr<SoapySSDPRecord> parse(const std::string &datagram)
{
    std::vector<std::string> diagnostics;
    return parse(datagram, diagnostics);
}

TEST(MSearchResponse, ParsesTypicalReply)
{
    const std::string datagram =
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "EXT:\r\n"
        "LOCATION: http://10.0.0.5:80/desc.xml\r\n"
        "SERVER: Linux/5.4 UPnP/1.1 Device/1.0\r\n"
        "ST: urn:x\r\n"
        "USN: uuid:abc::urn:x\r\n"
        "\r\n";

    std::vector<std::string> diagnostics;
    const auto record = parse(datagram, diagnostics);
    ASSERT_TRUE(record);
    EXPECT_TRUE(diagnostics.empty());
    EXPECT_EQ("http://10.0.0.5:80/desc.xml", record->getLocation());
    EXPECT_EQ("urn:x", record->getServiceType());
    EXPECT_EQ("uuid:abc::urn:x", record->getUSN());
    EXPECT_EQ("Linux/5.4 UPnP/1.1 Device/1.0", record->getServer());
    ASSERT_TRUE(record->hasCacheControl());
    EXPECT_EQ(1800, record->getCacheControl());
    EXPECT_EQ("10.0.0.5:1900", record->getSourceAddress());
    EXPECT_EQ("abc", record->getUUID());
    EXPECT_EQ(1u, record->getHeaders().count("EXT"));
}

TEST(MSearchResponse, RejectsNonSuccessStatus)
{
    std::vector<std::string> diagnostics;
    EXPECT_FALSE(parse("HTTP/1.1 404 Not Found\r\nUSN: uuid:1\r\n\r\n", diagnostics));
    ASSERT_EQ(1u, diagnostics.size());
    EXPECT_NE(std::string::npos, diagnostics[0].find("HTTP/1.1 404 Not Found"));

    EXPECT_FALSE(parse("HTTP/1.1 2000 OK\r\nUSN: uuid:1\r\n\r\n"));
    EXPECT_FALSE(parse("NOTIFY * HTTP/1.1\r\nUSN: uuid:1\r\n\r\n"));
    EXPECT_FALSE(parse("M-SEARCH * HTTP/1.1\r\nST: ssdp:all\r\n\r\n"));
    EXPECT_FALSE(parse(""));
}

TEST(MSearchResponse, StatusWithoutReason)
{
    EXPECT_TRUE(parse("HTTP/1.1 200\r\nUSN: uuid:1\r\n\r\n"));
}

TEST(MSearchResponse, RejectsWithoutIdentity)
{
    std::vector<std::string> diagnostics;
    EXPECT_FALSE(parse("HTTP/1.1 200 OK\r\nST: urn:x\r\nSERVER: thing\r\n\r\n", diagnostics));
    ASSERT_FALSE(diagnostics.empty());
    EXPECT_NE(std::string::npos, diagnostics.back().find("LOCATION"));
}

TEST(MSearchResponse, EitherIdentityIsEnough)
{
    const auto onlyLocation = parse("HTTP/1.1 200 OK\r\nLOCATION: http://h/d.xml\r\n\r\n");
    ASSERT_TRUE(onlyLocation);
    EXPECT_EQ("", onlyLocation->getUSN());

    const auto onlyUSN = parse("HTTP/1.1 200 OK\r\nUSN: uuid:1\r\n\r\n");
    ASSERT_TRUE(onlyUSN);
    EXPECT_EQ("", onlyUSN->getLocation());
    EXPECT_FALSE(onlyUSN->hasCacheControl());
}

TEST(MSearchResponse, ToleratesSloppyDevices)
{
    std::vector<std::string> diagnostics;
    const auto record = parse(
        "HTTP/1.1 200 OK\n"
        "location:http://10.0.0.9/d.xml\n"
        "this line is junk\n"
        "Usn:   uuid:dead::upnp:rootdevice  \n"
        "\n", diagnostics);
    ASSERT_TRUE(record);
    EXPECT_EQ("http://10.0.0.9/d.xml", record->getLocation());
    EXPECT_EQ("uuid:dead::upnp:rootdevice", record->getUSN());
    ASSERT_EQ(1u, diagnostics.size());
    EXPECT_NE(std::string::npos, diagnostics[0].find("line 3"));
}

TEST(MSearchResponse, NotifyTypeFallback)
{
    const auto record = parse("HTTP/1.1 200 OK\r\nNT: upnp:rootdevice\r\nUSN: uuid:1\r\n\r\n");
    ASSERT_TRUE(record);
    EXPECT_EQ("upnp:rootdevice", record->getServiceType());
}

TEST(MSearchResponse, MalformedCacheControlIsNotFatal)
{
    std::vector<std::string> diagnostics;
    const auto record = parse("HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=soon\r\nUSN: uuid:1\r\n\r\n", diagnostics);
    ASSERT_TRUE(record);
    EXPECT_FALSE(record->hasCacheControl());
    ASSERT_EQ(1u, diagnostics.size());
    EXPECT_NE(std::string::npos, diagnostics[0].find("CACHE-CONTROL"));
}

TEST(MSearchResponse, CacheControlDirectives)
{
    EXPECT_EQ(1800, parseCacheControlMaxAge("max-age=1800"));
    EXPECT_EQ(60, parseCacheControlMaxAge("no-cache, Max-Age = 60"));
    EXPECT_EQ(0, parseCacheControlMaxAge("max-age=0"));
    EXPECT_GT(0, parseCacheControlMaxAge("no-cache"));
    EXPECT_GT(0, parseCacheControlMaxAge("max-age="));
    EXPECT_GT(0, parseCacheControlMaxAge("max-age=-5"));
    EXPECT_GT(0, parseCacheControlMaxAge("max-age=99999999999999999999999"));
    EXPECT_GT(0, parseCacheControlMaxAge(""));
}

TEST(MSearchResponse, UUIDWithoutPrefix)
{
    const auto record = parse("HTTP/1.1 200 OK\r\nUSN: some-device-id\r\n\r\n");
    ASSERT_TRUE(record);
    EXPECT_EQ("some-device-id", record->getUUID());
}
