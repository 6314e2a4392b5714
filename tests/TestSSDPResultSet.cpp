// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPResultSet.hpp"
#include <gtest/gtest.h>

static SoapySSDPRecord makeRecord(const std::string &usn, const std::string &location, const std::string &server = "")
{
    SoapySSDPRecord::Headers headers;
    if (not usn.empty()) headers["USN"] = usn;
    if (not location.empty()) headers["LOCATION"] = location;
    if (not server.empty()) headers["SERVER"] = server;
    return SoapySSDPRecord(headers, "10.0.0.1:1900");
}

TEST(SSDPResultSet, KeepsOrderOfFirstArrival)
{
    SoapySSDPResultSet results;
    EXPECT_TRUE(results.add(makeRecord("uuid:A", "http://a/")));
    EXPECT_TRUE(results.add(makeRecord("uuid:B", "http://b/")));
    EXPECT_FALSE(results.add(makeRecord("uuid:A", "http://a/")));
    EXPECT_TRUE(results.add(makeRecord("uuid:C", "http://c/")));

    const auto records = results.toResult();
    ASSERT_EQ(3u, records.size());
    EXPECT_EQ("uuid:A", records[0].getUSN());
    EXPECT_EQ("uuid:B", records[1].getUSN());
    EXPECT_EQ("uuid:C", records[2].getUSN());
    EXPECT_EQ(1u, results.duplicates());
}

TEST(SSDPResultSet, FirstReplyWins)
{
    SoapySSDPResultSet results;
    EXPECT_TRUE(results.add(makeRecord("uuid:A", "http://a/", "first")));
    EXPECT_FALSE(results.add(makeRecord("uuid:A", "http://a/", "second")));
    ASSERT_EQ(1u, results.size());
    EXPECT_EQ("first", results.toResult()[0].getServer());
}

TEST(SSDPResultSet, USNTakesPrecedenceOverLocation)
{
    SoapySSDPResultSet results;
    EXPECT_TRUE(results.add(makeRecord("uuid:A::upnp:rootdevice", "http://dev/desc.xml")));
    EXPECT_TRUE(results.add(makeRecord("uuid:A::urn:x", "http://dev/desc.xml")));
    EXPECT_EQ(2u, results.size());
}

TEST(SSDPResultSet, LocationWhenNoUSN)
{
    SoapySSDPResultSet results;
    EXPECT_TRUE(results.add(makeRecord("", "http://dev/desc.xml")));
    EXPECT_FALSE(results.add(makeRecord("", "http://dev/desc.xml")));
    EXPECT_TRUE(results.add(makeRecord("", "http://other/desc.xml")));
    EXPECT_EQ(2u, results.size());
}

TEST(SSDPResultSet, KeysDoNotCollide)
{
    SoapySSDPResultSet results;
    EXPECT_TRUE(results.add(makeRecord("http://dev/desc.xml", "")));
    EXPECT_TRUE(results.add(makeRecord("", "http://dev/desc.xml")));
    EXPECT_EQ("usn:http://dev/desc.xml", SoapySSDPResultSet::dedupKey(results.toResult()[0]));
    EXPECT_EQ("location:http://dev/desc.xml", SoapySSDPResultSet::dedupKey(results.toResult()[1]));
}

TEST(SSDPResultSet, NoIdentityIsAlwaysUnique)
{
    SoapySSDPResultSet results;
    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(results.add(makeRecord("", "")));
    EXPECT_TRUE(results.add(makeRecord("", "")));
    EXPECT_EQ(2u, results.size());
    EXPECT_EQ(0u, results.duplicates());
}
