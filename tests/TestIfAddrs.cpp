// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapyIfAddrs.hpp"
#include <gtest/gtest.h>

static SoapyIfAddr makeIfAddr(const std::string &name, const std::string &addr, const int ipVer, const bool isUp = true)
{
    SoapyIfAddr ifAddr;
    ifAddr.ethno = 2;
    ifAddr.name = name;
    ifAddr.addr = addr;
    ifAddr.ipVer = ipVer;
    ifAddr.isUp = isUp;
    ifAddr.isMulticast = true;
    return ifAddr;
}

TEST(IfAddrs, FindByNameAndVersion)
{
    std::vector<SoapyIfAddr> ifAddrs;
    ifAddrs.push_back(makeIfAddr("eth0", "fe80::1", 6));
    ifAddrs.push_back(makeIfAddr("eth0", "192.168.1.7", 4));

    SoapyIfAddr result;
    EXPECT_EQ("", findSoapyIfAddr(ifAddrs, "eth0", 4, result));
    EXPECT_EQ("192.168.1.7", result.addr);
    EXPECT_EQ("", findSoapyIfAddr(ifAddrs, "eth0", 6, result));
    EXPECT_EQ("fe80::1", result.addr);
}

TEST(IfAddrs, FindByAddress)
{
    std::vector<SoapyIfAddr> ifAddrs;
    ifAddrs.push_back(makeIfAddr("eth0", "192.168.1.7", 4));
    ifAddrs.push_back(makeIfAddr("wlan0", "10.1.1.1", 4));

    SoapyIfAddr result;
    EXPECT_EQ("", findSoapyIfAddr(ifAddrs, "10.1.1.1", 4, result));
    EXPECT_EQ("wlan0", result.name);
}

TEST(IfAddrs, ReportsWhyNotFound)
{
    std::vector<SoapyIfAddr> ifAddrs;
    ifAddrs.push_back(makeIfAddr("eth0", "192.168.1.7", 4));
    ifAddrs.push_back(makeIfAddr("eth1", "192.168.2.7", 4, false));

    SoapyIfAddr result;
    EXPECT_EQ("interface eth9 not found", findSoapyIfAddr(ifAddrs, "eth9", 4, result));
    EXPECT_EQ("interface eth0 has no IPv6 address", findSoapyIfAddr(ifAddrs, "eth0", 6, result));
    EXPECT_EQ("interface eth1 is down", findSoapyIfAddr(ifAddrs, "eth1", 4, result));
}

TEST(IfAddrs, ListsLoopback)
{
    bool foundLoopback = false;
    for (const auto &ifAddr : listSoapyIfAddrs())
    {
        EXPECT_TRUE(ifAddr.ipVer == 4 or ifAddr.ipVer == 6);
        if (ifAddr.isLoopback) foundLoopback = true;
    }
    EXPECT_TRUE(foundLoopback);
}
