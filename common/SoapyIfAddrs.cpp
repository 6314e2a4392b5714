// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapyIfAddrs.hpp"

SoapyIfAddr::SoapyIfAddr(void):
    ethno(0),
    ipVer(0),
    isUp(false),
    isLoopback(false),
    isMulticast(false)
{
    return;
}

std::string findSoapyIfAddr(
    const std::vector<SoapyIfAddr> &ifAddrs,
    const std::string &nameOrAddr,
    const int ipVer,
    SoapyIfAddr &result)
{
    bool nameFound = false;
    for (const auto &ifAddr : ifAddrs)
    {
        if (ifAddr.name != nameOrAddr and ifAddr.addr != nameOrAddr) continue;
        nameFound = true;
        if (ifAddr.ipVer != ipVer) continue;
        if (not ifAddr.isUp) return "interface " + ifAddr.name + " is down";
        if (not ifAddr.isMulticast) return "interface " + ifAddr.name + " does not support multicast";
        result = ifAddr;
        return "";
    }
    if (nameFound) return "interface " + nameOrAddr + " has no IPv" + std::to_string(ipVer) + " address";
    return "interface " + nameOrAddr + " not found";
}
