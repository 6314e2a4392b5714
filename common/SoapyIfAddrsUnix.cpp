// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySocketDefs.hpp"
#include "SoapyIfAddrs.hpp"
#include "SoapySSDPDefs.hpp"
#include "SoapyURLUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <cstring> //strerror
#include <cerrno> //errno

static int familyToIpVer(const int family)
{
    if (family == AF_INET) return SOAPY_SSDP_IPVER_INET;
    if (family == AF_INET6) return SOAPY_SSDP_IPVER_INET6;
    return 0;
}

std::vector<SoapyIfAddr> listSoapyIfAddrs(void)
{
    std::vector<SoapyIfAddr> result;

    struct ifaddrs *ifaddr = NULL;
    if (getifaddrs(&ifaddr) == -1)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "listSoapyIfAddrs() getifaddrs FAIL: %s", std::strerror(errno));
        return result;
    }

    for (const struct ifaddrs *ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == NULL) continue;
        const int ipVer = familyToIpVer(ifa->ifa_addr->sa_family);
        if (ipVer == 0) continue;

        SoapyIfAddr ifAddr;
        ifAddr.ipVer = ipVer;
        ifAddr.name = ifa->ifa_name;
        ifAddr.ethno = int(if_nametoindex(ifa->ifa_name));
        ifAddr.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        ifAddr.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        ifAddr.isMulticast = (ifa->ifa_flags & IFF_MULTICAST) != 0;

        //the scope is carried by ethno, keep the bare address for matching
        ifAddr.addr = SoapyURL(ifa->ifa_addr, false).getNode();
        result.push_back(ifAddr);
    }

    freeifaddrs(ifaddr);
    return result;
}
