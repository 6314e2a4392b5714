// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPTransport.hpp"
#include "SoapySSDPSearchConfig.hpp"
#include "SoapySSDPUtils.hpp"
#include "SoapySSDPDefs.hpp"
#include "SoapyIfAddrs.hpp"
#include "SoapyURLUtils.hpp"
#include <SoapySDR/Logger.hpp>

SoapySSDPTransport::~SoapySSDPTransport(void)
{
    return;
}

SoapySSDPClock::~SoapySSDPClock(void)
{
    return;
}

SoapySSDPClock::TimePoint SoapySSDPSteadyClock::now(void)
{
    return std::chrono::steady_clock::now();
}

/***********************************************************************
 * UDP socket transport
 **********************************************************************/
SoapyUDPTransport::SoapyUDPTransport(void)
{
    return;
}

int SoapyUDPTransport::open(const SoapySSDPSearchConfig &config)
{
    const auto groupURL = getSSDPGroupURL(config.ipVer);
    const auto bindNode = (config.ipVer == SOAPY_SSDP_IPVER_INET6)?"::":"0.0.0.0";

    //resolve the send interface when one was requested
    SoapyIfAddr ifAddr;
    if (not config.iface.empty())
    {
        const auto errorMsg = findSoapyIfAddr(listSoapyIfAddrs(), config.iface, config.ipVer, ifAddr);
        if (not errorMsg.empty())
        {
            _lastErrorMsg = "findSoapyIfAddr("+config.iface+") [" + errorMsg + "]";
            return -1;
        }
        SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapyUDPTransport sending on %s IPv%d %s",
            ifAddr.name.c_str(), ifAddr.ipVer, ifAddr.addr.c_str());
    }

    const std::string ifaceAddr = (config.ipVer == SOAPY_SSDP_IPVER_INET)?ifAddr.addr:"";
    int ret = _sock.multicastSetup(groupURL, ifaceAddr, (unsigned int)(ifAddr.ethno), true, config.ttl);
    if (ret != 0)
    {
        _lastErrorMsg = _sock.lastErrorMsg();
        return ret;
    }

    const auto bindURL = SoapyURL("udp", bindNode, "0").toString();
    ret = _sock.bind(bindURL);
    if (ret != 0)
    {
        _lastErrorMsg = _sock.lastErrorMsg();
        return ret;
    }

    SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapyUDPTransport bound to %s for group %s",
        _sock.getsockname().c_str(), groupURL.c_str());
    return 0;
}

int SoapyUDPTransport::sendto(const void *buf, size_t len, const std::string &url)
{
    const int ret = _sock.sendto(buf, len, url);
    if (ret < 0) _lastErrorMsg = _sock.lastErrorMsg();
    return ret;
}

int SoapyUDPTransport::selectRecv(const long timeoutUs)
{
    const int ret = _sock.selectRecv(timeoutUs);
    if (ret < 0) _lastErrorMsg = _sock.lastErrorMsg();
    return ret;
}

int SoapyUDPTransport::recvfrom(void *buf, size_t len, std::string &url)
{
    const int ret = _sock.recvfrom(buf, len, url);
    if (ret < 0) _lastErrorMsg = _sock.lastErrorMsg();
    return ret;
}

int SoapyUDPTransport::close(void)
{
    const int ret = _sock.close();
    if (ret != 0) _lastErrorMsg = _sock.lastErrorMsg();
    return ret;
}

const char *SoapyUDPTransport::lastErrorMsg(void) const
{
    return _lastErrorMsg.c_str();
}
