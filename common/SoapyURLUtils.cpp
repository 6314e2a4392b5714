// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySocketDefs.hpp"
#include "SoapyURLUtils.hpp"
#include "SoapySSDPDefs.hpp"
#include <cstring> //memcpy
#include <string>

SockAddrData::SockAddrData(void)
{
    return;
}

SockAddrData::SockAddrData(const struct sockaddr *addr, const size_t addrlen):
    _storage((const char *)addr, (const char *)addr + addrlen)
{
    return;
}

const struct sockaddr *SockAddrData::addr(void) const
{
    return (const struct sockaddr *)_storage.data();
}

size_t SockAddrData::addrlen(void) const
{
    return _storage.size();
}

/***********************************************************************
 * URL markup
 **********************************************************************/
SoapyURL::SoapyURL(void)
{
    return;
}

SoapyURL::SoapyURL(const std::string &scheme, const std::string &node, const std::string &service):
    _scheme(scheme),
    _node(node),
    _service(service)
{
    return;
}

SoapyURL::SoapyURL(const std::string &url)
{
    size_t pos = 0;
    const auto schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos)
    {
        _scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    }

    //bracketed IPv6 node: [ff02::c]:1900
    if (pos < url.size() and url[pos] == '[')
    {
        const auto close = url.find(']', pos);
        if (close == std::string::npos)
        {
            _node = url.substr(pos+1);
            return;
        }
        _node = url.substr(pos+1, close-pos-1);
        if (close+1 < url.size() and url[close+1] == ':') _service = url.substr(close+2);
        return;
    }

    //host or IPv4 node: 239.255.255.250:1900
    const auto colon = url.find(':', pos);
    _node = url.substr(pos, colon-pos);
    if (colon != std::string::npos) _service = url.substr(colon+1);
}

SoapyURL::SoapyURL(const SockAddrData &addr):
    SoapyURL(addr.addr())
{
    return;
}

SoapyURL::SoapyURL(const struct sockaddr *addr, const bool scoped)
{
    if (addr == nullptr) return;

    char s[INET6_ADDRSTRLEN];
    unsigned short port = 0;
    if (addr->sa_family == AF_INET)
    {
        const auto *addr_in = (const struct sockaddr_in *)addr;
        if (inet_ntop(AF_INET, &addr_in->sin_addr, s, sizeof(s)) == nullptr) return;
        port = ntohs(addr_in->sin_port);
        _node = s;
    }
    else if (addr->sa_family == AF_INET6)
    {
        const auto *addr_in6 = (const struct sockaddr_in6 *)addr;
        if (inet_ntop(AF_INET6, &addr_in6->sin6_addr, s, sizeof(s)) == nullptr) return;
        port = ntohs(addr_in6->sin6_port);
        _node = s;
        if (scoped and addr_in6->sin6_scope_id != 0)
        {
            _node += "%" + std::to_string(addr_in6->sin6_scope_id);
        }
    }
    else return;

    _service = std::to_string(port);
}

std::string SoapyURL::toSockAddr(SockAddrData &addr, const int ipVer) const
{
    if (_service.empty()) return "service not specified";

    struct addrinfo hints, *servinfo = NULL;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_NUMERICSERV;
    switch (ipVer)
    {
    case SOAPY_SSDP_IPVER_INET: hints.ai_family = AF_INET; break;
    case SOAPY_SSDP_IPVER_INET6: hints.ai_family = AF_INET6; break;
    default: hints.ai_family = AF_UNSPEC; break;
    }

    const int ret = getaddrinfo(_node.c_str(), _service.c_str(), &hints, &servinfo);
    if (ret != 0) return gai_strerror(ret);

    std::string errorMsg("no lookup results");
    for (struct addrinfo *p = servinfo; p != NULL; p = p->ai_next)
    {
        if (p->ai_family != AF_INET and p->ai_family != AF_INET6) continue;
        addr = SockAddrData(p->ai_addr, p->ai_addrlen);
        errorMsg.clear();
        break;
    }

    freeaddrinfo(servinfo);
    return errorMsg;
}

std::string SoapyURL::toString(void) const
{
    std::string url;
    if (not _scheme.empty()) url += _scheme + "://";
    if (_node.find(':') != std::string::npos) url += "[" + _node + "]";
    else url += _node;
    if (not _service.empty()) url += ":" + _service;
    return url;
}

std::string SoapyURL::getScheme(void) const
{
    return _scheme;
}

std::string SoapyURL::getNode(void) const
{
    return _node;
}

std::string SoapyURL::getService(void) const
{
    return _service;
}
