// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySocketDefs.hpp"
#include "SoapyUDPSocket.hpp"
#include "SoapyURLUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <cstring> //strerror
#include <cerrno> //errno

SoapyUDPSocket::SoapyUDPSocket(void):
    _sock(INVALID_SOCKET)
{
    return;
}

SoapyUDPSocket::~SoapyUDPSocket(void)
{
    if (this->close() != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SoapyUDPSocket::~SoapyUDPSocket: %s", this->lastErrorMsg());
    }
}

bool SoapyUDPSocket::null(void) const
{
    return _sock == INVALID_SOCKET;
}

int SoapyUDPSocket::close(void)
{
    if (this->null()) return 0;
    int ret = ::closesocket(_sock);
    _sock = INVALID_SOCKET;
    if (ret != 0) this->reportError("closesocket()");
    return ret;
}

int SoapyUDPSocket::bind(const std::string &url)
{
    SoapyURL urlObj(url);
    SockAddrData addr;
    const auto errorMsg = urlObj.toSockAddr(addr);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+url+")", errorMsg);
        return -1;
    }

    if (this->null()) _sock = ::socket(addr.addr()->sa_family, SOCK_DGRAM, 0);
    if (this->null())
    {
        this->reportError("socket("+url+")");
        return -1;
    }

    int ret = ::bind(_sock, addr.addr(), socklen_t(addr.addrlen()));
    if (ret == -1) this->reportError("bind("+url+")");
    return ret;
}

template <typename T>
static int setSockOpt(const int sock, const int level, const int name, const T &value)
{
    return ::setsockopt(sock, level, name, (const char *)&value, sizeof(value));
}

int SoapyUDPSocket::multicastSetup(
    const std::string &group,
    const std::string &ifaceAddr,
    const unsigned int ifaceIndex,
    const bool loop,
    const int ttl)
{
    /*
     * Multicast send docs:
     * http://www.tldp.org/HOWTO/Multicast-HOWTO-6.html
     * Replies to M-SEARCH are unicast to the sender,
     * so there is no group membership to join here.
     */
    SockAddrData addr;
    const auto errorMsg = SoapyURL(group).toSockAddr(addr);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+group+")", errorMsg);
        return -1;
    }

    const int family = addr.addr()->sa_family;
    if (family != AF_INET and family != AF_INET6)
    {
        this->reportError("multicastSetup("+group+")", "unsupported address family");
        return -1;
    }

    if (this->null()) _sock = ::socket(family, SOCK_DGRAM, 0);
    if (this->null())
    {
        this->reportError("socket("+group+")");
        return -1;
    }

    if (family == AF_INET6)
    {
        //IPv6 options take an int or unsigned int
        if (setSockOpt(_sock, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, (unsigned int)(loop?1:0)) != 0)
        {
            this->reportError("setsockopt(IPV6_MULTICAST_LOOP)");
            return -1;
        }
        if (setSockOpt(_sock, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, ttl) != 0)
        {
            this->reportError("setsockopt(IPV6_MULTICAST_HOPS, "+std::to_string(ttl)+")");
            return -1;
        }
        if (ifaceIndex != 0 and setSockOpt(_sock, IPPROTO_IPV6, IPV6_MULTICAST_IF, ifaceIndex) != 0)
        {
            this->reportError("setsockopt(IPV6_MULTICAST_IF, "+std::to_string(ifaceIndex)+")");
            return -1;
        }
        return 0;
    }

    //IPv4 options take an unsigned char
    if (setSockOpt(_sock, IPPROTO_IP, IP_MULTICAST_LOOP, (unsigned char)(loop?1:0)) != 0)
    {
        this->reportError("setsockopt(IP_MULTICAST_LOOP)");
        return -1;
    }
    if (setSockOpt(_sock, IPPROTO_IP, IP_MULTICAST_TTL, (unsigned char)(ttl)) != 0)
    {
        this->reportError("setsockopt(IP_MULTICAST_TTL, "+std::to_string(ttl)+")");
        return -1;
    }
    if (ifaceAddr.empty()) return 0;

    struct in_addr sendAddr;
    if (inet_pton(AF_INET, ifaceAddr.c_str(), &sendAddr) != 1)
    {
        this->reportError("inet_pton("+ifaceAddr+")", "not an IPv4 address");
        return -1;
    }
    if (setSockOpt(_sock, IPPROTO_IP, IP_MULTICAST_IF, sendAddr) != 0)
    {
        this->reportError("setsockopt(IP_MULTICAST_IF, "+ifaceAddr+")");
        return -1;
    }
    return 0;
}

int SoapyUDPSocket::sendto(const void *buf, size_t len, const std::string &url, int flags)
{
    SockAddrData addr;
    const auto errorMsg = SoapyURL(url).toSockAddr(addr);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+url+")", errorMsg);
        return -1;
    }
    int ret = int(::sendto(_sock, (const char *)buf, len, flags | MSG_NOSIGNAL, addr.addr(), socklen_t(addr.addrlen())));
    if (ret == -1) this->reportError("sendto("+url+")");
    return ret;
}

int SoapyUDPSocket::recvfrom(void *buf, size_t len, std::string &url, int flags)
{
    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);
    int ret = int(::recvfrom(_sock, (char *)buf, len, flags, (struct sockaddr*)&addr, &addrlen));
    if (ret == -1) this->reportError("recvfrom()");
    else url = SoapyURL((const struct sockaddr *)&addr).toString();
    return ret;
}

int SoapyUDPSocket::selectRecv(const long timeoutUs)
{
    struct timeval tv;
    tv.tv_sec = timeoutUs / 1000000;
    tv.tv_usec = timeoutUs % 1000000;

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(_sock, &readfds);

    int ret = ::select(_sock+1, &readfds, NULL, NULL, &tv);
    if (ret == -1 and SOCKET_ERRNO == EINTR) return 0; //interrupted system call counts as timeout
    if (ret == -1) this->reportError("select()");
    return ret;
}

static std::string errToString(const int err)
{
    char buff[1024];
    //http://linux.die.net/man/3/strerror_r
    #ifdef STRERROR_R_XSI
    strerror_r(err, buff, sizeof(buff));
    #else
    //this version may decide to use its own internal string
    return strerror_r(err, buff, sizeof(buff));
    #endif
    return buff;
}

void SoapyUDPSocket::reportError(const std::string &what)
{
    this->reportError(what, SOCKET_ERRNO);
}

void SoapyUDPSocket::reportError(const std::string &what, const int err)
{
    if (err == 0) _lastErrorMsg = what;
    else this->reportError(what, std::to_string(err) + ": " + errToString(err));
}

void SoapyUDPSocket::reportError(const std::string &what, const std::string &errorMsg)
{
    _lastErrorMsg = what + " [" + errorMsg + "]";
}

std::string SoapyUDPSocket::getsockname(void)
{
    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);
    int ret = ::getsockname(_sock, (struct sockaddr *)&addr, &addrlen);
    if (ret == -1) this->reportError("getsockname()");
    if (ret != 0) return "";
    return SoapyURL((const struct sockaddr *)&addr).toString();
}
