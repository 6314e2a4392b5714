// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <cstddef>
#include <string>
#include <vector>

//forward declares
struct sockaddr;

//! A simple storage class for a sockaddr
class SOAPY_SSDP_API SockAddrData
{
public:
    //! Create an empty socket address
    SockAddrData(void);

    //! Create a socket address from a pointer and length
    SockAddrData(const struct sockaddr *addr, const size_t addrlen);

    //! Get a pointer to the underlying data
    const struct sockaddr *addr(void) const;

    //! Length of the underlying structure
    size_t addrlen(void) const;

private:
    std::vector<char> _storage;
};

/*!
 * Datagram URL parsing and lookup.
 * Markup is [scheme://]node:service where the node may be
 * a host name, an IPv4 address, or an IPv6 address in brackets.
 * The service is always a numeric UDP port.
 */
class SOAPY_SSDP_API SoapyURL
{
public:
    //! Create empty url object
    SoapyURL(void);

    //! Create URL from components
    SoapyURL(const std::string &scheme, const std::string &node, const std::string &service);

    //! Parse from url markup string
    SoapyURL(const std::string &url);

    //! Create URL from socket address
    SoapyURL(const SockAddrData &addr);

    /*!
     * Create URL from a raw socket address (IPv4 or IPv6 only).
     * A scoped IPv6 node is written as fe80::1%2 unless scoped is false.
     */
    SoapyURL(const struct sockaddr *addr, const bool scoped = true);

    /*!
     * Convert to socket address + resolve address.
     * \param addr the resolved address
     * \param ipVer restrict to IPv4 or IPv6, or 0 for either
     * \return the error message on failure or empty on success
     */
    std::string toSockAddr(SockAddrData &addr, const int ipVer = 0) const;

    /*!
     * Convert to URL string markup.
     */
    std::string toString(void) const;

    //! Get the scheme
    std::string getScheme(void) const;

    //! Get the node
    std::string getNode(void) const;

    //! Get the service
    std::string getService(void) const;

private:
    std::string _scheme;
    std::string _node;
    std::string _service;
};
