// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <string>
#include <vector>

struct SoapyIfAddr
{
    SoapyIfAddr(void);
    int ethno; //! The ethernet index
    int ipVer; //! The ip protocol: 4 or 6
    bool isUp; //! Is this link active?
    bool isLoopback; //! Is this a loopback interface?
    bool isMulticast; //! Does this interface support multicast?
    std::string name; //! The interface name: ex eth0
    std::string addr; //! The ip address as a string
};

//! Get a list of IF addrs
SOAPY_SSDP_API std::vector<SoapyIfAddr> listSoapyIfAddrs(void);

/*!
 * Find the interface for a multicast send.
 * \param ifAddrs the candidates, usually from listSoapyIfAddrs()
 * \param nameOrAddr an interface name (eth0) or one of its addresses
 * \param ipVer the IP version of the address to pick
 * \param [out] result the matching entry
 * \return an empty string on success or the reason for failure
 */
SOAPY_SSDP_API std::string findSoapyIfAddr(
    const std::vector<SoapyIfAddr> &ifAddrs,
    const std::string &nameOrAddr,
    const int ipVer,
    SoapyIfAddr &result);
