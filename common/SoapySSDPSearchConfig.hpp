// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <SoapySDR/Types.hpp>
#include <string>

/*!
 * Parameters for one discovery invocation.
 * Constructed once by the caller, copied into the session,
 * and read-only from then on.
 */
struct SOAPY_SSDP_API SoapySSDPSearchConfig
{
    //! Create a configuration with the default values
    SoapySSDPSearchConfig(void);

    //! The ST header: ssdp:all, upnp:rootdevice, a URN, or uuid:...
    std::string searchTarget;

    //! The MX header: devices delay their reply randomly within this window
    int maxWaitSeconds;

    //! Upper bound for maxWaitSeconds, widen with care
    int maxWaitLimit;

    //! How long to listen for replies after each probe, at most an hour
    double timeoutSeconds;

    //! Additional probe rounds after the first, at most 1000
    int retryCount;

    //! Log parse diagnostics and send failures
    bool verbose;

    //! Multicast group IP version: 4 or 6
    int ipVer;

    //! Send interface name or address, empty for the system default
    std::string iface;

    //! Multicast time to live or IPv6 hop limit
    int ttl;

    /*!
     * Check the parameters.
     * \throws SoapySSDPInvalidConfig describing the first problem
     */
    void validate(void) const;

    /*!
     * Create a configuration from keyword arguments.
     * Missing keys keep their defaults, a missing timeout is mx + 1.
     * The result is not validated.
     * \throws SoapySSDPInvalidConfig when a value does not parse
     */
    static SoapySSDPSearchConfig fromKwargs(const SoapySDR::Kwargs &args);

    //! Convert to keyword arguments, the inverse of fromKwargs()
    SoapySDR::Kwargs toKwargs(void) const;
};
