// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

//! Base class for all discovery failures
class SOAPY_SSDP_API SoapySSDPError : public std::runtime_error
{
public:
    explicit SoapySSDPError(const std::string &what):
        std::runtime_error(what)
    {
        return;
    }
};

/*!
 * Malformed discovery parameters.
 * Raised before any network I/O takes place.
 */
class SOAPY_SSDP_API SoapySSDPInvalidConfig : public SoapySSDPError
{
public:
    explicit SoapySSDPInvalidConfig(const std::string &what):
        SoapySSDPError(what)
    {
        return;
    }
};

/*!
 * The multicast socket could not be opened, bound, or configured.
 * Fatal to the session, no results are produced.
 */
class SOAPY_SSDP_API SoapySSDPSocketError : public SoapySSDPError
{
public:
    explicit SoapySSDPSocketError(const std::string &what):
        SoapySSDPError(what)
    {
        return;
    }
};

/*!
 * A probe could not be sent after the socket was established.
 * The session records these and keeps going.
 */
class SOAPY_SSDP_API SoapySSDPTransportError : public SoapySSDPError
{
public:
    SoapySSDPTransportError(const std::string &what, const size_t round):
        SoapySSDPError(what),
        _round(round)
    {
        return;
    }

    //! The zero based probe round that failed
    size_t round(void) const
    {
        return _round;
    }

private:
    size_t _round;
};
