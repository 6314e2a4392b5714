// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <string>
#include <map>

/*!
 * One parsed M-SEARCH reply from a device.
 * Records are immutable once constructed.
 */
class SOAPY_SSDP_API SoapySSDPRecord
{
public:

    //! Header fields with upper-cased keys
    typedef std::map<std::string, std::string> Headers;

    /*!
     * Create a record from the reply header fields.
     * \param headers all reply fields, keys are upper-cased here
     * \param sourceAddress the URL the reply arrived from
     * \param maxAge the cache max-age in seconds or negative when absent
     */
    SoapySSDPRecord(const Headers &headers, const std::string &sourceAddress, const long maxAge = -1);

    //! The URL of the device description (LOCATION)
    const std::string &getLocation(void) const
    {
        return _location;
    }

    //! The service type from ST, or NT when ST is absent
    const std::string &getServiceType(void) const
    {
        return _serviceType;
    }

    //! The unique service name (USN)
    const std::string &getUSN(void) const
    {
        return _usn;
    }

    //! The SERVER header, empty when absent
    const std::string &getServer(void) const
    {
        return _server;
    }

    bool hasCacheControl(void) const
    {
        return _maxAge >= 0;
    }

    //! The CACHE-CONTROL max-age in seconds, check hasCacheControl() first
    long getCacheControl(void) const
    {
        return _maxAge;
    }

    //! The host:port the reply was received from
    const std::string &getSourceAddress(void) const
    {
        return _sourceAddress;
    }

    //! All reply headers with upper-cased keys
    const Headers &getHeaders(void) const
    {
        return _headers;
    }

    /*!
     * The device UUID from a USN of the form uuid:XXX::urn:...
     * or the entire USN when it has no uuid part.
     */
    std::string getUUID(void) const;

private:
    Headers _headers;
    std::string _location;
    std::string _serviceType;
    std::string _usn;
    std::string _server;
    long _maxAge;
    std::string _sourceAddress;
};
