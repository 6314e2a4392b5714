// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include "SoapySSDPDefs.hpp"
#include "SoapySSDPRecord.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

/*!
 * Get the SSDP multicast group URL for the IP version.
 * Example: 239.255.255.250:1900 or [ff02::c]:1900
 * \throws SoapySSDPInvalidConfig for an unknown IP version
 */
SOAPY_SSDP_API std::string getSSDPGroupURL(const int ipVer = SOAPY_SSDP_IPVER_INET);

/*!
 * Format the M-SEARCH request datagram.
 * The MX bound is soft, callers may widen it with maxWaitLimit.
 * \throws SoapySSDPInvalidConfig for an empty search target,
 * an MX outside [1, maxWaitLimit], or an unknown IP version
 */
SOAPY_SSDP_API std::string formatMSearchRequest(
    const std::string &searchTarget,
    const int maxWaitSeconds,
    const int ipVer = SOAPY_SSDP_IPVER_INET,
    const int maxWaitLimit = SOAPY_SSDP_MX_MAX
);

/*!
 * Extract max-age from a CACHE-CONTROL value.
 * \return seconds or negative when absent or malformed
 */
SOAPY_SSDP_API long parseCacheControlMaxAge(const std::string &cacheControl);

/*!
 * Parse one received datagram into a record.
 * Skipped lines and the reject reason are appended to diagnostics.
 * \return the record or null when the reply is rejected
 */
SOAPY_SSDP_API std::unique_ptr<SoapySSDPRecord> parseMSearchResponse(
    const void *buff,
    const size_t length,
    const std::string &sourceAddress,
    std::vector<std::string> &diagnostics
);
