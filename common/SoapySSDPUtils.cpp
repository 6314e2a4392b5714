// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

/*
 * Docs and examples:
 * https://stackoverflow.com/questions/13382469/ssdp-protocol-implementation
 * http://upnp.org/specs/arch/UPnP-arch-DeviceArchitecture-v1.1.pdf
 */

#include "SoapySSDPUtils.hpp"
#include "SoapySSDPError.hpp"
#include "SoapyHTTPUtils.hpp"
#include "SoapyInfoUtils.hpp"
#include "SoapyURLUtils.hpp"
#include <cctype>
#include <stdexcept>

//! Status line prefix of a successful search reply
static const std::string STATUS_OK_PREFIX("HTTP/1.1 200");

std::string getSSDPGroupURL(const int ipVer)
{
    switch (ipVer)
    {
    case SOAPY_SSDP_IPVER_INET:
        return SoapyURL("", SOAPY_SSDP_MULTICAST_ADDR_IPV4, SOAPY_SSDP_UDP_PORT_NUMBER).toString();
    case SOAPY_SSDP_IPVER_INET6:
        return SoapyURL("", SOAPY_SSDP_MULTICAST_ADDR_IPV6, SOAPY_SSDP_UDP_PORT_NUMBER).toString();
    default:
        throw SoapySSDPInvalidConfig("getSSDPGroupURL("+std::to_string(ipVer)+") -- IP version must be 4 or 6");
    }
}

std::string formatMSearchRequest(
    const std::string &searchTarget,
    const int maxWaitSeconds,
    const int ipVer,
    const int maxWaitLimit
){
    if (searchTarget.empty())
    {
        throw SoapySSDPInvalidConfig("formatMSearchRequest() -- empty search target");
    }
    if (maxWaitSeconds < SOAPY_SSDP_MX_MIN or maxWaitSeconds > maxWaitLimit)
    {
        throw SoapySSDPInvalidConfig("formatMSearchRequest() -- MX "+std::to_string(maxWaitSeconds)+
            " outside of ["+std::to_string(SOAPY_SSDP_MX_MIN)+", "+std::to_string(maxWaitLimit)+"]");
    }

    SoapyHTTPHeader header("M-SEARCH * HTTP/1.1");
    header.addField("HOST", getSSDPGroupURL(ipVer));
    header.addField("MAN", "\"" SOAPY_SSDP_MAN_DISCOVER "\"");
    header.addField("MX", std::to_string(maxWaitSeconds));
    header.addField("ST", searchTarget);
    header.addField("USER-AGENT", SoapyInfo::getUserAgent());
    header.finalize();
    return std::string((const char *)header.data(), header.size());
}

long parseCacheControlMaxAge(const std::string &cacheControl)
{
    //directives are comma separated, ex: "no-cache, max-age = 1800"
    size_t pos = 0;
    while (pos <= cacheControl.size())
    {
        auto end = cacheControl.find(',', pos);
        if (end == std::string::npos) end = cacheControl.size();
        const auto directive = trimWhitespace(cacheControl.substr(pos, end-pos));
        pos = end + 1;

        const auto equalsPos = directive.find('=');
        if (equalsPos == std::string::npos) continue;
        if (not equalsIgnoreCase(trimWhitespace(directive.substr(0, equalsPos)), "max-age")) continue;

        const auto value = trimWhitespace(directive.substr(equalsPos+1));
        if (value.empty()) return -1;
        for (const char ch : value)
        {
            if (not std::isdigit((unsigned char)ch)) return -1;
        }
        try {return std::stol(value);}
        catch (const std::out_of_range &) {return -1;}
    }
    return -1;
}

std::unique_ptr<SoapySSDPRecord> parseMSearchResponse(
    const void *buff,
    const size_t length,
    const std::string &sourceAddress,
    std::vector<std::string> &diagnostics
){
    std::unique_ptr<SoapySSDPRecord> record;

    const SoapyHTTPHeader header(buff, length);

    //only a successful search reply is of interest
    const auto line0 = header.getLine0();
    const bool statusOk = line0.compare(0, STATUS_OK_PREFIX.size(), STATUS_OK_PREFIX) == 0 and
        (line0.size() == STATUS_OK_PREFIX.size() or line0[STATUS_OK_PREFIX.size()] == ' ');
    if (not statusOk)
    {
        diagnostics.push_back("unexpected status line '" + line0 + "'");
        return record;
    }

    diagnostics.insert(diagnostics.end(), header.getDiagnostics().begin(), header.getDiagnostics().end());

    //not enough identity to report without location or usn
    const auto location = header.getField("LOCATION");
    const auto usn = header.getField("USN");
    if (location.empty() and usn.empty())
    {
        diagnostics.push_back("missing both LOCATION and USN");
        return record;
    }

    long maxAge = -1;
    if (header.hasField("CACHE-CONTROL"))
    {
        const auto cacheControl = header.getField("CACHE-CONTROL");
        maxAge = parseCacheControlMaxAge(cacheControl);
        if (maxAge < 0) diagnostics.push_back("ignored malformed CACHE-CONTROL '" + cacheControl + "'");
    }

    //first occurrence of a repeated field wins
    SoapySSDPRecord::Headers headers;
    for (const auto &field : header.getFields())
    {
        std::string key(field.first);
        for (auto &ch : key) ch = char(std::toupper((unsigned char)ch));
        headers.insert(std::make_pair(key, field.second));
    }

    record.reset(new SoapySSDPRecord(headers, sourceAddress, maxAge));
    return record;
}
