// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPSearchConfig.hpp"
#include "SoapySSDPDefs.hpp"
#include "SoapySSDPError.hpp"
#include "SoapyHTTPUtils.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

SoapySSDPSearchConfig::SoapySSDPSearchConfig(void):
    searchTarget(SOAPY_SSDP_DEFAULT_ST),
    maxWaitSeconds(SOAPY_SSDP_DEFAULT_MX),
    maxWaitLimit(SOAPY_SSDP_MX_MAX),
    timeoutSeconds(SOAPY_SSDP_DEFAULT_MX + 1),
    retryCount(SOAPY_SSDP_DEFAULT_RETRIES),
    verbose(false),
    ipVer(SOAPY_SSDP_IPVER_INET),
    ttl(SOAPY_SSDP_DEFAULT_TTL)
{
    return;
}

void SoapySSDPSearchConfig::validate(void) const
{
    if (searchTarget.empty())
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- search target is empty");
    }
    if (maxWaitSeconds < SOAPY_SSDP_MX_MIN or maxWaitSeconds > maxWaitLimit)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- max wait "+std::to_string(maxWaitSeconds)+
            "s outside of ["+std::to_string(SOAPY_SSDP_MX_MIN)+", "+std::to_string(maxWaitLimit)+"]");
    }
    if (not std::isfinite(timeoutSeconds) or timeoutSeconds <= 0.0)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- timeout must be positive");
    }
    if (timeoutSeconds > SOAPY_SSDP_TIMEOUT_MAX)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- timeout "+std::to_string(timeoutSeconds)+
            "s exceeds "+std::to_string(SOAPY_SSDP_TIMEOUT_MAX)+"s");
    }
    if (timeoutSeconds < maxWaitSeconds)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- timeout "+std::to_string(timeoutSeconds)+
            "s is shorter than max wait "+std::to_string(maxWaitSeconds)+"s");
    }
    if (retryCount < 0 or retryCount > SOAPY_SSDP_RETRIES_MAX)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- retry count "+std::to_string(retryCount)+
            " outside of [0, "+std::to_string(SOAPY_SSDP_RETRIES_MAX)+"]");
    }
    if (ipVer != SOAPY_SSDP_IPVER_INET and ipVer != SOAPY_SSDP_IPVER_INET6)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- IP version must be 4 or 6");
    }
    if (ttl < 1 or ttl > 255)
    {
        throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- ttl outside of [1, 255]");
    }
}

/***********************************************************************
 * Keyword argument conversions
 **********************************************************************/
static int kwargToInt(const SoapySDR::Kwargs &args, const std::string &key, const int defaultValue)
{
    const auto it = args.find(key);
    if (it == args.end()) return defaultValue;
    try
    {
        size_t pos = 0;
        const int value = std::stoi(it->second, &pos);
        if (pos == it->second.size()) return value;
    }
    catch (const std::logic_error &) {}
    throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- "+key+"="+it->second+" is not an integer");
}

static double kwargToDouble(const SoapySDR::Kwargs &args, const std::string &key, const double defaultValue)
{
    const auto it = args.find(key);
    if (it == args.end()) return defaultValue;
    try
    {
        size_t pos = 0;
        const double value = std::stod(it->second, &pos);
        if (pos == it->second.size()) return value;
    }
    catch (const std::logic_error &) {}
    throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- "+key+"="+it->second+" is not a number");
}

static bool kwargToBool(const SoapySDR::Kwargs &args, const std::string &key, const bool defaultValue)
{
    const auto it = args.find(key);
    if (it == args.end()) return defaultValue;
    const auto &value = it->second;
    if (value.empty() or value == "1" or equalsIgnoreCase(value, "true") or equalsIgnoreCase(value, "yes")) return true;
    if (value == "0" or equalsIgnoreCase(value, "false") or equalsIgnoreCase(value, "no")) return false;
    throw SoapySSDPInvalidConfig("SoapySSDPSearchConfig -- "+key+"="+value+" is not a boolean");
}

SoapySSDPSearchConfig SoapySSDPSearchConfig::fromKwargs(const SoapySDR::Kwargs &args)
{
    SoapySSDPSearchConfig config;

    const auto stIt = args.find(SOAPY_SSDP_KWARG_ST);
    if (stIt != args.end()) config.searchTarget = stIt->second;

    config.maxWaitSeconds = kwargToInt(args, SOAPY_SSDP_KWARG_MX, config.maxWaitSeconds);
    config.maxWaitLimit = kwargToInt(args, SOAPY_SSDP_KWARG_MX_LIMIT, config.maxWaitLimit);
    config.timeoutSeconds = kwargToDouble(args, SOAPY_SSDP_KWARG_TIMEOUT, config.maxWaitSeconds + 1);
    config.retryCount = kwargToInt(args, SOAPY_SSDP_KWARG_RETRIES, config.retryCount);
    config.verbose = kwargToBool(args, SOAPY_SSDP_KWARG_VERBOSE, config.verbose);
    config.ipVer = kwargToInt(args, SOAPY_SSDP_KWARG_IPVER, config.ipVer);
    config.ttl = kwargToInt(args, SOAPY_SSDP_KWARG_TTL, config.ttl);

    const auto ifaceIt = args.find(SOAPY_SSDP_KWARG_IFACE);
    if (ifaceIt != args.end()) config.iface = ifaceIt->second;

    return config;
}

SoapySDR::Kwargs SoapySSDPSearchConfig::toKwargs(void) const
{
    //round trip friendly formatting of the timeout
    std::ostringstream timeout;
    timeout.precision(17);
    timeout << timeoutSeconds;

    SoapySDR::Kwargs args;
    args[SOAPY_SSDP_KWARG_ST] = searchTarget;
    args[SOAPY_SSDP_KWARG_MX] = std::to_string(maxWaitSeconds);
    args[SOAPY_SSDP_KWARG_MX_LIMIT] = std::to_string(maxWaitLimit);
    args[SOAPY_SSDP_KWARG_TIMEOUT] = timeout.str();
    args[SOAPY_SSDP_KWARG_RETRIES] = std::to_string(retryCount);
    args[SOAPY_SSDP_KWARG_VERBOSE] = verbose?"true":"false";
    args[SOAPY_SSDP_KWARG_IPVER] = std::to_string(ipVer);
    args[SOAPY_SSDP_KWARG_TTL] = std::to_string(ttl);
    if (not iface.empty()) args[SOAPY_SSDP_KWARG_IFACE] = iface;
    return args;
}
