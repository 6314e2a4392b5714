// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapyInfoUtils.hpp"

SOAPY_SSDP_API std::string SoapyInfo::getUserAgent(void)
{
    return "@CMAKE_SYSTEM_NAME@/@CMAKE_SYSTEM_VERSION@ UPnP/1.1 SoapySSDP/@SOAPY_SSDP_VERSION@";
}

SOAPY_SSDP_API std::string SoapyInfo::getVersion(void)
{
    return "@SOAPY_SSDP_VERSION@";
}
