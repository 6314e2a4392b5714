// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <string>

namespace SoapyInfo
{
    /*!
     * Get the user agent string for this build.
     * Format: OS/version UPnP/1.1 product/version
     */
    SOAPY_SSDP_API std::string getUserAgent(void);

    /*!
     * Get the version string for this build.
     */
    SOAPY_SSDP_API std::string getVersion(void);
};
