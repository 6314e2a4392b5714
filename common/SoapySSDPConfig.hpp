// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include <SoapySDR/Config.hpp>

/***********************************************************************
 * API export defines
 **********************************************************************/
#ifdef SOAPY_SSDP_DLL // defined if SoapySSDP is compiled as a DLL
  #ifdef SOAPY_SSDP_DLL_EXPORTS // defined if we are building the DLL (instead of using it)
    #define SOAPY_SSDP_API SOAPY_SDR_HELPER_DLL_EXPORT
  #else
    #define SOAPY_SSDP_API SOAPY_SDR_HELPER_DLL_IMPORT
  #endif // SOAPY_SSDP_DLL_EXPORTS
  #define SOAPY_SSDP_LOCAL SOAPY_SDR_HELPER_DLL_LOCAL
#else // SOAPY_SSDP_DLL is not defined: this means SoapySSDP is a static lib.
  #define SOAPY_SSDP_API SOAPY_SDR_HELPER_DLL_EXPORT
#endif // SOAPY_SSDP_DLL
