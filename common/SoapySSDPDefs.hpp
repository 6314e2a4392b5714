// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"

/***********************************************************************
 * SSDP wire constants
 **********************************************************************/
//! IPv4 multi-cast address for SSDP communications
#define SOAPY_SSDP_MULTICAST_ADDR_IPV4 "239.255.255.250"

//! IPv6 link-local multi-cast address for SSDP communications
#define SOAPY_SSDP_MULTICAST_ADDR_IPV6 "ff02::c"

//! UDP service port number for SSDP communications
#define SOAPY_SSDP_UDP_PORT_NUMBER "1900"

//! The MAN header value for an active search
#define SOAPY_SSDP_MAN_DISCOVER "ssdp:discover"

//! Search all devices and services
#define SOAPY_SSDP_TARGET_ALL "ssdp:all"

//! Recommended bounds for the MX header in seconds
#define SOAPY_SSDP_MX_MIN 1
#define SOAPY_SSDP_MX_MAX 5

/*!
 * Largest possible UDP payload (65527 bytes over IPv6).
 * Replies are small, but oversized ones must not be truncated
 * into something that still parses.
 */
#define SOAPY_SSDP_MAX_DATAGRAM 65527

/***********************************************************************
 * Key-words and their defaults
 **********************************************************************/
//! Search target (ST header)
#define SOAPY_SSDP_KWARG_ST "st"
#define SOAPY_SSDP_DEFAULT_ST SOAPY_SSDP_TARGET_ALL

//! Maximum reply delay in seconds (MX header)
#define SOAPY_SSDP_KWARG_MX "mx"
#define SOAPY_SSDP_DEFAULT_MX 3

//! Upper bound for mx, widen it to search with a longer MX
#define SOAPY_SSDP_KWARG_MX_LIMIT "mx_limit"

//! Listen window in seconds after each probe, defaults to mx + 1
#define SOAPY_SSDP_KWARG_TIMEOUT "timeout"
#define SOAPY_SSDP_TIMEOUT_MAX 3600.0

//! Additional probe rounds after the first
#define SOAPY_SSDP_KWARG_RETRIES "retries"
#define SOAPY_SSDP_DEFAULT_RETRIES 3
#define SOAPY_SSDP_RETRIES_MAX 1000

//! Surface parse diagnostics and send failures
#define SOAPY_SSDP_KWARG_VERBOSE "verbose"

//! IP version of the multicast group: 4 or 6
#define SOAPY_SSDP_KWARG_IPVER "ipver"

//! Multicast send interface by name or address
#define SOAPY_SSDP_KWARG_IFACE "iface"

//! Multicast time to live (hop limit for IPv6)
#define SOAPY_SSDP_KWARG_TTL "ttl"
#define SOAPY_SSDP_DEFAULT_TTL 2

/***********************************************************************
 * Socket defaults
 **********************************************************************/

//! Use this timeout for every socket poll loop
#define SOAPY_SSDP_SOCKET_TIMEOUT_US (100*1000) //100 ms

//! Constants for specifying IP versions
#define SOAPY_SSDP_IPVER_INET     4
#define SOAPY_SSDP_IPVER_INET6    6
