// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include "SoapyUDPSocket.hpp"
#include <cstddef>
#include <chrono>
#include <string>

struct SoapySSDPSearchConfig;

/*!
 * The datagram operations used by a discovery session.
 * Calls follow the socket convention: negative on error
 * with the reason available from lastErrorMsg().
 */
class SOAPY_SSDP_API SoapySSDPTransport
{
public:
    virtual ~SoapySSDPTransport(void);

    /*!
     * Create the socket, configure multicast sending, and bind.
     * \return 0 for success or negative error code
     */
    virtual int open(const SoapySSDPSearchConfig &config) = 0;

    //! Send a datagram, return the number of bytes sent or negative error
    virtual int sendto(const void *buf, size_t len, const std::string &url) = 0;

    //! Wait for a datagram: 1 for ready, 0 for timeout, negative on error
    virtual int selectRecv(const long timeoutUs) = 0;

    //! Receive a datagram and its source URL
    virtual int recvfrom(void *buf, size_t len, std::string &url) = 0;

    //! Release the socket, safe to call more than once
    virtual int close(void) = 0;

    virtual const char *lastErrorMsg(void) const = 0;
};

/*!
 * Transport over a real UDP socket.
 * Replies to M-SEARCH arrive as unicast on the ephemeral port
 * chosen when binding, so no group membership is needed.
 */
class SOAPY_SSDP_API SoapyUDPTransport : public SoapySSDPTransport
{
public:
    SoapyUDPTransport(void);

    int open(const SoapySSDPSearchConfig &config);

    int sendto(const void *buf, size_t len, const std::string &url);

    int selectRecv(const long timeoutUs);

    int recvfrom(void *buf, size_t len, std::string &url);

    int close(void);

    const char *lastErrorMsg(void) const;

private:
    SoapyUDPSocket _sock;
    std::string _lastErrorMsg;
};

/*!
 * Time source for session deadlines.
 */
class SOAPY_SSDP_API SoapySSDPClock
{
public:
    typedef std::chrono::steady_clock::time_point TimePoint;

    virtual ~SoapySSDPClock(void);

    virtual TimePoint now(void) = 0;
};

//! The monotonic system clock
class SOAPY_SSDP_API SoapySSDPSteadyClock : public SoapySSDPClock
{
public:
    TimePoint now(void);
};
