// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <cstddef>
#include <string>

/*!
 * A simple datagram socket wrapper.
 * Calls return negative values on error
 * and record a description in lastErrorMsg().
 */
class SOAPY_SSDP_API SoapyUDPSocket
{
public:
    SoapyUDPSocket(void);

    ~SoapyUDPSocket(void);

    /*!
     * Is the socket null?
     * The default constructor makes a null socket.
     * The socket is non null after bind or multicastSetup.
     */
    bool null(void) const;

    /*!
     * Explicit close the socket, also done by destructor.
     */
    int close(void);

    /*!
     * Bind to a local address, creating the socket when null.
     * URL examples:
     * 0.0.0.0:0
     * [::]:0
     */
    int bind(const std::string &url);

    /*!
     * Configure the socket to send to a multi-cast group.
     * The socket is created with the family of the group when null.
     * \param group the url for the multicast group and port number
     * \param ifaceAddr IPv4 address of the send interface or empty for automatic
     * \param ifaceIndex the IPv6 interface index or 0 for automatic
     * \param loop specify to receive local loopback
     * \param ttl specify time to live for send packets
     */
    int multicastSetup(
        const std::string &group,
        const std::string &ifaceAddr = "",
        const unsigned int ifaceIndex = 0,
        const bool loop = true,
        const int ttl = 1);

    /*!
     * Send to a specific destination.
     * Return the number of bytes sent or negative error.
     */
    int sendto(const void *buf, size_t len, const std::string &url, int flags = 0);

    /*!
     * Receive from an unconnected socket.
     * The source address is written into url.
     */
    int recvfrom(void *buf, size_t len, std::string &url, int flags = 0);

    /*!
     * Wait for recv to become ready with timeout.
     * Return 1 for ready, 0 for timeout, negative on error.
     */
    int selectRecv(const long timeoutUs);

    /*!
     * Query the last error message as a string.
     */
    const char *lastErrorMsg(void) const
    {
        return _lastErrorMsg.c_str();
    }

    /*!
     * Get the URL of the local socket.
     * Return an empty string on error.
     */
    std::string getsockname(void);

private:
    SoapyUDPSocket(const SoapyUDPSocket &);
    SoapyUDPSocket &operator=(const SoapyUDPSocket &);

    int _sock;
    std::string _lastErrorMsg;

    void reportError(const std::string &what, const std::string &errorMsg);
    void reportError(const std::string &what, const int err);
    void reportError(const std::string &what);
};
