// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include "SoapySSDPSearchConfig.hpp"
#include "SoapySSDPRecord.hpp"
#include "SoapySSDPResultSet.hpp"
#include "SoapySSDPTransport.hpp"
#include "SoapySSDPError.hpp"
#include <csignal> //sig_atomic_t
#include <cstddef>
#include <memory> //unique_ptr
#include <string>
#include <vector>

//! Counters collected while a session runs
struct SOAPY_SSDP_API SoapySSDPSessionStats
{
    SoapySSDPSessionStats(void);
    size_t rounds; //! Completed probe rounds
    size_t sends; //! Probe send attempts
    size_t sendFailures; //! Probes that failed to send
    size_t datagrams; //! Datagrams received
    size_t malformed; //! Datagrams rejected by the parser
    size_t duplicates; //! Replies merged into an earlier record
    size_t recvErrors; //! Failed waits and reads, a failed wait ends the listen window
};

/*!
 * One active SSDP discovery run.
 *
 * The session owns its transport exclusively and drives it
 * through IDLE -> SENDING -> LISTENING -> (SENDING | DONE),
 * one send/listen round for the first probe and each retry.
 * Every round listens for the full timeout regardless of how many
 * replies arrived, so a run takes at most (retries + 1) * timeout.
 */
class SOAPY_SSDP_API SoapySSDPSession
{
public:

    enum State
    {
        IDLE,
        SENDING,
        LISTENING,
        DONE,
    };

    /*!
     * Create a session on a UDP multicast socket.
     * \throws SoapySSDPInvalidConfig before any socket is created
     */
    SoapySSDPSession(const SoapySSDPSearchConfig &config);

    /*!
     * Create a session with a custom transport and clock.
     * \throws SoapySSDPInvalidConfig before the transport is used
     */
    SoapySSDPSession(
        const SoapySSDPSearchConfig &config,
        std::unique_ptr<SoapySSDPTransport> transport,
        std::unique_ptr<SoapySSDPClock> clock);

    ~SoapySSDPSession(void);

    /*!
     * Run the discovery to completion.
     * Can only be called once per session.
     * \return unique records in order of first arrival
     * \throws SoapySSDPSocketError when the socket cannot be set up
     */
    std::vector<SoapySSDPRecord> discover(void);

    /*!
     * Request early termination.
     * The current wait ends at the next poll interval
     * and no further rounds are started.
     * Safe to call from a signal handler.
     */
    void cancel(void);

    State getState(void) const
    {
        return _state;
    }

    const SoapySSDPSessionStats &getStats(void) const
    {
        return _stats;
    }

    //! Send failures, in round order
    const std::vector<SoapySSDPTransportError> &getTransportErrors(void) const
    {
        return _transportErrors;
    }

    const SoapySSDPSearchConfig &getConfig(void) const
    {
        return _config;
    }

private:
    SoapySSDPSession(const SoapySSDPSession &);
    SoapySSDPSession &operator=(const SoapySSDPSession &);

    const SoapySSDPSearchConfig _config;
    const std::string _request;
    const std::string _groupURL;
    std::unique_ptr<SoapySSDPTransport> _transport;
    std::unique_ptr<SoapySSDPClock> _clock;

    State _state;
    volatile sig_atomic_t _cancelled;
    SoapySSDPResultSet _results;
    SoapySSDPSessionStats _stats;
    std::vector<SoapySSDPTransportError> _transportErrors;
    std::vector<char> _recvBuff;

    void sendProbe(const size_t round);
    void listenRound(const size_t round);
    void handleDatagram(const size_t length, const std::string &recvAddr);
};
