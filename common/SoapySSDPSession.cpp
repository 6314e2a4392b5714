// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPSession.hpp"
#include "SoapySSDPUtils.hpp"
#include "SoapySSDPDefs.hpp"
#include <SoapySDR/Logger.hpp>
#include <algorithm> //min
#include <chrono>
#include <stdexcept>
#include <utility> //move

SoapySSDPSessionStats::SoapySSDPSessionStats(void):
    rounds(0),
    sends(0),
    sendFailures(0),
    datagrams(0),
    malformed(0),
    duplicates(0),
    recvErrors(0)
{
    return;
}

static const SoapySSDPSearchConfig &validated(const SoapySSDPSearchConfig &config)
{
    config.validate();
    return config;
}

/***********************************************************************
 * Session construction
 **********************************************************************/
SoapySSDPSession::SoapySSDPSession(const SoapySSDPSearchConfig &config):
    SoapySSDPSession(config,
        std::unique_ptr<SoapySSDPTransport>(new SoapyUDPTransport()),
        std::unique_ptr<SoapySSDPClock>(new SoapySSDPSteadyClock()))
{
    return;
}

SoapySSDPSession::SoapySSDPSession(
    const SoapySSDPSearchConfig &config,
    std::unique_ptr<SoapySSDPTransport> transport,
    std::unique_ptr<SoapySSDPClock> clock):
    _config(validated(config)),
    _request(formatMSearchRequest(_config.searchTarget, _config.maxWaitSeconds, _config.ipVer, _config.maxWaitLimit)),
    _groupURL(getSSDPGroupURL(_config.ipVer)),
    _transport(std::move(transport)),
    _clock(std::move(clock)),
    _state(IDLE),
    _cancelled(0)
{
    if (not _transport) throw std::runtime_error("SoapySSDPSession() -- missing transport");
    if (not _clock) throw std::runtime_error("SoapySSDPSession() -- missing clock");
}

SoapySSDPSession::~SoapySSDPSession(void)
{
    return;
}

void SoapySSDPSession::cancel(void)
{
    _cancelled = 1;
}

/***********************************************************************
 * State machine
 **********************************************************************/
namespace
{
    //! Release the transport and end the session on every exit path
    struct SessionCloser
    {
        SessionCloser(SoapySSDPTransport &transport, SoapySSDPSession::State &state):
            transport(transport),
            state(state)
        {
            return;
        }

        ~SessionCloser(void)
        {
            state = SoapySSDPSession::DONE;
            if (transport.close() != 0)
            {
                SoapySDR::logf(SOAPY_SDR_ERROR, "SoapySSDPSession::close() FAIL: %s", transport.lastErrorMsg());
            }
        }

        SoapySSDPTransport &transport;
        SoapySSDPSession::State &state;
    };
}

std::vector<SoapySSDPRecord> SoapySSDPSession::discover(void)
{
    if (_state != IDLE) throw std::runtime_error("SoapySSDPSession::discover() -- session already ran");

    SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapySSDPSession searching %s for %s (MX=%d, timeout=%gs, retries=%d)",
        _groupURL.c_str(), _config.searchTarget.c_str(), _config.maxWaitSeconds, _config.timeoutSeconds, _config.retryCount);

    SessionCloser closer(*_transport, _state);

    if (_transport->open(_config) != 0)
    {
        throw SoapySSDPSocketError("SoapySSDPSession::discover() -- socket setup FAIL: " + std::string(_transport->lastErrorMsg()));
    }

    _recvBuff.resize(SOAPY_SSDP_MAX_DATAGRAM);

    for (size_t round = 0; ; round++)
    {
        _state = SENDING;
        this->sendProbe(round);

        _state = LISTENING;
        this->listenRound(round);
        _stats.rounds++;

        if (_cancelled)
        {
            SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapySSDPSession cancelled after round %d", int(round+1));
            break;
        }
        if (round >= size_t(_config.retryCount)) break;
    }

    SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapySSDPSession done: %d services, %d datagrams, %d malformed, %d duplicates",
        int(_results.size()), int(_stats.datagrams), int(_stats.malformed), int(_stats.duplicates));
    return _results.toResult();
}

void SoapySSDPSession::sendProbe(const size_t round)
{
    _stats.sends++;
    const int ret = _transport->sendto(_request.data(), _request.size(), _groupURL);
    if (ret == int(_request.size()))
    {
        SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapySSDPSession M-SEARCH %d/%d sent to %s",
            int(round+1), int(size_t(_config.retryCount)+1), _groupURL.c_str());
        return;
    }

    //the probe may have partially gone out, keep listening regardless
    const std::string what = (ret < 0)?
        "SoapySSDPSession::sendto("+_groupURL+") FAIL: "+std::string(_transport->lastErrorMsg()):
        "SoapySSDPSession::sendto("+_groupURL+") FAIL: sent "+std::to_string(ret)+" of "+std::to_string(_request.size())+" bytes";
    _transportErrors.push_back(SoapySSDPTransportError(what, round));
    _stats.sendFailures++;
    SoapySDR::log(_config.verbose?SOAPY_SDR_WARNING:SOAPY_SDR_DEBUG, what);
}

void SoapySSDPSession::listenRound(const size_t round)
{
    const auto window = std::chrono::duration_cast<SoapySSDPClock::TimePoint::duration>(
        std::chrono::duration<double>(_config.timeoutSeconds));
    const auto deadline = _clock->now() + window;

    std::string recvAddr;
    while (true)
    {
        //cancellation shortens the remaining wait to zero
        const auto remaining = deadline - _clock->now();
        if (_cancelled or remaining <= SoapySSDPClock::TimePoint::duration::zero()) return;

        const long remainingUs = long(std::chrono::duration_cast<std::chrono::microseconds>(remaining).count());
        if (remainingUs <= 0) return;
        const int ready = _transport->selectRecv(std::min<long>(remainingUs, SOAPY_SSDP_SOCKET_TIMEOUT_US));
        if (ready == 0) continue;

        //a failed wait means the socket is unusable for the rest of this round
        if (ready < 0)
        {
            _stats.recvErrors++;
            SoapySDR::logf(SOAPY_SDR_ERROR, "SoapySSDPSession round %d select FAIL: %s",
                int(round+1), _transport->lastErrorMsg());
            return;
        }

        //a failed read only loses that datagram
        const int ret = _transport->recvfrom(_recvBuff.data(), _recvBuff.size(), recvAddr);
        if (ret < 0)
        {
            _stats.recvErrors++;
            SoapySDR::logf(SOAPY_SDR_ERROR, "SoapySSDPSession round %d receive FAIL: %s",
                int(round+1), _transport->lastErrorMsg());
            continue;
        }

        this->handleDatagram(size_t(ret), recvAddr);
    }
}

void SoapySSDPSession::handleDatagram(const size_t length, const std::string &recvAddr)
{
    _stats.datagrams++;

    std::vector<std::string> diagnostics;
    const auto record = parseMSearchResponse(_recvBuff.data(), length, recvAddr, diagnostics);
    if (_config.verbose)
    {
        for (const auto &diagnostic : diagnostics)
        {
            SoapySDR::logf(SOAPY_SDR_INFO, "SoapySSDPSession reply from %s: %s", recvAddr.c_str(), diagnostic.c_str());
        }
    }

    if (not record)
    {
        _stats.malformed++;
        return;
    }

    if (_results.add(*record))
    {
        SoapySDR::logf(SOAPY_SDR_DEBUG, "SoapySSDPSession discovered %s at %s [%s] from %s",
            record->getServiceType().c_str(), record->getLocation().c_str(),
            record->getUUID().c_str(), recvAddr.c_str());
    }
    else _stats.duplicates++;
}
