// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPRecord.hpp"
#include <cctype>
#include <utility>

static SoapySSDPRecord::Headers upperCaseKeys(const SoapySSDPRecord::Headers &headers)
{
    SoapySSDPRecord::Headers result;
    for (const auto &pair : headers)
    {
        std::string key(pair.first);
        for (auto &ch : key) ch = char(std::toupper((unsigned char)ch));
        result.insert(std::make_pair(key, pair.second));
    }
    return result;
}

static std::string lookup(const SoapySSDPRecord::Headers &headers, const std::string &key)
{
    const auto it = headers.find(key);
    if (it == headers.end()) return "";
    return it->second;
}

SoapySSDPRecord::SoapySSDPRecord(const Headers &headers, const std::string &sourceAddress, const long maxAge):
    _headers(upperCaseKeys(headers)),
    _maxAge(maxAge < 0 ? -1 : maxAge),
    _sourceAddress(sourceAddress)
{
    _location = lookup(_headers, "LOCATION");
    _usn = lookup(_headers, "USN");
    _server = lookup(_headers, "SERVER");
    _serviceType = (_headers.count("ST") != 0)? lookup(_headers, "ST") : lookup(_headers, "NT");
}

std::string SoapySSDPRecord::getUUID(void) const
{
    auto posUUID = _usn.find("uuid:");
    if (posUUID == std::string::npos) return _usn;
    posUUID += 5;
    const auto posColon = _usn.find(":", posUUID);
    if (posColon == std::string::npos) return _usn.substr(posUUID);
    return _usn.substr(posUUID, posColon-posUUID);
}
