// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPResultSet.hpp"

SoapySSDPResultSet::SoapySSDPResultSet(void):
    _duplicates(0)
{
    return;
}

std::string SoapySSDPResultSet::dedupKey(const SoapySSDPRecord &record)
{
    //prefixed so that a USN can never collide with a LOCATION
    if (not record.getUSN().empty()) return "usn:" + record.getUSN();
    if (not record.getLocation().empty()) return "location:" + record.getLocation();
    return "";
}

bool SoapySSDPResultSet::add(const SoapySSDPRecord &record)
{
    const auto key = dedupKey(record);
    if (not key.empty() and not _keys.insert(key).second)
    {
        _duplicates++;
        return false;
    }
    _records.push_back(record);
    return true;
}

std::vector<SoapySSDPRecord> SoapySSDPResultSet::toResult(void) const
{
    return _records;
}
