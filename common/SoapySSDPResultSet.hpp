// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include "SoapySSDPRecord.hpp"
#include <cstddef>
#include <string>
#include <vector>
#include <set>

/*!
 * Collapse repeated replies into unique service records.
 * The identity of a record is its USN, else its LOCATION.
 * A record with neither is always considered unique.
 * The first reply for an identity wins and the order of
 * the result is the order of first arrival.
 */
class SOAPY_SSDP_API SoapySSDPResultSet
{
public:
    SoapySSDPResultSet(void);

    /*!
     * Add a reply to the set.
     * \return true when inserted, false for a discarded duplicate
     */
    bool add(const SoapySSDPRecord &record);

    //! The unique records in order of first arrival
    std::vector<SoapySSDPRecord> toResult(void) const;

    //! Number of unique records
    size_t size(void) const
    {
        return _records.size();
    }

    bool empty(void) const
    {
        return _records.empty();
    }

    //! Number of replies discarded as duplicates
    size_t duplicates(void) const
    {
        return _duplicates;
    }

    /*!
     * The identity of a record used for deduplication.
     * Empty when the record has neither USN nor LOCATION.
     */
    static std::string dedupKey(const SoapySSDPRecord &record);

private:
    std::set<std::string> _keys;
    std::vector<SoapySSDPRecord> _records;
    size_t _duplicates;
};
