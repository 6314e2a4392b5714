// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SoapySSDPConfig.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/*!
 * An HTTP-style header as used by SSDP over UDP.
 * Build one with the line0 constructor and addField(),
 * or parse a received datagram with the buffer constructor.
 *
 * Parsing is tolerant: lines are split on LF with an optional CR,
 * field names are matched case-insensitively, and lines that are not
 * "Key: value" shaped are skipped and noted in getDiagnostics().
 */
class SOAPY_SSDP_API SoapyHTTPHeader
{
public:

    typedef std::pair<std::string, std::string> Field;

    //! Create an HTTP header given request/response line
    SoapyHTTPHeader(const std::string &line0);

    //! Add a key/value field to the header
    void addField(const std::string &key, const std::string &value);

    //! Done adding fields to the header
    void finalize(void);

    //! Create an HTTP from a received datagram
    SoapyHTTPHeader(const void *buff, const size_t length);

    //! Get the request/response line
    std::string getLine0(void) const;

    //! Read a field from the HTTP header (empty when missing)
    std::string getField(const std::string &key) const;

    //! Is the field present (even with an empty value)?
    bool hasField(const std::string &key) const;

    //! All fields in order of appearance, keys as received
    const std::vector<Field> &getFields(void) const
    {
        return _fields;
    }

    //! Notes about skipped lines from parsing
    const std::vector<std::string> &getDiagnostics(void) const
    {
        return _diagnostics;
    }

    const void *data(void) const
    {
        return _storage.data();
    }

    size_t size(void) const
    {
        return _storage.size();
    }

private:
    std::string _storage;
    std::string _line0;
    std::vector<Field> _fields;
    std::vector<std::string> _diagnostics;

    std::vector<Field>::const_iterator findField(const std::string &key) const;
};

//! Case-insensitive ASCII string comparison
SOAPY_SSDP_API bool equalsIgnoreCase(const std::string &a, const std::string &b);

//! Remove leading and trailing whitespace
SOAPY_SSDP_API std::string trimWhitespace(const std::string &s);
