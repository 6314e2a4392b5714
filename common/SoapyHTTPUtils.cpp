// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapyHTTPUtils.hpp"
#include <cctype>

bool equalsIgnoreCase(const std::string &a, const std::string &b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++)
    {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

std::string trimWhitespace(const std::string &s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end and std::isspace((unsigned char)s[begin])) begin++;
    while (end > begin and std::isspace((unsigned char)s[end-1])) end--;
    return s.substr(begin, end-begin);
}

SoapyHTTPHeader::SoapyHTTPHeader(const std::string &line0):
    _line0(line0)
{
    _storage = line0 + "\r\n";
}

void SoapyHTTPHeader::addField(const std::string &key, const std::string &value)
{
    _storage += key + ": " + value + "\r\n";
    _fields.push_back(Field(key, value));
}

void SoapyHTTPHeader::finalize(void)
{
    _storage += "\r\n";
}

SoapyHTTPHeader::SoapyHTTPHeader(const void *buff, const size_t length)
{
    _storage = std::string((const char *)buff, length);

    size_t lineNo = 0;
    size_t pos = 0;
    while (pos < _storage.size())
    {
        //extract the next line, LF terminated with optional CR
        auto end = _storage.find('\n', pos);
        if (end == std::string::npos) end = _storage.size();
        std::string line = _storage.substr(pos, end-pos);
        if (not line.empty() and line.back() == '\r') line.pop_back();
        pos = end + 1;
        lineNo++;

        if (lineNo == 1)
        {
            _line0 = line;
            continue;
        }

        //blank line ends the header
        if (line.empty()) break;

        const auto colon = line.find(':');
        if (colon == std::string::npos)
        {
            _diagnostics.push_back("line " + std::to_string(lineNo) + ": missing colon, skipped");
            continue;
        }

        const auto key = line.substr(0, colon);
        bool keyOk = not key.empty();
        for (const char ch : key)
        {
            if (std::isspace((unsigned char)ch) or std::iscntrl((unsigned char)ch)) keyOk = false;
        }
        if (not keyOk)
        {
            _diagnostics.push_back("line " + std::to_string(lineNo) + ": bad field name '" + key + "', skipped");
            continue;
        }

        _fields.push_back(Field(key, trimWhitespace(line.substr(colon+1))));
    }
}

std::string SoapyHTTPHeader::getLine0(void) const
{
    return _line0;
}

std::vector<SoapyHTTPHeader::Field>::const_iterator SoapyHTTPHeader::findField(const std::string &key) const
{
    for (auto it = _fields.begin(); it != _fields.end(); ++it)
    {
        if (equalsIgnoreCase(it->first, key)) return it;
    }
    return _fields.end();
}

std::string SoapyHTTPHeader::getField(const std::string &key) const
{
    const auto it = this->findField(key);
    if (it == _fields.end()) return "";
    return it->second;
}

bool SoapyHTTPHeader::hasField(const std::string &key) const
{
    return this->findField(key) != _fields.end();
}
