// covalent/io/src/charset.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/charset.hpp"
#include <cctype>

using namespace std;

namespace covalent {
namespace io {

using utility::replacement_character;

namespace {

struct Alias {
    const char* name_;
    Charset     cs_;
};

const Alias aliases[] = {
    {"utf-8", Charset::Utf8},
    {"utf8", Charset::Utf8},
    {"utf-16be", Charset::Utf16BE},
    {"utf16be", Charset::Utf16BE},
    {"utf-16le", Charset::Utf16LE},
    {"utf16le", Charset::Utf16LE},
    {"iso-8859-1", Charset::Latin1},
    {"iso8859-1", Charset::Latin1},
    {"latin1", Charset::Latin1},
    {"us-ascii", Charset::Ascii},
    {"ascii", Charset::Ascii},
};

bool equal_nocase(std::string_view _a, const char* _b)
{
    size_t i = 0;
    for (; i < _a.size() && _b[i] != '\0'; ++i) {
        if (tolower(static_cast<unsigned char>(_a[i])) != _b[i]) {
            return false;
        }
    }
    return i == _a.size() && _b[i] == '\0';
}

inline void append_unit16(std::string& _rout, const char16_t _u, const bool _big_endian)
{
    const char hi = static_cast<char>((_u >> 8) & 0xFF);
    const char lo = static_cast<char>(_u & 0xFF);
    if (_big_endian) {
        _rout += hi;
        _rout += lo;
    } else {
        _rout += lo;
        _rout += hi;
    }
}

void encode_utf16(std::string& _rout, char32_t _cp, const bool _big_endian)
{
    if (utility::is_surrogate(_cp) || _cp > utility::max_code_point) {
        _cp = replacement_character;
    }
    if (_cp >= 0x10000) {
        _cp -= 0x10000;
        append_unit16(_rout, static_cast<char16_t>(0xD800 + (_cp >> 10)), _big_endian);
        append_unit16(_rout, static_cast<char16_t>(0xDC00 + (_cp & 0x3FF)), _big_endian);
    } else {
        append_unit16(_rout, static_cast<char16_t>(_cp), _big_endian);
    }
}

} //namespace

const char* name(const Charset _cs)
{
    switch (_cs) {
    case Charset::Utf8:
        return "UTF-8";
    case Charset::Utf16BE:
        return "UTF-16BE";
    case Charset::Utf16LE:
        return "UTF-16LE";
    case Charset::Latin1:
        return "ISO-8859-1";
    case Charset::Ascii:
        return "US-ASCII";
    default:
        return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& _ros, const Charset _cs)
{
    return _ros << name(_cs);
}

bool parse(std::string_view _txt, Charset& _rcs)
{
    for (const auto& a : aliases) {
        if (equal_nocase(_txt, a.name_)) {
            _rcs = a.cs_;
            return true;
        }
    }
    return false;
}

void charset_encode(const Charset _cs, const char32_t _cp, std::string& _rout)
{
    switch (_cs) {
    case Charset::Utf8:
        utility::utf8_append(_rout, _cp);
        break;
    case Charset::Utf16BE:
        encode_utf16(_rout, _cp, true);
        break;
    case Charset::Utf16LE:
        encode_utf16(_rout, _cp, false);
        break;
    case Charset::Latin1:
        _rout += _cp <= 0xFF ? static_cast<char>(_cp) : '?';
        break;
    case Charset::Ascii:
        _rout += _cp <= 0x7F ? static_cast<char>(_cp) : '?';
        break;
    }
}

//-----------------------------------------------------------------------------
//  CharsetDecoder
//-----------------------------------------------------------------------------

void CharsetDecoder::unit(const char16_t _u, std::string& _rout)
{
    if (high_ != 0) {
        if (utility::is_low_surrogate(_u)) {
            const char32_t cp = 0x10000 + ((high_ - 0xD800) << 10) + (_u - 0xDC00);
            high_             = 0;
            utility::utf8_append(_rout, cp);
            return;
        }
        high_ = 0;
        utility::utf8_append(_rout, replacement_character);
    }
    if (utility::is_high_surrogate(_u)) {
        high_ = _u;
    } else if (utility::is_low_surrogate(_u)) {
        utility::utf8_append(_rout, replacement_character);
    } else {
        utility::utf8_append(_rout, _u);
    }
}

void CharsetDecoder::decode(const char* _pb, const size_t _bl, std::string& _rout)
{
    switch (cs_) {
    case Charset::Utf8:
        utf8_.feed(_pb, _bl, [&_rout](const char32_t _cp) { utility::utf8_append(_rout, _cp); });
        break;
    case Charset::Utf16BE:
    case Charset::Utf16LE:
        for (size_t i = 0; i < _bl; ++i) {
            const int b = static_cast<uint8_t>(_pb[i]);
            if (lead_ < 0) {
                lead_ = b;
                continue;
            }
            const char16_t u = cs_ == Charset::Utf16BE ? static_cast<char16_t>((lead_ << 8) | b) : static_cast<char16_t>((b << 8) | lead_);
            lead_            = -1;
            unit(u, _rout);
        }
        break;
    case Charset::Latin1:
        for (size_t i = 0; i < _bl; ++i) {
            utility::utf8_append(_rout, static_cast<uint8_t>(_pb[i]));
        }
        break;
    case Charset::Ascii:
        for (size_t i = 0; i < _bl; ++i) {
            const uint8_t b = static_cast<uint8_t>(_pb[i]);
            utility::utf8_append(_rout, b < 0x80 ? static_cast<char32_t>(b) : replacement_character);
        }
        break;
    }
}

void CharsetDecoder::finish(std::string& _rout)
{
    if (cs_ == Charset::Utf8) {
        utf8_.finish([&_rout](const char32_t _cp) { utility::utf8_append(_rout, _cp); });
        return;
    }
    if (high_ != 0) {
        high_ = 0;
        utility::utf8_append(_rout, replacement_character);
    }
    if (lead_ >= 0) {
        lead_ = -1;
        utility::utf8_append(_rout, replacement_character);
    }
}

} //namespace io
} //namespace covalent
