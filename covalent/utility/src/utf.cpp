// covalent/utility/src/utf.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/utility/utf.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/utility/error.hpp"

namespace covalent {
namespace utility {

void utf8_append(std::string& _rout, char32_t _cp)
{
    if (_cp > max_code_point || is_surrogate(_cp)) {
        _cp = replacement_character;
    }
    if (_cp < 0x80) {
        _rout += static_cast<char>(_cp);
    } else if (_cp < 0x800) {
        _rout += static_cast<char>(0xC0 | (_cp >> 6));
        _rout += static_cast<char>(0x80 | (_cp & 0x3F));
    } else if (_cp < 0x10000) {
        _rout += static_cast<char>(0xE0 | (_cp >> 12));
        _rout += static_cast<char>(0x80 | ((_cp >> 6) & 0x3F));
        _rout += static_cast<char>(0x80 | (_cp & 0x3F));
    } else {
        _rout += static_cast<char>(0xF0 | (_cp >> 18));
        _rout += static_cast<char>(0x80 | ((_cp >> 12) & 0x3F));
        _rout += static_cast<char>(0x80 | ((_cp >> 6) & 0x3F));
        _rout += static_cast<char>(0x80 | (_cp & 0x3F));
    }
}

void utf16_append(std::u16string& _rout, char32_t _cp)
{
    if (_cp > max_code_point || is_surrogate(_cp)) {
        _cp = replacement_character;
    }
    if (_cp < 0x10000) {
        _rout += static_cast<char16_t>(_cp);
    } else {
        _cp -= 0x10000;
        _rout += static_cast<char16_t>(0xD800 + (_cp >> 10));
        _rout += static_cast<char16_t>(0xDC00 + (_cp & 0x3FF));
    }
}

std::u16string utf8_to_utf16(std::string_view _txt)
{
    std::u16string rv;
    Utf8Decoder    decoder;
    const auto     append = [&rv](const char32_t _cp) { utf16_append(rv, _cp); };

    rv.reserve(_txt.size());
    decoder.feed(_txt.data(), _txt.size(), append);
    decoder.finish(append);

    covalent_check_error(decoder.errorCount() == 0, error_utf8_format);
    return rv;
}

std::string utf16_to_utf8(std::u16string_view _txt)
{
    std::string rv;
    rv.reserve(_txt.size());

    for (size_t i = 0; i < _txt.size(); ++i) {
        const char32_t c = _txt[i];
        if (is_high_surrogate(c) && (i + 1) < _txt.size() && is_low_surrogate(_txt[i + 1])) {
            const char32_t lo = _txt[i + 1];
            utf8_append(rv, 0x10000 + ((c - 0xD800) << 10) + (lo - 0xDC00));
            ++i;
        } else {
            utf8_append(rv, c); // a lone surrogate turns into U+FFFD
        }
    }
    return rv;
}

bool utf8_valid(std::string_view _txt)
{
    Utf8Decoder decoder;
    const auto  ignore = [](const char32_t) {};

    decoder.feed(_txt.data(), _txt.size(), ignore);
    decoder.finish(ignore);
    return decoder.errorCount() == 0;
}

size_t utf8_count(std::string_view _txt)
{
    size_t      count = 0;
    Utf8Decoder decoder;
    const auto  counter = [&count](const char32_t) { ++count; };

    decoder.feed(_txt.data(), _txt.size(), counter);
    decoder.finish(counter);
    return count;
}

} //namespace utility
} //namespace covalent
