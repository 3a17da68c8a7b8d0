// covalent/utility/utf.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/common.hpp"
#include <string>
#include <string_view>

namespace covalent {
namespace utility {

constexpr char32_t replacement_character = 0xFFFD;
constexpr char32_t max_code_point        = 0x10FFFF;

inline bool is_surrogate(const char32_t _c)
{
    return _c >= 0xD800 && _c <= 0xDFFF;
}

inline bool is_high_surrogate(const char32_t _c)
{
    return _c >= 0xD800 && _c <= 0xDBFF;
}

inline bool is_low_surrogate(const char32_t _c)
{
    return _c >= 0xDC00 && _c <= 0xDFFF;
}

void utf8_append(std::string& _rout, char32_t _cp);
void utf16_append(std::u16string& _rout, char32_t _cp);

//! Strict UTF-8 to UTF-16, raises error_utf8_format on malformed input
std::u16string utf8_to_utf16(std::string_view _txt);

//! UTF-16 to UTF-8, unpaired surrogates become U+FFFD
std::string utf16_to_utf8(std::u16string_view _txt);

bool utf8_valid(std::string_view _txt);

//! Number of code points, each malformed sequence counting as one
size_t utf8_count(std::string_view _txt);

//! Incremental UTF-8 decoder
/*!
    Sequences may be split across feed() calls. Malformed input is reported
    as U+FFFD, one per maximal invalid subpart, and counted in errorCount().
*/
class Utf8Decoder {
    char32_t cp_;
    char32_t min_;
    uint8_t  need_;
    size_t   error_count_;

public:
    Utf8Decoder()
        : cp_(0)
        , min_(0)
        , need_(0)
        , error_count_(0)
    {
    }

    template <class F>
    void feed(const char* _pdata, const size_t _sz, F _f)
    {
        for (size_t i = 0; i < _sz; ++i) {
            push(static_cast<uint8_t>(_pdata[i]), _f);
        }
    }

    //! Flushes a truncated trailing sequence
    template <class F>
    void finish(F _f)
    {
        if (need_ != 0) {
            need_ = 0;
            fail(_f);
        }
    }

    bool pending() const
    {
        return need_ != 0;
    }

    size_t errorCount() const
    {
        return error_count_;
    }

private:
    template <class F>
    void fail(F& _f)
    {
        ++error_count_;
        _f(replacement_character);
    }

    template <class F>
    void push(const uint8_t _b, F& _f)
    {
        if (need_ != 0) {
            if ((_b & 0xC0) == 0x80) {
                cp_ = (cp_ << 6) | (_b & 0x3F);
                if (--need_ == 0) {
                    if (cp_ < min_ || cp_ > max_code_point || is_surrogate(cp_)) {
                        fail(_f);
                    } else {
                        _f(cp_);
                    }
                }
                return;
            }
            need_ = 0;
            fail(_f);
            // the byte starts something new, fall through
        }

        if (_b < 0x80) {
            _f(static_cast<char32_t>(_b));
        } else if (_b >= 0xC2 && _b <= 0xDF) {
            cp_   = _b & 0x1F;
            min_  = 0x80;
            need_ = 1;
        } else if (_b >= 0xE0 && _b <= 0xEF) {
            cp_   = _b & 0x0F;
            min_  = 0x800;
            need_ = 2;
        } else if (_b >= 0xF0 && _b <= 0xF4) {
            cp_   = _b & 0x07;
            min_  = 0x10000;
            need_ = 3;
        } else {
            fail(_f);
        }
    }
};

} //namespace utility
} //namespace covalent
