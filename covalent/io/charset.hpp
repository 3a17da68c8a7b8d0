// covalent/io/charset.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/utility/utf.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace covalent {
namespace io {

enum struct Charset {
    Utf8,
    Utf16BE,
    Utf16LE,
    Latin1,
    Ascii,
};

const char* name(Charset _cs);

std::ostream& operator<<(std::ostream& _ros, Charset _cs);

//! Case insensitive, accepts the IANA names and the usual aliases
bool parse(std::string_view _txt, Charset& _rcs);

//! Appends the encoding of _cp, or '?' when _cs cannot represent it
void charset_encode(Charset _cs, char32_t _cp, std::string& _rout);

//! Incremental decoder from a charset to UTF-8
/*!
    Input may be split anywhere, including inside a multi-byte sequence.
    Malformed input and lone surrogates come out as U+FFFD.
*/
class CharsetDecoder {
    const Charset       cs_;
    utility::Utf8Decoder utf8_;
    int                  lead_; // first byte of a pending UTF-16 unit, -1 if none
    char32_t             high_; // pending high surrogate, 0 if none

public:
    explicit CharsetDecoder(Charset _cs)
        : cs_(_cs)
        , lead_(-1)
        , high_(0)
    {
    }

    Charset charset() const
    {
        return cs_;
    }

    void decode(const char* _pb, size_t _bl, std::string& _rout);
    //! Flushes an incomplete trailing sequence as U+FFFD
    void finish(std::string& _rout);

private:
    void unit(char16_t _u, std::string& _rout);
};

} //namespace io
} //namespace covalent
