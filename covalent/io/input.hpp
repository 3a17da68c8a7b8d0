// covalent/io/input.hpp
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
#include <istream>
#include <string>
#include <vector>

namespace covalent {
namespace io {

//! Reads back what Output writes
/*!
    Every fixed size read either completes or raises error_end_of_stream.
    Malformed modified UTF-8 raises error_utf_format.
*/
class Input : NonCopyable {
    std::istream&     ris_;
    std::vector<char> buf_;

public:
    explicit Input(std::istream& _ris, size_t _buffer_capacity = 0);

    //! The next byte as 0-255, or -1 at end of stream
    int read();
    //! Up to _bl bytes, returns how many were read, 0 at end of stream
    size_t read(char* _pb, size_t _bl);
    void   readFully(char* _pb, size_t _bl);

    bool     readBoolean();
    int8_t   readByte();
    uint8_t  readUnsignedByte();
    int16_t  readShort();
    uint16_t readUnsignedShort();
    char16_t readChar();
    int32_t  readInt();
    int64_t  readLong();
    float    readFloat();
    double   readDouble();

    std::u16string readUTF();
    //! Modified UTF text given back as UTF-8, unpaired surrogates become U+FFFD
    std::string readUTF8();

    //! Skips up to _n bytes, returns how many were skipped
    size_t skipBytes(size_t _n);

    char* buffer()
    {
        return buf_.data();
    }

    size_t bufferCapacity() const
    {
        return buf_.size();
    }

    std::istream& stream()
    {
        return ris_;
    }

private:
    uint8_t nextByte();
};

} //namespace io
} //namespace covalent
