// covalent/io/output.hpp
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
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace covalent {
namespace io {

//! Writes primitive values to a byte stream
/*!
    Multi-byte values go out big-endian. Text goes out as an int32 count of
    UTF-16 code units followed by the modified UTF-8 form of each unit.
    A failing delegate stream raises error_stream_write.
*/
class Output : NonCopyable {
    std::ostream&     ros_;
    std::vector<char> buf_;

public:
    //! _buffer_capacity of 0 means the configured blob buffer capacity
    explicit Output(std::ostream& _ros, size_t _buffer_capacity = 0);

    void write(char _c);
    void write(const char* _pb, size_t _bl);

    void writeBoolean(bool _v);
    void writeByte(int8_t _v);
    void writeShort(int16_t _v);
    void writeChar(char16_t _v);
    void writeInt(int32_t _v);
    void writeLong(int64_t _v);
    void writeFloat(float _v);
    void writeDouble(double _v);

    void writeUTF(std::u16string_view _txt);
    //! UTF-8 text, written as the modified UTF form of its UTF-16 transcoding
    void writeUTF8(std::string_view _txt);

    void flush();

    //! Scratch memory for callers that copy through the codec
    char* buffer()
    {
        return buf_.data();
    }

    size_t bufferCapacity() const
    {
        return buf_.size();
    }

    std::ostream& stream()
    {
        return ros_;
    }
};

} //namespace io
} //namespace covalent
