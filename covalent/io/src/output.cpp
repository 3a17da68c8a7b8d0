// covalent/io/src/output.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/output.hpp"
#include "covalent/io/binarybasic.hpp"
#include "covalent/io/configuration.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/utility/utf.hpp"
#include <cstring>

namespace covalent {
namespace io {

namespace {
// room for the widest primitive plus one encoded code unit
constexpr size_t min_buffer_capacity = 16;

size_t buffer_capacity(const size_t _cp)
{
    const size_t cp = _cp != 0 ? _cp : configuration().buffer_capacity;
    return cp < min_buffer_capacity ? min_buffer_capacity : cp;
}

} //namespace

Output::Output(std::ostream& _ros, size_t _buffer_capacity)
    : ros_(_ros)
    , buf_(buffer_capacity(_buffer_capacity))
{
}

void Output::write(char _c)
{
    ros_.put(_c);
    covalent_check_error(ros_.good(), error_stream_write);
}

void Output::write(const char* _pb, size_t _bl)
{
    ros_.write(_pb, static_cast<std::streamsize>(_bl));
    covalent_check_error(ros_.good(), error_stream_write);
}

void Output::writeBoolean(bool _v)
{
    write(static_cast<char>(_v ? 1 : 0));
}

void Output::writeByte(int8_t _v)
{
    write(static_cast<char>(_v));
}

void Output::writeShort(int16_t _v)
{
    char* pend = binary::store(buf_.data(), static_cast<uint16_t>(_v));
    write(buf_.data(), pend - buf_.data());
}

void Output::writeChar(char16_t _v)
{
    char* pend = binary::store(buf_.data(), static_cast<uint16_t>(_v));
    write(buf_.data(), pend - buf_.data());
}

void Output::writeInt(int32_t _v)
{
    char* pend = binary::store(buf_.data(), static_cast<uint32_t>(_v));
    write(buf_.data(), pend - buf_.data());
}

void Output::writeLong(int64_t _v)
{
    char* pend = binary::store(buf_.data(), static_cast<uint64_t>(_v));
    write(buf_.data(), pend - buf_.data());
}

void Output::writeFloat(float _v)
{
    static_assert(sizeof(float) == sizeof(uint32_t), "IEEE 754 single precision expected");
    uint32_t bits;
    memcpy(&bits, &_v, sizeof(bits));
    char* pend = binary::store(buf_.data(), bits);
    write(buf_.data(), pend - buf_.data());
}

void Output::writeDouble(double _v)
{
    static_assert(sizeof(double) == sizeof(uint64_t), "IEEE 754 double precision expected");
    uint64_t bits;
    memcpy(&bits, &_v, sizeof(bits));
    char* pend = binary::store(buf_.data(), bits);
    write(buf_.data(), pend - buf_.data());
}

// 0x0001-0x007F on one byte, 0x0080-0x07FF on two, everything else on
// three: 0x0000 and each surrogate half included.
void Output::writeUTF(std::u16string_view _txt)
{
    covalent_check(_txt.size() <= static_cast<size_t>(INT32_MAX), "text too long: " << _txt.size());

    writeInt(static_cast<int32_t>(_txt.size()));

    char*       pcrt = buf_.data();
    const char* pend = buf_.data() + buf_.size() - 3;

    for (const char16_t c : _txt) {
        if (pcrt > pend) {
            write(buf_.data(), pcrt - buf_.data());
            pcrt = buf_.data();
        }
        if (c >= 0x0001 && c <= 0x007F) {
            *pcrt++ = static_cast<char>(c);
        } else if (c >= 0x0080 && c <= 0x07FF) {
            *pcrt++ = static_cast<char>(0xC0 | ((c >> 6) & 0x1F));
            *pcrt++ = static_cast<char>(0x80 | (c & 0x3F));
        } else {
            *pcrt++ = static_cast<char>(0xE0 | ((c >> 12) & 0x0F));
            *pcrt++ = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            *pcrt++ = static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    if (pcrt != buf_.data()) {
        write(buf_.data(), pcrt - buf_.data());
    }
}

void Output::writeUTF8(std::string_view _txt)
{
    writeUTF(utility::utf8_to_utf16(_txt));
}

void Output::flush()
{
    ros_.flush();
    covalent_check_error(ros_.good(), error_stream_write);
}

} //namespace io
} //namespace covalent
