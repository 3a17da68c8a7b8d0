// covalent/io/src/input.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/input.hpp"
#include "covalent/io/binarybasic.hpp"
#include "covalent/io/configuration.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/utility/utf.hpp"
#include <cstring>

namespace covalent {
namespace io {

namespace {
constexpr size_t min_buffer_capacity = 16;

size_t buffer_capacity(const size_t _cp)
{
    const size_t cp = _cp != 0 ? _cp : configuration().buffer_capacity;
    return cp < min_buffer_capacity ? min_buffer_capacity : cp;
}

} //namespace

Input::Input(std::istream& _ris, size_t _buffer_capacity)
    : ris_(_ris)
    , buf_(buffer_capacity(_buffer_capacity))
{
}

int Input::read()
{
    const auto c = ris_.get();
    if (c == std::istream::traits_type::eof()) {
        return -1;
    }
    return static_cast<uint8_t>(c);
}

size_t Input::read(char* _pb, size_t _bl)
{
    ris_.read(_pb, static_cast<std::streamsize>(_bl));
    return static_cast<size_t>(ris_.gcount());
}

void Input::readFully(char* _pb, size_t _bl)
{
    ris_.read(_pb, static_cast<std::streamsize>(_bl));
    covalent_check_error(static_cast<size_t>(ris_.gcount()) == _bl, error_end_of_stream);
}

uint8_t Input::nextByte()
{
    const auto c = ris_.get();
    covalent_check_error(c != std::istream::traits_type::eof(), error_end_of_stream);
    return static_cast<uint8_t>(c);
}

bool Input::readBoolean()
{
    return nextByte() != 0;
}

int8_t Input::readByte()
{
    return static_cast<int8_t>(nextByte());
}

uint8_t Input::readUnsignedByte()
{
    return nextByte();
}

int16_t Input::readShort()
{
    return static_cast<int16_t>(readUnsignedShort());
}

uint16_t Input::readUnsignedShort()
{
    readFully(buf_.data(), sizeof(uint16_t));
    uint16_t v;
    binary::load(buf_.data(), v);
    return v;
}

char16_t Input::readChar()
{
    return static_cast<char16_t>(readUnsignedShort());
}

int32_t Input::readInt()
{
    readFully(buf_.data(), sizeof(uint32_t));
    uint32_t v;
    binary::load(buf_.data(), v);
    return static_cast<int32_t>(v);
}

int64_t Input::readLong()
{
    readFully(buf_.data(), sizeof(uint64_t));
    uint64_t v;
    binary::load(buf_.data(), v);
    return static_cast<int64_t>(v);
}

float Input::readFloat()
{
    readFully(buf_.data(), sizeof(uint32_t));
    uint32_t bits;
    binary::load(buf_.data(), bits);
    float v;
    memcpy(&v, &bits, sizeof(v));
    return v;
}

double Input::readDouble()
{
    readFully(buf_.data(), sizeof(uint64_t));
    uint64_t bits;
    binary::load(buf_.data(), bits);
    double v;
    memcpy(&v, &bits, sizeof(v));
    return v;
}

// Accepts both spellings of U+0000: the three byte one we write and the
// two byte C0 80 other modified UTF writers use.
std::u16string Input::readUTF()
{
    const int32_t count = readInt();
    covalent_check_error(count >= 0, error_utf_format);

    std::u16string rv;
    rv.reserve(count < 4096 ? count : 4096);

    for (int32_t i = 0; i < count; ++i) {
        const uint8_t b0 = nextByte();
        if ((b0 & 0x80) == 0) {
            rv += static_cast<char16_t>(b0);
        } else if ((b0 & 0xE0) == 0xC0) {
            const uint8_t b1 = nextByte();
            covalent_check_error((b1 & 0xC0) == 0x80, error_utf_format);
            rv += static_cast<char16_t>(((b0 & 0x1F) << 6) | (b1 & 0x3F));
        } else if ((b0 & 0xF0) == 0xE0) {
            const uint8_t b1 = nextByte();
            covalent_check_error((b1 & 0xC0) == 0x80, error_utf_format);
            const uint8_t b2 = nextByte();
            covalent_check_error((b2 & 0xC0) == 0x80, error_utf_format);
            rv += static_cast<char16_t>(((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F));
        } else {
            // 10xxxxxx or 1111xxxx cannot start a code unit
            covalent_throw_error(error_utf_format);
        }
    }
    return rv;
}

std::string Input::readUTF8()
{
    return utility::utf16_to_utf8(readUTF());
}

size_t Input::skipBytes(size_t _n)
{
    size_t skipped = 0;
    while (skipped < _n) {
        const size_t toread = (_n - skipped) < buf_.size() ? (_n - skipped) : buf_.size();
        const size_t rv     = read(buf_.data(), toread);
        if (rv == 0) {
            break;
        }
        skipped += rv;
    }
    return skipped;
}

} //namespace io
} //namespace covalent
