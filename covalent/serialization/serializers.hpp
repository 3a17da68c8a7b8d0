// covalent/serialization/serializers.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/io/blob.hpp"
#include "covalent/io/clob.hpp"
#include "covalent/serialization/serializer.hpp"
#include "covalent/utility/url.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace covalent {
namespace serialization {

using TimestampT = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

namespace serializers {

const Serializer<int8_t>&  int8();
const Serializer<int8_t>&  byte();
const Serializer<int16_t>& int16();
const Serializer<int32_t>& int32();
const Serializer<int64_t>& int64();
const Serializer<float>&   float32();
const Serializer<double>&  float64();
const Serializer<bool>&    boolean();
const Serializer<char16_t>& character();

//! Modified UTF text
const Serializer<std::u16string>& utf();
//! UTF-8 text, stored as the modified UTF of its UTF-16 form
const Serializer<std::string>& utf8();
//! int32 count then the low byte of each code unit
const Serializer<std::u16string>& ascii();

//! int64 milliseconds since the epoch
const Serializer<TimestampT>& timestamp();
//! Canonical text; reading raises error_url_format on invalid text
const Serializer<utility::Url>& url();
//! int32 count of the segments after the root, has-root flag, root, segments
const Serializer<std::filesystem::path>& path();

//! uint64 length then the raw bytes
const Serializer<io::Blob>& blob();
//! uint64 character count then the blob encoding of the UTF-8 text
const Serializer<io::Clob>& clob();

} //namespace serializers

//! The default serializer for T
template <class T>
const Serializer<T>& serializer();

template <>
inline const Serializer<int8_t>& serializer<int8_t>()
{
    return serializers::int8();
}

template <>
inline const Serializer<int16_t>& serializer<int16_t>()
{
    return serializers::int16();
}

template <>
inline const Serializer<int32_t>& serializer<int32_t>()
{
    return serializers::int32();
}

template <>
inline const Serializer<int64_t>& serializer<int64_t>()
{
    return serializers::int64();
}

template <>
inline const Serializer<float>& serializer<float>()
{
    return serializers::float32();
}

template <>
inline const Serializer<double>& serializer<double>()
{
    return serializers::float64();
}

template <>
inline const Serializer<bool>& serializer<bool>()
{
    return serializers::boolean();
}

template <>
inline const Serializer<char16_t>& serializer<char16_t>()
{
    return serializers::character();
}

template <>
inline const Serializer<std::u16string>& serializer<std::u16string>()
{
    return serializers::utf();
}

template <>
inline const Serializer<std::string>& serializer<std::string>()
{
    return serializers::utf8();
}

template <>
inline const Serializer<TimestampT>& serializer<TimestampT>()
{
    return serializers::timestamp();
}

template <>
inline const Serializer<utility::Url>& serializer<utility::Url>()
{
    return serializers::url();
}

template <>
inline const Serializer<std::filesystem::path>& serializer<std::filesystem::path>()
{
    return serializers::path();
}

template <>
inline const Serializer<io::Blob>& serializer<io::Blob>()
{
    return serializers::blob();
}

template <>
inline const Serializer<io::Clob>& serializer<io::Clob>()
{
    return serializers::clob();
}

} //namespace serialization
} //namespace covalent
