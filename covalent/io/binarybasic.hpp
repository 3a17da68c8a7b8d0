// covalent/io/binarybasic.hpp
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
#include <cstring>

// Fixed width unsigned integers in network (big-endian) byte order.

namespace covalent {
namespace io {
namespace binary {

namespace impl {

template <typename T>
union BytesConvertor {
    T       value_;
    uint8_t bytes_[sizeof(T)];
};

template <typename T>
inline char* store(char* _pd, const T _val, TypeToType<T> /*_ff*/)
{
    uint8_t*          pd = reinterpret_cast<uint8_t*>(_pd);
    BytesConvertor<T> c;
    c.value_ = _val;
#ifdef COVALENT_ON_BIG_ENDIAN
    memcpy(pd, c.bytes_, sizeof(T));
#else
    for (size_t i = 0; i < sizeof(T); ++i) {
        pd[i] = c.bytes_[sizeof(T) - 1 - i];
    }
#endif
    return _pd + sizeof(T);
}

inline char* store(char* _pd, const uint8_t _val, TypeToType<uint8_t> /*_ff*/)
{
    *reinterpret_cast<uint8_t*>(_pd) = _val;
    return _pd + 1;
}

template <typename T>
inline const char* load(const char* _ps, T& _val, TypeToType<T> /*_ff*/)
{
    const uint8_t*    ps = reinterpret_cast<const uint8_t*>(_ps);
    BytesConvertor<T> c;
#ifdef COVALENT_ON_BIG_ENDIAN
    memcpy(c.bytes_, ps, sizeof(T));
#else
    for (size_t i = 0; i < sizeof(T); ++i) {
        c.bytes_[sizeof(T) - 1 - i] = ps[i];
    }
#endif
    _val = c.value_;
    return _ps + sizeof(T);
}

inline const char* load(const char* _ps, uint8_t& _val, TypeToType<uint8_t> /*_ff*/)
{
    _val = *reinterpret_cast<const uint8_t*>(_ps);
    return _ps + 1;
}

} // namespace impl

template <typename T>
inline char* store(char* _pd, const T _v)
{
    static_assert(std::is_unsigned_v<T>, "store takes unsigned integers only");
    return impl::store(_pd, _v, TypeToType<T>());
}

template <typename T>
inline const char* load(const char* _ps, T& _v)
{
    static_assert(std::is_unsigned_v<T>, "load takes unsigned integers only");
    return impl::load(_ps, _v, TypeToType<T>());
}

} // namespace binary
} // namespace io
} // namespace covalent
