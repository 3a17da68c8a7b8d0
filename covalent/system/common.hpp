// covalent/system/common.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/covalent_config.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <type_traits>

namespace covalent {

using uchar  = unsigned char;
using uint   = unsigned int;
using ulong  = unsigned long;
using ushort = unsigned short;

template <class T>
struct TypeToType {
    using TypeT = T;
};

class NonCopyable {
protected:
    NonCopyable(const NonCopyable&)            = delete;
    NonCopyable(NonCopyable&&)                 = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable& operator=(NonCopyable&&)      = delete;

    NonCopyable() = default;
};

using ssize_t = std::make_signed<size_t>::type;

} // namespace covalent

// Some macro helpers:

// adapted from: https://stackoverflow.com/questions/9183993/msvc-variadic-macro-expansion/9338429#9338429
#define COVALENT_GLUE(x, y) x y

#define COVALENT_RETURN_ARG_COUNT(_1_, _2_, _3_, _4_, _5_, count, ...) count
#define COVALENT_EXPAND_ARGS(args) COVALENT_RETURN_ARG_COUNT args
#define COVALENT_COUNT_ARGS_MAX5(...) COVALENT_EXPAND_ARGS((__VA_ARGS__, 5, 4, 3, 2, 1, 0))

#define COVALENT_OVERLOAD_MACRO2(name, count) name##count
#define COVALENT_OVERLOAD_MACRO1(name, count) COVALENT_OVERLOAD_MACRO2(name, count)
#define COVALENT_OVERLOAD_MACRO(name, count) COVALENT_OVERLOAD_MACRO1(name, count)

#define COVALENT_CALL_OVERLOAD(name, ...) COVALENT_GLUE(COVALENT_OVERLOAD_MACRO(name, COVALENT_COUNT_ARGS_MAX5(__VA_ARGS__)), (__VA_ARGS__))

#ifndef COVALENT_FUNCTION_NAME
#define COVALENT_FUNCTION_NAME __FUNCTION__
#endif
