// covalent/system/exception.hpp
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
#include "covalent/system/error.hpp"
#include "covalent/system/log.hpp"
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace covalent {

//! The exception thrown by every covalent_throw* and covalent_check* macro
/*!
    When raised through covalent_throw_error or covalent_check_error it also
    carries the error condition, so callers can dispatch on error() instead
    of parsing what().
*/
class RuntimeError : public std::runtime_error {
    const ErrorConditionT err_;

public:
    template <typename F>
    RuntimeError(const F& _rf, const char* const _file, const int _line, const char* const _fnc)
        : std::runtime_error(_rf(_file, _line, _fnc))
    {
    }

    template <typename F>
    RuntimeError(const ErrorConditionT& _err, const F& _rf, const char* const _file, const int _line, const char* const _fnc)
        : std::runtime_error(_rf(_file, _line, _fnc, _err))
        , err_(_err)
    {
    }

    const ErrorConditionT& error() const noexcept
    {
        return err_;
    }
};

} //namespace covalent

#if defined(__clang__) || defined(__GNUC__)
#define covalent_likely(x) __builtin_expect(!!(x), 1)
#define covalent_unlikely(x) __builtin_expect(!!(x), 0)
#else
#define covalent_likely(x) (!!(x))
#define covalent_unlikely(x) (!(x))
#endif

#define covalent_throw(x)                                                       \
    throw covalent::RuntimeError(                                               \
        [&](const char* const _file, const int _line, const char* const _fnc) { \
            std::ostringstream os;                                              \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " << x;   \
            return os.str();                                                    \
        },                                                                      \
        __FILE__, __LINE__, static_cast<const char*>((COVALENT_FUNCTION_NAME)))

#define covalent_throw_log(l, x)                                                \
    covalent_log(l, Exception, x);                                              \
    throw covalent::RuntimeError(                                               \
        [&](const char* const _file, const int _line, const char* const _fnc) { \
            std::ostringstream os;                                              \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " << x;   \
            return os.str();                                                    \
        },                                                                      \
        __FILE__, __LINE__, static_cast<const char*>((COVALENT_FUNCTION_NAME)))

#define covalent_throw_error(c)                                                                                           \
    throw covalent::RuntimeError((c),                                                                                     \
        [&](const char* const _file, const int _line, const char* const _fnc, const covalent::ErrorConditionT& _err) {  \
            std::ostringstream os;                                                                                        \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " #c ":" << _err.message();                         \
            return os.str();                                                                                              \
        },                                                                                                                \
        __FILE__, __LINE__, static_cast<const char*>((COVALENT_FUNCTION_NAME)))

//! Same as covalent_throw_error but appends extra context to what()
#define covalent_throw_error_ex(c, x)                                                                                     \
    throw covalent::RuntimeError((c),                                                                                     \
        [&](const char* const _file, const int _line, const char* const _fnc, const covalent::ErrorConditionT& _err) {  \
            std::ostringstream os;                                                                                        \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " #c ":" << _err.message() << ": " << x;            \
            return os.str();                                                                                              \
        },                                                                                                                \
        __FILE__, __LINE__, static_cast<const char*>((COVALENT_FUNCTION_NAME)))

#define covalent_check_error(a, c) \
    (covalent_likely(a) ? static_cast<void>(0) : covalent_throw_error(c))

#define covalent_check1(a) \
    (covalent_likely(a) ? static_cast<void>(0) : covalent_throw("(" #a ") check failed"))

#define covalent_check2(a, msg) \
    (covalent_likely(a) ? static_cast<void>(0) : covalent_throw("(" #a ") check failed: " << msg))

#define covalent_check_log2(a, l)                       \
    if (covalent_likely(a)) {                           \
    } else {                                            \
        covalent_throw_log(l, "(" #a ") check failed"); \
    }

#define covalent_check_log3(a, l, msg)                           \
    if (covalent_likely(a)) {                                    \
    } else {                                                     \
        covalent_throw_log(l, "(" #a ") check failed: " << msg); \
    }

#define covalent_check(...) COVALENT_CALL_OVERLOAD(covalent_check, __VA_ARGS__)
#define covalent_check_log(...) COVALENT_CALL_OVERLOAD(covalent_check_log, __VA_ARGS__)
