// covalent/io/src/error.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/error.hpp"
#include "covalent/system/log.hpp"
#include <sstream>

namespace covalent {
namespace io {

extern const LoggerT logger;

const LoggerT logger("covalent::io");

namespace {

enum {
    ErrorEndOfStreamE = 1,
    ErrorUtfFormatE,
    ErrorStreamWriteE,
    ErrorBlobReleasedE,
    ErrorBlobOverflowE,
    ErrorTempCreateE,
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "covalent::io";
    }
    std::string message(int _ev) const override;
};

const ErrorCategory category;

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case ErrorEndOfStreamE:
        oss << "Unexpected end of stream";
        break;
    case ErrorUtfFormatE:
        oss << "Malformed modified UTF-8 text";
        break;
    case ErrorStreamWriteE:
        oss << "Stream write failed";
        break;
    case ErrorBlobReleasedE:
        oss << "Blob storage was released";
        break;
    case ErrorBlobOverflowE:
        oss << "Write exceeds the wrapped buffer";
        break;
    case ErrorTempCreateE:
        oss << "Cannot create temporary file";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

} //namespace

/*extern*/ const ErrorConditionT error_end_of_stream(ErrorEndOfStreamE, category);
/*extern*/ const ErrorConditionT error_utf_format(ErrorUtfFormatE, category);
/*extern*/ const ErrorConditionT error_stream_write(ErrorStreamWriteE, category);
/*extern*/ const ErrorConditionT error_blob_released(ErrorBlobReleasedE, category);
/*extern*/ const ErrorConditionT error_blob_overflow(ErrorBlobOverflowE, category);
/*extern*/ const ErrorConditionT error_temp_create(ErrorTempCreateE, category);

} //namespace io
} //namespace covalent
