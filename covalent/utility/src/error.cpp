// covalent/utility/src/error.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/utility/error.hpp"
#include <sstream>

namespace covalent {
namespace utility {

namespace {

enum {
    ErrorUrlFormatE = 1,
    ErrorUtf8FormatE,
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "covalent::utility";
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
    case ErrorUrlFormatE:
        oss << "Malformed URL";
        break;
    case ErrorUtf8FormatE:
        oss << "Malformed UTF-8 text";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

} //namespace

/*extern*/ const ErrorConditionT error_url_format(ErrorUrlFormatE, category);
/*extern*/ const ErrorConditionT error_utf8_format(ErrorUtf8FormatE, category);

} //namespace utility
} //namespace covalent
