// covalent/system/src/error.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/system/error.hpp"
#include <cerrno>
#include <sstream>

namespace covalent {

ErrorCodeT last_system_error()
{
    return ErrorCodeT(errno, std::system_category());
}

namespace {
enum {
    ErrorNotImplementedE = 1,
    ErrorSystemE,
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "covalent";
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
    case ErrorNotImplementedE:
        oss << "Functionality not implemented";
        break;
    case ErrorSystemE:
        oss << "System";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

} //namespace

/*extern*/ const ErrorConditionT error_not_implemented(ErrorNotImplementedE, category);
/*extern*/ const ErrorConditionT error_system(ErrorSystemE, category);

} //namespace covalent
