// covalent/system/error.hpp
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

#include <ostream>
#include <system_error>

namespace covalent {

using ErrorConditionT = std::error_condition;
using ErrorCodeT      = std::error_code;
using ErrorCategoryT  = std::error_category;

//! Wraps the current value of errno
ErrorCodeT last_system_error();

extern const ErrorConditionT error_not_implemented;
extern const ErrorConditionT error_system;

} //namespace covalent
