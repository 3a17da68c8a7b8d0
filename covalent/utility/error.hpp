// covalent/utility/error.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/error.hpp"

namespace covalent {
namespace utility {

extern const ErrorConditionT error_url_format;
extern const ErrorConditionT error_utf8_format;

} //namespace utility
} //namespace covalent
