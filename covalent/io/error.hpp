// covalent/io/error.hpp
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
namespace io {

extern const ErrorConditionT error_end_of_stream;
extern const ErrorConditionT error_utf_format;
extern const ErrorConditionT error_stream_write;
extern const ErrorConditionT error_blob_released;
extern const ErrorConditionT error_blob_overflow;
extern const ErrorConditionT error_temp_create;

} //namespace io
} //namespace covalent
