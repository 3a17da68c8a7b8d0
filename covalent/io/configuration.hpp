// covalent/io/configuration.hpp
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
#include <ostream>
#include <string>

namespace covalent {
namespace io {

//! What a blob wrapping a caller buffer does when a write outgrows it
enum struct WrapOverflowE {
    Promote, //!< Spill to a temporary file like any buffered blob
    Fail, //!< Raise error_blob_overflow
};

struct Configuration {
    static constexpr uint32_t default_buffer_capacity = 4096;

    std::string   temp_dir;
    uint32_t      buffer_capacity = default_buffer_capacity;
    WrapOverflowE wrap_overflow   = WrapOverflowE::Promote;

    //! Defaults taken from COVALENT_TEMP_DIR, COVALENT_BLOB_BUFFER_SIZE and TMPDIR
    static Configuration fromEnvironment();
};

std::ostream& operator<<(std::ostream& _ros, const Configuration& _rcfg);

//! A copy of the process wide configuration
Configuration configuration();

//! Replace the process wide configuration used by newly created blobs
void configure(const Configuration& _rcfg);

} //namespace io
} //namespace covalent
