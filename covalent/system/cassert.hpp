// covalent/system/cassert.hpp
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
#include "covalent/system/log.hpp"

#ifdef COVALENT_HAS_ASSERT

#include <cassert>

#define covalent_assert(a) assert((a))
#define covalent_assert_log(a, l)                             \
    if (static_cast<bool>(a)) {                               \
    } else {                                                  \
        covalent_log(l, Exception, "(" #a ") assert failed"); \
        assert((a));                                          \
    }

#else
#define covalent_assert(a)
#define covalent_assert_log(a, l)
#endif
