// covalent/serialization/serializer.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/io/input.hpp"
#include "covalent/io/output.hpp"

namespace covalent {
namespace serialization {

//! Reads and writes values of type T through the primitive codec
/*!
    Implementations keep no state, so one instance can serve any number of
    streams, and serializers for compound values are built by calling the
    serializers of their parts.
    Every encoding is self-delimiting: read() consumes exactly the bytes
    write() produced.
*/
template <class T>
class Serializer {
public:
    using ValueT = T;

    virtual ~Serializer() {}

    virtual T    read(io::Input& _rin) const                = 0;
    virtual void write(io::Output& _rout, const T& _v) const = 0;
};

} //namespace serialization
} //namespace covalent
