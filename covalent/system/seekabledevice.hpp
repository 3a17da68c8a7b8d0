// covalent/system/seekabledevice.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/device.hpp"

namespace covalent {

//! A wrapper for devices with random access.
class SeekableDevice : public Device {
public:
    using Device::read;
    using Device::write;
    using Device::writeAll;
    //! Read from a given position, without moving the cursor
    ssize_t read(char* _pb, size_t _bl, int64_t _off);
    //! Write at a given position, without moving the cursor
    ssize_t write(const char* _pb, size_t _bl, int64_t _off);
    //! Write the whole range at a given position
    bool writeAll(const char* _pb, size_t _bl, int64_t _off);
    //! Truncate to a certain length
    bool truncate(int64_t _len);

protected:
    explicit SeekableDevice(DescriptorT _desc = invalidDescriptor())
        : Device(_desc)
    {
    }
};

} //namespace covalent
