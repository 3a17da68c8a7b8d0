// covalent/system/device.hpp
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

namespace covalent {

//! Owns a POSIX descriptor, closing it on destruction
class Device {
public:
    using DescriptorT = int;

    static constexpr DescriptorT invalidDescriptor()
    {
        return -1;
    }

    Device(Device&& _dev) noexcept;
    explicit Device(DescriptorT _desc = invalidDescriptor());
    ~Device();

    Device(const Device&)            = delete;
    Device& operator=(const Device&) = delete;

    Device& operator=(Device&& _dev) noexcept;

    //! Read call, returns -1 on error
    ssize_t read(char* _pb, size_t _bl);
    //! Write call, returns -1 on error
    ssize_t write(const char* _pb, size_t _bl);
    //! Write the whole range, retrying on partial writes and EINTR
    bool writeAll(const char* _pb, size_t _bl);
    //! Close the device
    void close();
    //! Flush the device to stable storage
    bool flush();

    explicit operator bool() const noexcept
    {
        return ok();
    }

    DescriptorT descriptor() const
    {
        return desc_;
    }

protected:
    void descriptor(const DescriptorT _desc)
    {
        close();
        desc_ = _desc;
    }

    bool ok() const noexcept
    {
        return desc_ != invalidDescriptor();
    }

private:
    DescriptorT desc_;
};

} //namespace covalent
