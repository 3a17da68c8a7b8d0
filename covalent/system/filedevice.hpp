// covalent/system/filedevice.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/seekabledevice.hpp"
#include <fcntl.h>
#include <string>

namespace covalent {

//! Wrapper for a file descriptor
class FileDevice : public SeekableDevice {
public:
    enum OpenMode {
        ReadOnlyE  = O_RDONLY, //!< Read only
        WriteOnlyE = O_WRONLY, //!< Write only
        ReadWriteE = O_RDWR, //!< Read write
        TruncateE  = O_TRUNC, //!< Truncate
        AppendE    = O_APPEND, //!< Append
        CreateE    = O_CREAT //!< Create
    };

    FileDevice();

    //! Returns the size of a file without opening it, -1 if it cannot be stat-ed
    static int64_t size(const char* _fname);

    //! Open a file using its name and open mode flags
    bool open(const char* _fname, int _how);
    //! Create a file using its name and open mode flags
    bool create(const char* _fname, int _how);
    //! Create and open, read-write, a new uniquely named file
    /*!
        The file is named <_dir>/<_prefix>XXXXXX<_suffix>; on success
        _rpath receives the full path.
    */
    bool createTemp(std::string& _rpath, const char* _dir, const char* _prefix, const char* _suffix);
    //! Get the size of an opened file
    int64_t size() const;
};

} //namespace covalent
