// covalent/system/directory.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

namespace covalent {

//! A wrapper for filesystem directory operations
class Directory {
public:
    //! Create a new directory
    static bool create(const char*);
    //! Create a directory together with its missing parents
    /*!
        Succeeds when the directory exists at the end of the call,
        whether it was created or was already there.
    */
    static bool createAll(const char*);
    //! Check whether a path exists
    static bool exists(const char*);
    //! Erase a file
    static bool eraseFile(const char*);
    //! Rename a file
    static bool renameFile(const char* _from, const char* _to);
};

} //namespace covalent
