// covalent/io/blob.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/io/blobstream.hpp"
#include "covalent/io/configuration.hpp"
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

namespace covalent {
namespace io {

enum struct BlobStateE {
    Buffered,
    FileBacked,
    Released,
};

const char* name(BlobStateE _state);

std::ostream& operator<<(std::ostream& _ros, BlobStateE _state);

//! A byte sequence of any size kept in memory until it outgrows its buffer
/*!
    A blob starts buffered. The first write that would not fit in the buffer
    moves everything written so far to a temporary file, and the blob stays
    file backed from then on. free(), or the destruction of the last owner,
    drops the buffer or deletes the file.

    Blobs are move only; copy() duplicates the content into new storage.
    Streams opened on a blob share its storage, so the storage lives until
    both the blob and its streams are gone, unless free() is called.
*/
class Blob {
    impl::BlobDataPtrT pdata_;

    explicit Blob(impl::BlobDataPtrT&& _pdata);

public:
    //! Buffered blob with the process wide configuration
    static Blob create();
    static Blob create(const Configuration& _rcfg);
    //! Buffered blob with no buffer: the first byte written promotes it
    static Blob empty();
    //! Buffered blob holding _data, capacity equal to its size
    static Blob wrap(std::vector<char>&& _data);
    static Blob wrap(std::vector<char>&& _data, const Configuration& _rcfg);
    //! File backed blob taking ownership of an existing file
    /*!
        The file is only read until a writer touches it, so a read only file
        can be wrapped and read back.
    */
    static Blob wrap(const std::filesystem::path& _path);

    Blob(Blob&& _other) noexcept;
    Blob& operator=(Blob&& _other) noexcept;
    ~Blob();

    Blob(const Blob&)            = delete;
    Blob& operator=(const Blob&) = delete;

    //! Writer positioned at the end when _append, at the start otherwise
    BlobOStreamPtrT openOutputStream(bool _append = false);
    //! Reader over the bytes written so far
    BlobIStreamPtrT openInputStream() const;

    //! Replaces the content
    void write(const char* _pb, size_t _bl);
    void write(std::string_view _data)
    {
        write(_data.data(), _data.size());
    }
    //! Appends everything _ris yields, returns the number of bytes appended
    uint64_t writeFrom(std::istream& _ris);
    //! Writes the content to _ros, returns the number of bytes written
    uint64_t copyTo(std::ostream& _ros) const;
    std::vector<char> bytes() const;

    void switchToFile();
    Blob copy() const;
    void free();

    uint64_t   length() const;
    BlobStateE state() const;
    //! Size of the memory buffer, 0 unless buffered
    uint32_t capacity() const;
    //! The backing file, empty unless file backed
    std::filesystem::path path() const;

private:
    const impl::BlobDataPtrT& checkedData() const;
};

} //namespace io
} //namespace covalent
