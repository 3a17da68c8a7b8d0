// covalent/io/blobstream.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/filedevice.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <streambuf>
#include <vector>

namespace covalent {
namespace io {

namespace impl {
struct BlobData;
using BlobDataPtrT = std::shared_ptr<BlobData>;
} //namespace impl

//! Collects bytes in a put area and hands them to the blob storage
class BlobOBuffer : public std::streambuf {
    impl::BlobDataPtrT pdata_;
    std::vector<char>  buf_;

public:
    BlobOBuffer(const impl::BlobDataPtrT& _pdata, bool _append);
    ~BlobOBuffer() override;

    //! Pushes pending bytes to the storage, raising on failure
    void flushPut();

protected:
    int_type        overflow(int_type _c) override;
    std::streamsize xsputn(const char* _s, std::streamsize _n) override;
    int             sync() override;
};

//! Reads blob content either straight from the memory buffer or from the file
class BlobIBuffer : public std::streambuf {
    impl::BlobDataPtrT                 pdata_;
    std::shared_ptr<std::vector<char>> pbuf_;
    FileDevice                         dev_;
    std::vector<char>                  rbuf_;
    uint64_t                           off_;
    uint64_t                           end_;

public:
    explicit BlobIBuffer(const impl::BlobDataPtrT& _pdata);

protected:
    int_type        underflow() override;
    std::streamsize xsgetn(char* _s, std::streamsize _n) override;
    std::streamsize showmanyc() override;
};

//! Output stream over a blob; pending bytes are flushed on destruction
class BlobOStream : public std::ostream {
    BlobOBuffer buf_;

public:
    BlobOStream(const impl::BlobDataPtrT& _pdata, bool _append);
    ~BlobOStream() override;

    //! Flush and raise if the pending bytes cannot be stored
    void close();
};

class BlobIStream : public std::istream {
    BlobIBuffer buf_;

public:
    explicit BlobIStream(const impl::BlobDataPtrT& _pdata);
};

using BlobOStreamPtrT = std::unique_ptr<BlobOStream>;
using BlobIStreamPtrT = std::unique_ptr<BlobIStream>;

} //namespace io
} //namespace covalent
