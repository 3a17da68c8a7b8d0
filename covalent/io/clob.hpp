// covalent/io/clob.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/io/blob.hpp"
#include "covalent/io/charset.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace covalent {
namespace io {

namespace impl {
struct ClobData;
using ClobDataPtrT = std::shared_ptr<ClobData>;
} //namespace impl

//! Takes UTF-8, counts characters and stores them in the clob charset
class ClobOBuffer : public std::streambuf {
    impl::ClobDataPtrT   pdata_;
    BlobOStreamPtrT      pos_;
    utility::Utf8Decoder dec_;
    std::vector<char>    buf_;
    std::string          enc_;

public:
    ClobOBuffer(const impl::ClobDataPtrT& _pdata, bool _append);

    void flushPut();
    //! Flushes everything, a truncated trailing sequence included
    void close();

protected:
    int_type overflow(int_type _c) override;
    int      sync() override;

private:
    void encode(const char* _pb, size_t _bl);
};

//! Gives back the stored characters as UTF-8
class ClobIBuffer : public std::streambuf {
    impl::ClobDataPtrT pdata_;
    BlobIStreamPtrT    pis_;
    CharsetDecoder     dec_;
    std::vector<char>  raw_;
    std::string        out_;
    bool               done_;

public:
    explicit ClobIBuffer(const impl::ClobDataPtrT& _pdata);

protected:
    int_type underflow() override;
};

class ClobOStream : public std::ostream {
    ClobOBuffer buf_;

public:
    ClobOStream(const impl::ClobDataPtrT& _pdata, bool _append);
    ~ClobOStream() override;

    void close();
};

class ClobIStream : public std::istream {
    ClobIBuffer buf_;

public:
    explicit ClobIStream(const impl::ClobDataPtrT& _pdata);
};

using ClobOStreamPtrT = std::unique_ptr<ClobOStream>;
using ClobIStreamPtrT = std::unique_ptr<ClobIStream>;

//! A character sequence stored in a Blob
/*!
    length() counts the UTF-16 code units written through the writers, so a
    code point above U+FFFF counts twice.
    It is kept apart from the byte length of the Blob, which depends on the
    charset.
*/
class Clob {
    impl::ClobDataPtrT pdata_;

    explicit Clob(impl::ClobDataPtrT&& _pdata);

public:
    static Clob create(Charset _cs = Charset::Utf8);
    static Clob empty();
    static Clob create(std::string_view _txt, Charset _cs = Charset::Utf8);
    //! Reads _ris to its end, taking its content as UTF-8
    static Clob create(std::istream& _ris, Charset _cs = Charset::Utf8);
    //! Takes over a blob that already holds _length characters in _cs
    static Clob adopt(Blob&& _blob, uint64_t _length, Charset _cs = Charset::Utf8);

    Clob(Clob&& _other) noexcept;
    Clob& operator=(Clob&& _other) noexcept;
    ~Clob();

    Clob(const Clob&)            = delete;
    Clob& operator=(const Clob&) = delete;

    ClobOStreamPtrT openWriter(bool _append = false);
    ClobIStreamPtrT openReader() const;

    //! Writes the text as UTF-8, returns the number of bytes written
    uint64_t    copyTo(std::ostream& _ros) const;
    std::string str() const;

    Clob copy() const;
    void free();

    uint64_t    length() const;
    Charset     charset() const;
    const Blob& blob() const;
};

} //namespace io
} //namespace covalent
