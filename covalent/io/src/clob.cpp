// covalent/io/src/clob.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/clob.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/system/log.hpp"
#include <sstream>

using namespace std;

namespace covalent {
namespace io {

extern const LoggerT logger;

namespace impl {

struct ClobData {
    Blob          blob_;
    uint64_t      length_;
    const Charset charset_;

    ClobData(Blob&& _blob, const uint64_t _length, const Charset _cs)
        : blob_(std::move(_blob))
        , length_(_length)
        , charset_(_cs)
    {
    }
};

} //namespace impl

namespace {
constexpr size_t text_chunk_size = 1024;
} //namespace

//-----------------------------------------------------------------------------
//  ClobOBuffer
//-----------------------------------------------------------------------------

ClobOBuffer::ClobOBuffer(const impl::ClobDataPtrT& _pdata, const bool _append)
    : pdata_(_pdata)
    , pos_(_pdata->blob_.openOutputStream(_append))
    , buf_(text_chunk_size)
{
    if (!_append) {
        pdata_->length_ = 0;
    }
    setp(buf_.data(), buf_.data() + buf_.size());
}

void ClobOBuffer::encode(const char* _pb, const size_t _bl)
{
    enc_.clear();
    const Charset cs    = pdata_->charset_;
    uint64_t      count = 0;
    dec_.feed(_pb, _bl, [this, cs, &count](const char32_t _cp) {
        charset_encode(cs, _cp, enc_);
        count += _cp > 0xFFFF ? 2 : 1;
    });
    if (!enc_.empty()) {
        pos_->write(enc_.data(), static_cast<std::streamsize>(enc_.size()));
    }
    pdata_->length_ += count;
}

void ClobOBuffer::flushPut()
{
    const size_t towrite = pptr() - pbase();
    setp(buf_.data(), buf_.data() + buf_.size());
    if (towrite != 0) {
        encode(buf_.data(), towrite);
    }
}

void ClobOBuffer::close()
{
    flushPut();
    enc_.clear();
    uint64_t      count = 0;
    const Charset cs    = pdata_->charset_;
    dec_.finish([this, cs, &count](const char32_t _cp) {
        charset_encode(cs, _cp, enc_);
        count += _cp > 0xFFFF ? 2 : 1;
    });
    if (!enc_.empty()) {
        pos_->write(enc_.data(), static_cast<std::streamsize>(enc_.size()));
    }
    pdata_->length_ += count;
    pos_->close();
}

/*virtual*/ ClobOBuffer::int_type ClobOBuffer::overflow(int_type _c)
{
    flushPut();
    if (_c != traits_type::eof()) {
        *pptr() = traits_type::to_char_type(_c);
        pbump(1);
    }
    return traits_type::not_eof(_c);
}

/*virtual*/ int ClobOBuffer::sync()
{
    flushPut();
    pos_->flush();
    return 0;
}

//-----------------------------------------------------------------------------
//  ClobIBuffer
//-----------------------------------------------------------------------------

ClobIBuffer::ClobIBuffer(const impl::ClobDataPtrT& _pdata)
    : pdata_(_pdata)
    , pis_(_pdata->blob_.openInputStream())
    , dec_(_pdata->charset_)
    , raw_(text_chunk_size)
    , done_(false)
{
    setg(nullptr, nullptr, nullptr);
}

/*virtual*/ ClobIBuffer::int_type ClobIBuffer::underflow()
{
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    out_.clear();
    while (out_.empty() && !done_) {
        pis_->read(raw_.data(), static_cast<std::streamsize>(raw_.size()));
        const std::streamsize cnt = pis_->gcount();
        if (cnt > 0) {
            dec_.decode(raw_.data(), static_cast<size_t>(cnt), out_);
        } else {
            dec_.finish(out_);
            done_ = true;
        }
    }
    if (out_.empty()) {
        return traits_type::eof();
    }
    setg(out_.data(), out_.data(), out_.data() + out_.size());
    return traits_type::to_int_type(*gptr());
}

//-----------------------------------------------------------------------------
//  Streams
//-----------------------------------------------------------------------------

ClobOStream::ClobOStream(const impl::ClobDataPtrT& _pdata, const bool _append)
    : std::ostream(nullptr)
    , buf_(_pdata, _append)
{
    rdbuf(&buf_);
    exceptions(std::ios_base::badbit);
}

ClobOStream::~ClobOStream()
{
    try {
        buf_.close();
    } catch (const std::exception& _rex) {
        covalent_log(logger, Error, "lost pending clob text: " << _rex.what());
    }
}

void ClobOStream::close()
{
    buf_.close();
}

ClobIStream::ClobIStream(const impl::ClobDataPtrT& _pdata)
    : std::istream(nullptr)
    , buf_(_pdata)
{
    rdbuf(&buf_);
    exceptions(std::ios_base::badbit);
}

//-----------------------------------------------------------------------------
//  Clob
//-----------------------------------------------------------------------------

Clob::Clob(impl::ClobDataPtrT&& _pdata)
    : pdata_(std::move(_pdata))
{
}

Clob::Clob(Clob&& _other) noexcept = default;

Clob& Clob::operator=(Clob&& _other) noexcept = default;

Clob::~Clob() = default;

/*static*/ Clob Clob::create(const Charset _cs)
{
    return Clob(std::make_shared<impl::ClobData>(Blob::create(), 0, _cs));
}

/*static*/ Clob Clob::empty()
{
    return Clob(std::make_shared<impl::ClobData>(Blob::empty(), 0, Charset::Utf8));
}

/*static*/ Clob Clob::create(std::string_view _txt, const Charset _cs)
{
    Clob clob = create(_cs);
    {
        auto pos = clob.openWriter();
        pos->write(_txt.data(), static_cast<std::streamsize>(_txt.size()));
        pos->close();
    }
    return clob;
}

/*static*/ Clob Clob::create(std::istream& _ris, const Charset _cs)
{
    Clob clob = create(_cs);
    {
        auto              pos = clob.openWriter();
        std::vector<char> buf(text_chunk_size);
        while (_ris) {
            _ris.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const std::streamsize cnt = _ris.gcount();
            if (cnt <= 0) {
                break;
            }
            pos->write(buf.data(), cnt);
        }
        if (_ris.bad()) {
            covalent_throw_error_ex(error_stream_write, "source stream failed");
        }
        pos->close();
    }
    return clob;
}

/*static*/ Clob Clob::adopt(Blob&& _blob, const uint64_t _length, const Charset _cs)
{
    return Clob(std::make_shared<impl::ClobData>(std::move(_blob), _length, _cs));
}

ClobOStreamPtrT Clob::openWriter(const bool _append)
{
    return std::make_unique<ClobOStream>(pdata_, _append);
}

ClobIStreamPtrT Clob::openReader() const
{
    return std::make_unique<ClobIStream>(pdata_);
}

uint64_t Clob::copyTo(std::ostream& _ros) const
{
    auto              pis = openReader();
    std::vector<char> buf(text_chunk_size);
    uint64_t          total = 0;
    while (*pis) {
        pis->read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize cnt = pis->gcount();
        if (cnt <= 0) {
            break;
        }
        _ros.write(buf.data(), cnt);
        if (!_ros) {
            covalent_throw_error_ex(error_stream_write, "destination stream failed after " << total << " bytes");
        }
        total += static_cast<uint64_t>(cnt);
    }
    return total;
}

std::string Clob::str() const
{
    std::ostringstream oss;
    copyTo(oss);
    return oss.str();
}

Clob Clob::copy() const
{
    return Clob(std::make_shared<impl::ClobData>(pdata_->blob_.copy(), pdata_->length_, pdata_->charset_));
}

void Clob::free()
{
    pdata_->blob_.free();
    pdata_->length_ = 0;
}

uint64_t Clob::length() const
{
    return pdata_->length_;
}

Charset Clob::charset() const
{
    return pdata_->charset_;
}

const Blob& Clob::blob() const
{
    return pdata_->blob_;
}

} //namespace io
} //namespace covalent
