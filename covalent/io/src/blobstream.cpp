// covalent/io/src/blobstream.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/blobstream.hpp"
#include "blobdata.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/cassert.hpp"
#include "covalent/system/exception.hpp"
#include <cerrno>
#include <climits>
#include <cstring>

using namespace std;

namespace covalent {
namespace io {

namespace {
constexpr size_t put_capacity  = 4096;
constexpr size_t read_capacity = 4096;
} //namespace

//-----------------------------------------------------------------------------
//  BlobOBuffer
//-----------------------------------------------------------------------------

BlobOBuffer::BlobOBuffer(const impl::BlobDataPtrT& _pdata, const bool _append)
    : pdata_(_pdata)
    , buf_(put_capacity)
{
    covalent_check_error(pdata_->state() != BlobStateE::Released, error_blob_released);
    covalent_assert(!pdata_->writing_);

    if (!_append) {
        pdata_->reset();
    }
    pdata_->writing_ = true;
    setp(buf_.data(), buf_.data() + buf_.size());
}

BlobOBuffer::~BlobOBuffer()
{
    pdata_->writing_ = false;
}

void BlobOBuffer::flushPut()
{
    const size_t towrite = pptr() - pbase();
    if (towrite != 0) {
        // drop the pending bytes even on failure, they cannot be retried
        setp(buf_.data(), buf_.data() + buf_.size());
        pdata_->write(buf_.data(), towrite);
    }
}

/*virtual*/ BlobOBuffer::int_type BlobOBuffer::overflow(int_type _c)
{
    flushPut();
    if (_c != traits_type::eof()) {
        *pptr() = traits_type::to_char_type(_c);
        pbump(1);
    }
    return traits_type::not_eof(_c);
}

/*virtual*/ std::streamsize BlobOBuffer::xsputn(const char* _s, std::streamsize _n)
{
    const std::streamsize room = epptr() - pptr();
    if (_n <= room) {
        memcpy(pptr(), _s, static_cast<size_t>(_n));
        pbump(static_cast<int>(_n));
        return _n;
    }
    flushPut();
    if (static_cast<size_t>(_n) >= buf_.size()) {
        pdata_->write(_s, static_cast<size_t>(_n));
    } else {
        memcpy(pptr(), _s, static_cast<size_t>(_n));
        pbump(static_cast<int>(_n));
    }
    return _n;
}

/*virtual*/ int BlobOBuffer::sync()
{
    flushPut();
    return 0;
}

//-----------------------------------------------------------------------------
//  BlobIBuffer
//-----------------------------------------------------------------------------

BlobIBuffer::BlobIBuffer(const impl::BlobDataPtrT& _pdata)
    : pdata_(_pdata)
    , off_(0)
    , end_(_pdata->length_)
{
    std::visit(
        impl::Overloaded{
            [this](impl::BlobBuffer& _rbuf) {
                // read in place from a snapshot of the buffer reference
                pbuf_ = _rbuf.pbuf_;
                setg(pbuf_->data(), pbuf_->data(), pbuf_->data() + end_);
            },
            [this](impl::BlobFile& _rfile) {
                if (!dev_.open(_rfile.path_.c_str(), FileDevice::ReadOnlyE)) {
                    covalent_throw_error_ex(error_system, _rfile.path_ << ": " << last_system_error().message());
                }
                rbuf_.resize(read_capacity);
                setg(rbuf_.data(), rbuf_.data(), rbuf_.data());
            },
            [](impl::BlobReleased&) {
                covalent_throw_error(error_blob_released);
            }},
        pdata_->backing_);
}

/*virtual*/ BlobIBuffer::int_type BlobIBuffer::underflow()
{
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (!dev_ || off_ >= end_) {
        return traits_type::eof();
    }
    const uint64_t left   = end_ - off_;
    const size_t   toread = left < rbuf_.size() ? static_cast<size_t>(left) : rbuf_.size();
    ssize_t        rv;
    do {
        rv = dev_.read(rbuf_.data(), toread, static_cast<int64_t>(off_));
    } while (rv < 0 && errno == EINTR);

    if (rv < 0) {
        covalent_throw_error_ex(error_system, last_system_error().message());
    }
    if (rv == 0) {
        // the file is shorter than the recorded length
        end_ = off_;
        return traits_type::eof();
    }
    off_ += static_cast<uint64_t>(rv);
    setg(rbuf_.data(), rbuf_.data(), rbuf_.data() + rv);
    return traits_type::to_int_type(*gptr());
}

/*virtual*/ std::streamsize BlobIBuffer::xsgetn(char* _s, std::streamsize _n)
{
    std::streamsize count = 0;
    while (count < _n) {
        std::streamsize avail = egptr() - gptr();
        if (avail == 0) {
            if (underflow() == traits_type::eof()) {
                break;
            }
            avail = egptr() - gptr();
        }
        std::streamsize tocopy = (_n - count) < avail ? (_n - count) : avail;
        if (tocopy > INT_MAX) {
            tocopy = INT_MAX; // gbump takes an int
        }
        memcpy(_s + count, gptr(), static_cast<size_t>(tocopy));
        gbump(static_cast<int>(tocopy));
        count += tocopy;
    }
    return count;
}

/*virtual*/ std::streamsize BlobIBuffer::showmanyc()
{
    const std::streamsize avail = egptr() - gptr();
    if (dev_) {
        return avail + static_cast<std::streamsize>(end_ - off_);
    }
    return avail != 0 ? avail : -1;
}

//-----------------------------------------------------------------------------
//  Streams
//-----------------------------------------------------------------------------

BlobOStream::BlobOStream(const impl::BlobDataPtrT& _pdata, const bool _append)
    : std::ostream(nullptr)
    , buf_(_pdata, _append)
{
    rdbuf(&buf_);
    exceptions(std::ios_base::badbit);
}

BlobOStream::~BlobOStream()
{
    try {
        buf_.flushPut();
    } catch (const std::exception& _rex) {
        covalent_log(logger, Error, "lost pending blob bytes: " << _rex.what());
    }
}

void BlobOStream::close()
{
    buf_.flushPut();
}

BlobIStream::BlobIStream(const impl::BlobDataPtrT& _pdata)
    : std::istream(nullptr)
    , buf_(_pdata)
{
    rdbuf(&buf_);
    exceptions(std::ios_base::badbit);
}

} //namespace io
} //namespace covalent
