// covalent/io/src/blob.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/blob.hpp"
#include "blobdata.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/cassert.hpp"
#include "covalent/system/directory.hpp"
#include "covalent/system/exception.hpp"
#include <cerrno>
#include <cstring>
#include <iterator>

using namespace std;

namespace covalent {
namespace io {

namespace {
constexpr size_t copy_chunk_size = 16 * 1024;
} //namespace

const char* name(const BlobStateE _state)
{
    switch (_state) {
    case BlobStateE::Buffered:
        return "Buffered";
    case BlobStateE::FileBacked:
        return "FileBacked";
    case BlobStateE::Released:
        return "Released";
    default:
        return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& _ros, const BlobStateE _state)
{
    return _ros << name(_state);
}

namespace impl {

FileDevice create_temp_file(std::string& _rpath, const std::string& _dir)
{
    if (!Directory::createAll(_dir.c_str())) {
        covalent_throw_error_ex(error_temp_create, _dir << ": " << last_system_error().message());
    }
    FileDevice dev;
    if (!dev.createTemp(_rpath, _dir.c_str(), "covalent", ".blob")) {
        covalent_throw_error_ex(error_temp_create, _dir << ": " << last_system_error().message());
    }
    return dev;
}

namespace {

// Copies [0, _len) from _rsrc into _rdst, both positioned reads/writes.
void copy_file_content(FileDevice& _rsrc, FileDevice& _rdst, const uint64_t _len)
{
    std::vector<char> buf(copy_chunk_size);
    uint64_t          off = 0;
    while (off < _len) {
        const uint64_t left   = _len - off;
        const size_t   toread = left < buf.size() ? static_cast<size_t>(left) : buf.size();
        ssize_t        rv;
        do {
            rv = _rsrc.read(buf.data(), toread, static_cast<int64_t>(off));
        } while (rv < 0 && errno == EINTR);

        if (rv <= 0) {
            covalent_throw_error_ex(error_stream_write, "reading blob file: " << (rv == 0 ? std::string("unexpected end of file") : last_system_error().message()));
        }
        if (!_rdst.writeAll(buf.data(), static_cast<size_t>(rv), static_cast<int64_t>(off))) {
            covalent_throw_error_ex(error_stream_write, last_system_error().message());
        }
        off += static_cast<uint64_t>(rv);
    }
}

// A wrapped file is opened read only until something writes to it.
void open_for_writing(BlobFile& _rfile)
{
    if (!_rfile.read_only_) {
        return;
    }
    FileDevice dev;
    if (!dev.open(_rfile.path_.c_str(), FileDevice::ReadWriteE)) {
        covalent_throw_error_ex(error_system, _rfile.path_ << ": " << last_system_error().message());
    }
    _rfile.dev_       = std::move(dev);
    _rfile.read_only_ = false;
}

} //namespace

BlobData::~BlobData()
{
    release();
}

void BlobData::beforeWrite(const size_t _bl)
{
    switch (state()) {
    case BlobStateE::Released:
        covalent_throw_error(error_blob_released);
    case BlobStateE::Buffered: {
        const BlobBuffer& rbuf = std::get<BlobBuffer>(backing_);
        if (length_ + _bl > rbuf.pbuf_->size()) {
            if (wrapped_ && wrap_overflow_ == WrapOverflowE::Fail) {
                covalent_throw_error_ex(error_blob_overflow, "capacity " << rbuf.pbuf_->size() << " cannot take " << (length_ + _bl) << " bytes");
            }
            promote();
        }
    } break;
    case BlobStateE::FileBacked:
        break;
    }
}

void BlobData::write(const char* _pb, const size_t _bl)
{
    if (_bl == 0) {
        covalent_check_error(state() != BlobStateE::Released, error_blob_released);
        return;
    }
    beforeWrite(_bl);

    std::visit(
        Overloaded{
            [this, _pb, _bl](BlobBuffer& _rbuf) {
                memcpy(_rbuf.pbuf_->data() + length_, _pb, _bl);
            },
            [this, _pb, _bl](BlobFile& _rfile) {
                open_for_writing(_rfile);
                if (!_rfile.dev_.writeAll(_pb, _bl, static_cast<int64_t>(length_))) {
                    covalent_throw_error_ex(error_stream_write, _rfile.path_ << ": " << last_system_error().message());
                }
            },
            [](BlobReleased&) {
                covalent_throw_error(error_blob_released);
            }},
        backing_);

    length_ += _bl;
}

void BlobData::reset()
{
    std::visit(
        Overloaded{
            [](BlobBuffer& _rbuf) {
                if (_rbuf.pbuf_.use_count() > 1) {
                    // a reader still holds the current bytes
                    _rbuf.pbuf_ = std::make_shared<std::vector<char>>(_rbuf.pbuf_->size());
                }
            },
            [](BlobFile& _rfile) {
                open_for_writing(_rfile);
                if (!_rfile.dev_.truncate(0)) {
                    covalent_throw_error_ex(error_stream_write, _rfile.path_ << ": " << last_system_error().message());
                }
            },
            [](BlobReleased&) {
                covalent_throw_error(error_blob_released);
            }},
        backing_);
    length_ = 0;
}

void BlobData::promote()
{
    covalent_assert(state() == BlobStateE::Buffered);

    BlobFile file;
    file.dev_ = create_temp_file(file.path_, temp_dir_);

    const BlobBuffer& rbuf = std::get<BlobBuffer>(backing_);

    if (length_ != 0 && !file.dev_.writeAll(rbuf.pbuf_->data(), static_cast<size_t>(length_), 0)) {
        const auto err = last_system_error();
        file.dev_.close();
        Directory::eraseFile(file.path_.c_str());
        covalent_throw_error_ex(error_temp_create, file.path_ << ": " << err.message());
    }

    covalent_log(logger, Info, "blob of " << length_ << " bytes moved to " << file.path_);
    backing_ = std::move(file);
}

void BlobData::release()
{
    if (BlobFile* pfile = std::get_if<BlobFile>(&backing_)) {
        pfile->dev_.close();
        if (!Directory::eraseFile(pfile->path_.c_str())) {
            covalent_log(logger, Warning, "could not delete " << pfile->path_ << ": " << last_system_error().message());
        } else {
            covalent_log(logger, Verbose, "deleted " << pfile->path_);
        }
    }
    backing_ = BlobReleased{};
    length_  = 0;
}

} //namespace impl

//-----------------------------------------------------------------------------
//  Blob
//-----------------------------------------------------------------------------

Blob::Blob(impl::BlobDataPtrT&& _pdata)
    : pdata_(std::move(_pdata))
{
}

Blob::Blob(Blob&& _other) noexcept = default;

Blob& Blob::operator=(Blob&& _other) noexcept = default;

Blob::~Blob() = default;

/*static*/ Blob Blob::create()
{
    return create(configuration());
}

/*static*/ Blob Blob::create(const Configuration& _rcfg)
{
    impl::BlobBuffer buf{std::make_shared<std::vector<char>>(_rcfg.buffer_capacity)};
    return Blob(std::make_shared<impl::BlobData>(std::move(buf), 0, _rcfg, false));
}

/*static*/ Blob Blob::empty()
{
    impl::BlobBuffer buf{std::make_shared<std::vector<char>>()};
    return Blob(std::make_shared<impl::BlobData>(std::move(buf), 0, configuration(), false));
}

/*static*/ Blob Blob::wrap(std::vector<char>&& _data)
{
    return wrap(std::move(_data), configuration());
}

/*static*/ Blob Blob::wrap(std::vector<char>&& _data, const Configuration& _rcfg)
{
    const uint64_t   len = _data.size();
    impl::BlobBuffer buf{std::make_shared<std::vector<char>>(std::move(_data))};
    return Blob(std::make_shared<impl::BlobData>(std::move(buf), len, _rcfg, true));
}

/*static*/ Blob Blob::wrap(const std::filesystem::path& _path)
{
    impl::BlobFile file;
    file.path_ = _path.string();
    file.read_only_ = true;
    if (!file.dev_.open(file.path_.c_str(), FileDevice::ReadOnlyE)) {
        covalent_throw_error_ex(error_system, file.path_ << ": " << last_system_error().message());
    }
    const int64_t sz = file.dev_.size();
    if (sz < 0) {
        covalent_throw_error_ex(error_system, file.path_ << ": " << last_system_error().message());
    }
    return Blob(std::make_shared<impl::BlobData>(std::move(file), static_cast<uint64_t>(sz), configuration(), true));
}

const impl::BlobDataPtrT& Blob::checkedData() const
{
    if (!pdata_ || pdata_->state() == BlobStateE::Released) {
        covalent_throw_error(error_blob_released);
    }
    return pdata_;
}

BlobOStreamPtrT Blob::openOutputStream(const bool _append)
{
    return std::make_unique<BlobOStream>(checkedData(), _append);
}

BlobIStreamPtrT Blob::openInputStream() const
{
    return std::make_unique<BlobIStream>(checkedData());
}

void Blob::write(const char* _pb, const size_t _bl)
{
    const auto& pdata = checkedData();
    covalent_assert(!pdata->writing_);
    pdata->reset();
    pdata->write(_pb, _bl);
}

uint64_t Blob::writeFrom(std::istream& _ris)
{
    const auto& pdata = checkedData();
    covalent_assert(!pdata->writing_);

    std::vector<char> buf(copy_chunk_size);
    uint64_t          total = 0;
    while (_ris) {
        _ris.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize cnt = _ris.gcount();
        if (cnt <= 0) {
            break;
        }
        pdata->write(buf.data(), static_cast<size_t>(cnt));
        total += static_cast<uint64_t>(cnt);
    }
    if (_ris.bad()) {
        covalent_throw_error_ex(error_stream_write, "source stream failed after " << total << " bytes");
    }
    return total;
}

uint64_t Blob::copyTo(std::ostream& _ros) const
{
    auto              pis = openInputStream();
    std::vector<char> buf(copy_chunk_size);
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

std::vector<char> Blob::bytes() const
{
    std::vector<char> rv;
    rv.reserve(static_cast<size_t>(length()));
    auto pis = openInputStream();
    rv.assign(std::istreambuf_iterator<char>(*pis), std::istreambuf_iterator<char>());
    return rv;
}

void Blob::switchToFile()
{
    const auto& pdata = checkedData();
    if (pdata->state() == BlobStateE::Buffered) {
        pdata->promote();
    }
}

Blob Blob::copy() const
{
    const auto& pdata = checkedData();

    return std::visit(
        impl::Overloaded{
            [&pdata](impl::BlobBuffer& _rbuf) -> Blob {
                auto pbuf = std::make_shared<std::vector<char>>(*_rbuf.pbuf_);
                return Blob(std::make_shared<impl::BlobData>(impl::BlobBuffer{std::move(pbuf)}, pdata->length_, pdata->configuration(), pdata->wrapped_));
            },
            [&pdata](impl::BlobFile& _rfile) -> Blob {
                FileDevice src;
                if (!src.open(_rfile.path_.c_str(), FileDevice::ReadOnlyE)) {
                    covalent_throw_error_ex(error_system, _rfile.path_ << ": " << last_system_error().message());
                }
                impl::BlobFile file;
                file.dev_ = impl::create_temp_file(file.path_, pdata->temp_dir_);
                // the new BlobData owns the file from here on, and deletes it if the copy fails
                auto pnew = std::make_shared<impl::BlobData>(std::move(file), 0, pdata->configuration(), false);
                impl::copy_file_content(src, std::get<impl::BlobFile>(pnew->backing_).dev_, pdata->length_);
                pnew->length_ = pdata->length_;
                return Blob(std::move(pnew));
            },
            [](impl::BlobReleased&) -> Blob {
                covalent_throw_error(error_blob_released);
            }},
        pdata->backing_);
}

void Blob::free()
{
    if (pdata_) {
        pdata_->release();
    }
}

uint64_t Blob::length() const
{
    return pdata_ ? pdata_->length_ : 0;
}

BlobStateE Blob::state() const
{
    return pdata_ ? pdata_->state() : BlobStateE::Released;
}

uint32_t Blob::capacity() const
{
    if (pdata_) {
        if (const impl::BlobBuffer* pbuf = std::get_if<impl::BlobBuffer>(&pdata_->backing_)) {
            return static_cast<uint32_t>(pbuf->pbuf_->size());
        }
    }
    return 0;
}

std::filesystem::path Blob::path() const
{
    if (pdata_) {
        if (const impl::BlobFile* pfile = std::get_if<impl::BlobFile>(&pdata_->backing_)) {
            return pfile->path_;
        }
    }
    return std::filesystem::path();
}

} //namespace io
} //namespace covalent
