// covalent/system/src/device.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//
#define _FILE_OFFSET_BITS 64

#include "covalent/system/common.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "covalent/system/cassert.hpp"
#include "covalent/system/directory.hpp"
#include "covalent/system/filedevice.hpp"

using namespace std;

namespace covalent {

Device::Device(Device&& _dev) noexcept
    : desc_(_dev.desc_)
{
    _dev.desc_ = invalidDescriptor();
}

Device& Device::operator=(Device&& _dev) noexcept
{
    if (this != &_dev) {
        close();
        desc_      = _dev.desc_;
        _dev.desc_ = invalidDescriptor();
    }
    return *this;
}

Device::Device(DescriptorT _desc)
    : desc_(_desc)
{
}

Device::~Device()
{
    close();
}

ssize_t Device::read(char* _pb, size_t _bl)
{
    covalent_assert(ok());
    return ::read(desc_, _pb, _bl);
}

ssize_t Device::write(const char* _pb, size_t _bl)
{
    covalent_assert(ok());
    return ::write(desc_, _pb, _bl);
}

bool Device::writeAll(const char* _pb, size_t _bl)
{
    while (_bl != 0) {
        const ssize_t rv = write(_pb, _bl);
        if (rv < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        _pb += rv;
        _bl -= static_cast<size_t>(rv);
    }
    return true;
}

void Device::close()
{
    if (ok()) {
        if (::close(desc_) != 0) {
            covalent_assert(errno != EBADF);
        }
        desc_ = invalidDescriptor();
    }
}

bool Device::flush()
{
    covalent_assert(ok());
    return fsync(desc_) == 0;
}

//-- SeekableDevice ----------------------------------------

ssize_t SeekableDevice::read(char* _pb, size_t _bl, int64_t _off)
{
    return pread(descriptor(), _pb, _bl, _off);
}

ssize_t SeekableDevice::write(const char* _pb, size_t _bl, int64_t _off)
{
    return pwrite(descriptor(), _pb, _bl, _off);
}

bool SeekableDevice::writeAll(const char* _pb, size_t _bl, int64_t _off)
{
    while (_bl != 0) {
        const ssize_t rv = write(_pb, _bl, _off);
        if (rv < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        _pb += rv;
        _bl -= static_cast<size_t>(rv);
        _off += rv;
    }
    return true;
}

bool SeekableDevice::truncate(int64_t _len)
{
    return ::ftruncate(descriptor(), _len) == 0;
}

//-- File ----------------------------------------

FileDevice::FileDevice()
{
}

bool FileDevice::open(const char* _fname, int _how)
{
    descriptor(::open(_fname, _how | O_CLOEXEC, 00666));
    return ok();
}

bool FileDevice::create(const char* _fname, int _how)
{
    return this->open(_fname, _how | CreateE | TruncateE);
}

bool FileDevice::createTemp(std::string& _rpath, const char* _dir, const char* _prefix, const char* _suffix)
{
    std::string tmpl{_dir};
    if (!tmpl.empty() && tmpl.back() != '/') {
        tmpl += '/';
    }
    tmpl += _prefix;
    tmpl += "XXXXXX";
    tmpl += _suffix;

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    descriptor(::mkstemps(buf.data(), static_cast<int>(strlen(_suffix))));
    if (ok()) {
        _rpath.assign(buf.data());
    }
    return ok();
}

int64_t FileDevice::size() const
{
    struct stat st;
    if (fstat(descriptor(), &st) != 0) {
        return -1;
    }
    return st.st_size;
}

/*static*/ int64_t FileDevice::size(const char* _fname)
{
    struct stat st;
    if (stat(_fname, &st) != 0) {
        return -1;
    }
    return st.st_size;
}

//-- Directory -------------------------------------

/*static*/ bool Directory::create(const char* _fname)
{
    return mkdir(_fname, S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) == 0;
}

/*static*/ bool Directory::createAll(const char* _fname)
{
    static constexpr const char sep = '/';

    string path(_fname);
    size_t sep_pos = path.find(sep, 1);

    while (sep_pos != string::npos) {
        path[sep_pos] = 0;
        create(path.c_str());
        path[sep_pos] = sep;
        sep_pos       = path.find(sep, sep_pos + 1);
    }
    create(_fname);

    struct stat st;
    return stat(_fname, &st) == 0 && S_ISDIR(st.st_mode);
}

/*static*/ bool Directory::exists(const char* _fname)
{
    struct stat st;
    return stat(_fname, &st) == 0;
}

/*static*/ bool Directory::eraseFile(const char* _fname)
{
    return unlink(_fname) == 0;
}

/*static*/ bool Directory::renameFile(const char* _from, const char* _to)
{
    return ::rename(_from, _to) == 0;
}

} //namespace covalent
