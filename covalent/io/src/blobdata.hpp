// covalent/io/src/blobdata.hpp
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
#include "covalent/io/configuration.hpp"
#include "covalent/system/filedevice.hpp"
#include "covalent/system/log.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace covalent {
namespace io {

extern const LoggerT logger;

namespace impl {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

using BufferPtrT = std::shared_ptr<std::vector<char>>;

struct BlobBuffer {
    BufferPtrT pbuf_; // capacity is pbuf_->size()
};

struct BlobFile {
    std::string path_;
    FileDevice  dev_; // read-write unless read_only_
    bool        read_only_ = false;
};

struct BlobReleased {
};

using BlobBackingT = std::variant<BlobBuffer, BlobFile, BlobReleased>;

//! The storage shared by a Blob and the streams opened on it
struct BlobData {
    BlobBackingT        backing_;
    uint64_t            length_ = 0;
    const std::string   temp_dir_;
    const WrapOverflowE wrap_overflow_;
    const bool          wrapped_;
    bool                writing_ = false;

    BlobData(BlobBackingT&& _backing, const uint64_t _length, const Configuration& _rcfg, const bool _wrapped)
        : backing_(std::move(_backing))
        , length_(_length)
        , temp_dir_(_rcfg.temp_dir)
        , wrap_overflow_(_rcfg.wrap_overflow)
        , wrapped_(_wrapped)
    {
    }

    ~BlobData();

    BlobStateE state() const
    {
        return static_cast<BlobStateE>(backing_.index());
    }

    Configuration configuration() const
    {
        Configuration cfg;
        cfg.temp_dir      = temp_dir_;
        cfg.wrap_overflow = wrap_overflow_;
        return cfg;
    }

    //! Appends at length_, promoting first when the buffer cannot take _bl more bytes
    void write(const char* _pb, size_t _bl);
    //! Starts over for a non appending writer
    void reset();
    void promote();
    void release();

private:
    void beforeWrite(size_t _bl);
};

//! Creates a temporary file in _dir (created if needed) holding no data
FileDevice create_temp_file(std::string& _rpath, const std::string& _dir);

} //namespace impl
} //namespace io
} //namespace covalent
