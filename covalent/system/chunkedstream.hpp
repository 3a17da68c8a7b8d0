// covalent/system/chunkedstream.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include <cstring>
#include <memory>
#include <ostream>

namespace covalent {

//! An output streambuf over a chain of fixed size chunks
/*!
    The first chunk lives inside the object so short lines never touch the heap.
    Used to assemble one log line before it is handed to the recorder.
*/
template <size_t NodeSize>
class ChunkedBuffer : public std::streambuf {
    struct Node {
        static constexpr const size_t capacity = NodeSize - sizeof(std::unique_ptr<Node>);

        char                  data_[capacity];
        std::unique_ptr<Node> pnext_;

        char* begin()
        {
            return &data_[0];
        }
        char* end()
        {
            return &data_[capacity];
        }
    };

    Node            first_;
    Node*           plast_;
    char*           pcrt_;
    std::streamsize size_;

public:
    ChunkedBuffer()
        : plast_(&first_)
        , pcrt_(first_.begin())
        , size_(0)
    {
    }

    ChunkedBuffer(const ChunkedBuffer&)            = delete;
    ChunkedBuffer& operator=(const ChunkedBuffer&) = delete;

    ~ChunkedBuffer()
    {
        // unlink iteratively, a long chain must not recurse in the destructor
        std::unique_ptr<Node> pnode = std::move(first_.pnext_);
        while (pnode) {
            pnode = std::move(pnode->pnext_);
        }
    }

    std::streamsize size() const
    {
        return size_;
    }

    template <class F>
    void visit(F _f) const
    {
        const Node* pnode = &first_;
        while (pnode != nullptr) {
            const size_t sz = pnode == plast_ ? static_cast<size_t>(pcrt_ - pnode->data_) : Node::capacity;
            _f(pnode->data_, sz);
            pnode = pnode->pnext_.get();
        }
    }

    std::ostream& writeTo(std::ostream& _ros) const
    {
        visit([&_ros](const char* _data, const size_t _sz) { _ros.write(_data, _sz); });
        return _ros;
    }

protected:
    int_type overflow(int_type _c) override
    {
        if (_c != traits_type::eof()) {
            if (pcrt_ == plast_->end()) {
                grow();
            }
            *pcrt_ = traits_type::to_char_type(_c);
            ++pcrt_;
            ++size_;
        }
        return _c;
    }

    std::streamsize xsputn(const char* _s, std::streamsize _n) override
    {
        std::streamsize left = _n;
        while (left != 0) {
            if (pcrt_ == plast_->end()) {
                grow();
            }
            std::streamsize towrite = plast_->end() - pcrt_;
            if (towrite > left) {
                towrite = left;
            }
            memcpy(pcrt_, _s, static_cast<size_t>(towrite));
            _s += towrite;
            left -= towrite;
            pcrt_ += towrite;
        }
        size_ += _n;
        return _n;
    }

private:
    void grow()
    {
        plast_->pnext_ = std::make_unique<Node>();
        plast_         = plast_->pnext_.get();
        pcrt_          = plast_->begin();
    }
};

template <size_t NodeSize>
class OChunkedStream : public std::ostream {
    ChunkedBuffer<NodeSize> buf_;

public:
    OChunkedStream()
        : std::ostream(nullptr)
    {
        rdbuf(&buf_);
    }

    std::ostream& writeTo(std::ostream& _ros) const
    {
        return buf_.writeTo(_ros);
    }

    size_t size() const
    {
        return static_cast<size_t>(buf_.size());
    }

    template <class F>
    void visit(F _f) const
    {
        buf_.visit(_f);
    }
};

} // namespace covalent
