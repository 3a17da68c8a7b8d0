// covalent/serialization/src/serializers.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/serialization/serializers.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/system/log.hpp"
#include "covalent/utility/error.hpp"

namespace covalent {
namespace serialization {

namespace {

const LoggerT logger("covalent::serialization");

//-----------------------------------------------------------------------------
//  Fixed width values
//-----------------------------------------------------------------------------

template <class T, T (io::Input::*Read)(), void (io::Output::*Write)(T)>
class PrimitiveSerializer final : public Serializer<T> {
public:
    T read(io::Input& _rin) const override
    {
        return (_rin.*Read)();
    }
    void write(io::Output& _rout, const T& _v) const override
    {
        (_rout.*Write)(_v);
    }
};

using Int8SerializerT    = PrimitiveSerializer<int8_t, &io::Input::readByte, &io::Output::writeByte>;
using Int16SerializerT   = PrimitiveSerializer<int16_t, &io::Input::readShort, &io::Output::writeShort>;
using Int32SerializerT   = PrimitiveSerializer<int32_t, &io::Input::readInt, &io::Output::writeInt>;
using Int64SerializerT   = PrimitiveSerializer<int64_t, &io::Input::readLong, &io::Output::writeLong>;
using FloatSerializerT   = PrimitiveSerializer<float, &io::Input::readFloat, &io::Output::writeFloat>;
using DoubleSerializerT  = PrimitiveSerializer<double, &io::Input::readDouble, &io::Output::writeDouble>;
using BoolSerializerT    = PrimitiveSerializer<bool, &io::Input::readBoolean, &io::Output::writeBoolean>;
using CharSerializerT    = PrimitiveSerializer<char16_t, &io::Input::readChar, &io::Output::writeChar>;

//-----------------------------------------------------------------------------
//  Text
//-----------------------------------------------------------------------------

class UtfSerializer final : public Serializer<std::u16string> {
public:
    std::u16string read(io::Input& _rin) const override
    {
        return _rin.readUTF();
    }
    void write(io::Output& _rout, const std::u16string& _v) const override
    {
        _rout.writeUTF(_v);
    }
};

class Utf8Serializer final : public Serializer<std::string> {
public:
    std::string read(io::Input& _rin) const override
    {
        return _rin.readUTF8();
    }
    void write(io::Output& _rout, const std::string& _v) const override
    {
        _rout.writeUTF8(_v);
    }
};

class AsciiSerializer final : public Serializer<std::u16string> {
public:
    std::u16string read(io::Input& _rin) const override
    {
        const int32_t count = _rin.readInt();
        covalent_check_error(count >= 0, io::error_utf_format);

        size_t         left = static_cast<size_t>(count);
        std::u16string rv;
        rv.reserve(left < 4096 ? left : 4096);

        while (left != 0) {
            const size_t toread = left < _rin.bufferCapacity() ? left : _rin.bufferCapacity();
            _rin.readFully(_rin.buffer(), toread);
            for (size_t i = 0; i < toread; ++i) {
                rv += static_cast<char16_t>(static_cast<uint8_t>(_rin.buffer()[i]));
            }
            left -= toread;
        }
        return rv;
    }

    void write(io::Output& _rout, const std::u16string& _v) const override
    {
        covalent_check(_v.size() <= static_cast<size_t>(INT32_MAX), "text too long: " << _v.size());
        _rout.writeInt(static_cast<int32_t>(_v.size()));

        size_t off = 0;
        while (off < _v.size()) {
            const size_t towrite = (_v.size() - off) < _rout.bufferCapacity() ? (_v.size() - off) : _rout.bufferCapacity();
            for (size_t i = 0; i < towrite; ++i) {
                _rout.buffer()[i] = static_cast<char>(_v[off + i] & 0xFF);
            }
            _rout.write(_rout.buffer(), towrite);
            off += towrite;
        }
    }
};

//-----------------------------------------------------------------------------
//  Timestamp, Url, Path
//-----------------------------------------------------------------------------

class TimestampSerializer final : public Serializer<TimestampT> {
public:
    TimestampT read(io::Input& _rin) const override
    {
        return TimestampT(std::chrono::milliseconds(_rin.readLong()));
    }
    void write(io::Output& _rout, const TimestampT& _v) const override
    {
        _rout.writeLong(static_cast<int64_t>(_v.time_since_epoch().count()));
    }
};

class UrlSerializer final : public Serializer<utility::Url> {
public:
    utility::Url read(io::Input& _rin) const override
    {
        return utility::Url::parse(_rin.readUTF8());
    }
    void write(io::Output& _rout, const utility::Url& _v) const override
    {
        _rout.writeUTF8(_v.str());
    }
};

class PathSerializer final : public Serializer<std::filesystem::path> {
public:
    std::filesystem::path read(io::Input& _rin) const override
    {
        const int32_t count = _rin.readInt();
        covalent_check_error(count >= 0, io::error_utf_format);

        std::filesystem::path rv;
        if (_rin.readBoolean()) {
            rv = std::filesystem::path(_rin.readUTF8());
        }
        for (int32_t i = 0; i < count; ++i) {
            rv /= std::filesystem::path(_rin.readUTF8());
        }
        return rv;
    }

    void write(io::Output& _rout, const std::filesystem::path& _v) const override
    {
        const std::filesystem::path relative = _v.relative_path();

        int32_t count = 0;
        for (auto it = relative.begin(); it != relative.end(); ++it) {
            ++count;
        }
        _rout.writeInt(count);
        _rout.writeBoolean(_v.has_root_path());
        if (_v.has_root_path()) {
            _rout.writeUTF8(_v.root_path().generic_string());
        }
        for (const auto& segment : relative) {
            _rout.writeUTF8(segment.generic_string());
        }
    }
};

//-----------------------------------------------------------------------------
//  Blob, Clob
//-----------------------------------------------------------------------------

class BlobSerializer final : public Serializer<io::Blob> {
public:
    io::Blob read(io::Input& _rin) const override
    {
        const uint64_t length = static_cast<uint64_t>(_rin.readLong());

        io::Blob blob = io::Blob::create();
        {
            auto     pos  = blob.openOutputStream();
            uint64_t left = length;
            while (left != 0) {
                const size_t toread = left < _rin.bufferCapacity() ? static_cast<size_t>(left) : _rin.bufferCapacity();
                _rin.readFully(_rin.buffer(), toread);
                pos->write(_rin.buffer(), static_cast<std::streamsize>(toread));
                left -= toread;
            }
            pos->close();
        }
        covalent_log(logger, Verbose, "read blob of " << length << " bytes, " << blob.state());
        return blob;
    }

    void write(io::Output& _rout, const io::Blob& _v) const override
    {
        const uint64_t length = _v.length();
        _rout.writeLong(static_cast<int64_t>(length));

        auto     pis  = _v.openInputStream();
        uint64_t left = length;
        while (left != 0) {
            const size_t toread = left < _rout.bufferCapacity() ? static_cast<size_t>(left) : _rout.bufferCapacity();
            pis->read(_rout.buffer(), static_cast<std::streamsize>(toread));
            const size_t cnt = static_cast<size_t>(pis->gcount());
            if (cnt == 0) {
                covalent_throw_error_ex(io::error_end_of_stream, "blob ended " << left << " bytes early");
            }
            _rout.write(_rout.buffer(), cnt);
            left -= cnt;
        }
    }
};

class ClobSerializer final : public Serializer<io::Clob> {
    const BlobSerializer& blob_;

public:
    explicit ClobSerializer(const BlobSerializer& _blob)
        : blob_(_blob)
    {
    }

    io::Clob read(io::Input& _rin) const override
    {
        const uint64_t length = static_cast<uint64_t>(_rin.readLong());
        return io::Clob::adopt(blob_.read(_rin), length, io::Charset::Utf8);
    }

    void write(io::Output& _rout, const io::Clob& _v) const override
    {
        _rout.writeLong(static_cast<int64_t>(_v.length()));
        if (_v.charset() == io::Charset::Utf8) {
            blob_.write(_rout, _v.blob());
            return;
        }
        covalent_log(logger, Verbose, "transcoding clob from " << _v.charset());
        io::Blob utf8 = io::Blob::create();
        {
            auto pos = utf8.openOutputStream();
            _v.copyTo(*pos);
            pos->close();
        }
        blob_.write(_rout, utf8);
    }
};

} //namespace

namespace serializers {

const Serializer<int8_t>& int8()
{
    static const Int8SerializerT s{};
    return s;
}

const Serializer<int8_t>& byte()
{
    return int8();
}

const Serializer<int16_t>& int16()
{
    static const Int16SerializerT s{};
    return s;
}

const Serializer<int32_t>& int32()
{
    static const Int32SerializerT s{};
    return s;
}

const Serializer<int64_t>& int64()
{
    static const Int64SerializerT s{};
    return s;
}

const Serializer<float>& float32()
{
    static const FloatSerializerT s{};
    return s;
}

const Serializer<double>& float64()
{
    static const DoubleSerializerT s{};
    return s;
}

const Serializer<bool>& boolean()
{
    static const BoolSerializerT s{};
    return s;
}

const Serializer<char16_t>& character()
{
    static const CharSerializerT s{};
    return s;
}

const Serializer<std::u16string>& utf()
{
    static const UtfSerializer s{};
    return s;
}

const Serializer<std::string>& utf8()
{
    static const Utf8Serializer s{};
    return s;
}

const Serializer<std::u16string>& ascii()
{
    static const AsciiSerializer s{};
    return s;
}

const Serializer<TimestampT>& timestamp()
{
    static const TimestampSerializer s{};
    return s;
}

const Serializer<utility::Url>& url()
{
    static const UrlSerializer s{};
    return s;
}

const Serializer<std::filesystem::path>& path()
{
    static const PathSerializer s{};
    return s;
}

namespace {

const BlobSerializer& blob_serializer()
{
    static const BlobSerializer s{};
    return s;
}

} //namespace

const Serializer<io::Blob>& blob()
{
    return blob_serializer();
}

const Serializer<io::Clob>& clob()
{
    static const ClobSerializer s(blob_serializer());
    return s;
}

} //namespace serializers

} //namespace serialization
} //namespace covalent
