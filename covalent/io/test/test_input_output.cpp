#include "covalent/io/error.hpp"
#include "covalent/io/input.hpp"
#include "covalent/io/output.hpp"
#include "covalent/system/exception.hpp"
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>

using namespace std;
using namespace covalent;

namespace {

template <class F>
bool raises(const ErrorConditionT& _err, F _f)
{
    try {
        _f();
    } catch (const RuntimeError& _rex) {
        cout << "expected: " << _rex.what() << endl;
        return _rex.error() == _err;
    }
    return false;
}

} //namespace

int test_input_output(int argc, char* argv[])
{
    ostringstream oss;
    {
        io::Output out(oss);

        out.writeBoolean(true);
        out.writeBoolean(false);
        out.writeByte(-2);
        out.writeShort(-12345);
        out.writeChar(u'\u00E9');
        out.writeInt(0x01020304);
        out.writeLong(std::numeric_limits<int64_t>::min());
        out.writeFloat(3.5f);
        out.writeDouble(-0.125);
        out.writeDouble(std::numeric_limits<double>::infinity());
        out.write("raw", 3);
        out.write('!');
        out.flush();
    }

    const string data = oss.str();
    covalent_check(data.size() == 1 + 1 + 1 + 2 + 2 + 4 + 8 + 4 + 8 + 8 + 3 + 1, "size = " << data.size());

    // multi byte values are big-endian
    covalent_check(data[3] == static_cast<char>(0xCF) && data[4] == static_cast<char>(0xC7));
    covalent_check(data[5] == 0x00 && data[6] == static_cast<char>(0xE9));
    covalent_check(data.compare(7, 4, "\x01\x02\x03\x04") == 0);
    covalent_check(data[11] == static_cast<char>(0x80));
    covalent_check(data.compare(19, 4, "\x40\x60\x00\x00", 4) == 0, "float layout");

    istringstream iss(data);
    io::Input     in(iss);

    covalent_check(in.readBoolean() == true);
    covalent_check(in.readBoolean() == false);
    covalent_check(in.readByte() == -2);
    covalent_check(in.readShort() == -12345);
    covalent_check(in.readChar() == u'\u00E9');
    covalent_check(in.readInt() == 0x01020304);
    covalent_check(in.readLong() == std::numeric_limits<int64_t>::min());
    covalent_check(in.readFloat() == 3.5f);
    covalent_check(in.readDouble() == -0.125);
    covalent_check(std::isinf(in.readDouble()));

    char raw[3];
    in.readFully(raw, 3);
    covalent_check(memcmp(raw, "raw", 3) == 0);
    covalent_check(in.read() == '!');
    covalent_check(in.read() == -1, "end of stream reads as -1");

    {
        istringstream iss2(string("\xFF\xFE\x00\x01\x02", 5));
        io::Input     in2(iss2);
        covalent_check(in2.readUnsignedByte() == 0xFF);
        covalent_check(in2.readUnsignedShort() == 0xFE00);
        covalent_check(in2.skipBytes(10) == 2, "skip stops at the end");
        covalent_check(raises(io::error_end_of_stream, [&in2]() { in2.readByte(); }));
    }
    {
        istringstream iss3(string("\x00\x00", 2));
        io::Input     in3(iss3);
        covalent_check(raises(io::error_end_of_stream, [&in3]() { in3.readInt(); }));
    }
    {
        istringstream iss4(string("abc"));
        io::Input     in4(iss4);
        char          buf[8];
        covalent_check(in4.read(buf, sizeof(buf)) == 3);
        covalent_check(raises(io::error_end_of_stream, [&in4, &buf]() { in4.readFully(buf, 1); }));
    }
    {
        // scratch capacity is never below what one primitive needs
        ostringstream oss5;
        io::Output    out5(oss5, 1);
        covalent_check(out5.bufferCapacity() >= 8);
        out5.writeLong(42);
        istringstream iss5(oss5.str());
        io::Input     in5(iss5, 1);
        covalent_check(in5.readLong() == 42);
    }
    return 0;
}
