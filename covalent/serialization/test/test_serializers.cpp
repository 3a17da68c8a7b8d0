#include "covalent/io/error.hpp"
#include "covalent/serialization/serializers.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/utility/error.hpp"
#include <iostream>
#include <limits>
#include <sstream>

using namespace std;
using namespace covalent;
namespace sz = covalent::serialization::serializers;

namespace {

template <class T>
T round_trip(const serialization::Serializer<T>& _rs, const T& _v, size_t* _psize = nullptr)
{
    ostringstream oss;
    {
        io::Output out(oss);
        _rs.write(out, _v);
        out.flush();
    }
    if (_psize != nullptr) {
        *_psize = oss.str().size();
    }
    istringstream iss(oss.str());
    io::Input     in(iss);
    T             rv = _rs.read(in);
    covalent_check(in.read() == -1, "serializer left bytes behind");
    return rv;
}

} //namespace

int test_serializers(int argc, char* argv[])
{
    size_t size = 0;

    covalent_check(round_trip(sz::int8(), int8_t(-128), &size) == -128 && size == 1);
    covalent_check(round_trip(sz::byte(), int8_t(127)) == 127);
    covalent_check(round_trip(sz::int16(), int16_t(-300), &size) == -300 && size == 2);
    covalent_check(round_trip(sz::int32(), std::numeric_limits<int32_t>::min(), &size) == std::numeric_limits<int32_t>::min() && size == 4);
    covalent_check(round_trip(sz::int64(), int64_t(1) << 40, &size) == (int64_t(1) << 40) && size == 8);
    covalent_check(round_trip(sz::float32(), 1.25f, &size) == 1.25f && size == 4);
    covalent_check(round_trip(sz::float64(), -1e300, &size) == -1e300 && size == 8);
    covalent_check(round_trip(sz::boolean(), true, &size) == true && size == 1);
    covalent_check(round_trip(sz::boolean(), false) == false);
    covalent_check(round_trip(sz::character(), char16_t(0x20AC), &size) == 0x20AC && size == 2);

    covalent_check(round_trip(sz::utf(), u16string()).empty());
    const u16string mixed = u16string(1, u'\0') + u"x\u07FF\uFFFF";
    covalent_check(round_trip(sz::utf(), mixed, &size) == mixed);
    covalent_check(size == 4 + 3 + 1 + 2 + 3, "utf size = " << size);

    const string utf8 = "na\xC3\xAFve \xF0\x9F\x8D\x95";
    covalent_check(round_trip(sz::utf8(), utf8) == utf8);
    covalent_check(round_trip(sz::utf8(), string()).empty());

    covalent_check(round_trip(sz::ascii(), u16string(u"plain"), &size) == u"plain" && size == 4 + 5);
    covalent_check(round_trip(sz::ascii(), u16string(u"\u0141")) == u16string(u"A"), "ascii keeps the low byte");
    {
        // a huge count with no text behind it
        istringstream iss(string("\x7F\xFF\xFF\xFF" "abc", 7));
        io::Input     in(iss);
        bool          raised = false;
        try {
            sz::ascii().read(in);
        } catch (const RuntimeError& _rex) {
            cout << "expected: " << _rex.what() << endl;
            raised = _rex.error() == io::error_end_of_stream;
        }
        covalent_check(raised);
    }

    {
        const serialization::TimestampT ts{std::chrono::milliseconds(1700000000123LL)};
        covalent_check(round_trip(sz::timestamp(), ts, &size) == ts && size == 8);

        const serialization::TimestampT before{std::chrono::milliseconds(-5)};
        covalent_check(round_trip(sz::timestamp(), before) == before);
    }
    {
        const auto url = utility::Url::parse("HTTPS://user@example.com:8443/a/b?x=1#frag");
        const auto rv  = round_trip(sz::url(), url);
        covalent_check(rv == url);
        covalent_check(rv.scheme() == "https");
        covalent_check(rv.port() == 8443);

        ostringstream oss;
        {
            io::Output out(oss);
            out.writeUTF8("not a url");
        }
        istringstream iss(oss.str());
        io::Input     in(iss);
        bool          raised = false;
        try {
            sz::url().read(in);
        } catch (const RuntimeError& _rex) {
            cout << "expected: " << _rex.what() << endl;
            raised = _rex.error() == utility::error_url_format;
        }
        covalent_check(raised);
    }
    {
        const std::filesystem::path abs("/var/lib/covalent/data.bin");
        covalent_check(round_trip(sz::path(), abs, &size) == abs);

        const std::filesystem::path rel("a/b/c");
        const auto                  rv = round_trip(sz::path(), rel);
        covalent_check(rv == rel);
        covalent_check(!rv.has_root_path());

        covalent_check(round_trip(sz::path(), std::filesystem::path("/")) == std::filesystem::path("/"));
        covalent_check(round_trip(sz::path(), std::filesystem::path()).empty());

        ostringstream oss;
        {
            io::Output out(oss);
            sz::path().write(out, rel);
        }
        const string data = oss.str();
        covalent_check(data.compare(0, 5, string("\x00\x00\x00\x03\x00", 5)) == 0, "three segments, no root");
    }
    {
        // the default serializers for the natural types
        covalent_check(&serialization::serializer<int32_t>() == &sz::int32());
        covalent_check(&serialization::serializer<std::string>() == &sz::utf8());
        covalent_check(&serialization::serializer<std::u16string>() == &sz::utf());
        covalent_check(&serialization::serializer<io::Blob>() == &sz::blob());
    }
    {
        // values written back to back read back in order
        ostringstream oss;
        {
            io::Output out(oss);
            sz::int32().write(out, 7);
            sz::utf8().write(out, "seven");
            sz::boolean().write(out, true);
        }
        istringstream iss(oss.str());
        io::Input     in(iss);
        covalent_check(sz::int32().read(in) == 7);
        covalent_check(sz::utf8().read(in) == "seven");
        covalent_check(sz::boolean().read(in));

        bool raised = false;
        try {
            sz::int64().read(in);
        } catch (const RuntimeError& _rex) {
            raised = _rex.error() == io::error_end_of_stream;
        }
        covalent_check(raised);
    }
    return 0;
}
