#include "covalent/io/blob.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/directory.hpp"
#include "covalent/system/exception.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
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

string as_string(const io::Blob& _blob)
{
    const auto v = _blob.bytes();
    return string(v.begin(), v.end());
}

} //namespace

int test_blob(int argc, char* argv[])
{
    io::Configuration cfg = io::configuration();
    if (argc > 1) {
        cfg.temp_dir = argv[1];
    }
    cfg.buffer_capacity = 64;
    io::configure(cfg);

    {
        io::Blob blob = io::Blob::create();
        covalent_check(blob.state() == io::BlobStateE::Buffered);
        covalent_check(blob.capacity() == 64);
        covalent_check(blob.length() == 0);
        covalent_check(blob.path().empty());

        {
            auto pos = blob.openOutputStream();
            *pos << "hello";
            pos->write(" world", 6);
        }
        covalent_check(blob.length() == 11, "length = " << blob.length());
        covalent_check(as_string(blob) == "hello world");

        {
            auto pos = blob.openOutputStream(true);
            *pos << '!';
        }
        covalent_check(as_string(blob) == "hello world!");

        {
            auto pos = blob.openOutputStream();
            *pos << "reset";
        }
        covalent_check(as_string(blob) == "reset");

        blob.write("direct");
        covalent_check(blob.length() == 6);

        ostringstream oss;
        covalent_check(blob.copyTo(oss) == 6);
        covalent_check(oss.str() == "direct");

        istringstream iss(" more");
        covalent_check(blob.writeFrom(iss) == 5);
        covalent_check(as_string(blob) == "direct more");
    }
    {
        // a reader sees the bytes written before it was opened
        io::Blob blob = io::Blob::create();
        blob.write("abc");
        auto pis = blob.openInputStream();
        {
            auto pos = blob.openOutputStream(true);
            *pos << "def";
        }
        string s;
        *pis >> s;
        covalent_check(s == "abc", "snapshot = " << s);
        covalent_check(as_string(blob) == "abcdef");
    }
    {
        // copies do not share storage
        io::Blob src = io::Blob::create();
        src.write("original");
        io::Blob dst = src.copy();
        dst.write("changed");
        covalent_check(as_string(src) == "original");
        covalent_check(as_string(dst) == "changed");

        src.switchToFile();
        covalent_check(src.state() == io::BlobStateE::FileBacked);
        covalent_check(src.capacity() == 0);
        io::Blob fcopy = src.copy();
        covalent_check(fcopy.state() == io::BlobStateE::FileBacked);
        covalent_check(fcopy.path() != src.path());
        covalent_check(as_string(fcopy) == "original");

        src.switchToFile();
        covalent_check(src.state() == io::BlobStateE::FileBacked, "second switch is a no-op");
    }
    {
        // moved from blobs keep nothing
        io::Blob a = io::Blob::create();
        a.write("x");
        io::Blob b = std::move(a);
        covalent_check(b.length() == 1);
        covalent_check(a.state() == io::BlobStateE::Released);
    }
    {
        io::Blob blob = io::Blob::create();
        blob.write("bye");
        blob.free();
        covalent_check(blob.state() == io::BlobStateE::Released);
        covalent_check(blob.length() == 0);
        covalent_check(raises(io::error_blob_released, [&blob]() { blob.openInputStream(); }));
        covalent_check(raises(io::error_blob_released, [&blob]() { blob.openOutputStream(); }));
        covalent_check(raises(io::error_blob_released, [&blob]() { blob.copy(); }));
        blob.free();
    }
    {
        // an open stream keeps the storage alive
        io::BlobIStreamPtrT pis;
        {
            io::Blob blob = io::Blob::create();
            blob.write("alive");
            pis = blob.openInputStream();
        }
        string s;
        *pis >> s;
        covalent_check(s == "alive");
    }
    {
        // wrapping an existing file takes it over
        const string fname = cfg.temp_dir + "/test_blob_wrap.dat";
        covalent_check(Directory::createAll(cfg.temp_dir.c_str()));
        {
            ofstream ofs(fname, ios::binary | ios::trunc);
            ofs << "file content";
        }
        io::Blob blob = io::Blob::wrap(std::filesystem::path(fname));
        covalent_check(blob.state() == io::BlobStateE::FileBacked);
        covalent_check(blob.length() == 12);
        covalent_check(as_string(blob) == "file content");
        {
            auto pos = blob.openOutputStream(true);
            *pos << "!";
        }
        covalent_check(as_string(blob) == "file content!");
        blob.free();
        covalent_check(!Directory::exists(fname.c_str()), "wrapped file deleted on free");

        covalent_check(raises(error_system, []() { io::Blob::wrap(std::filesystem::path("/nonexistent/covalent/blob")); }));
    }
    {
        // a read only file can be wrapped and read
        const string fname = cfg.temp_dir + "/test_blob_wrap_ro.dat";
        {
            ofstream ofs(fname, ios::binary | ios::trunc);
            ofs << "read only";
        }
        std::filesystem::permissions(fname, std::filesystem::perms::owner_read | std::filesystem::perms::group_read | std::filesystem::perms::others_read);

        io::Blob blob = io::Blob::wrap(std::filesystem::path(fname));
        covalent_check(blob.state() == io::BlobStateE::FileBacked);
        covalent_check(blob.length() == 9);
        covalent_check(as_string(blob) == "read only");
        io::Blob dup = blob.copy();
        covalent_check(as_string(dup) == "read only");
        blob.free();
        covalent_check(!Directory::exists(fname.c_str()));
    }
    {
        // one read call larger than the whole wrapped buffer
        vector<char> v(1 << 20);
        for (size_t i = 0; i < v.size(); ++i) {
            v[i] = static_cast<char>(i % 251);
        }
        const vector<char> expect = v;
        io::Blob           blob   = io::Blob::wrap(std::move(v));
        auto               pis    = blob.openInputStream();
        vector<char>       out(expect.size() + 10);
        pis->read(out.data(), static_cast<std::streamsize>(out.size()));
        covalent_check(static_cast<size_t>(pis->gcount()) == expect.size(), "gcount = " << pis->gcount());
        out.resize(expect.size());
        covalent_check(out == expect);
    }
    {
        vector<char> v{'a', 'b', 'c'};
        io::Blob     blob = io::Blob::wrap(std::move(v));
        covalent_check(blob.state() == io::BlobStateE::Buffered);
        covalent_check(blob.capacity() == 3);
        covalent_check(blob.length() == 3);
        covalent_check(as_string(blob) == "abc");
    }
    {
        io::Blob blob = io::Blob::empty();
        covalent_check(blob.capacity() == 0);
        covalent_check(blob.state() == io::BlobStateE::Buffered);
        blob.write("", 0);
        covalent_check(blob.state() == io::BlobStateE::Buffered);
        covalent_check(blob.bytes().empty());
    }

    ostringstream oss;
    oss << io::BlobStateE::FileBacked;
    covalent_check(oss.str() == "FileBacked");
    return 0;
}
