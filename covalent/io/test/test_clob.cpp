#include "covalent/io/clob.hpp"
#include "covalent/io/error.hpp"
#include "covalent/system/exception.hpp"
#include <iostream>
#include <sstream>

using namespace std;
using namespace covalent;

namespace {

string stored(const io::Clob& _clob)
{
    const auto v = _clob.blob().bytes();
    return string(v.begin(), v.end());
}

} //namespace

int test_clob(int argc, char* argv[])
{
    io::Configuration cfg = io::configuration();
    if (argc > 1) {
        cfg.temp_dir = argv[1];
    }
    cfg.buffer_capacity = 32;
    io::configure(cfg);

    // h, e acute, euro sign, grinning face: 1 + 1 + 1 + 2 UTF-16 units on 1 + 2 + 3 + 4 bytes
    const string text = "h\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";

    {
        io::Clob clob = io::Clob::create(text);
        covalent_check(clob.charset() == io::Charset::Utf8);
        covalent_check(clob.length() == 5, "length = " << clob.length());
        covalent_check(clob.blob().length() == 10);
        covalent_check(clob.str() == text);

        // a character outside the BMP is a surrogate pair
        covalent_check(io::Clob::create(string("\xF0\x9F\x98\x80")).length() == 2);
        covalent_check(io::Clob::create(string("\xEF\xBF\xBF")).length() == 1);
    }
    {
        io::Clob clob = io::Clob::create();
        {
            auto pw = clob.openWriter();
            // a sequence split across writes still counts once
            pw->write(text.data(), 4);
            pw->flush();
            pw->write(text.data() + 4, text.size() - 4);
        }
        covalent_check(clob.length() == 5);
        {
            auto pw = clob.openWriter(true);
            *pw << "!!";
        }
        covalent_check(clob.length() == 7);
        covalent_check(clob.str() == text + "!!");
        {
            auto pw = clob.openWriter();
            *pw << "new";
        }
        covalent_check(clob.length() == 3);
        covalent_check(clob.str() == "new");
    }
    {
        // malformed input becomes one replacement character
        io::Clob clob = io::Clob::create(string("a\xFF" "b"));
        covalent_check(clob.length() == 3);
        covalent_check(clob.str() == "a\xEF\xBF\xBD" "b");

        io::Clob trunc = io::Clob::create(string("a\xE2\x82"));
        covalent_check(trunc.length() == 2, "truncated tail counts as one");
    }
    {
        io::Clob be = io::Clob::create(text, io::Charset::Utf16BE);
        covalent_check(be.length() == 5);
        covalent_check(be.blob().length() == 2 + 2 + 2 + 4);
        covalent_check(stored(be).compare(0, 2, string("\x00h", 2)) == 0);
        covalent_check(be.str() == text);

        io::Clob le = io::Clob::create(text, io::Charset::Utf16LE);
        covalent_check(stored(le).compare(0, 2, string("h\x00", 2)) == 0);
        covalent_check(stored(le).compare(4, 2, "\xAC\x20") == 0);
        covalent_check(le.str() == text);

        io::Clob latin = io::Clob::create(text, io::Charset::Latin1);
        covalent_check(latin.length() == 5);
        covalent_check(stored(latin) == "h\xE9??");
        covalent_check(latin.str() == "h\xC3\xA9??");

        io::Clob ascii = io::Clob::create(text, io::Charset::Ascii);
        covalent_check(stored(ascii) == "h???");
    }
    {
        // long text goes through the blob promotion
        string long_text;
        for (int i = 0; i < 100; ++i) {
            long_text += "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82 ";
        }
        istringstream iss(long_text);
        io::Clob      clob = io::Clob::create(iss);
        covalent_check(clob.length() == 700);
        covalent_check(clob.blob().state() == io::BlobStateE::FileBacked);

        io::Clob dup = clob.copy();
        clob.free();
        covalent_check(clob.length() == 0);
        covalent_check(dup.length() == 700);
        covalent_check(dup.str() == long_text);

        bool raised = false;
        try {
            clob.openReader();
        } catch (const RuntimeError& _rex) {
            raised = _rex.error() == io::error_blob_released;
        }
        covalent_check(raised);
    }
    {
        io::Clob clob = io::Clob::empty();
        covalent_check(clob.length() == 0);
        covalent_check(clob.str().empty());
    }
    {
        io::CharsetDecoder dec(io::Charset::Utf16BE);
        string             out;
        // lone high surrogate followed by 'A', then a stray byte
        dec.decode("\xD8\x00\x00\x41\x00", 5, out);
        dec.finish(out);
        covalent_check(out == "\xEF\xBF\xBD" "A\xEF\xBF\xBD");
    }

    io::Charset cs;
    covalent_check(io::parse("utf-16le", cs) && cs == io::Charset::Utf16LE);
    covalent_check(io::parse("ISO-8859-1", cs) && cs == io::Charset::Latin1);
    covalent_check(!io::parse("ebcdic", cs));

    ostringstream oss;
    oss << io::Charset::Utf16BE;
    covalent_check(oss.str() == "UTF-16BE");
    return 0;
}
