#include "covalent/system/exception.hpp"
#include "covalent/utility/error.hpp"
#include "covalent/utility/utf.hpp"
#include <algorithm>
#include <iostream>
#include <string>

using namespace std;
using namespace covalent;

namespace {

u32string decode_all(const string& _txt, const size_t _slice, size_t& _rerrors)
{
    u32string            rv;
    utility::Utf8Decoder decoder;
    const auto           append = [&rv](const char32_t _cp) { rv += _cp; };

    for (size_t off = 0; off < _txt.size(); off += _slice) {
        const size_t sz = std::min(_slice, _txt.size() - off);
        decoder.feed(_txt.data() + off, sz, append);
    }
    decoder.finish(append);
    _rerrors = decoder.errorCount();
    return rv;
}

} //namespace

int test_utf(int argc, char* argv[])
{
    // a (1 byte), e acute (2), euro (3), G clef (4)
    const string text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9D\x84\x9E";

    {
        const u16string u16 = utility::utf8_to_utf16(text);
        covalent_check(u16.size() == 5, "size = " << u16.size());
        covalent_check(u16[0] == u'a');
        covalent_check(u16[1] == 0x00E9);
        covalent_check(u16[2] == 0x20AC);
        covalent_check(u16[3] == 0xD834 && u16[4] == 0xDD1E);
        covalent_check(utility::utf16_to_utf8(u16) == text);
    }

    covalent_check(utility::utf8_count(text) == 4);
    covalent_check(utility::utf8_valid(text));
    covalent_check(utility::utf8_count("") == 0);

    for (size_t slice = 1; slice <= text.size(); ++slice) {
        size_t          errors = 0;
        const u32string cps    = decode_all(text, slice, errors);
        covalent_check(errors == 0);
        covalent_check(cps == U"a\u00E9\u20AC\U0001D11E", "slice " << slice);
    }

    {
        // stray continuation, truncated sequence at the end
        size_t          errors = 0;
        const u32string cps    = decode_all("x\x80y\xE2\x82", 2, errors);
        covalent_check(errors == 2, "errors = " << errors);
        covalent_check(cps == U"x\uFFFDy\uFFFD");
    }

    {
        // overlong encoding of '/' and an encoded surrogate
        size_t errors = 0;
        decode_all("\xC0\xAF", 1, errors);
        covalent_check(errors == 2);
        const u32string cps = decode_all("\xED\xA0\x80", 3, errors);
        covalent_check(errors == 1 && cps == U"\uFFFD");
    }

    {
        // an interrupted sequence gives back the byte that broke it
        size_t          errors = 0;
        const u32string cps    = decode_all("\xC3z", 1, errors);
        covalent_check(errors == 1 && cps == U"\uFFFDz");
    }

    {
        bool thrown = false;
        try {
            utility::utf8_to_utf16("bad\xFF");
        } catch (RuntimeError& _rerr) {
            thrown = true;
            covalent_check(_rerr.error() == utility::error_utf8_format);
        }
        covalent_check(thrown);
        covalent_check(!utility::utf8_valid("bad\xFF"));
        covalent_check(utility::utf8_count("bad\xFF") == 4);
    }

    {
        const u16string lone{u'a', static_cast<char16_t>(0xD800), u'b'};
        covalent_check(utility::utf16_to_utf8(lone) == "a\xEF\xBF\xBD" "b");
    }

    {
        string out;
        utility::utf8_append(out, 0x110000);
        covalent_check(out == "\xEF\xBF\xBD");
        u16string u16;
        utility::utf16_append(u16, 0x1F600);
        covalent_check(u16.size() == 2 && u16[0] == 0xD83D && u16[1] == 0xDE00);
    }
    return 0;
}
