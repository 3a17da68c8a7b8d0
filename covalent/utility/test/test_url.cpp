#include "covalent/system/exception.hpp"
#include "covalent/utility/error.hpp"
#include "covalent/utility/url.hpp"
#include <iostream>
#include <sstream>

using namespace std;
using namespace covalent;

namespace {

bool is_malformed(const char* _txt)
{
    utility::Url url;
    return utility::Url::parse(url, _txt) == utility::error_url_format;
}

} //namespace

int test_url(int argc, char* argv[])
{
    {
        const auto url = utility::Url::parse("HTTP://user:pw@Example.com:8080/a/b%20c?x=1&y=2#frag");
        covalent_check(url.scheme() == "http");
        covalent_check(url.hasAuthority());
        covalent_check(url.userInfo() == "user:pw");
        covalent_check(url.host() == "Example.com");
        covalent_check(url.port() == 8080);
        covalent_check(url.path() == "/a/b%20c");
        covalent_check(url.query() && *url.query() == "x=1&y=2");
        covalent_check(url.fragment() && *url.fragment() == "frag");
        covalent_check(url.str() == "http://user:pw@Example.com:8080/a/b%20c?x=1&y=2#frag", url.str());
        covalent_check(utility::Url::parse(url.str()) == url);
    }
    {
        const auto url = utility::Url::parse("file:///tmp/data.bin");
        covalent_check(url.hasAuthority() && url.host().empty());
        covalent_check(url.path() == "/tmp/data.bin");
        covalent_check(url.port() == -1);
        covalent_check(url.str() == "file:///tmp/data.bin");
    }
    {
        const auto url = utility::Url::parse("mailto:someone@example.org");
        covalent_check(!url.hasAuthority());
        covalent_check(url.path() == "someone@example.org");
        ostringstream oss;
        oss << url;
        covalent_check(oss.str() == "mailto:someone@example.org");
    }
    {
        const auto url = utility::Url::parse("http://[::1]:9000/");
        covalent_check(url.host() == "[::1]");
        covalent_check(url.port() == 9000);
    }
    {
        const auto url = utility::Url::parse("http://example.com?");
        covalent_check(url.query() && url.query()->empty());
        covalent_check(!url.fragment());
        covalent_check(url.str() == "http://example.com?");
    }

    covalent_check(is_malformed(""));
    covalent_check(is_malformed("no scheme here"));
    covalent_check(is_malformed("1http://example.com"));
    covalent_check(is_malformed("http:"));
    covalent_check(is_malformed("http://exa mple.com/"));
    covalent_check(is_malformed("http://example.com:80x/"));
    covalent_check(is_malformed("http://example.com:70000/"));
    covalent_check(is_malformed("http://example.com/%zz"));
    covalent_check(is_malformed("http://example.com/a b"));

    bool thrown = false;
    try {
        utility::Url::parse("::");
    } catch (RuntimeError& _rerr) {
        thrown = true;
        cout << _rerr.what() << endl;
        covalent_check(_rerr.error() == utility::error_url_format);
    }
    covalent_check(thrown);
    covalent_check(utility::Url().empty());
    return 0;
}
