// covalent/utility/src/url.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/utility/url.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/utility/error.hpp"
#include <cctype>
#include <cstring>

namespace covalent {
namespace utility {

namespace {

bool is_alpha(const char _c)
{
    return (_c >= 'a' && _c <= 'z') || (_c >= 'A' && _c <= 'Z');
}

bool is_digit(const char _c)
{
    return _c >= '0' && _c <= '9';
}

bool is_hex(const char _c)
{
    return is_digit(_c) || (_c >= 'a' && _c <= 'f') || (_c >= 'A' && _c <= 'F');
}

bool is_unreserved(const char _c)
{
    return is_alpha(_c) || is_digit(_c) || _c == '-' || _c == '.' || _c == '_' || _c == '~';
}

bool is_sub_delim(const char _c)
{
    return _c != '\0' && strchr("!$&'()*+,;=", _c) != nullptr;
}

// Checks a component made of unreserved, sub-delims, percent escapes and the
// extra characters the component allows.
bool valid_component(std::string_view _txt, const char* _extra)
{
    for (size_t i = 0; i < _txt.size(); ++i) {
        const char c = _txt[i];
        if (c == '\0') {
            return false;
        }
        if (c == '%') {
            if (i + 2 >= _txt.size()) {
                return false;
            }
            if (!is_hex(_txt[i + 1]) || !is_hex(_txt[i + 2])) {
                return false;
            }
            i += 2;
        } else if (!is_unreserved(c) && !is_sub_delim(c) && strchr(_extra, c) == nullptr) {
            return false;
        }
    }
    return true;
}

bool valid_scheme(std::string_view _txt)
{
    if (_txt.empty() || !is_alpha(_txt[0])) {
        return false;
    }
    for (const auto c : _txt) {
        if (!is_alpha(c) && !is_digit(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

bool valid_host(std::string_view _txt)
{
    if (!_txt.empty() && _txt.front() == '[') {
        // IP-literal: hex digits, dots, colons, with an optional zone
        if (_txt.size() < 3 || _txt.back() != ']') {
            return false;
        }
        return valid_component(_txt.substr(1, _txt.size() - 2), ":");
    }
    return valid_component(_txt, "");
}

} //namespace

/*static*/ ErrorConditionT Url::parse(Url& _rurl, std::string_view _txt)
{
    Url url;

    const size_t scheme_end = _txt.find(':');
    if (scheme_end == std::string_view::npos || !valid_scheme(_txt.substr(0, scheme_end))) {
        return error_url_format;
    }
    for (const auto c : _txt.substr(0, scheme_end)) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::string_view rest = _txt.substr(scheme_end + 1);

    const size_t fragment_pos = rest.find('#');
    if (fragment_pos != std::string_view::npos) {
        const auto fragment = rest.substr(fragment_pos + 1);
        if (!valid_component(fragment, ":@/?")) {
            return error_url_format;
        }
        url.fragment_ = std::string(fragment);
        rest          = rest.substr(0, fragment_pos);
    }

    const size_t query_pos = rest.find('?');
    if (query_pos != std::string_view::npos) {
        const auto query = rest.substr(query_pos + 1);
        if (!valid_component(query, ":@/?")) {
            return error_url_format;
        }
        url.query_ = std::string(query);
        rest       = rest.substr(0, query_pos);
    }

    if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
        rest = rest.substr(2);

        const size_t     path_pos  = rest.find('/');
        std::string_view authority = rest.substr(0, path_pos);
        rest                       = path_pos == std::string_view::npos ? std::string_view() : rest.substr(path_pos);

        const size_t at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            const auto user_info = authority.substr(0, at_pos);
            if (!valid_component(user_info, ":")) {
                return error_url_format;
            }
            url.user_info_ = std::string(user_info);
            authority      = authority.substr(at_pos + 1);
        }

        const size_t port_pos = authority.rfind(':');
        if (port_pos != std::string_view::npos && authority.find(']', port_pos) == std::string_view::npos) {
            const auto port = authority.substr(port_pos + 1);
            for (const auto c : port) {
                if (!is_digit(c)) {
                    return error_url_format;
                }
            }
            if (port.size() > 5 || (!port.empty() && std::stoi(std::string(port)) > 65535)) {
                return error_url_format;
            }
            url.port_ = std::string(port);
            authority = authority.substr(0, port_pos);
        }

        if (!valid_host(authority)) {
            return error_url_format;
        }
        url.host_ = std::string(authority);
    } else if (rest.empty()) {
        // "scheme:" alone names nothing
        return error_url_format;
    }

    if (!valid_component(rest, ":@/")) {
        return error_url_format;
    }
    url.path_ = std::string(rest);

    _rurl = std::move(url);
    return ErrorConditionT();
}

/*static*/ Url Url::parse(std::string_view _txt)
{
    Url        url;
    const auto err = parse(url, _txt);
    if (err) {
        covalent_throw_error_ex(error_url_format, '"' << _txt << '"');
    }
    return url;
}

int Url::port() const
{
    if (port_ && !port_->empty()) {
        return std::stoi(*port_);
    }
    return -1;
}

std::string Url::str() const
{
    std::string rv = scheme_;
    rv += ':';
    if (host_) {
        rv += "//";
        if (user_info_) {
            rv += *user_info_;
            rv += '@';
        }
        rv += *host_;
        if (port_) {
            rv += ':';
            rv += *port_;
        }
    }
    rv += path_;
    if (query_) {
        rv += '?';
        rv += *query_;
    }
    if (fragment_) {
        rv += '#';
        rv += *fragment_;
    }
    return rv;
}

std::ostream& operator<<(std::ostream& _ros, const Url& _url)
{
    return _ros << _url.str();
}

} //namespace utility
} //namespace covalent
