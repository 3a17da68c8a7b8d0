// covalent/utility/url.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/error.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace covalent {
namespace utility {

//! An absolute URL in the RFC 3986 generic syntax
/*!
    scheme ":" ["//" [userinfo "@"] host [":" port]] path ["?" query] ["#" fragment]

    The scheme is kept lower case; every other component is kept as written,
    percent escapes included. str() gives back the canonical text.
*/
class Url {
    std::string                scheme_;
    std::optional<std::string> user_info_;
    std::optional<std::string> host_;
    std::optional<std::string> port_;
    std::string                path_;
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;

public:
    //! Parse or raise error_url_format
    static Url parse(std::string_view _txt);
    //! Parse without throwing
    static ErrorConditionT parse(Url& _rurl, std::string_view _txt);

    Url() = default;

    bool empty() const
    {
        return scheme_.empty();
    }

    const std::string& scheme() const
    {
        return scheme_;
    }

    bool hasAuthority() const
    {
        return host_.has_value();
    }

    std::string userInfo() const
    {
        return user_info_.value_or(std::string());
    }

    std::string host() const
    {
        return host_.value_or(std::string());
    }

    //! The port number or -1 when the URL has none
    int port() const;

    const std::string& path() const
    {
        return path_;
    }

    const std::optional<std::string>& query() const
    {
        return query_;
    }

    const std::optional<std::string>& fragment() const
    {
        return fragment_;
    }

    std::string str() const;

    bool operator==(const Url& _other) const = default;
};

std::ostream& operator<<(std::ostream& _ros, const Url& _url);

} //namespace utility
} //namespace covalent
