//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/cors.hpp>
#include <boost/tryfiles/detail/except.hpp>
#include <boost/http_proto/field.hpp>

namespace boost {
namespace tryfiles {

cors_policy::
cors_policy(
    core::string_view source)
    : source_(source)
{
    if(source_.empty())
        return;
    if(source_ == "*")
    {
        kind_ = kind::wildcard;
        return;
    }
    try
    {
        re_ = std::make_shared<std::regex const>(
            source_, std::regex::ECMAScript);
    }
    catch(std::regex_error const& e)
    {
        std::string s = "bad CORS origin pattern: ";
        s.append(e.what());
        detail::throw_invalid_argument(s);
    }
    kind_ = kind::pattern;
}

void
cors_policy::
apply(
    http::fields_base const& req,
    http::fields_base& res) const
{
    switch(kind_)
    {
    case kind::disabled:
        break;

    case kind::wildcard:
        res.append(http::field::access_control_allow_origin, "*");
        res.append(http::field::access_control_allow_methods,
            "OPTIONS,HEAD,GET");
        // anything except Authorization when not using credentials
        res.append(http::field::access_control_allow_headers, "*");
        break;

    case kind::pattern:
    {
        auto const it = req.find(http::field::origin);
        if(it == req.end())
            break;
        std::string const origin(it->value);
        if(! std::regex_search(origin, *re_))
            break;
        res.append(http::field::access_control_allow_origin, origin);
        res.append(http::field::access_control_allow_methods,
            "OPTIONS,HEAD,GET,POST,PATCH,PUT,DELETE");
        res.append(http::field::access_control_allow_headers,
            "Accept,Accept-Language,Authorization,Cache-Control,"
            "If-Modified-Since,Content-Language,Content-Type,"
            "Expires,Last-Modified,Pragma,Range,User-Agent,"
            "X-Requested-With");
        res.append(http::field::access_control_allow_credentials, "true");
        // seven days
        res.append(http::field::access_control_max_age, "604800");
        break;
    }
    }
}

} // tryfiles
} // boost
