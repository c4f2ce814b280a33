//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/message.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/status.hpp>

namespace boost {
namespace tryfiles {

void
reply::
set_body(std::string s)
{
    if(! message.exists(http::field::content_type))
    {
        message.set(http::field::content_type,
            "text/plain; charset=UTF-8");
    }
    body = std::move(s);
}

void
reply::
clear(http::version v)
{
    message.clear();
    message.set_start_line(http::status::ok, v);
    body.clear();
}

void
not_found_handler(
    request const&,
    reply& rep)
{
    rep.message.set_status(http::status::not_found);
    rep.set_body("Not Found");
}

} // tryfiles
} // boost
