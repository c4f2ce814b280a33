//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_MESSAGE_HPP
#define BOOST_TRYFILES_MESSAGE_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http_proto/request_base.hpp>
#include <boost/http_proto/response.hpp>
#include <boost/http_proto/version.hpp>
#include <boost/url/url_view.hpp>
#include <functional>
#include <string>

namespace boost {
namespace tryfiles {

/** An incoming request, as presented to handlers
*/
struct request
{
    /// The request line and headers
    http::request_base const& message;

    /// The parsed request target
    urls::url_view url;

    /// The complete body, if any
    core::string_view body;
};

/** The response to a request

    The @ref message holds the status line and headers.
    The @ref body is sent after the headers, except in
    response to `HEAD` and for statuses which have no
    content, when only the headers are sent.
*/
struct reply
{
    http::response message;
    std::string body;

    /** Set the body, and the content type if it is not already set
    */
    BOOST_TRYFILES_DECL
    void
    set_body(std::string s);

    /** Reset the reply to `200 OK` with no headers and no body
    */
    BOOST_TRYFILES_DECL
    void
    clear(http::version v);
};

/** The application handler invoked when no file matches

    The handler runs on a worker thread and may block.
    An exception thrown from the handler results in a
    `500 Internal Server Error` for that request only.
*/
using fallback_handler =
    std::function<void(request const&, reply&)>;

/** A fallback handler which responds 404 Not Found
*/
BOOST_TRYFILES_DECL
void
not_found_handler(
    request const& req,
    reply& rep);

} // tryfiles
} // boost

#endif
