//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_HTTP_DATE_HPP
#define BOOST_TRYFILES_HTTP_DATE_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <cstdint>
#include <string>

namespace boost {
namespace tryfiles {

/** Format a point in time as an HTTP date

    The result uses the IMF-fixdate format of RFC 9110,
    for example `Sun, 06 Nov 1994 08:49:37 GMT`.
    Milliseconds are truncated.

    @param ms The time in milliseconds since the epoch.
*/
BOOST_TRYFILES_DECL
std::string
format_http_date(
    std::int64_t ms);

/** Parse an HTTP date

    All three formats accepted by RFC 9110 are recognized:
    IMF-fixdate, the obsolete RFC 850 format, and the
    format of ANSI C's `asctime`. Surrounding whitespace
    is ignored.

    @return The time in seconds since the epoch,
    or an empty optional if `s` is not a valid date.
*/
BOOST_TRYFILES_DECL
boost::optional<std::int64_t>
parse_http_date(
    core::string_view s) noexcept;

} // tryfiles
} // boost

#endif
