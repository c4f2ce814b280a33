//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_MIME_TYPES_HPP
#define BOOST_TRYFILES_MIME_TYPES_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace boost {
namespace tryfiles {

/** Return the extension of the last segment of a path

    The extension is the text after the final dot, lowercased.
    It must consist only of letters, digits and underscores,
    and at least one character must precede the dot.
    Otherwise the returned string is empty.

    @par Example
    @code
    assert( file_extension( "public/Logo.PNG" ) == "png" );
    assert( file_extension( "public/README" ) == "" );
    @endcode
*/
BOOST_TRYFILES_DECL
std::string
file_extension(
    core::string_view path);

/** Return the content type for a file extension

    The comparison is case-insensitive and the
    extension is given without the leading dot.
    Unknown extensions yield `application/octet-stream`.
*/
BOOST_TRYFILES_DECL
core::string_view
mime_type(
    core::string_view ext) noexcept;

} // tryfiles
} // boost

#endif
