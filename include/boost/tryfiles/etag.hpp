//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_ETAG_HPP
#define BOOST_TRYFILES_ETAG_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace boost {
namespace tryfiles {

struct file_info;

/** Return an entity tag computed from file metadata

    The tag has the form `"<size>-<mtime>"`, with both values
    in lowercase hexadecimal and the modification time in
    milliseconds since the epoch. An absent modification
    time is written as `0`.

    @param info The file metadata.

    @param weak If `true`, the tag is prefixed with `W/`.
*/
BOOST_TRYFILES_DECL
std::string
make_etag(
    file_info const& info,
    bool weak = true);

/** Return an entity tag computed from content

    The tag has the form `"<length>-<hash>"` where the length
    is in lowercase hexadecimal and the hash is the first 27
    characters of the base64 encoded SHA-1 digest of the
    content. Empty content yields `"0-2jmj7l5rSw0yVb/vlWAYkK/YBwk="`.

    @param body The content bytes.

    @param weak If `true`, the tag is prefixed with `W/`.
*/
BOOST_TRYFILES_DECL
std::string
make_etag(
    core::string_view body,
    bool weak = true);

} // tryfiles
} // boost

#endif
