//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_DETAIL_BASE64_HPP
#define BOOST_TRYFILES_DETAIL_BASE64_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>

namespace boost {
namespace tryfiles {
namespace detail {

/** Append the RFC 4648 base64 encoding of `src` to `dest`

    The standard alphabet is used, with padding.
*/
BOOST_TRYFILES_DECL
void
base64_encode(
    std::string& dest,
    void const* src,
    std::size_t n);

inline
void
base64_encode(
    std::string& dest,
    core::string_view src)
{
    base64_encode(dest, src.data(), src.size());
}

} // detail
} // tryfiles
} // boost

#endif
