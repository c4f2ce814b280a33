//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_DETAIL_CONFIG_HPP
#define BOOST_TRYFILES_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

namespace boost {
namespace tryfiles {

# if (defined(BOOST_TRYFILES_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_TRYFILES_STATIC_LINK)
#  if defined(BOOST_TRYFILES_SOURCE)
#   define BOOST_TRYFILES_DECL        BOOST_SYMBOL_EXPORT
#  else
#   define BOOST_TRYFILES_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib
# ifndef  BOOST_TRYFILES_DECL
#  define BOOST_TRYFILES_DECL
# endif

//------------------------------------------------

// Add source location to error codes
#ifdef BOOST_TRYFILES_NO_SOURCE_LOCATION
# define BOOST_TRYFILES_ERR(ev) (::boost::system::error_code(ev))
#else
# define BOOST_TRYFILES_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
#endif

} // tryfiles

namespace http_proto {}
namespace tryfiles {
namespace http = http_proto;
}

} // boost

#endif
