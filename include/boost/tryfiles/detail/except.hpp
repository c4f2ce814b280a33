//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_DETAIL_EXCEPT_HPP
#define BOOST_TRYFILES_DETAIL_EXCEPT_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace tryfiles {
namespace detail {

BOOST_TRYFILES_DECL void BOOST_NORETURN throw_logic_error(
    core::string_view s,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_TRYFILES_DECL void BOOST_NORETURN throw_invalid_argument(
    core::string_view s,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_TRYFILES_DECL void BOOST_NORETURN throw_out_of_range(
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // tryfiles
} // boost

#endif
