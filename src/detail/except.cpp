//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/detail/except.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>
#include <string>

namespace boost {
namespace tryfiles {
namespace detail {

void
throw_logic_error(
    core::string_view s,
    source_location const& loc)
{
    throw_exception(std::logic_error(std::string(s)), loc);
}

void
throw_invalid_argument(
    core::string_view s,
    source_location const& loc)
{
    throw_exception(std::invalid_argument(std::string(s)), loc);
}

void
throw_out_of_range(
    source_location const& loc)
{
    throw_exception(std::out_of_range("out of range"), loc);
}

} // detail
} // tryfiles
} // boost
