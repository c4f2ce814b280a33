//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/error.hpp>

namespace boost {
namespace tryfiles {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.tryfiles";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::success: return "success";
    case error::bad_path: return "bad path";
    case error::not_regular_file: return "not a regular file";
    case error::short_read: return "short read";
    case error::not_supported: return "operation not supported";
    default:
        return "unknown";
    }
}

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

} // detail
} // tryfiles
} // boost
