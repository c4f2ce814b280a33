//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_ERROR_HPP
#define BOOST_TRYFILES_ERROR_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <type_traits>

namespace boost {
namespace tryfiles {

/** Error codes returned by the library
*/
enum class error
{
    success = 0,

    /// The request path cannot be mapped safely onto the document root
    bad_path,

    /// The path names something which is neither a file nor a directory
    not_regular_file,

    /// The file ended before the requested number of bytes was read
    short_read,

    /// The operation is not supported by the file system
    not_supported
};

} // tryfiles

namespace system {
template<>
struct is_error_code_enum<
    ::boost::tryfiles::error>
{
    static bool const value = true;
};
} // system

namespace tryfiles {

namespace detail {
struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_TRYFILES_DECL const char* name(
        ) const noexcept override;
    BOOST_TRYFILES_DECL std::string message(
        int) const override;
    BOOST_TRYFILES_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0xa4c1e07d5b2f9e31 )
    {
    }
};
BOOST_TRYFILES_DECL extern error_cat_type error_cat;
} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // tryfiles
} // boost

#endif
