//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_FILE_SYSTEM_HPP
#define BOOST_TRYFILES_FILE_SYSTEM_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>

namespace boost {
namespace tryfiles {

/** Metadata describing a path in the file system
*/
struct file_info
{
    bool is_file = false;
    bool is_directory = false;

    /// The size in bytes, meaningful for regular files
    std::uint64_t size = 0;

    /// The modification time in milliseconds since the epoch, if known
    boost::optional<std::int64_t> mtime;
};

//------------------------------------------------

/** The file system operations used to serve static files

    Implementations must be safe to call concurrently.
    Paths are passed as given, in the native format.
*/
class BOOST_SYMBOL_VISIBLE
    file_system
{
public:
    BOOST_TRYFILES_DECL
    virtual ~file_system();

    /** Return metadata for a path

        When the path does not exist, `ec` is set
        to `errc::no_such_file_or_directory`.
    */
    virtual
    file_info
    stat(
        core::string_view path,
        system::error_code& ec) = 0;

    /** Return the entire contents of a file
    */
    virtual
    std::string
    read_all(
        core::string_view path,
        system::error_code& ec) = 0;

    /** Return up to `n` bytes of a file starting at `offset`

        Fewer bytes are returned only when the
        end of the file is reached.

        If positional reads are not supported,
        `ec` is set to @ref error::not_supported.
    */
    virtual
    std::string
    read_range(
        core::string_view path,
        std::uint64_t offset,
        std::uint64_t n,
        system::error_code& ec) = 0;

    /** Return true if @ref read_range is supported
    */
    virtual
    bool
    supports_positional_read() const noexcept = 0;
};

//------------------------------------------------

/** A file system backed by the operating system
*/
class BOOST_SYMBOL_VISIBLE
    native_file_system
    : public file_system
{
public:
    BOOST_TRYFILES_DECL
    file_info
    stat(
        core::string_view path,
        system::error_code& ec) override;

    BOOST_TRYFILES_DECL
    std::string
    read_all(
        core::string_view path,
        system::error_code& ec) override;

    BOOST_TRYFILES_DECL
    std::string
    read_range(
        core::string_view path,
        std::uint64_t offset,
        std::uint64_t n,
        system::error_code& ec) override;

    bool
    supports_positional_read() const noexcept override
    {
        return true;
    }
};

} // tryfiles
} // boost

#endif
