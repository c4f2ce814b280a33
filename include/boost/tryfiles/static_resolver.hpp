//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_STATIC_RESOLVER_HPP
#define BOOST_TRYFILES_STATIC_RESOLVER_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/content_cache.hpp>
#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/tryfiles/server_config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <string>

namespace boost {
namespace tryfiles {

/** A file chosen to answer a request
*/
struct resolved_asset
{
    /// The path in the file system
    std::string path;

    /// The metadata obtained when the file was found
    file_info info;

    /// True if a directory was requested and its index file chosen
    bool is_index = false;
};

/** A span of bytes to transmit from a file
*/
struct range_spec
{
    /// Offset of the first byte
    std::uint64_t start = 0;

    /// Number of bytes
    std::uint64_t count = 0;

    /// True if this is less than the whole file
    bool partial = false;

    /** Return the offset of the last byte

        @par Preconditions
        @code
        count > 0
        @endcode
    */
    std::uint64_t
    last() const noexcept
    {
        return start + count - 1;
    }
};

/** Return the span of bytes selected by a Range header

    The first match of `bytes=(\d+)-(\d+)?` in `value`
    is used; when there is none, the start is zero and
    the end is open. An open end selects at most `chunk`
    bytes. An end past the end of the file is clamped.
    A start past the end of the file, a start after the
    end, or an empty file selects the whole file.

    @param value The value of the Range field.

    @param size The size of the file.

    @param chunk The most bytes selected by an open-ended range.
*/
BOOST_TRYFILES_DECL
range_spec
parse_range(
    core::string_view value,
    std::uint64_t size,
    std::uint64_t chunk);

//------------------------------------------------

/** Answers GET and HEAD requests from a directory of files

    For each request the URL path is mapped onto the files
    directory. When a file is found a complete response is
    produced, including conditional responses, byte ranges,
    cache control and content type. Otherwise the request
    is left for the application.

    CORS headers are not added here.
*/
class static_resolver
{
public:
    /** Constructor

        @param cfg The server settings. Only the files
        directory, index name and range chunk are used,
        and they are copied.

        @param fs The file system, which must outlive
        the resolver.

        @param cache The content cache to use, or null.
        When not null it must outlive the resolver.

        @param sect The log section for errors.

        @throws std::invalid_argument `cfg.byte_range_chunk`
        is zero.
    */
    BOOST_TRYFILES_DECL
    static_resolver(
        server_config const& cfg,
        file_system& fs,
        content_cache* cache,
        section sect);

    /** Find the file for a decoded URL path

        The path must start with a slash. A directory resolves
        to its index file. The returned error is
        `errc::no_such_file_or_directory` when nothing exists
        at the path, @ref error::bad_path when the path tries
        to leave the files directory, and
        @ref error::not_regular_file for other kinds of files.
    */
    BOOST_TRYFILES_DECL
    system::result<resolved_asset>
    lookup(core::string_view path) const;

    /** Attempt to answer a request from the files directory

        @return `true` if `rep` now holds the complete response,
        or `false` if the request should be passed on, in which
        case `rep` is unchanged.
    */
    BOOST_TRYFILES_DECL
    bool
    resolve(
        request const& req,
        reply& rep) const;

private:
    std::string
    read_content(
        request const& req,
        core::string_view key,
        resolved_asset const& asset,
        range_spec const& r,
        system::error_code& ec) const;

    std::string files_dir_;
    std::string index_name_;
    std::uint64_t chunk_;
    file_system& fs_;
    content_cache* cache_;
    section sect_;
};

} // tryfiles
} // boost

#endif
