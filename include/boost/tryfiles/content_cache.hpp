//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_CONTENT_CACHE_HPP
#define BOOST_TRYFILES_CONTENT_CACHE_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace boost {
namespace tryfiles {

/** An in-memory cache of file contents

    Each entry is keyed by a URL path and tagged with a version,
    which is the query string of the request that loaded it.
    A lookup hits only when both match. Entries never expire;
    a lookup with a different version is expected to be
    followed by an @ref insert which replaces the entry.

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Safe.
*/
class content_cache
{
public:
    using value_type = std::shared_ptr<std::string const>;

    BOOST_TRYFILES_DECL
    ~content_cache();

    BOOST_TRYFILES_DECL
    content_cache();

    content_cache(content_cache const&) = delete;
    content_cache& operator=(content_cache const&) = delete;

    /** Return the cached bytes for a path and version

        @return The bytes, or null on a miss.
    */
    BOOST_TRYFILES_DECL
    value_type
    find(
        core::string_view path,
        core::string_view version) const;

    /** Store the bytes for a path, replacing any previous entry

        When two threads insert the same path,
        the last one wins.
    */
    BOOST_TRYFILES_DECL
    void
    insert(
        core::string_view path,
        core::string_view version,
        value_type bytes);

    /** Return the number of cached paths
    */
    BOOST_TRYFILES_DECL
    std::size_t
    size() const;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

} // tryfiles
} // boost

#endif
