//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_TRY_FILES_HPP
#define BOOST_TRYFILES_TRY_FILES_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/content_cache.hpp>
#include <boost/tryfiles/cors.hpp>
#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/tryfiles/server_config.hpp>
#include <boost/tryfiles/static_resolver.hpp>
#include <memory>

namespace boost {
namespace tryfiles {

/** Produces the response for each request

    `OPTIONS` is answered with `204 No Content`. Other
    requests are offered to a @ref static_resolver, and
    when it finds no file, to the fallback handler.
    The CORS policy is applied to every response last.

    @par Thread Safety
    The function call operator may be invoked concurrently.
*/
class try_files
{
public:
    /** Constructor

        @param cfg The server settings.

        @param fs The file system, which must outlive this object.

        @param fallback The handler for requests which
        match no file. If empty, @ref not_found_handler is used.

        @param sections The log sections to use.
    */
    BOOST_TRYFILES_DECL
    try_files(
        server_config const& cfg,
        file_system& fs,
        fallback_handler fallback,
        log_sections& sections);

    /** Fill in the reply for a request

        Exceptions thrown by the fallback handler propagate.
    */
    BOOST_TRYFILES_DECL
    void
    operator()(
        request const& req,
        reply& rep) const;

    /** Return the content cache, or null if caching is disabled
    */
    content_cache*
    cache() const noexcept
    {
        return cache_.get();
    }

private:
    cors_policy cors_;
    std::unique_ptr<content_cache> cache_;
    static_resolver resolver_;
    fallback_handler fallback_;
};

} // tryfiles
} // boost

#endif
